#pragma once

#include <reflect>

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

/**
 * Generic reflection-based JSON serialization for aggregate config types.
 *
 * Uses qlibs/reflect for compile-time introspection and nlohmann/json
 * for JSON generation. Works automatically with any aggregate type whose members
 * are themselves JSON-convertible.
 *
 * Example:
 *   struct ScoringConfig { double speedCeilingMph = 40.0; };
 *   auto j = ReflectSerializer::to_json(ScoringConfig{});
 *   auto s = ReflectSerializer::from_json<ScoringConfig>(j);
 */
namespace ReflectSerializer {

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};
template <typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

template <typename T>
nlohmann::json to_json(const T& obj)
{
    nlohmann::json j = nlohmann::json::object();

    reflect::for_each(
        [&](auto I) {
            auto name = std::string(reflect::member_name<I>(obj));
            const auto& value = reflect::get<I>(obj);

            using MemberType = std::remove_cvref_t<decltype(value)>;

            if constexpr (is_optional_v<MemberType>) {
                // Only include optional fields if they have a value.
                if (value.has_value()) {
                    j[name] = *value;
                }
            }
            else if constexpr (std::is_enum_v<MemberType>) {
                j[name] = std::string(reflect::enum_name(value));
            }
            else {
                j[name] = value;
            }
        },
        obj);

    return j;
}

/**
 * Deserialize nlohmann::json to any aggregate type. Members missing from the JSON keep
 * their default member initializers, so partial config files are valid.
 */
template <typename T>
T from_json(const nlohmann::json& j)
{
    T obj{};

    reflect::for_each(
        [&](auto I) {
            auto name = std::string(reflect::member_name<I>(obj));

            using MemberType = std::remove_reference_t<decltype(reflect::get<I>(obj))>;

            if (!j.contains(name) || j[name].is_null()) {
                return;
            }

            if constexpr (is_optional_v<MemberType>) {
                using InnerType = typename MemberType::value_type;
                reflect::get<I>(obj) = j[name].template get<InnerType>();
            }
            else if constexpr (std::is_enum_v<MemberType>) {
                const auto str = j[name].template get<std::string>();
                bool found = false;
                for (const auto& [enumValue, enumName] : reflect::enumerators<MemberType>) {
                    if (enumName == str) {
                        reflect::get<I>(obj) = static_cast<MemberType>(enumValue);
                        found = true;
                        break;
                    }
                }
                if (!found) {
                    throw std::runtime_error("Invalid enum value for " + name + ": " + str);
                }
            }
            else {
                reflect::get<I>(obj) = j[name].template get<MemberType>();
            }
        },
        obj);

    return obj;
}

} // namespace ReflectSerializer
