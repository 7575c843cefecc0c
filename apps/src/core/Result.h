#pragma once

#include <string>
#include <utility>
#include <variant>

namespace LanderSim {

/**
 * Value-or-error return type for recoverable failures (config loading, validation,
 * collaborator streams going away).
 *
 * Example:
 *   Result<TrainingConfig, std::string> r = ConfigLoader::load<TrainingConfig>("training.json");
 *   if (r.isError()) {
 *       SLOG_ERROR("{}", r.errorValue());
 *   }
 */
template <typename T, typename E>
class Result {
public:
    static Result okay(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result error(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    bool isValue() const { return data_.index() == 0; }
    bool isError() const { return data_.index() == 1; }

    const T& value() const& { return std::get<0>(data_); }
    T& value() & { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    const E& errorValue() const { return std::get<1>(data_); }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v))
    {}

    std::variant<T, E> data_;
};

} // namespace LanderSim
