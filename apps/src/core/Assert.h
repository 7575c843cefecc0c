#pragma once

#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <cstdlib>
#include <spdlog/spdlog.h>

/**
 * Invariant check that stays on in release builds.
 *
 * Used for programming errors (mismatched network shapes, ranking unevaluated members)
 * and for refusing to build a simulator or trainer from a configuration that failed
 * validation. Recoverable problems return a Result instead.
 *
 * On failure the message, location and condition are logged at critical level, every
 * registered logger is flushed so the log file keeps the reason, and the process aborts.
 *
 *   LANDERSIM_ASSERT(layout.inputCount() > 0, "Policy needs at least one observation channel");
 */
#define LANDERSIM_ASSERT(condition, message)                                                 \
    do {                                                                                     \
        if (!(condition)) {                                                                  \
            spdlog::critical("Invariant violated: {} ({}:{})", message, __FILE__, __LINE__); \
            spdlog::critical("  Condition: {}", #condition);                                 \
            spdlog::apply_all([](std::shared_ptr<spdlog::logger> l) { l->flush(); });        \
            std::abort();                                                                    \
        }                                                                                    \
    } while (0)
