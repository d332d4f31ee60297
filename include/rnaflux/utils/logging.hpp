#ifndef RNAFLUX_LOGGING_HPP
#define RNAFLUX_LOGGING_HPP

#include <memory>
#include "spdlog/spdlog.h"
#include "spdlog/sinks/null_sink.h"

/**
 * @file logging.hpp
 * @brief Logger handles for **rnaflux**.
 */

namespace rnaflux {

/**
 * Shorthand for the logger type accepted by the `set_logger()` methods.
 */
typedef std::shared_ptr<spdlog::logger> Logger;

/**
 * @return The logger used when `set_logger()` is not called, i.e., **spdlog**'s default logger.
 */
inline Logger default_logger() {
    return spdlog::default_logger();
}

/**
 * @return A logger that discards all messages.
 * This is occasionally useful in tests to silence warnings about degenerate cells.
 */
inline Logger null_logger() {
    return std::make_shared<spdlog::logger>("rnaflux-null", std::make_shared<spdlog::sinks::null_sink_mt>());
}

}

#endif
