#ifndef KMFIT_REPORTER_HPP
#define KMFIT_REPORTER_HPP

#include <memory>
#include <string>
#include <stdexcept>

#include "spdlog/spdlog.h"

/**
 * @file Reporter.hpp
 * @brief Sinks for non-fatal messages from the fit.
 */

namespace kmfit {

/**
 * @brief Interface for reporting messages from the fit.
 *
 * Warnings are emitted for recoverable conditions, e.g., failure to converge or a metric that cannot partition the data.
 * Informational messages describe the progress of the fit.
 * Neither affects the outcome of the fit.
 */
class Reporter {
public:
    /**
     * @cond
     */
    Reporter() = default;
    Reporter(Reporter&&) = default;
    Reporter(const Reporter&) = default;
    Reporter& operator=(Reporter&&) = default;
    Reporter& operator=(const Reporter&) = default;
    virtual ~Reporter() = default;
    /**
     * @endcond
     */

    /**
     * @param message Warning message.
     */
    virtual void warn(const std::string& message) = 0;

    /**
     * @param message Informational message.
     */
    virtual void info(const std::string& message) = 0;
};

/**
 * @brief Report messages through an **spdlog** logger.
 */
class SpdlogReporter final : public Reporter {
public:
    /**
     * @param logger Logger to use, should not be null.
     */
    SpdlogReporter(std::shared_ptr<spdlog::logger> logger) : my_logger(std::move(logger)) {
        if (!my_logger) {
            throw std::runtime_error("logger should not be null");
        }
    }

    /**
     * Default constructor, using the default **spdlog** logger.
     */
    SpdlogReporter() : SpdlogReporter(spdlog::default_logger()) {}

private:
    std::shared_ptr<spdlog::logger> my_logger;

public:
    /**
     * @cond
     */
    void warn(const std::string& message) {
        my_logger->warn("[kmfit] {}", message);
    }

    void info(const std::string& message) {
        my_logger->info("[kmfit] {}", message);
    }
    /**
     * @endcond
     */
};

}

#endif
