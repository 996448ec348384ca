#ifndef HOSTEXT_UTILS_LOGGING_HPP
#define HOSTEXT_UTILS_LOGGING_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#define HLOG_DEBUG(message)    ::hostext::utils::logger()->debug(message)
#define HLOG_INFO(message)     ::hostext::utils::logger()->info(message)
#define HLOG_WARN(message)     ::hostext::utils::logger()->warn(message)
#define HLOG_ERROR(message)    ::hostext::utils::logger()->error(message)
#define HLOG_CRITICAL(message) ::hostext::utils::logger()->critical(message)

namespace hostext {
namespace utils {

/**
 * @brief Returns the process-wide logger used by the HLOG_* macros.
 *
 * The logger is named "hostext" and writes to stderr until replaced
 * through setLogger().
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Replaces the process-wide logger.
 *
 * @param replacement New logger, or nullptr to restore the default stderr logger.
 */
void setLogger(std::shared_ptr<spdlog::logger> replacement);

/**
 * @brief Sets the level of the current logger from its name ("debug", "info", "warn", ...).
 * @throws std::invalid_argument if the name is not a known spdlog level
 */
void setLogLevel(const std::string& level);

} // namespace utils
} // namespace hostext

#endif // HOSTEXT_UTILS_LOGGING_HPP
