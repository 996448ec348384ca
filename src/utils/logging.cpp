#include "hostext/utils/logging.hpp"

#include <mutex>
#include <stdexcept>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace hostext {
namespace utils {

namespace {

std::mutex& loggerMutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::logger> makeDefaultLogger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto created = std::make_shared<spdlog::logger>("hostext", std::move(sink));
    created->set_level(spdlog::level::info);
    return created;
}

std::shared_ptr<spdlog::logger>& currentLogger() {
    static std::shared_ptr<spdlog::logger> instance = makeDefaultLogger();
    return instance;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(loggerMutex());
    return currentLogger();
}

void setLogger(std::shared_ptr<spdlog::logger> replacement) {
    std::lock_guard<std::mutex> lock(loggerMutex());
    currentLogger() = replacement ? std::move(replacement) : makeDefaultLogger();
}

void setLogLevel(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str falls back to "off" for unknown names
    if (parsed == spdlog::level::off && level != "off") {
        throw std::invalid_argument("Unknown log level: " + level);
    }
    logger()->set_level(parsed);
}

} // namespace utils
} // namespace hostext
