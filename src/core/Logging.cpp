#include "core/Logging.h"
#include <algorithm>
#include <cctype>
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

namespace ViewPane::Core::Logging {

namespace {
std::shared_ptr<spdlog::logger> MakeNullLogger() {
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, std::make_shared<spdlog::sinks::null_sink_mt>());
    logger->set_level(spdlog::level::off);
    return logger;
}
} // anonymous namespace

bool Initialize(const LoggingConfig& config) {
    spdlog::drop(kLoggerName);

    if (config.file.empty()) {
        spdlog::set_default_logger(MakeNullLogger());
        return true;
    }

    std::shared_ptr<spdlog::logger> logger;
    try {
        logger = spdlog::basic_logger_mt(kLoggerName, config.file);
    } catch (const spdlog::spdlog_ex&) {
        spdlog::set_default_logger(MakeNullLogger());
        return false;
    }

    std::string level = config.level;
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (level == "warning") {
        level = "warn";
    }
    logger->set_level(spdlog::level::from_str(level));
    logger->flush_on(spdlog::level::warn);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e %^%-8l%$ viewpane] %v");
    spdlog::set_default_logger(logger);
    return true;
}

void Shutdown() {
    if (auto logger = spdlog::default_logger()) {
        logger->flush();
    }
    spdlog::drop_all();

    // Late log calls (static destructors, tests) go nowhere
    spdlog::set_default_logger(MakeNullLogger());
}

} // namespace ViewPane::Core::Logging
