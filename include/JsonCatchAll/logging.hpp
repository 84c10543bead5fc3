#pragma once

#include <memory>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace JsonCatchAll {

namespace log {

inline constexpr const char* LoggerName = "JsonCatchAll";

/// Library logger: stdout colour sink, level `warn` until changed with setLevel().
/// Reuses a logger of the same name if the application registered one first.
inline const std::shared_ptr<spdlog::logger> & logger() {
    static const std::shared_ptr<spdlog::logger> instance = [] {
        std::shared_ptr<spdlog::logger> existing = spdlog::get(LoggerName);
        if(existing) {
            return existing;
        }
        auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        auto created = std::make_shared<spdlog::logger>(LoggerName, sink);
        created->set_level(spdlog::level::warn);
        created->flush_on(spdlog::level::warn);
        spdlog::register_logger(created);
        return created;
    }();
    return instance;
}

inline void setLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace log

} // namespace JsonCatchAll
