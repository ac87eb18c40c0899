/// @file log.cpp
/// @brief Logger registry for habitat_core

#include <habitat/core/log.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <iterator>
#include <mutex>
#include <utility>
#include <vector>

namespace habitat_core {

namespace {

struct LevelName {
    const char* name;
    spdlog::level::level_enum level;
};

// First entry per level is its canonical name
constexpr LevelName LEVEL_NAMES[] = {
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"err", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"fatal", spdlog::level::critical},
    {"off", spdlog::level::off},
};

class LoggerRegistry {
public:
    static LoggerRegistry& instance() {
        static LoggerRegistry registry;
        return registry;
    }

    void configure(const LogConfig& config) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = config;

        if (m_config.file_enabled && !m_config.log_directory.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(m_config.log_directory, ec);
            if (ec) {
                spdlog::warn("Could not create log directory '{}': {}", m_config.log_directory, ec.message());
            }
        }

        for (auto& [name, logger] : m_loggers) {
            logger->flush();
            logger = publish(name);
        }
    }

    std::shared_ptr<spdlog::logger> get(const std::string& name) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_loggers.find(name);
        if (it != m_loggers.end()) {
            return it->second;
        }
        return m_loggers.emplace(name, publish(name)).first->second;
    }

    void set_level(spdlog::level::level_enum level) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config.level = level;
        for (auto& entry : m_loggers) {
            entry.second->set_level(level);
        }
    }

private:
    /// Build a logger from the current config and hand it to spdlog (mutex held)
    std::shared_ptr<spdlog::logger> publish(const std::string& name) const {
        std::vector<spdlog::sink_ptr> sinks;

        if (m_config.console_enabled) {
            auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
            sinks.push_back(std::move(console));
        }

        if (m_config.file_enabled && !m_config.log_directory.empty()) {
            auto path = std::filesystem::path(m_config.log_directory) / (name + ".log");
            try {
                auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    path.string(), m_config.max_file_size, m_config.max_files);
                file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
                sinks.push_back(std::move(file));
            } catch (const spdlog::spdlog_ex& ex) {
                spdlog::warn("Logger '{}' has no file sink: {}", name, ex.what());
            }
        }

        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(m_config.level);

        // Replace any logger of the same name created through spdlog directly
        spdlog::drop(name);
        spdlog::register_logger(logger);
        return logger;
    }

    std::mutex m_mutex;
    LogConfig m_config;
    std::map<std::string, std::shared_ptr<spdlog::logger>> m_loggers;
};

} // anonymous namespace

void configure_logging(const LogConfig& config) {
    LoggerRegistry::instance().configure(config);
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    return LoggerRegistry::instance().get(name);
}

std::shared_ptr<spdlog::logger> core_logger() {
    return get_logger("habitat_core");
}

std::shared_ptr<spdlog::logger> ecs_logger() {
    return get_logger("habitat_ecs");
}

std::shared_ptr<spdlog::logger> grid_logger() {
    return get_logger("habitat_grid");
}

void set_global_log_level(spdlog::level::level_enum level) {
    LoggerRegistry::instance().set_level(level);
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    for (const auto& entry : LEVEL_NAMES) {
        if (str == entry.name) {
            return entry.level;
        }
    }
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    for (const auto& entry : LEVEL_NAMES) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "unknown";
}

void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields)
{
    auto logger = get_logger(logger_name);
    if (!logger->should_log(level)) {
        return;
    }

    fmt::memory_buffer line;
    fmt::format_to(std::back_inserter(line), "{}", message);
    const char* separator = " {";
    for (const auto& [key, value] : fields) {
        fmt::format_to(std::back_inserter(line), "{}{}=\"{}\"", separator, key, value);
        separator = ", ";
    }
    if (!fields.empty()) {
        line.push_back('}');
    }

    logger->log(level, fmt::to_string(line));
}

} // namespace habitat_core
