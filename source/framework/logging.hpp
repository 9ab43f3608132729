#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <unordered_map>
#include <utility>

/**
 * Owns one spdlog logger per subsystem, all writing to a common sink.
 *
 * Loggers are created by the frontend and passed down by reference; library
 * code never looks them up globally.
 */
class LogManager {
    spdlog::sink_ptr sink;
    spdlog::level::level_enum level = spdlog::level::info;
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;

public:
    LogManager(spdlog::sink_ptr sink_) : sink(sink_) {
    }

    /// Applies to all registered loggers as well as to those registered later on
    void SetLevel(spdlog::level::level_enum new_level) {
        level = new_level;
        for (auto& logger : loggers) {
            logger.second->set_level(level);
        }
    }

    std::shared_ptr<spdlog::logger> GetLogger(const std::string& name) {
        return loggers.at(name);
    }

    std::shared_ptr<spdlog::logger> RegisterLogger(std::string name) {
        auto logger = std::make_shared<spdlog::logger>(name, sink);
        logger->set_pattern("[%n] [%l] %v");
        logger->set_level(level);
        auto ret = loggers.emplace(std::move(name), std::move(logger));
        return ret.first->second;
    }
};
