#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace refiner::runtime::config {
class RuntimeConfig;
}

namespace refiner::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

// key=value pairs separated by spaces; values with spaces, quotes or '='
// are double-quoted so warnings carrying feed errors stay parseable.
std::string FormatFields(std::initializer_list<LogField> fields);

// Throws util::InvalidConfig for names spdlog does not know.
spdlog::level::level_enum ParseLevel(std::string_view name);

// Level and pattern come from REFINER_LOG_LEVEL / REFINER_LOG_PATTERN,
// then the logging section of the config.
void InitializeLogging(const refiner::runtime::config::RuntimeConfig& config);

// Console logger for tools that run without a config file.
void InitializeDefaultLogging(std::string_view level = "warn");
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace refiner::observability

#define REFINER_LOG_DEBUG(message, ...) ::refiner::observability::Log(spdlog::level::debug, (message), ##__VA_ARGS__)
#define REFINER_LOG_INFO(message, ...) ::refiner::observability::Log(spdlog::level::info, (message), ##__VA_ARGS__)
#define REFINER_LOG_WARN(message, ...) ::refiner::observability::Log(spdlog::level::warn, (message), ##__VA_ARGS__)
#define REFINER_LOG_ERROR(message, ...) ::refiner::observability::Log(spdlog::level::err, (message), ##__VA_ARGS__)
