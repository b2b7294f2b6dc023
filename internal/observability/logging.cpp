#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace release::observability {
namespace {

constexpr std::size_t kDefaultMaxFileSizeMb = 16;
constexpr std::size_t kDefaultMaxFiles      = 3;

std::atomic<bool> g_include_trace_context{false};

std::string ResolveLevel(const release::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("RELEASE_LOG_LEVEL")) {
    return level;
  }
  if (!config.logging().level().empty()) {
    return config.logging().level();
  }
  return "info";
}

std::string ResolvePattern(const release::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("RELEASE_LOG_PATTERN")) {
    return pattern;
  }
  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }
  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";
}

bool ResolveTraceContextEnabled(const release::runtime::config::RuntimeConfig& config) {
  if (const char* include_trace = std::getenv("RELEASE_LOG_INCLUDE_TRACE_CONTEXT")) {
    return std::string(include_trace) == "1" || std::string(include_trace) == "true";
  }
  return config.logging().include_trace_context();
}

std::vector<spdlog::sink_ptr> BuildSinks(const release::runtime::config::LoggingConfig& logging) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  if (!logging.file_path().empty()) {
    const std::size_t max_mb    = logging.max_file_size_mb() > 0 ? logging.max_file_size_mb() : kDefaultMaxFileSizeMb;
    const std::size_t max_files = logging.max_files() > 0 ? logging.max_files() : kDefaultMaxFiles;
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logging.file_path(), max_mb * 1024 * 1024, max_files));
  }
  return sinks;
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

std::string TraceContextFields() {
  if (!g_include_trace_context.load(std::memory_order_relaxed)) {
    return {};
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return {};
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  return "trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
}
#else
std::string TraceContextFields() {
  return {};
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DurationField(std::string_view key, std::chrono::milliseconds value) {
  return {std::string(key), std::to_string(value.count()) + "ms"};
}

void InitializeLogging(const release::runtime::config::RuntimeConfig& config) {
  auto sinks  = BuildSinks(config.logging());
  auto logger = std::make_shared<spdlog::logger>("release-coordinator", sinks.begin(), sinks.end());
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));

  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context.store(ResolveTraceContextEnabled(config), std::memory_order_relaxed);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  const auto serialized_fields = SerializeFields(fields);
  const auto trace_fields      = TraceContextFields();

  if (serialized_fields.empty() && trace_fields.empty()) {
    spdlog::log(level, "{}", message);
    return;
  }
  if (trace_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  if (serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, trace_fields);
    return;
  }
  spdlog::log(level, "{} {} {}", message, serialized_fields, trace_fields);
}

} // namespace release::observability
