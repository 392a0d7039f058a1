#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace upload::observability {
namespace {

constexpr const char* kLoggerName     = "upload-manager";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::string EnvOr(const char* name, const std::string& fallback) {
  if (const char* value = std::getenv(name)) {
    return value;
  }
  return fallback;
}

bool ResolveTraceContextEnabled(const upload::runtime::config::RuntimeConfig& config) {
  if (const char* include_trace = std::getenv("UPLOAD_LOG_INCLUDE_TRACE_CONTEXT")) {
    return std::string(include_trace) == "1" || std::string(include_trace) == "true";
  }
  return config.logging().include_trace_context();
}

bool g_include_trace_context{false};

bool NeedsQuoting(const std::string& value) {
  return value.empty() || value.find_first_of(" \t\n\"=") != std::string::npos;
}

void AppendQuoted(fmt::memory_buffer& out, const std::string& value) {
  out.push_back('"');
  for (char c : value) {
    switch (c) {
      case '"':
        fmt::format_to(std::back_inserter(out), "\\\"");
        break;
      case '\\':
        fmt::format_to(std::back_inserter(out), "\\\\");
        break;
      case '\n':
        fmt::format_to(std::back_inserter(out), "\\n");
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
}

void AppendFields(fmt::memory_buffer& out, std::initializer_list<LogField> fields) {
  for (const auto& field : fields) {
    fmt::format_to(std::back_inserter(out), " {}=", field.key);
    if (NeedsQuoting(field.value)) {
      AppendQuoted(out, field.value);
    } else {
      fmt::format_to(std::back_inserter(out), "{}", field.value);
    }
  }
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

void AppendTraceContext(fmt::memory_buffer& out) {
  if (!g_include_trace_context) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  fmt::format_to(std::back_inserter(out), " trace_id={} span_id={}", HexId(trace_bytes, 16), HexId(span_bytes, 8));
}
#else
void AppendTraceContext(fmt::memory_buffer&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField SizeField(std::string_view key, std::uint64_t bytes) {
  return {std::string(key), std::to_string(bytes)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField UrlField(std::string_view key, std::string_view url) {
  const auto query = url.find_first_of("?#");
  return {std::string(key), std::string(url.substr(0, query))};
}

void InitializeLogging(const upload::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  const auto file_path = EnvOr("UPLOAD_LOG_FILE", logging.file_path());
  if (!file_path.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path));
  }

  spdlog::drop(kLoggerName);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(EnvOr("UPLOAD_LOG_PATTERN", logging.pattern().empty() ? kDefaultPattern : logging.pattern()));
  logger->set_level(spdlog::level::from_str(EnvOr("UPLOAD_LOG_LEVEL", logging.level().empty() ? "info" : logging.level())));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = ResolveTraceContextEnabled(config);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  fmt::memory_buffer line;
  fmt::format_to(std::back_inserter(line), "{}", message);
  AppendFields(line, fields);
  AppendTraceContext(line);
  spdlog::log(level, "{}", fmt::to_string(line));
}

} // namespace upload::observability
