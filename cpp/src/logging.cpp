#include "internal.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <mutex>

namespace completion_repair {

namespace {

constexpr const char* kLoggerName = "completion_repair";

std::mutex& logger_mutex() {
  static std::mutex m;
  return m;
}

std::shared_ptr<spdlog::logger>& logger_slot() {
  static std::shared_ptr<spdlog::logger> slot;
  return slot;
}

const char* kind_name(ErrorDetail::Kind kind) { return kind == ErrorDetail::Kind::Parse ? "parse" : "validation"; }

std::string safe_file_part(const std::string& s) {
  std::string out;
  for (char c : s) out.push_back(detail::is_ident_char(c) || c == '-' || c == '.' ? c : '_');
  if (out.empty()) out = "unknown";
  if (out.size() > 64) out.resize(64);
  return out;
}

Json failure_document(const ErrorDetail& error, const std::string& raw, const LlmContext& context) {
  JsonObject ctx;
  ctx["resource"] = context.resource;
  for (const auto& kv : context.attributes) ctx[kv.first] = kv.second;

  JsonArray issues;
  for (const auto& issue : error.issues) {
    issues.push_back(JsonObject{{"path", issue.path}, {"message", issue.message}, {"kind", issue.kind}});
  }
  JsonArray diagnostics;
  for (const auto& d : error.diagnostics) diagnostics.push_back(d);

  JsonObject doc;
  doc["kind"] = kind_name(error.kind);
  doc["message"] = error.message;
  if (!error.cause.empty()) doc["cause"] = error.cause;
  doc["context"] = std::move(ctx);
  doc["issues"] = std::move(issues);
  doc["diagnostics"] = std::move(diagnostics);
  doc["raw"] = raw;
  return doc;
}

}  // namespace

std::shared_ptr<spdlog::logger> logger() {
  std::lock_guard<std::mutex> lock(logger_mutex());
  auto& slot = logger_slot();
  if (slot) return slot;
  slot = spdlog::get(kLoggerName);
  if (!slot) {
    try {
      slot = spdlog::stderr_color_mt(kLoggerName);
      slot->set_level(spdlog::level::warn);
    } catch (const spdlog::spdlog_ex&) {
      // Registered concurrently by someone else.
      slot = spdlog::get(kLoggerName);
    }
  }
  return slot;
}

void set_logger(std::shared_ptr<spdlog::logger> l) {
  std::lock_guard<std::mutex> lock(logger_mutex());
  logger_slot() = std::move(l);
}

void LogErrorLogger::record_parse_failure(const ErrorDetail& error, const std::string& raw,
                                          const LlmContext& context) noexcept {
  try {
    auto log = logger();
    if (!log) return;
    log->warn("{} failure for resource '{}': {}", kind_name(error.kind), context.resource, error.message);
    for (const auto& d : error.diagnostics) log->debug("  {}", d);
    log->debug("raw completion ({} bytes): {}", raw.size(), raw.substr(0, 500));
  } catch (const std::exception& e) {
    std::fprintf(stderr, "completion_repair: failed to log parse failure: %s\n", e.what());
  }
}

FileErrorLogger::FileErrorLogger(std::string directory) : directory_(std::move(directory)) {}

void FileErrorLogger::record_parse_failure(const ErrorDetail& error, const std::string& raw,
                                           const LlmContext& context) noexcept {
  try {
    namespace fs = std::filesystem;
    fs::create_directories(directory_);
    auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::system_clock::now().time_since_epoch())
                     .count();
    fs::path file = fs::path(directory_) / (safe_file_part(context.resource) + "-" + std::to_string(stamp) + "-" +
                                            std::to_string(recorded_) + ".json");
    std::ofstream out(file, std::ios::binary);
    if (!out) {
      if (auto log = logger()) log->error("cannot open error log file {}", file.string());
      return;
    }
    out << dumps_json(failure_document(error, raw, context)) << "\n";
    out.close();
    if (!out) {
      if (auto log = logger()) log->error("failed writing error log file {}", file.string());
      return;
    }
    ++recorded_;
    if (auto log = logger()) log->info("recorded {} failure for '{}' in {}", kind_name(error.kind), context.resource, file.string());
  } catch (const std::exception& e) {
    if (auto log = logger()) log->error("failed to record parse failure: {}", e.what());
  }
}

}  // namespace completion_repair
