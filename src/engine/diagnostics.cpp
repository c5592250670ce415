#include "json_table/diagnostics.hpp"
#include <iostream>
#include <utility>

namespace jt {

std::string_view to_string(DiagLevel level) noexcept {
  switch (level) {
    case DiagLevel::Warning: return "warning";
    case DiagLevel::Info:    return "info";
  }
  return "info";
}

static std::mutex& stderr_mutex() {
  static std::mutex mu;
  return mu;
}

DiagnosticSink stderr_sink(std::string tag) {
  return [tag = std::move(tag)](DiagLevel level, std::string_view msg) {
    std::lock_guard<std::mutex> lk(stderr_mutex());
    std::cerr << "[" << tag << "] " << to_string(level) << ": " << msg << "\n";
  };
}

DiagnosticSink null_sink() {
  return [](DiagLevel, std::string_view) {};
}

DiagnosticSink DiagnosticLog::sink() {
  return [this](DiagLevel level, std::string_view msg) { add(level, msg); };
}

void DiagnosticLog::add(DiagLevel level, std::string_view message) {
  std::lock_guard<std::mutex> lk(mu_);
  entries_.push_back(Diagnostic{level, std::string(message)});
}

std::vector<Diagnostic> DiagnosticLog::entries() const {
  std::lock_guard<std::mutex> lk(mu_);
  return entries_;
}

std::size_t DiagnosticLog::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return entries_.size();
}

}
