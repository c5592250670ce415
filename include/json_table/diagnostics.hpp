#pragma once
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace jt {

enum class DiagLevel { Info, Warning };

std::string_view to_string(DiagLevel level) noexcept;

struct Diagnostic {
  DiagLevel level = DiagLevel::Info;
  std::string message;
};

// Side channel for the row limit policy. Implementations must tolerate
// concurrent calls from independent conversions.
using DiagnosticSink = std::function<void(DiagLevel, std::string_view)>;

// "[tag] warning: ..." on std::cerr, serialized by a process-wide mutex.
DiagnosticSink stderr_sink(std::string tag = "jsontable");

// Drops everything.
DiagnosticSink null_sink();

// Collects diagnostics in arrival order.
class DiagnosticLog {
public:
  DiagnosticSink sink();
  void add(DiagLevel level, std::string_view message);

  std::vector<Diagnostic> entries() const;
  std::size_t size() const;

private:
  mutable std::mutex mu_;
  std::vector<Diagnostic> entries_;
};

}
