#pragma once

#include <string>
#include <vector>

enum class DiagnosticSeverity { INFO, WARNING };

struct Diagnostic {
    DiagnosticSeverity severity = DiagnosticSeverity::INFO;
    std::string stage;
    std::string message;
};

// Accumulates non-fatal findings of one run. Each entry is also forwarded to the Logger.
class Diagnostics {
public:
    void info(const std::string& stage, const std::string& message);
    void warn(const std::string& stage, const std::string& message);

    const std::vector<Diagnostic>& entries() const noexcept { return entries_; }
    size_t warningCount() const noexcept;
    bool hasWarnings() const noexcept { return warningCount() > 0; }

    // "stage: message" for every warning, in insertion order.
    std::vector<std::string> warningMessages() const;

private:
    std::vector<Diagnostic> entries_;
};
