#include "Diagnostics.h"
#include "Logger.h"

#include <algorithm>

void Diagnostics::info(const std::string& stage, const std::string& message) {
    entries_.push_back({DiagnosticSeverity::INFO, stage, message});
    Logger::info(stage, message);
}

void Diagnostics::warn(const std::string& stage, const std::string& message) {
    entries_.push_back({DiagnosticSeverity::WARNING, stage, message});
    Logger::warn(stage, message);
}

size_t Diagnostics::warningCount() const noexcept {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(), [](const Diagnostic& d) {
        return d.severity == DiagnosticSeverity::WARNING;
    }));
}

std::vector<std::string> Diagnostics::warningMessages() const {
    std::vector<std::string> out;
    for (const auto& d : entries_) {
        if (d.severity != DiagnosticSeverity::WARNING) continue;
        out.push_back(d.stage + ": " + d.message);
    }
    return out;
}
