#ifndef TABSIGHT_EXCEPTIONS_H
#define TABSIGHT_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Tabsight {

class TabsightException : public std::runtime_error {
public:
    explicit TabsightException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public TabsightException {
public:
    explicit IOException(const std::string& message) : TabsightException("IO Error: " + message) {}
};

class DatasetException : public TabsightException {
public:
    explicit DatasetException(const std::string& message) : TabsightException("Dataset Error: " + message) {}
};

class ConfigurationException : public TabsightException {
public:
    explicit ConfigurationException(const std::string& message) : TabsightException("Configuration Error: " + message) {}
};

// Raised only for the fatal outcome: nothing usable survived cleaning.
class ProfilingException : public TabsightException {
public:
    ProfilingException(const std::string& datasetId, const std::string& message)
        : TabsightException("Profiling Error [" + datasetId + "]: " + message), datasetId_(datasetId) {}

    const std::string& datasetId() const noexcept { return datasetId_; }

private:
    std::string datasetId_;
};

} // namespace Tabsight

#endif // TABSIGHT_EXCEPTIONS_H
