#include "Logger.h"
#include "ProfileConsole.h"
#include "ProfileJson.h"
#include "ProfileRegistry.h"
#include "ProfilerConfig.h"
#include "ProfilingEngine.h"
#include "TabsightExceptions.h"

#include <chrono>
#include <iostream>

namespace {
constexpr int kExitFatal = 1;
constexpr int kExitConfig = 2;
} // namespace

int main(int argc, char* argv[]) {
    ProfilerConfig config;
    try {
        config = ProfilerConfig::fromArgs(argc, argv);
    } catch (const Tabsight::ConfigurationException& e) {
        std::cerr << "[Tabsight] " << e.what() << "\n";
        return kExitConfig;
    }

    Logger::setLevel(config.effectiveLogLevel());
    const std::string datasetId = config.effectiveDatasetId();
    Logger::info("Main", "profiling '" + config.datasetPath + "' as dataset '" + datasetId + "'");

    try {
        const ProfilingEngine engine(config);
        ProfileRegistry registry(std::chrono::seconds(config.registryTtlSeconds));
        const auto profile = registry.getOrCompute(datasetId, [&]() {
            return engine.profileFile(config.datasetPath, datasetId);
        });

        ProfileConsole::printSummary(*profile);
        ProfileJson::save(*profile, config.outputPath);
        std::cout << "\n[Tabsight] Profile written to " << config.outputPath << "\n";
    } catch (const Tabsight::ConfigurationException& e) {
        Logger::error("Main", e.what());
        return kExitConfig;
    } catch (const Tabsight::TabsightException& e) {
        Logger::error("Main", e.what());
        return kExitFatal;
    } catch (const std::exception& e) {
        Logger::error("Main", std::string("unexpected failure: ") + e.what());
        return kExitFatal;
    }
    return 0;
}
