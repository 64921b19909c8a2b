/**
 * @file SortwellApp.hpp
 * @brief Command-line front end over the scan / plan / execute / undo pipeline.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "infrastructure/ArtifactStore.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace sortwell::app {

/**
 * @class SortwellApp
 * @brief Parses the command line, wires the services from Settings and runs one subcommand.
 *
 * Every stage persists its artifact through the ArtifactStore so the next stage
 * (possibly in a later invocation) can pick it up by path.
 */
class SortwellApp {
public:
    /**
     * @brief Runs one subcommand.
     * @return Process exit code: 0 success, 1 runtime failure, 2 usage error.
     */
    int Run(int argc, char** argv);

private:
    bool Init(const std::string& configPath, const std::string& outputDir);

    int cmdScan(const std::vector<std::string>& args);
    int cmdPlan(const std::vector<std::string>& args);
    int cmdExecute(const std::vector<std::string>& args);
    int cmdUndo(const std::vector<std::string>& args);
    int cmdStatus(const std::vector<std::string>& args);

    static void PrintUsage();

    infrastructure::Settings m_settings;
    std::unique_ptr<infrastructure::ArtifactStore> m_store;
};

} // namespace sortwell::app
