/**
 * @file ControlMapperApp.hpp
 * @brief Command-line front end of the control mapper.
 */

#pragma once

#include <string>
#include <vector>
#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace controlmapper::app {

/**
 * @class ControlMapperApp
 * @brief Parses the command line, wires the services and runs one command.
 */
class ControlMapperApp {
public:
    /**
     * @brief Runs the command given on the command line.
     * @return Exit code (0 for success, 1 on usage or fatal errors).
     */
    int Run(int argc, char** argv);

private:
    /** @brief Loads configuration and builds the composition root. */
    void Init(const std::string& configPath);

    int RunEmbed();
    int RunIngestPolicy(const std::vector<std::string>& args);
    int RunMap(const std::vector<std::string>& args);
    int RunValidate(const std::vector<std::string>& args);
    int RunRegistrySummary();

    static void PrintUsage();

    infrastructure::AppConfig m_config;
    application::AppServices m_services;
};

} // namespace controlmapper::app
