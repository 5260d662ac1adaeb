/**
 * @file ShipwrightApp.hpp
 * @brief Composition root and command-line front end.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "app/ConsoleEventSink.hpp"
#include "application/AppServices.hpp"

namespace shipwright::app {

/**
 * @class ShipwrightApp
 * @brief Wires the services together and routes `shipwright` subcommands.
 *
 * Exit codes: 0 success, 1 command failed, 2 usage error.
 */
class ShipwrightApp {
public:
    static constexpr int kExitSuccess = 0;
    static constexpr int kExitFailure = 1;
    static constexpr int kExitUsage = 2;

    ShipwrightApp();
    ~ShipwrightApp();

    int Run(int argc, char** argv);

private:
    void Init();

    int RunExport(const std::vector<std::string>& args);
    int RunCredential(const std::vector<std::string>& args);
    int RunPublish(const std::vector<std::string>& args);
    int RunDeploy(const std::vector<std::string>& args);

    static void PrintUsage(std::ostream& out);

    std::unique_ptr<ConsoleEventSink> m_sink;
    application::AppServices m_services;
};

} // namespace shipwright::app
