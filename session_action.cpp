/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <locker_config.h>
#include <logind.h>
#include <release.h>
#include <util.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <sys/wait.h>

using namespace DeskLocker;

//! Global config singleton for desk_session_action
SessionActionConfig g_config;

namespace {
//! Built-in actions that map onto a logind Manager power method.
const std::map<std::string, std::string> POWER_ACTIONS = {
    {"suspend", "Suspend"},
    {"hibernate", "Hibernate"},
    {"reboot", "Reboot"},
    {"shutdown", "PowerOff"}
};

void PrintUsage(const char* program)
{
    std::cout << "Usage: " << program << " [-c FILE] [--list] ACTION\n"
              << "\n"
              << "Built-in actions: lock, quit, suspend, hibernate, reboot, shutdown.\n"
              << "Custom actions are defined in the config file as action.<name>=<shell command>.\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config FILE  read configuration from FILE\n"
              << "  -l, --list         print the available actions in configured order\n"
              << "  -d, --debug        enable debug logging\n"
              << "  -v, --version      print the version and exit\n"
              << "  -h, --help         print this help and exit\n";
}

//!
//! \brief Runs a command through /bin/sh and waits for it.
//! \return 0 if the command exited with status 0, 1 otherwise.
//!
int RunShellCommand(const std::string& command)
{
    debug_log("INFO: %s: running \"%s\"", __func__, command);

    int status = std::system(command.c_str());

    if (status == -1) {
        error_log("%s: unable to run \"%s\": %s", __func__, command, strerror(errno));
        return 1;
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        error_log("%s: \"%s\" failed with status %i", __func__, command, status);
        return 1;
    }

    return 0;
}
} // anonymous namespace

//!
//! \brief This is the main function for desk_session_action
//! \param argc
//! \param argv
//! \return exit code
//!
int main(int argc, char* argv[])
{
    static const struct option long_options[] = {
        {"config",  required_argument, nullptr, 'c'},
        {"list",    no_argument,       nullptr, 'l'},
        {"debug",   no_argument,       nullptr, 'd'},
        {"version", no_argument,       nullptr, 'v'},
        {"help",    no_argument,       nullptr, 'h'},
        {nullptr,   0,                 nullptr, 0}
    };

    fs::path config_file_path;
    bool list = false;
    bool debug = false;
    int opt = 0;

    while ((opt = getopt_long(argc, argv, "c:ldvh", long_options, nullptr)) != -1) {
        switch (opt) {
        case 'c':
            config_file_path = optarg;
            break;
        case 'l':
            list = true;
            break;
        case 'd':
            debug = true;
            break;
        case 'v':
            std::cout << "desk_session_action " << g_version << std::endl;
            return 0;
        case 'h':
            PrintUsage(argv[0]);
            return 0;
        default:
            PrintUsage(argv[0]);
            return 1;
        }
    }

    if (!config_file_path.empty() && !(fs::exists(config_file_path) && fs::is_regular_file(config_file_path))) {
        log("WARNING: %s: Argument invalid for config file. Using defaults.",
            __func__);

        config_file_path = "";
    }

    g_config.ReadAndUpdateConfig(config_file_path);

    g_debug = debug || std::get<bool>(g_config.GetArg("debug"));

    std::vector<std::string> order = std::get<std::vector<std::string>>(g_config.GetArg("order"));
    std::map<std::string, std::string> custom_actions = g_config.GetArgsWithPrefix("action.");

    if (list) {
        for (const auto& action : ListSessionActions(order, custom_actions)) {
            std::cout << action << std::endl;
        }

        return 0;
    }

    if (optind != argc - 1) {
        error_log("%s: Exactly one action must be specified.", __func__);
        PrintUsage(argv[0]);
        return 1;
    }

    std::string action = ToLower(argv[optind]);

    // Custom actions take precedence, so that a built-in can be overridden from the config file.
    auto custom_action = custom_actions.find(action);

    if (custom_action != custom_actions.end()) {
        return RunShellCommand(custom_action->second);
    }

    if (action == "quit") {
        std::string quit_command = std::get<std::string>(g_config.GetArg("quit_command"));

        if (quit_command.empty()) {
            error_log("%s: quit_command is not set in the config file.", __func__);
            return 1;
        }

        return RunShellCommand(quit_command);
    }

    auto power_action = POWER_ACTIONS.find(action);

    if (action != "lock" && power_action == POWER_ACTIONS.end()) {
        error_log("%s: Unknown action: %s", __func__, action);
        return 1;
    }

    try {
        LogindClient logind_client;
        logind_client.Connect();

        if (action == "lock") {
            logind_client.LockSession(SessionId::FromEnvironment());
        } else {
            logind_client.CallPowerAction(power_action->second);
        }
    } catch (DeskLockerException& e) {
        error_log("%s: %s", __func__, e.what());
        return 1;
    }

    log("INFO: %s: %s requested", __func__, action);

    return 0;
}
