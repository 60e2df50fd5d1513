/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <locker_config.h>

#include <algorithm>
#include <getopt.h>

#include <glib.h>

const char* const DeskLocker::DEFAULT_LOCKER_COMMAND = "xsecurelock";
const char* const DeskLocker::DEFAULT_SLEEP_LOCK_FD_ENV = "XSS_SLEEP_LOCK_FD";

std::vector<std::string> DeskLocker::ParseCommandLine(const std::string& command_line)
{
    std::vector<std::string> argv_out;

    if (TrimString(command_line).empty()) {
        return argv_out;
    }

    gint argc = 0;
    gchar** argv = nullptr;
    GError* error = nullptr;

    if (!g_shell_parse_argv(command_line.c_str(), &argc, &argv, &error)) {
        std::string message = error ? error->message : "unknown error";

        if (error) {
            g_error_free(error);
        }

        throw DeskLockerException("Unable to parse command line \"" + command_line + "\": " + message);
    }

    for (gint i = 0; i < argc; ++i) {
        argv_out.push_back(argv[i]);
    }

    g_strfreev(argv);

    return argv_out;
}

//!
//! \brief Names the option getopt_long() just rejected. optopt is set for short options only.
//!
static std::string OffendingOption(char* argv[])
{
    if (optopt != 0) {
        return std::string("-") + static_cast<char>(optopt);
    }

    return optind > 0 ? std::string(argv[optind - 1]) : std::string();
}

DeskLocker::CommandLineOptions DeskLocker::ParseCommandLineOptions(int argc, char* argv[])
{
    enum LongOnlyOption {
        OPT_PASS_INHIBITOR = 256,
        OPT_NO_PASS_INHIBITOR,
        OPT_IDLE_HINT,
        OPT_NO_IDLE_HINT,
        OPT_NO_SCREENSAVER
    };

    static const struct option long_options[] = {
        {"config",             required_argument, nullptr, 'c'},
        {"pass-inhibitor",     no_argument,       nullptr, OPT_PASS_INHIBITOR},
        {"no-pass-inhibitor",  no_argument,       nullptr, OPT_NO_PASS_INHIBITOR},
        {"idle-hint",          no_argument,       nullptr, OPT_IDLE_HINT},
        {"no-idle-hint",       no_argument,       nullptr, OPT_NO_IDLE_HINT},
        {"no-screensaver",     no_argument,       nullptr, OPT_NO_SCREENSAVER},
        {"debug",              no_argument,       nullptr, 'd'},
        {"version",            no_argument,       nullptr, 'v'},
        {"help",               no_argument,       nullptr, 'h'},
        {nullptr,              0,                 nullptr, 0}
    };

    CommandLineOptions options;

    // optind = 0 makes getopt reinitialize, so that the parser can be run more than once in one process.
    optind = 0;
    opterr = 0;

    int opt = 0;

    // Leading '+' stops at the first non-option, which starts the locker command.
    while ((opt = getopt_long(argc, argv, "+:c:dvh", long_options, nullptr)) != -1) {
        switch (opt) {
        case 'c':
            options.m_config_file = fs::path(optarg);
            break;
        case OPT_PASS_INHIBITOR:
            options.m_pass_inhibitor = true;
            break;
        case OPT_NO_PASS_INHIBITOR:
            options.m_pass_inhibitor = false;
            break;
        case OPT_IDLE_HINT:
            options.m_manage_idle_hint = true;
            break;
        case OPT_NO_IDLE_HINT:
            options.m_manage_idle_hint = false;
            break;
        case OPT_NO_SCREENSAVER:
            options.m_monitor_screensaver = false;
            break;
        case 'd':
            options.m_debug = true;
            break;
        case 'v':
            options.m_show_version = true;
            break;
        case 'h':
            options.m_show_help = true;
            break;
        case ':':
            throw DeskLockerException("Option " + OffendingOption(argv) + " requires an argument.");
        default:
            throw DeskLockerException("Unknown option " + OffendingOption(argv) + ".");
        }
    }

    for (int i = optind; i < argc; ++i) {
        options.m_locker_command.push_back(argv[i]);
    }

    return options;
}

void DeskLocker::ApplyCommandLineOptions(const CommandLineOptions& options, Config& config)
{
    if (options.m_debug) {
        config.SetArg("debug", *options.m_debug);
    }

    if (options.m_pass_inhibitor) {
        config.SetArg("pass_inhibitor", *options.m_pass_inhibitor);
    }

    if (options.m_manage_idle_hint) {
        config.SetArg("manage_idle_hint", *options.m_manage_idle_hint);
    }

    if (options.m_monitor_screensaver) {
        config.SetArg("monitor_screensaver", *options.m_monitor_screensaver);
    }

    if (!options.m_locker_command.empty()) {
        config.SetArg("locker_command", options.m_locker_command);
    }
}

std::vector<std::string> DeskLocker::ListSessionActions(const std::vector<std::string>& order,
                                                        const std::map<std::string, std::string>& custom_actions)
{
    std::vector<std::string> actions;

    for (const auto& action : order) {
        if (std::find(actions.begin(), actions.end(), action) == actions.end()) {
            actions.push_back(action);
        }
    }

    for (const auto& [name, command] : custom_actions) {
        if (std::find(actions.begin(), actions.end(), name) == actions.end()) {
            actions.push_back(name);
        }
    }

    return actions;
}

// DeskLockerConfig class

void DeskLockerConfig::ProcessArgs()
{
    // debug

    ProcessBoolArg("debug", false);

    // locker_command

    std::vector<std::string> locker_command;

    try {
        locker_command = DeskLocker::ParseCommandLine(GetArgString("locker_command", DeskLocker::DEFAULT_LOCKER_COMMAND));
    } catch (DeskLockerException& e) {
        error_log("%s: locker_command parameter in config file has invalid value: %s",
                  __func__,
                  e.what());

        locker_command = {DeskLocker::DEFAULT_LOCKER_COMMAND};
    }

    m_config.insert(std::make_pair("locker_command", locker_command));

    // pass_inhibitor, manage_idle_hint, monitor_screensaver

    ProcessBoolArg("pass_inhibitor", true);
    ProcessBoolArg("manage_idle_hint", true);
    ProcessBoolArg("monitor_screensaver", true);

    // inhibitor_who, inhibitor_why

    m_config.insert(std::make_pair("inhibitor_who", GetArgString("inhibitor_who", "desk-locker")));
    m_config.insert(std::make_pair("inhibitor_why", GetArgString("inhibitor_why", "Lock screen on sleep")));

    // sleep_lock_fd_env

    std::string sleep_lock_fd_env = GetArgString("sleep_lock_fd_env", DeskLocker::DEFAULT_SLEEP_LOCK_FD_ENV);

    if (sleep_lock_fd_env.empty() || sleep_lock_fd_env.find('=') != std::string::npos) {
        error_log("%s: sleep_lock_fd_env parameter in config file has invalid value: %s",
                  __func__,
                  sleep_lock_fd_env);

        sleep_lock_fd_env = DeskLocker::DEFAULT_SLEEP_LOCK_FD_ENV;
    }

    m_config.insert(std::make_pair("sleep_lock_fd_env", sleep_lock_fd_env));

    // locker_stop_timeout_ms

    int locker_stop_timeout_ms = 2000;

    try {
        locker_stop_timeout_ms = ParseStringToInt(GetArgString("locker_stop_timeout_ms", "2000"));
    } catch (std::exception& e) {
        error_log("%s: locker_stop_timeout_ms parameter in config file has invalid value: %s",
                  __func__,
                  e.what());
    }

    if (locker_stop_timeout_ms < 0) {
        error_log("%s: locker_stop_timeout_ms parameter in config file is negative, using 0.",
                  __func__);

        locker_stop_timeout_ms = 0;
    }

    m_config.insert(std::make_pair("locker_stop_timeout_ms", locker_stop_timeout_ms));
}

// SessionActionConfig class

void SessionActionConfig::ProcessArgs()
{
    // debug

    ProcessBoolArg("debug", false);

    // quit_command

    m_config.insert(std::make_pair("quit_command", GetArgString("quit_command", "")));

    // order

    std::vector<std::string> order;

    for (const auto& action : StringSplit(GetArgString("order", "lock,quit,suspend,hibernate,reboot,shutdown"), ",")) {
        std::string trimmed = ToLower(TrimString(action));

        if (!trimmed.empty()) {
            order.push_back(trimmed);
        }
    }

    m_config.insert(std::make_pair("order", order));
}
