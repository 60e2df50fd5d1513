/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef LOCKER_CONFIG_H
#define LOCKER_CONFIG_H

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <util.h>

namespace DeskLocker {

//! The locker started when none is configured.
extern const char* const DEFAULT_LOCKER_COMMAND;

//! The environment variable through which xss-lock style lockers find the inherited inhibitor descriptor.
extern const char* const DEFAULT_SLEEP_LOCK_FD_ENV;

//!
//! \brief Splits a command line into an argument vector using shell quoting rules (no expansion is performed).
//! \param command_line
//! \return argument vector, empty if the command line is blank. Throws DeskLockerException on unbalanced quotes.
//!
std::vector<std::string> ParseCommandLine(const std::string& command_line);

//!
//! \brief Command line settings for the daemon. Unset members leave the config file value in place.
//!
struct CommandLineOptions
{
    std::optional<fs::path> m_config_file;
    std::optional<bool> m_pass_inhibitor;
    std::optional<bool> m_manage_idle_hint;
    std::optional<bool> m_monitor_screensaver;
    std::optional<bool> m_debug;
    bool m_show_version = false;
    bool m_show_help = false;

    //! Everything after the options (after "--" if given). Replaces locker_command when not empty.
    std::vector<std::string> m_locker_command;
};

//!
//! \brief Parses the daemon command line. Option parsing stops at the first non-option argument so that the locker
//! command keeps its own options.
//! \return the parsed options. Throws DeskLockerException on an unknown option or a missing option argument.
//!
CommandLineOptions ParseCommandLineOptions(int argc, char* argv[]);

//!
//! \brief Applies the command line overrides to the processed config.
//!
void ApplyCommandLineOptions(const CommandLineOptions& options, Config& config);

//!
//! \brief Lists the session actions in configured order, followed by custom actions the order does not mention.
//! \param order
//! \param custom_actions name to shell command
//! \return action names without duplicates
//!
std::vector<std::string> ListSessionActions(const std::vector<std::string>& order,
                                            const std::map<std::string, std::string>& custom_actions);

} // namespace DeskLocker

//!
//! \brief The DeskLockerConfig class. This specializes the Config class and implements the virtual method ProcessArgs()
//! for the desk_locker daemon.
//!
class DeskLockerConfig : public Config
{
    //!
    //! \brief The is the ProcessArgs() implementation for desk_locker.
    //!
    void ProcessArgs() override;
};

//!
//! \brief The SessionActionConfig class. This specializes the Config class and implements the virtual method
//! ProcessArgs() for desk_session_action. Custom actions (action.<name> keys) are read with GetArgsWithPrefix().
//!
class SessionActionConfig : public Config
{
    //!
    //! \brief The is the ProcessArgs() implementation for desk_session_action.
    //!
    void ProcessArgs() override;
};

#endif // LOCKER_CONFIG_H
