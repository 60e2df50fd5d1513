/*
 * Copyright (C) 2025 James C. Owens
 * Portions Copyright (c) 2019 The Bitcoin Core developers
 * Portions Copyright (c) 2025 The Gridcoin developers
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef UTIL_H
#define UTIL_H

#include <atomic>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <tinyformat.h>
#include <variant>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

extern std::atomic<bool> g_debug;
extern std::atomic<bool> g_log_timestamps;

//!
//! /brief Locale-independent version of std::to_string
//!
template <typename T>
std::string ToString(const T& t)
{
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << t;
    return oss.str();
}

//!
//! \brief Utility function to split string by the provided delimiter. Note that no trimming is done to remove white space.
//! \param s: the string to split
//! \param delim: the delimiter string
//! \return std::vector of string parts
//!
[[nodiscard]] std::vector<std::string> StringSplit(const std::string& s, const std::string& delim);

//!
//! \brief Utility function to trim whitespace from the beginning and end of a string.
//! \param str: the string to trim
//! \param pattern: the pattern to trim, defaulting to " \f\n\r\t\v"
//! \return trimmed string
//!
[[nodiscard]] std::string TrimString(const std::string& str, const std::string& pattern = " \f\n\r\t\v");

//!
//! \brief Utility function to remove a matching pair of enclosing single or double quotes from a string. This is
//! especially useful when dealing with quoted values in a config file.
//! \param str: the input string with potential quotes to remove
//! \return the string with any enclosing quotes removed
//!
[[nodiscard]] std::string StripQuotes(const std::string& str);

/**
 * Returns the lowercase equivalent of the given string.
 * This function is locale independent. It only converts uppercase
 * characters in the standard 7-bit ASCII range.
 * This is a feature, not a limitation.
 *
 * @param[in] str   the string to convert to lowercase.
 * @returns         lowercased equivalent of str
 */
std::string ToLower(const std::string& str);

//!
//! \brief Returns number of seconds since the beginning of the Unix Epoch.
//! \return int64_t seconds.
//!
int64_t GetUnixEpochTime();

//!
//! \brief Formats input unix epoch time in human readable format.
//! \param int64_t seconds.
//! \return ISO8601 conformant datetime string.
//!
std::string FormatISO8601DateTime(int64_t time);

template <typename... Args>
//!
//! \brief Creates a string with fmt specifier and variadic args.
//! \param fmt specifier
//! \param args... variadic
//! \return formatted std::string
//!
static inline std::string LogPrintStr(const char* fmt, const Args&... args)
{
    std::string log_msg;

    // Conditionally add timestamp prefix based on g_log_timestamps flag.
    if (g_log_timestamps.load(std::memory_order_relaxed)) {
        log_msg = FormatISO8601DateTime(GetUnixEpochTime()) + " ";
    }

    try {
        log_msg += tfm::format(fmt, args...);
    } catch (tinyformat::format_error& fmterr) {
        /* Original format string will have newline so don't add one here */
        log_msg += "Error \"" + std::string(fmterr.what()) + "\" while formatting log message: " + fmt;
    }

    log_msg += "\n";

    return log_msg;
}

template <typename... Args>
//!
//! \brief LogPrintStr directed to cout.
//! \param fmt
//! \param args
//!
void log(const char* fmt, const Args&... args)
{
    std::cout << LogPrintStr(fmt, args...) << std::flush;
}

template <typename... Args>
//!
//! \brief LogPrintStr directed to cout, conditioned on the debug setting.
//! \param fmt
//! \param args
//!
void debug_log(const char* fmt, const Args&... args)
{
    if (g_debug.load()) {
        log(fmt, args...);
    }
}

template <typename... Args>
//!
//! \brief LogPrintStr directed to cerr
//! \param fmt
//! \param args
//!
void error_log(const char* fmt, const Args&... args)
{
    std::string error_fmt = "ERROR: ";
    error_fmt += fmt;

    std::cerr << LogPrintStr(error_fmt.c_str(), args...);
}

[[nodiscard]] int ParseStringToInt(const std::string& str);

//!
//! \brief Parses a boolean config/command line value. Accepts 1/0 and true/false (case-insensitive).
//! \param str
//! \return std::nullopt if the string is not a recognized boolean.
//!
[[nodiscard]] std::optional<bool> ParseStringToBool(const std::string& str);

//!
//! \brief Safely get an enviroment variable value from the provided name
//! \param std::string of the name of the variable to retrieve
//! \return std::string of the value of the requested variable. std::nullopt if not found or empty.
//!
std::optional<std::string> GetEnvVariable(const std::string& var_name);

//!
//! \brief The DeskLockerException class is the base exception class for the desk_locker applications.
//!
class DeskLockerException : public std::exception
{
public:
    DeskLockerException(const std::string& message) : m_message(message) {}
    DeskLockerException(const char* message) : m_message(message) {}

    const char* what() const noexcept override {
        return m_message.c_str();
    }

protected:
    std::string m_message;
};

//! Threading Related Exceptions
class ThreadException : public DeskLockerException
{
public:
    ThreadException(const std::string& message) : DeskLockerException(message) {}
};

//! An event source lost (or could not establish) its connection. Fatal.
class ConnectionError : public DeskLockerException
{
public:
    ConnectionError(const std::string& message) : DeskLockerException(message) {}
};

//! The session manager refused a sleep inhibitor. Non-fatal.
class AcquisitionDenied : public DeskLockerException
{
public:
    AcquisitionDenied(const std::string& message) : DeskLockerException(message) {}
};

//! The locker process could not be started. Fatal.
class SpawnError : public DeskLockerException
{
public:
    SpawnError(const std::string& message) : DeskLockerException(message) {}
};

//! The idle hint could not be published. Non-fatal.
class PublishError : public DeskLockerException
{
public:
    PublishError(const std::string& message) : DeskLockerException(message) {}
};

typedef std::variant<bool, int, std::string, fs::path, std::vector<std::string>> config_variant;

//!
//! \brief Base class for key=value configuration. Raw values come from the config file; a derived class turns them
//! into typed values in ProcessArgs(), substituting defaults for anything missing or malformed.
//!
class Config
{
public:
    Config();

    virtual ~Config() = default;

    //!
    //! \brief Loads the raw key=value pairs from config_file into m_config_in and rebuilds m_config through
    //! ProcessArgs(). A missing or unreadable file leaves m_config_in empty, so every parameter gets its default.
    //! \param config_file path to the file. An empty path skips reading.
    //!
    void ReadAndUpdateConfig(const fs::path& config_file);

    //!
    //! \brief Typed value of a processed parameter.
    //! \param arg key
    //! \return the config_variant for arg, or an empty string variant if arg is unknown.
    //!
    config_variant GetArg(const std::string& arg);

    //!
    //! \brief Replaces the processed value of a parameter. This is used to apply command line overrides after the
    //! config file has been read.
    //! \param arg (key)
    //! \param value
    //!
    void SetArg(const std::string& arg, const config_variant& value);

    //!
    //! \brief Returns the raw (unprocessed) parameter-values from the config file whose key starts with the provided
    //! prefix. The prefix is removed from the returned keys.
    //! \param prefix
    //! \return std::map of key suffix to raw value.
    //!
    std::map<std::string, std::string> GetArgsWithPrefix(const std::string& prefix) const;

protected:
    //!
    //! \brief Raw string lookup in m_config_in for use from ProcessArgs().
    //! \param arg key
    //! \param default_value returned when the file did not set arg.
    //! \return the raw value or default_value.
    //!
    std::string GetArgString(const std::string& arg, const std::string& default_value) const;

    //!
    //! \brief Helper for ProcessArgs() implementations that converts a raw boolean parameter and inserts it into
    //! m_config, logging and falling back to the default on an invalid value.
    //! \param arg
    //! \param default_value
    //!
    void ProcessBoolArg(const std::string& arg, bool default_value);

    //!
    //! \brief Typed parameters, one entry per key known to the derived class.
    //!
    std::multimap<std::string, config_variant> m_config;

private:
    //!
    //! \brief Converts m_config_in into m_config. Called by ReadAndUpdateConfig() with mtx_config held.
    //!
    virtual void ProcessArgs() = 0;

    //! Guards m_config and m_config_in.
    mutable std::mutex mtx_config;

    //!
    //! \brief Raw key=value pairs as read from the file, quotes stripped.
    //!
    std::multimap<std::string, std::string> m_config_in;
};

#endif // UTIL_H
