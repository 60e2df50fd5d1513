/*
 * Copyright (C) 2025 James C. Owens
 * Portions Copyright (c) 2019 The Bitcoin Core developers
 * Portions Copyright (c) 2025 The Gridcoin developers
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <util.h>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <ctime>
#include <fstream>

//!
//! \brief This to support early use of the log utility functions before the config is read to get the
//! debug flag.
//!
std::atomic<bool> g_debug = false;

//!
//! \brief The flag controls the logging of timestamps by the log functions. This is used to suppress
//! timestamp output when run under systemd, where the journal appends a high resolution timestamp.
//!
std::atomic<bool> g_log_timestamps = true;

[[nodiscard]] std::vector<std::string> StringSplit(const std::string& s, const std::string& delim)
{
    size_t pos = 0;
    size_t end = 0;
    std::vector<std::string> elems;

    while((end = s.find(delim, pos)) != std::string::npos)
    {
        elems.push_back(s.substr(pos, end - pos));
        pos = end + delim.size();
    }

    // Append final value
    elems.push_back(s.substr(pos, end - pos));
    return elems;
}

[[nodiscard]] std::string TrimString(const std::string& str, const std::string& pattern)
{
    std::string::size_type front = str.find_first_not_of(pattern);
    if (front == std::string::npos) {
        return std::string();
    }
    std::string::size_type end = str.find_last_not_of(pattern);
    return str.substr(front, end - front + 1);
}

[[nodiscard]] std::string StripQuotes(const std::string& str)
{
    if (str.size() < 2) {
        return str;
    }

    // Only a matching pair is removed, so that quoting inside a value (a command line) survives.
    if ((str.front() == '"' || str.front() == '\'') && str.back() == str.front()) {
        return str.substr(1, str.size() - 2);
    }

    return str;
}

static constexpr char ToLower(char c)
{
    return (c >= 'A' && c <= 'Z' ? (c - 'A') + 'a' : c);
}

std::string ToLower(const std::string& str)
{
    std::string r;
    for (auto ch : str) r += ToLower(ch);
    return r;
}

int64_t GetUnixEpochTime()
{
    auto now = std::chrono::system_clock::now();

    return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

std::string FormatISO8601DateTime(int64_t time)
{
    struct tm ts;
    time_t time_val = time;
    if (gmtime_r(&time_val, &ts) == nullptr) {
        return {};
    }

    return strprintf("%04i-%02i-%02iT%02i:%02i:%02iZ",
                     ts.tm_year + 1900, ts.tm_mon + 1, ts.tm_mday, ts.tm_hour, ts.tm_min, ts.tm_sec);
}

[[nodiscard]] int ParseStringToInt(const std::string& str)
{
    try {
        return std::stoi(str);
    } catch (const std::invalid_argument& e){
        error_log("%s: Invalid argument: %s",
                  __func__,
                  e.what());
        throw;
    } catch (const std::out_of_range& e){
        error_log("%s: Out of range: %s",
                  __func__,
                  e.what());
        throw;
    }
}

[[nodiscard]] std::optional<bool> ParseStringToBool(const std::string& str)
{
    std::string lower = ToLower(TrimString(str));

    if (lower == "1" || lower == "true") {
        return true;
    } else if (lower == "0" || lower == "false") {
        return false;
    }

    return std::nullopt;
}

std::optional<std::string> GetEnvVariable(const std::string& var_name)
{
    const char* value = std::getenv(var_name.c_str());

    if (value == nullptr || value[0] == '\0') {
        return std::nullopt;
    }

    return std::string(value);
}

// Class Config

Config::Config()
{}

void Config::ReadAndUpdateConfig(const fs::path& config_file) {
    std::unique_lock<std::mutex> lock(mtx_config);

    std::multimap<std::string, std::string> config;

    if (!config_file.empty()) {
        try {
            std::ifstream file(config_file);

            if (!file.is_open()) {
                error_log("%s: Could not open the config file: %s",
                          __func__,
                          config_file);
            } else {
                std::string line;
                while (std::getline(file, line)) {
                    // Skip empty lines and lines starting with '#'
                    if (line.empty() || line[0] == '#') {
                        continue;
                    }

                    // Split at the first '=' only, so that values such as locker command lines may contain '='.
                    size_t separator = line.find('=');

                    if (separator == std::string::npos) {
                        continue;
                    }

                    std::string key = TrimString(line.substr(0, separator));

                    if (key.empty()) {
                        continue;
                    }

                    config.insert(std::make_pair(StripQuotes(key),
                                                 StripQuotes(TrimString(line.substr(separator + 1)))));
                }
            }
        } catch (std::exception& e) {
            error_log("%s: Reading config file failed, so defaults will be used: %s",
                      __func__,
                      e.what());
            config.clear();
        }
    }

    // Do this all at once so the result of the config read is essentially "atomic".
    m_config_in.swap(config);
    m_config.clear();

    // If the config file read failed, we will process args anyway, which will result in defaults being chosen.
    ProcessArgs();
}

config_variant Config::GetArg(const std::string& arg)
{
    std::unique_lock<std::mutex> lock(mtx_config);

    auto iter = m_config.find(arg);

    if (iter != m_config.end()) {
        return iter->second;
    } else {
        return std::string {};
    }
}

void Config::SetArg(const std::string& arg, const config_variant& value)
{
    std::unique_lock<std::mutex> lock(mtx_config);

    m_config.erase(arg);
    m_config.insert(std::make_pair(arg, value));
}

std::map<std::string, std::string> Config::GetArgsWithPrefix(const std::string& prefix) const
{
    std::unique_lock<std::mutex> lock(mtx_config);

    std::map<std::string, std::string> out;

    for (const auto& [key, value] : m_config_in) {
        if (key.size() > prefix.size() && key.compare(0, prefix.size(), prefix) == 0) {
            out.insert(std::make_pair(key.substr(prefix.size()), value));
        }
    }

    return out;
}

std::string Config::GetArgString(const std::string& arg, const std::string& default_value) const
{
    auto iter = m_config_in.find(arg);

    if (iter != m_config_in.end()) {
        return iter->second;
    } else {
        return default_value;
    }
}

void Config::ProcessBoolArg(const std::string& arg, bool default_value)
{
    std::string raw = GetArgString(arg, default_value ? "true" : "false");

    std::optional<bool> value = ParseStringToBool(raw);

    if (!value) {
        error_log("%s: %s parameter in config file has invalid value: %s",
                  __func__,
                  arg,
                  raw);
    }

    m_config.insert(std::make_pair(arg, value.value_or(default_value)));
}
