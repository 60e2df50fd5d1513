/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <idle_hint.h>
#include <inhibitor.h>
#include <lock_event.h>
#include <lock_state_machine.h>
#include <locker_config.h>
#include <locker_process.h>
#include <logind.h>
#include <release.h>
#include <screensaver.h>
#include <util.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <pthread.h>
#include <system_error>
#include <thread>
#include <unistd.h>

using namespace DeskLocker;

//! Global config singleton for desk_locker
DeskLockerConfig g_config;

//! Global flag for exit code
std::atomic<int> g_exit_code = 0;

//! Need the main thread id to be able to send a signal from the coordinator thread back to main.
pthread_t g_main_thread_id = 0;

void Shutdown(const int& exit_code)
{
    g_exit_code.store(exit_code);

    pthread_kill(g_main_thread_id, SIGTERM);
}

// Global scope functions.

static void PrintUsage(const char* program)
{
    std::cout << "Usage: " << program << " [OPTIONS] [--] [LOCKER COMMAND...]\n"
              << "\n"
              << "Starts the locker when the screen saver activates, before the system sleeps and when logind asks\n"
              << "the session to lock. Default locker: " << DEFAULT_LOCKER_COMMAND << "\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config FILE        read configuration from FILE\n"
              << "      --pass-inhibitor     pass a sleep delay lock to the locker (default)\n"
              << "      --no-pass-inhibitor  do not take or pass sleep delay locks\n"
              << "      --idle-hint          set the session idle hint while locked (default)\n"
              << "      --no-idle-hint       do not manage the session idle hint\n"
              << "      --no-screensaver     do not lock when the X screen saver activates\n"
              << "  -d, --debug              enable debug logging\n"
              << "  -v, --version            print the version and exit\n"
              << "  -h, --help               print this help and exit\n";
}

//!
//! \brief Default config file location: $XDG_CONFIG_HOME/desk_locker/desk_locker.conf, falling back to
//! ~/.config/desk_locker/desk_locker.conf.
//!
static fs::path DefaultConfigPath()
{
    if (std::optional<std::string> config_home = GetEnvVariable("XDG_CONFIG_HOME")) {
        return fs::path(*config_home) / "desk_locker" / "desk_locker.conf";
    }

    if (std::optional<std::string> home = GetEnvVariable("HOME")) {
        return fs::path(*home) / ".config" / "desk_locker" / "desk_locker.conf";
    }

    return fs::path();
}

//!
//! \brief This is the main function for desk_locker
//! \param argc
//! \param argv
//! \return exit code
//!
int main(int argc, char* argv[])
{
    const char* journal_stream = getenv("JOURNAL_STREAM");
    if (journal_stream != nullptr && strlen(journal_stream) > 0) {
        // If JOURNAL_STREAM is set, assume output is handled by journald
        g_log_timestamps.store(false);
    } else {
        g_log_timestamps.store(true);
    }

    CommandLineOptions options;

    try {
        options = ParseCommandLineOptions(argc, argv);
    } catch (DeskLockerException& e) {
        error_log("%s: %s", __func__, e.what());
        PrintUsage(argv[0]);

        return 1;
    }

    if (options.m_show_help) {
        PrintUsage(argv[0]);
        return 0;
    }

    if (options.m_show_version) {
        std::cout << "desk_locker " << g_version << std::endl;
        return 0;
    }

    fs::path config_file_path = options.m_config_file ? *options.m_config_file : DefaultConfigPath();

    if (!config_file_path.empty() && fs::exists(config_file_path) && fs::is_regular_file(config_file_path)) {
        log("INFO: %s: Using config from %s",
            __func__,
            config_file_path);
    } else {
        if (options.m_config_file) {
            log("WARNING: %s: Argument invalid for config file. Using defaults.",
                __func__);
        }

        config_file_path = "";
    }

    // Read the config file for config. If an error is encountered reading the config file, then defaults will be used.
    g_config.ReadAndUpdateConfig(config_file_path);

    ApplyCommandLineOptions(options, g_config);

    // Populate g_debug from the config to avoid having to call the heavyweight GetArg in each log function call.
    g_debug = std::get<bool>(g_config.GetArg("debug"));

    LockStateMachine::Options machine_options;
    machine_options.m_locker_command = std::get<std::vector<std::string>>(g_config.GetArg("locker_command"));
    machine_options.m_pass_inhibitor = std::get<bool>(g_config.GetArg("pass_inhibitor"));
    machine_options.m_inhibitor_reason = std::get<std::string>(g_config.GetArg("inhibitor_why"));

    bool manage_idle_hint = std::get<bool>(g_config.GetArg("manage_idle_hint"));
    bool monitor_screensaver = std::get<bool>(g_config.GetArg("monitor_screensaver"));

    if (machine_options.m_locker_command.empty()) {
        error_log("%s: No locker command configured.", __func__);
        return 1;
    }

    std::optional<SessionId> session_id;

    try {
        session_id = SessionId::FromEnvironment();
    } catch (DeskLockerException& e) {
        error_log("%s: %s", __func__, e.what());
        return 1;
    }

    g_main_thread_id = pthread_self();

    // Block the termination signals before any thread is started so that every thread inherits the mask and
    // only sigwait below receives them. The locker child unblocks them again.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGHUP);

    if (pthread_sigmask(SIG_BLOCK, &mask, nullptr) != 0) {
        perror("pthread_sigmask");
        return 1;
    }

    log("INFO: %s: desk_locker C++ program, %s, started, pid %i, session %s",
        __func__,
        g_version,
        getpid(),
        session_id->str());

    LogindClient logind_client;
    std::string session_path;

    try {
        logind_client.Connect();
        session_path = logind_client.GetSessionPath(*session_id);
    } catch (ConnectionError& e) {
        error_log("%s: %s", __func__, e.what());
        return 1;
    }

    EventQueue queue;

    LockerProcessSupervisor supervisor(queue, std::get<std::string>(g_config.GetArg("sleep_lock_fd_env")));
    supervisor.SetShutdownGracePeriod(
        std::chrono::milliseconds(std::get<int>(g_config.GetArg("locker_stop_timeout_ms"))));
    LogindInhibitorManager inhibitor_manager(logind_client, std::get<std::string>(g_config.GetArg("inhibitor_who")));
    SessionIdleHintSink idle_hint_sink(logind_client, session_path);
    IdleHintPublisher idle_hint_publisher(&idle_hint_sink, manage_idle_hint);

    LockStateMachine lock_state_machine(queue, supervisor, inhibitor_manager, idle_hint_publisher, machine_options);

    PowerSource power_source(queue);
    SessionSource session_source(queue, *session_id);
    ScreenSaverSource screensaver_source(queue);

    try {
        power_source.Start();
        session_source.Start();

        if (monitor_screensaver) {
            screensaver_source.Start();
        } else {
            log("INFO: %s: Screen saver monitoring disabled by configuration.", __func__);
        }
    } catch (DeskLockerException& e) {
        error_log("%s: Unable to start the event sources: %s", __func__, e.what());

        screensaver_source.Stop();
        session_source.Stop();
        power_source.Stop();

        return 1;
    }

    std::thread coordinator_thread;

    try {
        coordinator_thread = std::thread([&lock_state_machine]() {
            int exit_code = lock_state_machine.Run();

            if (exit_code != 0) {
                Shutdown(exit_code);
            }
        });
    } catch (const std::system_error& e) {
        error_log("%s: Error creating coordinator thread: %s", __func__, e.what());
        Shutdown(1);
    }

    int sig = 0;

    // Wait for signal. This will also cause a shutdown at this point if Shutdown() was/is called.
    while (true) {
        if (sigwait(&mask, &sig) != 0) {
            error_log("%s: sigwait failed: %s", __func__, strerror(errno));
            g_exit_code = 1;
            break;
        }

        if (sig == SIGHUP) {
            log("INFO: %s: SIGHUP ignored.", __func__);
            continue;
        }

        log("INFO: %s: Received signal %s, shutting down.", __func__, strsignal(sig));
        break;
    }

    // The coordinator stops the locker and releases the inhibitor on its way out.
    queue.Interrupt();

    if (coordinator_thread.joinable()) {
        coordinator_thread.join();
    }

    log("INFO: %s: stopping event sources", __func__);

    screensaver_source.Stop();
    session_source.Stop();
    power_source.Stop();

    log("INFO: %s: desk_locker exiting with code %i", __func__, g_exit_code.load());

    return g_exit_code;
}
