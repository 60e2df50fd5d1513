/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <locker_process.h>
#include <util.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

using namespace DeskLocker;

namespace {
const std::chrono::milliseconds WAITER_POLL_INTERVAL(100);
const std::chrono::milliseconds DEFAULT_SHUTDOWN_GRACE_PERIOD(2000);

std::string JoinCommand(const std::vector<std::string>& command)
{
    std::string out;

    for (const auto& arg : command) {
        if (!out.empty()) out += " ";
        out += arg;
    }

    return out;
}
} // anonymous namespace

LockerProcessSupervisor::LockerProcessSupervisor(EventQueue& queue, const std::string& fd_env_name)
    : m_queue(queue)
    , m_fd_env_name(fd_env_name)
    , m_pid(-1)
    , m_exited(false)
    , m_wait_status(0)
    , m_inherited_fd(-1)
    , m_inherited_dev(0)
    , m_inherited_ino(0)
    , m_shutdown_grace_period(DEFAULT_SHUTDOWN_GRACE_PERIOD)
{}

LockerProcessSupervisor::~LockerProcessSupervisor()
{
    Shutdown();
}

void LockerProcessSupervisor::Start(const std::vector<std::string>& command, const InhibitorLock* inherited)
{
    if (command.empty()) {
        throw SpawnError("The locker command is empty.");
    }

    {
        std::unique_lock<std::mutex> lock(mtx_process);

        if (m_pid > 0) {
            throw SpawnError("A locker process (pid " + ::ToString(m_pid) + ") is still running.");
        }
    }

    // Everything the child needs is prepared before fork(), so that the child only makes async-signal-safe calls.
    std::vector<std::string> environment;
    const std::string env_prefix = m_fd_env_name + "=";

    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        if (strncmp(*entry, env_prefix.c_str(), env_prefix.size()) != 0) {
            environment.push_back(*entry);
        }
    }

    int inherited_fd = (inherited != nullptr) ? inherited->GetFd() : -1;
    struct stat inherited_stat {};

    if (inherited_fd >= 0) {
        if (fstat(inherited_fd, &inherited_stat) == -1) {
            error_log("%s: fstat on inhibitor descriptor %i failed, starting the locker without it: %s",
                      __func__,
                      inherited_fd,
                      strerror(errno));
            inherited_fd = -1;
        } else {
            environment.push_back(env_prefix + ::ToString(inherited_fd));
        }
    }

    std::vector<char*> argv;
    for (const auto& arg : command) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (const auto& entry : environment) envp.push_back(const_cast<char*>(entry.c_str()));
    envp.push_back(nullptr);

    // The write end is close-on-exec: EOF without data means exec succeeded.
    int status_pipe[2];

    if (pipe2(status_pipe, O_CLOEXEC) == -1) {
        throw SpawnError(std::string("Unable to create status pipe: ") + strerror(errno));
    }

    pid_t pid = fork();

    if (pid == -1) {
        int fork_errno = errno;
        close(status_pipe[0]);
        close(status_pipe[1]);

        throw SpawnError(std::string("fork() failed: ") + strerror(fork_errno));
    }

    if (pid == 0) {
        close(status_pipe[0]);

        // The daemon blocks its termination signals in every thread; the locker must not inherit that mask.
        sigset_t empty_set;
        sigemptyset(&empty_set);
        sigprocmask(SIG_SETMASK, &empty_set, nullptr);

        if (inherited_fd >= 0) {
            int flags = fcntl(inherited_fd, F_GETFD);
            if (flags != -1) {
                fcntl(inherited_fd, F_SETFD, flags & ~FD_CLOEXEC);
            }
        }

        execvpe(argv[0], argv.data(), envp.data());

        int exec_errno = errno;
        [[maybe_unused]] ssize_t written = write(status_pipe[1], &exec_errno, sizeof(exec_errno));
        _exit(127);
    }

    close(status_pipe[1]);

    int exec_errno = 0;
    ssize_t bytes_read = 0;

    do {
        bytes_read = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (bytes_read == -1 && errno == EINTR);

    close(status_pipe[0]);

    if (bytes_read > 0) {
        int status = 0;
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {}

        throw SpawnError("Unable to execute locker \"" + command[0] + "\": " + strerror(exec_errno));
    }

    {
        std::unique_lock<std::mutex> lock(mtx_process);

        m_pid = pid;
        m_exited = false;
        m_wait_status = 0;
        m_inherited_fd = inherited_fd;
        m_inherited_dev = inherited_stat.st_dev;
        m_inherited_ino = inherited_stat.st_ino;
    }

    try {
        m_waiter_thread = std::thread(&LockerProcessSupervisor::WaiterThread, this);
    } catch (const std::system_error& e) {
        kill(pid, SIGKILL);

        int status = 0;
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {}

        std::unique_lock<std::mutex> lock(mtx_process);
        m_pid = -1;

        throw SpawnError(std::string("Unable to start locker waiter thread: ") + e.what());
    }

    log("INFO: %s: started locker \"%s\" (pid %i, inherited inhibitor fd %i)",
        __func__,
        JoinCommand(command),
        pid,
        inherited_fd);
}

void LockerProcessSupervisor::RequestStop()
{
    std::unique_lock<std::mutex> lock(mtx_process);

    if (m_pid <= 0 || m_exited) {
        debug_log("INFO: %s: no live locker to stop", __func__);
        return;
    }

    if (kill(m_pid, SIGTERM) == -1) {
        error_log("%s: kill(%i, SIGTERM) failed: %s",
                  __func__,
                  m_pid,
                  strerror(errno));
        return;
    }

    log("INFO: %s: sent SIGTERM to locker (pid %i)", __func__, m_pid);
}

bool LockerProcessSupervisor::HasProcess() const
{
    std::unique_lock<std::mutex> lock(mtx_process);

    return m_pid > 0;
}

void LockerProcessSupervisor::MarkExited()
{
    {
        std::unique_lock<std::mutex> lock(mtx_process);

        if (m_pid <= 0) {
            return;
        }

        if (!m_exited) {
            error_log("%s: locker (pid %i) has not exited yet, handle kept",
                      __func__,
                      m_pid);
            return;
        }
    }

    Retire();
}

void LockerProcessSupervisor::Shutdown()
{
    {
        std::unique_lock<std::mutex> lock(mtx_process);

        if (m_pid <= 0) {
            return;
        }

        if (!m_exited) {
            log("INFO: %s: stopping locker (pid %i)", __func__, m_pid);

            kill(m_pid, SIGTERM);

            if (!cv_process.wait_for(lock, m_shutdown_grace_period, [this]{ return m_exited; })) {
                error_log("WARNING: %s: locker (pid %i) did not exit within %lld ms, sending SIGKILL",
                          __func__,
                          m_pid,
                          static_cast<long long>(m_shutdown_grace_period.count()));

                kill(m_pid, SIGKILL);

                cv_process.wait(lock, [this]{ return m_exited; });
            }
        }
    }

    Retire();
}

int LockerProcessSupervisor::Wait()
{
    std::unique_lock<std::mutex> lock(mtx_process);

    if (m_pid <= 0) {
        return -1;
    }

    cv_process.wait(lock, [this]{ return m_exited; });

    return m_wait_status;
}

pid_t LockerProcessSupervisor::GetPid() const
{
    std::unique_lock<std::mutex> lock(mtx_process);

    return m_pid;
}

void LockerProcessSupervisor::SetShutdownGracePeriod(std::chrono::milliseconds grace_period)
{
    std::unique_lock<std::mutex> lock(mtx_process);

    m_shutdown_grace_period = grace_period;
}

void LockerProcessSupervisor::WaiterThread()
{
    pid_t pid = -1;
    bool ready_posted = false;
    bool fd_released = false;

    {
        std::unique_lock<std::mutex> lock(mtx_process);

        pid = m_pid;
        ready_posted = (m_inherited_fd < 0);
    }

    debug_log("INFO: %s: waiter thread started for pid %i", __func__, pid);

    if (ready_posted) {
        m_queue.Push(LockEvent::LockerReady());
    }

    while (true) {
        int status = 0;
        pid_t ret = waitpid(pid, &status, WNOHANG);

        if (ret == -1 && errno == EINTR) {
            continue;
        }

        if (ret == pid || ret == -1) {
            if (ret == -1) {
                error_log("%s: waitpid(%i) failed, treating the locker as exited: %s",
                          __func__,
                          pid,
                          strerror(errno));
                status = 0;
            }

            {
                std::unique_lock<std::mutex> lock(mtx_process);

                m_exited = true;
                m_wait_status = status;
            }

            cv_process.notify_all();

            m_queue.Push(LockEvent::LockerExited(status));
            break;
        }

        // An exiting child loses its descriptors before waitpid() can reap it, so a vanished descriptor only counts
        // as readiness once the child is seen alive on the following poll.
        if (!ready_posted) {
            if (fd_released) {
                debug_log("INFO: %s: locker (pid %i) released its inhibitor descriptor", __func__, pid);

                m_queue.Push(LockEvent::LockerReady());
                ready_posted = true;
            } else {
                fd_released = !ChildHoldsInheritedFd();
            }
        }

        std::this_thread::sleep_for(WAITER_POLL_INTERVAL);
    }

    debug_log("INFO: %s: waiter thread for pid %i exiting", __func__, pid);
}

bool LockerProcessSupervisor::ChildHoldsInheritedFd() const
{
    std::unique_lock<std::mutex> lock(mtx_process);

    if (m_pid <= 0 || m_inherited_fd < 0) {
        return false;
    }

    std::string fd_path = "/proc/" + ::ToString(m_pid) + "/fd/" + ::ToString(m_inherited_fd);

    struct stat fd_stat {};

    if (stat(fd_path.c_str(), &fd_stat) == -1) {
        return false;
    }

    return fd_stat.st_dev == m_inherited_dev && fd_stat.st_ino == m_inherited_ino;
}

void LockerProcessSupervisor::Retire()
{
    if (m_waiter_thread.joinable() && m_waiter_thread.get_id() != std::this_thread::get_id()) {
        try {
            m_waiter_thread.join();
        } catch (const std::system_error& e) {
            error_log("%s: Error joining locker waiter thread: %s", __func__, e.what());
        }
    }

    std::unique_lock<std::mutex> lock(mtx_process);

    debug_log("INFO: %s: retired locker handle (pid %i)", __func__, m_pid);

    m_pid = -1;
    m_exited = false;
    m_inherited_fd = -1;
    m_inherited_dev = 0;
    m_inherited_ino = 0;
}
