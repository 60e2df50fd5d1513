/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef LOCKER_PROCESS_H
#define LOCKER_PROCESS_H

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

#include <inhibitor.h>
#include <lock_event.h>

namespace DeskLocker {

//!
//! \brief The LockerSupervisor class is the interface the lock state machine uses to drive the single locker child.
//! LockerProcessSupervisor is the production implementation.
//!
class LockerSupervisor
{
public:
    virtual ~LockerSupervisor() = default;

    //!
    //! \brief Launches the locker. Must not be called while HasProcess() is true.
    //! \param command argument vector, command[0] is looked up in PATH.
    //! \param inherited inhibitor duplicate to be inherited by the child, or nullptr.
    //! Throws SpawnError.
    //!
    virtual void Start(const std::vector<std::string>& command, const InhibitorLock* inherited) = 0;

    //!
    //! \brief Asks the locker to exit gracefully. No-op if there is no live locker.
    //!
    virtual void RequestStop() = 0;

    //!
    //! \brief True from a successful Start() until MarkExited().
    //!
    virtual bool HasProcess() const = 0;

    //!
    //! \brief Retires the process handle after its LOCKER_EXITED event has been consumed.
    //!
    virtual void MarkExited() = 0;

    //!
    //! \brief Stops any live locker at daemon exit, escalating to SIGKILL after a grace period.
    //!
    virtual void Shutdown() = 0;
};

//!
//! \brief The LockerProcessSupervisor class forks and execs the locker and watches it from a waiter thread, which
//! posts LOCKER_READY and LOCKER_EXITED to the event queue.
//!
//! Readiness follows the xss-lock convention: the locker inherits a duplicate of the sleep inhibitor descriptor, whose
//! number is exported in an environment variable, and closes it once the screen is locked. The waiter observes this
//! through /proc/<pid>/fd. With no descriptor passed, the locker is considered ready as soon as it has been spawned.
//!
class LockerProcessSupervisor : public LockerSupervisor
{
public:
    //!
    //! \brief Constructor.
    //! \param queue destination of LOCKER_READY and LOCKER_EXITED
    //! \param fd_env_name environment variable that carries the inherited descriptor number
    //!
    LockerProcessSupervisor(EventQueue& queue, const std::string& fd_env_name);

    ~LockerProcessSupervisor();

    LockerProcessSupervisor(const LockerProcessSupervisor&) = delete;
    LockerProcessSupervisor& operator=(const LockerProcessSupervisor&) = delete;

    void Start(const std::vector<std::string>& command, const InhibitorLock* inherited) override;

    void RequestStop() override;

    bool HasProcess() const override;

    void MarkExited() override;

    void Shutdown() override;

    //!
    //! \brief Blocks the calling thread until the current locker has exited.
    //! \return the waitpid() status, or -1 if there is no process.
    //!
    int Wait();

    //!
    //! \brief Pid of the current locker, or -1.
    //!
    pid_t GetPid() const;

    //!
    //! \brief Sets the grace period Shutdown() allows before SIGKILL.
    //!
    void SetShutdownGracePeriod(std::chrono::milliseconds grace_period);

private:
    //!
    //! \brief Polls the child for exit and readiness until it has been reaped.
    //!
    void WaiterThread();

    //!
    //! \brief True while the child still holds the inherited descriptor.
    //!
    bool ChildHoldsInheritedFd() const;

    //!
    //! \brief Joins the waiter thread and clears the handle. Called with no lock held.
    //!
    void Retire();

    EventQueue& m_queue;
    std::string m_fd_env_name;

    //!
    //! \brief Protects the process handle below.
    //!
    mutable std::mutex mtx_process;

    //!
    //! \brief Signaled by the waiter when the child has been reaped.
    //!
    std::condition_variable cv_process;

    pid_t m_pid;
    bool m_exited;
    int m_wait_status;

    //! Number, device and inode of the descriptor handed to the child. m_inherited_fd is -1 when none was passed.
    int m_inherited_fd;
    dev_t m_inherited_dev;
    ino_t m_inherited_ino;

    std::thread m_waiter_thread;

    std::chrono::milliseconds m_shutdown_grace_period;
};

} // namespace DeskLocker

#endif // LOCKER_PROCESS_H
