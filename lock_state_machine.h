/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef LOCK_STATE_MACHINE_H
#define LOCK_STATE_MACHINE_H

#include <atomic>
#include <string>
#include <vector>

#include <idle_hint.h>
#include <inhibitor.h>
#include <lock_event.h>
#include <locker_process.h>

namespace DeskLocker {

//!
//! \brief The LockStateMachine class is the single coordinator of the lock cycle. It consumes the merged event stream
//! one event at a time and is the only component that decides when the locker starts and stops, when the sleep
//! inhibitor is taken, handed over and released, and which idle hint is published.
//!
//! The machine is level-triggered: any number of lock triggers collapse into one "should be locked" intent.
//!
class LockStateMachine
{
public:
    //!
    //! \brief The State enum. Note that if this enum is expanded, StateToString must also be updated.
    //!
    enum State {
        UNLOCKED,
        LOCKING,
        LOCKED,
        UNLOCKING
    };

    struct Options
    {
        //! Locker argument vector.
        std::vector<std::string> m_locker_command;

        //! Enables the inhibitor lock manager and hand-off of a duplicate to the locker.
        bool m_pass_inhibitor = true;

        //! "why" string of the inhibitor.
        std::string m_inhibitor_reason = "Lock screen on sleep";
    };

    LockStateMachine(EventQueue& queue,
                     LockerSupervisor& supervisor,
                     InhibitorManager& inhibitor_manager,
                     IdleHintPublisher& idle_hint_publisher,
                     const Options& options);

    //!
    //! \brief Takes the initial inhibitor (if enabled) and publishes the initial idle hint.
    //!
    void Initialize();

    //!
    //! \brief Applies one event. Throws ConnectionError on CONNECTION_LOST and SpawnError if the locker cannot be
    //! started.
    //! \param event
    //!
    void HandleEvent(const LockEvent& event);

    //!
    //! \brief The coordinator loop: Initialize(), then handle events until the queue is interrupted or a fatal
    //! error occurs. Cleanup runs on every exit path.
    //! \return exit code, 0 for a clean stop and 1 after a fatal error.
    //!
    int Run();

    //!
    //! \brief Stops any live locker and releases any held inhibitor.
    //!
    void Cleanup();

    State GetState() const;

    //!
    //! \brief True while the daemon's own inhibitor is held.
    //!
    bool IsInhibitorHeld() const;

    //!
    //! \brief True while a lock trigger received during UNLOCKING awaits the locker exit.
    //!
    bool IsLockPending() const;

    bool IsSleepPending() const;

    //!
    //! \brief Returns the string representation of the input state enum value.
    //! \param State enum state
    //! \return string representation of the state
    //!
    static std::string StateToString(const State& state);

    //!
    //! \brief Returns the string representation of the machine's current state.
    //!
    std::string StateToString() const;

private:
    void OnLockTrigger(const LockEvent& event);
    void OnResume();
    void OnUnlockRequested();
    void OnLockerReady();
    void OnLockerExited(const LockEvent& event);

    //!
    //! \brief Spawns the locker (handing it an inhibitor duplicate if enabled) and enters LOCKING.
    //!
    void StartLocker();

    void AcquireInhibitor();
    void ReleaseInhibitor();

    //!
    //! \brief Changes state and publishes the corresponding idle hint.
    //!
    void SetState(State state);

    EventQueue& m_queue;
    LockerSupervisor& m_supervisor;
    InhibitorManager& m_inhibitor_manager;
    IdleHintPublisher& m_idle_hint_publisher;
    Options m_options;

    //! Read by other threads for status, written only by the coordinator.
    std::atomic<State> m_state;

    //! The daemon's own inhibitor copy.
    InhibitorLock m_inhibitor;

    bool m_lock_pending;
    bool m_sleep_pending;
};

} // namespace DeskLocker

#endif // LOCK_STATE_MACHINE_H
