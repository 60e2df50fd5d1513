/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <lock_state_machine.h>
#include <util.h>

#include <csignal>

#include <sys/wait.h>

using namespace DeskLocker;

LockStateMachine::LockStateMachine(EventQueue& queue,
                                   LockerSupervisor& supervisor,
                                   InhibitorManager& inhibitor_manager,
                                   IdleHintPublisher& idle_hint_publisher,
                                   const Options& options)
    : m_queue(queue)
    , m_supervisor(supervisor)
    , m_inhibitor_manager(inhibitor_manager)
    , m_idle_hint_publisher(idle_hint_publisher)
    , m_options(options)
    , m_state(UNLOCKED)
    , m_inhibitor()
    , m_lock_pending(false)
    , m_sleep_pending(false)
{}

void LockStateMachine::Initialize()
{
    if (m_options.m_pass_inhibitor && !m_inhibitor.IsHeld()) {
        AcquireInhibitor();
    }

    m_idle_hint_publisher.Update(m_state != UNLOCKED);
}

void LockStateMachine::HandleEvent(const LockEvent& event)
{
    debug_log("INFO: %s: %s in state %s",
              __func__,
              event.ToString(),
              StateToString());

    switch (event.m_event_type) {
    case LockEvent::SCREEN_IDLE_CHANGED:
    case LockEvent::LOCK_REQUESTED:
        if (event.IsLockTrigger()) {
            OnLockTrigger(event);
        }
        break;
    case LockEvent::PREPARE_FOR_SLEEP:
        m_sleep_pending = event.m_active;

        if (event.m_active) {
            OnLockTrigger(event);
        } else {
            OnResume();
        }
        break;
    case LockEvent::UNLOCK_REQUESTED:
        OnUnlockRequested();
        break;
    case LockEvent::LOCKER_READY:
        OnLockerReady();
        break;
    case LockEvent::LOCKER_EXITED:
        OnLockerExited(event);
        break;
    case LockEvent::CONNECTION_LOST:
        throw ConnectionError("Lost the connection of " + event.m_source);
    case LockEvent::UNKNOWN:
        error_log("%s: ignoring event of unknown type", __func__);
        break;
    }
}

int LockStateMachine::Run()
{
    int exit_code = 0;

    try {
        Initialize();

        while (std::optional<LockEvent> event = m_queue.Pop()) {
            HandleEvent(*event);
        }

        log("INFO: %s: event stream closed, stopping the lock state machine.", __func__);
    } catch (const ConnectionError& e) {
        error_log("%s: %s", __func__, e.what());
        exit_code = 1;
    } catch (const SpawnError& e) {
        error_log("%s: Cannot start the locker, so the screen cannot be locked: %s", __func__, e.what());
        exit_code = 1;
    } catch (const DeskLockerException& e) {
        error_log("%s: %s", __func__, e.what());
        exit_code = 1;
    }

    Cleanup();

    return exit_code;
}

void LockStateMachine::Cleanup()
{
    if (m_supervisor.HasProcess()) {
        m_supervisor.Shutdown();
    }

    if (m_options.m_pass_inhibitor) {
        ReleaseInhibitor();
    }

    m_lock_pending = false;

    SetState(UNLOCKED);
}

LockStateMachine::State LockStateMachine::GetState() const
{
    return m_state.load();
}

bool LockStateMachine::IsInhibitorHeld() const
{
    return m_inhibitor.IsHeld();
}

bool LockStateMachine::IsLockPending() const
{
    return m_lock_pending;
}

bool LockStateMachine::IsSleepPending() const
{
    return m_sleep_pending;
}

std::string LockStateMachine::StateToString(const State& state)
{
    std::string out;

    switch (state) {
    case UNLOCKED:
        out = "UNLOCKED";
        break;
    case LOCKING:
        out = "LOCKING";
        break;
    case LOCKED:
        out = "LOCKED";
        break;
    case UNLOCKING:
        out = "UNLOCKING";
        break;
    }

    return out;
}

std::string LockStateMachine::StateToString() const
{
    return StateToString(m_state.load());
}

void LockStateMachine::OnLockTrigger(const LockEvent& event)
{
    switch (m_state.load()) {
    case UNLOCKED:
        StartLocker();
        break;
    case LOCKING:
        // The inhibitor, if held, stays held until the locker reports ready.
        debug_log("INFO: %s: already locking, %s ignored", __func__, event.ToString());
        break;
    case LOCKED:
        if (event.m_event_type == LockEvent::PREPARE_FOR_SLEEP && m_options.m_pass_inhibitor) {
            ReleaseInhibitor();
        }
        debug_log("INFO: %s: already locked, %s ignored", __func__, event.ToString());
        break;
    case UNLOCKING:
        // The old locker is on its way out; start a new one as soon as it has gone.
        m_lock_pending = true;
        debug_log("INFO: %s: %s while unlocking, relock scheduled", __func__, event.ToString());
        break;
    }
}

void LockStateMachine::OnResume()
{
    if (m_options.m_pass_inhibitor && !m_inhibitor.IsHeld()) {
        AcquireInhibitor();
    }
}

void LockStateMachine::OnUnlockRequested()
{
    m_lock_pending = false;

    switch (m_state.load()) {
    case UNLOCKED:
    case UNLOCKING:
        debug_log("INFO: %s: nothing to unlock in state %s", __func__, StateToString());
        break;
    case LOCKING:
    case LOCKED:
        // The screen stops being protected now, so a sleep arriving while the locker dies must be held back.
        if (m_options.m_pass_inhibitor && !m_sleep_pending && !m_inhibitor.IsHeld()) {
            AcquireInhibitor();
        }

        // Start() is synchronous, so in LOCKING the process handle already exists and can be stopped.
        m_supervisor.RequestStop();
        SetState(UNLOCKING);
        break;
    }
}

void LockStateMachine::OnLockerReady()
{
    if (m_state.load() != LOCKING) {
        debug_log("INFO: %s: locker ready in state %s, nothing to do", __func__, StateToString());
        return;
    }

    if (m_options.m_pass_inhibitor) {
        ReleaseInhibitor();
    }

    SetState(LOCKED);
}

void LockStateMachine::OnLockerExited(const LockEvent& event)
{
    int wait_status = event.m_wait_status;

    if (WIFEXITED(wait_status) && WEXITSTATUS(wait_status) == 0) {
        log("INFO: %s: locker exited (%s)", __func__, event.ToString());
    } else if (WIFSIGNALED(wait_status) && WTERMSIG(wait_status) == SIGTERM && m_state.load() == UNLOCKING) {
        log("INFO: %s: locker stopped on request (%s)", __func__, event.ToString());
    } else {
        error_log("WARNING: %s: locker exited abnormally (%s)", __func__, event.ToString());
    }

    m_supervisor.MarkExited();

    SetState(UNLOCKED);

    if (m_lock_pending) {
        m_lock_pending = false;
        StartLocker();
        return;
    }

    if (!m_options.m_pass_inhibitor) {
        return;
    }

    if (m_sleep_pending) {
        // Nothing is going to lock the screen for this sleep, so do not hold it up.
        error_log("WARNING: %s: locker gone while the system is preparing for sleep, releasing the inhibitor",
                  __func__);
        ReleaseInhibitor();
    } else if (!m_inhibitor.IsHeld()) {
        AcquireInhibitor();
    }
}

void LockStateMachine::StartLocker()
{
    if (m_supervisor.HasProcess()) {
        error_log("%s: a locker process is still live, not starting another", __func__);
        return;
    }

    InhibitorLock transfer;

    if (m_options.m_pass_inhibitor) {
        if (!m_inhibitor.IsHeld()) {
            AcquireInhibitor();
        }

        if (m_inhibitor.IsHeld()) {
            try {
                transfer = m_inhibitor_manager.Transfer(m_inhibitor);
            } catch (const DeskLockerException& e) {
                error_log("%s: unable to hand the inhibitor to the locker, starting it without: %s",
                          __func__,
                          e.what());
            }
        }
    }

    try {
        m_supervisor.Start(m_options.m_locker_command, transfer.IsHeld() ? &transfer : nullptr);
    } catch (const SpawnError&) {
        if (m_options.m_pass_inhibitor) {
            m_inhibitor_manager.Release(transfer);
        }
        throw;
    }

    // The child has its own copy now.
    if (m_options.m_pass_inhibitor) {
        m_inhibitor_manager.Release(transfer);
    }

    SetState(LOCKING);
}

void LockStateMachine::AcquireInhibitor()
{
    try {
        m_inhibitor = m_inhibitor_manager.Acquire(m_options.m_inhibitor_reason);

        debug_log("INFO: %s: holding sleep inhibitor %s", __func__, m_inhibitor.ToString());
    } catch (const AcquisitionDenied& e) {
        error_log("WARNING: %s: proceeding without sleep protection: %s", __func__, e.what());
    }
}

void LockStateMachine::ReleaseInhibitor()
{
    m_inhibitor_manager.Release(m_inhibitor);
}

void LockStateMachine::SetState(State state)
{
    State previous = m_state.exchange(state);

    if (previous == state) {
        return;
    }

    log("INFO: %s: %s -> %s",
        __func__,
        StateToString(previous),
        StateToString(state));

    m_idle_hint_publisher.Update(state != UNLOCKED);
}
