/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <gtest/gtest.h>
#include <lock_state_machine.h>
#include <util.h>

#include <csignal>
#include <functional>
#include <memory>

#include <fcntl.h>
#include <unistd.h>

using namespace DeskLocker;

namespace {
int ExitedWith(int code) { return (code & 0xff) << 8; }
int KilledBy(int sig) { return sig & 0x7f; }
} // anonymous namespace

//!
//! \brief In-memory supervisor. Records calls and enforces the at-most-one-locker invariant.
//!
class FakeSupervisor : public LockerSupervisor
{
public:
    void Start(const std::vector<std::string>& command, const InhibitorLock* inherited) override
    {
        ++m_start_calls;

        if (m_has_process) {
            ++m_overlapping_starts;
        }

        if (m_fail_start) {
            throw SpawnError("exec failed");
        }

        m_last_command = command;
        m_last_inherited = (inherited != nullptr && inherited->IsHeld());
        m_has_process = true;

        if (m_on_start) {
            m_on_start();
        }
    }

    void RequestStop() override
    {
        ++m_stop_calls;

        if (m_on_stop) {
            m_on_stop();
        }
    }

    bool HasProcess() const override
    {
        return m_has_process;
    }

    void MarkExited() override
    {
        ++m_mark_exited_calls;
        m_has_process = false;
    }

    void Shutdown() override
    {
        ++m_shutdown_calls;
        m_has_process = false;
    }

    int m_start_calls = 0;
    int m_overlapping_starts = 0;
    int m_stop_calls = 0;
    int m_mark_exited_calls = 0;
    int m_shutdown_calls = 0;
    bool m_has_process = false;
    bool m_fail_start = false;
    bool m_last_inherited = false;
    std::vector<std::string> m_last_command;
    std::function<void()> m_on_start;
    std::function<void()> m_on_stop;
};

//!
//! \brief Inhibitor manager handing out /dev/null descriptors, so that Transfer() and Release() operate on real
//! descriptors.
//!
class FakeInhibitorManager : public InhibitorManager
{
public:
    InhibitorLock Acquire(const std::string& reason) override
    {
        ++m_acquire_calls;
        m_last_reason = reason;

        if (m_deny) {
            throw AcquisitionDenied("denied by policy");
        }

        return InhibitorLock(open("/dev/null", O_RDONLY | O_CLOEXEC));
    }

    InhibitorLock Transfer(const InhibitorLock& handle) override
    {
        ++m_transfer_calls;

        return InhibitorManager::Transfer(handle);
    }

    void Release(InhibitorLock& handle) override
    {
        ++m_release_calls;

        InhibitorManager::Release(handle);
    }

    int Calls() const
    {
        return m_acquire_calls + m_transfer_calls + m_release_calls;
    }

    int m_acquire_calls = 0;
    int m_transfer_calls = 0;
    int m_release_calls = 0;
    bool m_deny = false;
    std::string m_last_reason;
};

class FakeIdleHintSink : public IdleHintSink
{
public:
    void SetIdleHint(bool idle) override
    {
        if (m_fail) {
            throw PublishError("no session");
        }

        m_published.push_back(idle);
    }

    std::vector<bool> m_published;
    bool m_fail = false;
};

class LockStateMachineTest : public ::testing::Test
{
protected:
    EventQueue m_queue;
    FakeSupervisor m_supervisor;
    FakeInhibitorManager m_inhibitor_manager;
    FakeIdleHintSink m_sink;
    IdleHintPublisher m_publisher {&m_sink, true};
    std::unique_ptr<LockStateMachine> m_machine;

    LockStateMachine& Machine(bool pass_inhibitor = true)
    {
        LockStateMachine::Options options;
        options.m_locker_command = {"xsecurelock"};
        options.m_pass_inhibitor = pass_inhibitor;

        m_machine = std::make_unique<LockStateMachine>(m_queue, m_supervisor, m_inhibitor_manager, m_publisher,
                                                       options);
        m_machine->Initialize();

        return *m_machine;
    }

    //! Drives the machine from UNLOCKED to LOCKED.
    void Lock(LockStateMachine& machine)
    {
        machine.HandleEvent(LockEvent::ScreenIdleChanged(true));
        machine.HandleEvent(LockEvent::LockerReady());
        ASSERT_EQ(machine.GetState(), LockStateMachine::LOCKED);
    }
};

// ============================================================================
// Initialization
// ============================================================================

TEST_F(LockStateMachineTest, InitializeTakesInhibitorAndPublishesNotIdle)
{
    LockStateMachine& machine = Machine();

    EXPECT_EQ(machine.GetState(), LockStateMachine::UNLOCKED);
    EXPECT_TRUE(machine.IsInhibitorHeld());
    EXPECT_EQ(m_inhibitor_manager.m_acquire_calls, 1);
    EXPECT_EQ(m_inhibitor_manager.m_last_reason, "Lock screen on sleep");
    EXPECT_EQ(m_sink.m_published, std::vector<bool> {false});
}

TEST_F(LockStateMachineTest, StateToString)
{
    EXPECT_EQ(LockStateMachine::StateToString(LockStateMachine::UNLOCKED), "UNLOCKED");
    EXPECT_EQ(LockStateMachine::StateToString(LockStateMachine::LOCKING), "LOCKING");
    EXPECT_EQ(LockStateMachine::StateToString(LockStateMachine::LOCKED), "LOCKED");
    EXPECT_EQ(LockStateMachine::StateToString(LockStateMachine::UNLOCKING), "UNLOCKING");
    EXPECT_EQ(Machine().StateToString(), "UNLOCKED");
}

// ============================================================================
// Scenario A: idle screen locks
// ============================================================================

TEST_F(LockStateMachineTest, IdleScreenStartsLockerThenLocksOnReady)
{
    LockStateMachine& machine = Machine();

    machine.HandleEvent(LockEvent::ScreenIdleChanged(true));

    EXPECT_EQ(m_supervisor.m_start_calls, 1);
    EXPECT_EQ(m_supervisor.m_last_command, std::vector<std::string> {"xsecurelock"});
    EXPECT_TRUE(m_supervisor.m_last_inherited);
    EXPECT_EQ(m_inhibitor_manager.m_transfer_calls, 1);
    EXPECT_EQ(machine.GetState(), LockStateMachine::LOCKING);

    // The daemon keeps its own copy until the locker is up.
    EXPECT_TRUE(machine.IsInhibitorHeld());

    machine.HandleEvent(LockEvent::LockerReady());

    EXPECT_EQ(machine.GetState(), LockStateMachine::LOCKED);
    EXPECT_FALSE(machine.IsInhibitorHeld());
    EXPECT_EQ(m_supervisor.m_start_calls, 1);
    EXPECT_EQ(m_sink.m_published, (std::vector<bool> {false, true}));
}

TEST_F(LockStateMachineTest, LockRequestedStartsLocker)
{
    LockStateMachine& machine = Machine();

    machine.HandleEvent(LockEvent::LockRequested());

    EXPECT_EQ(m_supervisor.m_start_calls, 1);
    EXPECT_EQ(machine.GetState(), LockStateMachine::LOCKING);
}

TEST_F(LockStateMachineTest, ScreenActiveIsNotAnUnlock)
{
    LockStateMachine& machine = Machine();
    Lock(machine);

    machine.HandleEvent(LockEvent::ScreenIdleChanged(false));

    EXPECT_EQ(machine.GetState(), LockStateMachine::LOCKED);
    EXPECT_EQ(m_supervisor.m_stop_calls, 0);
}

TEST_F(LockStateMachineTest, ScreenActiveWhileUnlockedDoesNothing)
{
    LockStateMachine& machine = Machine();

    machine.HandleEvent(LockEvent::ScreenIdleChanged(false));

    EXPECT_EQ(machine.GetState(), LockStateMachine::UNLOCKED);
    EXPECT_EQ(m_supervisor.m_start_calls, 0);
}

// ============================================================================
// Level-triggered lock intent
// ============================================================================

TEST_F(LockStateMachineTest, RepeatedTriggersWhileLockingStartOnce)
{
    LockStateMachine& machine = Machine();

    machine.HandleEvent(LockEvent::ScreenIdleChanged(true));
    machine.HandleEvent(LockEvent::ScreenIdleChanged(true));
    machine.HandleEvent(LockEvent::LockRequested());
    machine.HandleEvent(LockEvent::PrepareForSleep(true));

    EXPECT_EQ(m_supervisor.m_start_calls, 1);
    EXPECT_EQ(machine.GetState(), LockStateMachine::LOCKING);
}

TEST_F(LockStateMachineTest, RepeatedTriggersWhileLockedStartNothing)
{
    LockStateMachine& machine = Machine();
    Lock(machine);

    machine.HandleEvent(LockEvent::ScreenIdleChanged(true));
    machine.HandleEvent(LockEvent::LockRequested());

    EXPECT_EQ(m_supervisor.m_start_calls, 1);
    EXPECT_EQ(machine.GetState(), LockStateMachine::LOCKED);
}

TEST_F(LockStateMachineTest, NeverStartsOverALiveLocker)
{
    LockStateMachine& machine = Machine();

    const std::vector<LockEvent> events = {
        LockEvent::ScreenIdleChanged(true),
        LockEvent::LockRequested(),
        LockEvent::UnlockRequested(),
        LockEvent::LockRequested(),
        LockEvent::PrepareForSleep(true),
        LockEvent::LockerReady(),
        LockEvent::LockerExited(KilledBy(SIGTERM)),
        LockEvent::PrepareForSleep(false),
        LockEvent::LockerReady(),
        LockEvent::UnlockRequested(),
        LockEvent::ScreenIdleChanged(true),
        LockEvent::LockerExited(ExitedWith(0)),
        LockEvent::LockRequested(),
        LockEvent::LockerReady(),
        LockEvent::LockerExited(ExitedWith(1))
    };

    for (const auto& event : events) {
        machine.HandleEvent(event);
    }

    EXPECT_EQ(m_supervisor.m_overlapping_starts, 0);
    EXPECT_EQ(m_supervisor.m_start_calls, 3);
    EXPECT_EQ(machine.GetState(), LockStateMachine::UNLOCKED);
}

// ============================================================================
// Unlocking
// ============================================================================

TEST_F(LockStateMachineTest, UnlockStopsLockerAndExitReturnsToUnlocked)
{
    LockStateMachine& machine = Machine();
    Lock(machine);

    machine.HandleEvent(LockEvent::UnlockRequested());

    EXPECT_EQ(m_supervisor.m_stop_calls, 1);
    EXPECT_EQ(machine.GetState(), LockStateMachine::UNLOCKING);

    machine.HandleEvent(LockEvent::LockerExited(KilledBy(SIGTERM)));

    EXPECT_EQ(machine.GetState(), LockStateMachine::UNLOCKED);
    EXPECT_EQ(m_supervisor.m_mark_exited_calls, 1);
    EXPECT_FALSE(m_supervisor.HasProcess());

    // Back to holding an inhibitor for the next sleep.
    EXPECT_TRUE(machine.IsInhibitorHeld());
    EXPECT_EQ(m_sink.m_published, (std::vector<bool> {false, true, false}));
}

TEST_F(LockStateMachineTest, UnlockWhileUnlockedIsIgnored)
{
    LockStateMachine& machine = Machine();

    machine.HandleEvent(LockEvent::UnlockRequested());

    EXPECT_EQ(m_supervisor.m_stop_calls, 0);
    EXPECT_EQ(machine.GetState(), LockStateMachine::UNLOCKED);
}

TEST_F(LockStateMachineTest, RepeatedUnlockWhileUnlockingStopsOnce)
{
    LockStateMachine& machine = Machine();
    Lock(machine);

    machine.HandleEvent(LockEvent::UnlockRequested());
    machine.HandleEvent(LockEvent::UnlockRequested());

    EXPECT_EQ(m_supervisor.m_stop_calls, 1);
}

// ============================================================================
// Scenario B: unlock before the locker is ready
// ============================================================================

TEST_F(LockStateMachineTest, UnlockWhileLockingStopsOnceAfterStart)
{
    LockStateMachine& machine = Machine();

    int stops_at_start = -1;
    m_supervisor.m_on_start = [this, &stops_at_start]() { stops_at_start = m_supervisor.m_stop_calls; };

    machine.HandleEvent(LockEvent::LockRequested());
    machine.HandleEvent(LockEvent::UnlockRequested());

    EXPECT_EQ(stops_at_start, 0);
    EXPECT_EQ(m_supervisor.m_start_calls, 1);
    EXPECT_EQ(m_supervisor.m_stop_calls, 1);
    EXPECT_EQ(machine.GetState(), LockStateMachine::UNLOCKING);

    // A late readiness report does not lock the screen any more.
    machine.HandleEvent(LockEvent::LockerReady());
    EXPECT_EQ(machine.GetState(), LockStateMachine::UNLOCKING);

    machine.HandleEvent(LockEvent::LockerExited(KilledBy(SIGTERM)));
    EXPECT_EQ(machine.GetState(), LockStateMachine::UNLOCKED);
    EXPECT_EQ(m_supervisor.m_stop_calls, 1);
}

TEST_F(LockStateMachineTest, UnlockQueuedBehindLockThroughRun)
{
    LockStateMachine::Options options;
    options.m_locker_command = {"xsecurelock"};
    LockStateMachine machine(m_queue, m_supervisor, m_inhibitor_manager, m_publisher, options);

    // The unlock arrives while Start() is still running; the stream ends once the stop has been requested.
    m_supervisor.m_on_start = [this]() { m_queue.Push(LockEvent::UnlockRequested()); };
    m_supervisor.m_on_stop = [this]() { m_queue.Interrupt(); };

    m_queue.Push(LockEvent::LockRequested());

    EXPECT_EQ(machine.Run(), 0);
    EXPECT_EQ(m_supervisor.m_start_calls, 1);
    EXPECT_EQ(m_supervisor.m_stop_calls, 1);
    EXPECT_EQ(m_supervisor.m_shutdown_calls, 1);
}

// ============================================================================
// Relock while unlocking
// ============================================================================

TEST_F(LockStateMachineTest, TriggerWhileUnlockingRelocksAfterExit)
{
    LockStateMachine& machine = Machine();
    Lock(machine);

    machine.HandleEvent(LockEvent::UnlockRequested());
    machine.HandleEvent(LockEvent::ScreenIdleChanged(true));

    EXPECT_TRUE(machine.IsLockPending());
    EXPECT_EQ(m_supervisor.m_start_calls, 1);

    machine.HandleEvent(LockEvent::LockerExited(KilledBy(SIGTERM)));

    EXPECT_FALSE(machine.IsLockPending());
    EXPECT_EQ(m_supervisor.m_start_calls, 2);
    EXPECT_EQ(machine.GetState(), LockStateMachine::LOCKING);
}

TEST_F(LockStateMachineTest, UnlockCancelsPendingRelock)
{
    LockStateMachine& machine = Machine();
    Lock(machine);

    machine.HandleEvent(LockEvent::UnlockRequested());
    machine.HandleEvent(LockEvent::LockRequested());
    machine.HandleEvent(LockEvent::UnlockRequested());

    EXPECT_FALSE(machine.IsLockPending());

    machine.HandleEvent(LockEvent::LockerExited(KilledBy(SIGTERM)));

    EXPECT_EQ(m_supervisor.m_start_calls, 1);
    EXPECT_EQ(machine.GetState(), LockStateMachine::UNLOCKED);
}

// ============================================================================
// Locker exit in any state
// ============================================================================

TEST_F(LockStateMachineTest, ExitWhileLockingReturnsToUnlocked)
{
    LockStateMachine& machine = Machine();

    machine.HandleEvent(LockEvent::ScreenIdleChanged(true));
    machine.HandleEvent(LockEvent::LockerExited(ExitedWith(0)));

    EXPECT_EQ(machine.GetState(), LockStateMachine::UNLOCKED);
    EXPECT_FALSE(m_supervisor.HasProcess());
    EXPECT_TRUE(machine.IsInhibitorHeld());
}

TEST_F(LockStateMachineTest, CrashWhileLockedReturnsToUnlocked)
{
    LockStateMachine& machine = Machine();
    Lock(machine);

    machine.HandleEvent(LockEvent::LockerExited(KilledBy(SIGSEGV)));

    EXPECT_EQ(machine.GetState(), LockStateMachine::UNLOCKED);
    EXPECT_TRUE(machine.IsInhibitorHeld());
    EXPECT_EQ(m_sink.m_published.back(), false);

    // The next trigger starts a fresh locker.
    machine.HandleEvent(LockEvent::ScreenIdleChanged(true));
    EXPECT_EQ(m_supervisor.m_start_calls, 2);
}

// ============================================================================
// Sleep and resume
// ============================================================================

TEST_F(LockStateMachineTest, SleepHoldsInhibitorUntilLockerReady)
{
    LockStateMachine& machine = Machine();

    machine.HandleEvent(LockEvent::PrepareForSleep(true));

    EXPECT_TRUE(machine.IsSleepPending());
    EXPECT_EQ(machine.GetState(), LockStateMachine::LOCKING);
    EXPECT_TRUE(m_supervisor.m_last_inherited);
    EXPECT_TRUE(machine.IsInhibitorHeld());

    machine.HandleEvent(LockEvent::LockerReady());

    EXPECT_FALSE(machine.IsInhibitorHeld());
    EXPECT_EQ(machine.GetState(), LockStateMachine::LOCKED);
}

TEST_F(LockStateMachineTest, SleepWhileLockedReleasesInhibitor)
{
    LockStateMachine& machine = Machine();
    Lock(machine);

    // Resume while locked takes a new inhibitor for the next sleep.
    machine.HandleEvent(LockEvent::PrepareForSleep(false));
    EXPECT_TRUE(machine.IsInhibitorHeld());

    machine.HandleEvent(LockEvent::PrepareForSleep(true));
    EXPECT_FALSE(machine.IsInhibitorHeld());
    EXPECT_EQ(m_supervisor.m_start_calls, 1);
}

TEST_F(LockStateMachineTest, ResumeReacquiresInhibitor)
{
    LockStateMachine& machine = Machine();

    machine.HandleEvent(LockEvent::PrepareForSleep(true));
    machine.HandleEvent(LockEvent::LockerReady());
    ASSERT_FALSE(machine.IsInhibitorHeld());

    machine.HandleEvent(LockEvent::PrepareForSleep(false));

    EXPECT_FALSE(machine.IsSleepPending());
    EXPECT_TRUE(machine.IsInhibitorHeld());
    EXPECT_EQ(machine.GetState(), LockStateMachine::LOCKED);
}

TEST_F(LockStateMachineTest, ResumeWithInhibitorHeldDoesNotAcquireAgain)
{
    LockStateMachine& machine = Machine();

    machine.HandleEvent(LockEvent::PrepareForSleep(false));

    EXPECT_EQ(m_inhibitor_manager.m_acquire_calls, 1);
}

TEST_F(LockStateMachineTest, ExitWhileSleepPendingReleasesInhibitor)
{
    LockStateMachine& machine = Machine();

    machine.HandleEvent(LockEvent::PrepareForSleep(true));
    machine.HandleEvent(LockEvent::LockerExited(ExitedWith(1)));

    EXPECT_EQ(machine.GetState(), LockStateMachine::UNLOCKED);
    EXPECT_FALSE(machine.IsInhibitorHeld());
}

TEST_F(LockStateMachineTest, SleepWhileUnlockingRelocks)
{
    LockStateMachine& machine = Machine();
    Lock(machine);

    machine.HandleEvent(LockEvent::UnlockRequested());
    machine.HandleEvent(LockEvent::PrepareForSleep(true));

    // The sleep must wait for the relock.
    EXPECT_TRUE(machine.IsInhibitorHeld());

    machine.HandleEvent(LockEvent::LockerExited(KilledBy(SIGTERM)));

    EXPECT_EQ(m_supervisor.m_start_calls, 2);
    EXPECT_EQ(machine.GetState(), LockStateMachine::LOCKING);
    EXPECT_TRUE(m_supervisor.m_last_inherited);
    EXPECT_TRUE(machine.IsInhibitorHeld());

    machine.HandleEvent(LockEvent::LockerReady());

    EXPECT_EQ(machine.GetState(), LockStateMachine::LOCKED);
    EXPECT_FALSE(machine.IsInhibitorHeld());
}

TEST_F(LockStateMachineTest, UnlockTakesInhibitorBeforeLockerStops)
{
    LockStateMachine& machine = Machine();
    Lock(machine);
    ASSERT_FALSE(machine.IsInhibitorHeld());

    machine.HandleEvent(LockEvent::UnlockRequested());

    EXPECT_EQ(machine.GetState(), LockStateMachine::UNLOCKING);
    EXPECT_TRUE(machine.IsInhibitorHeld());
    EXPECT_EQ(m_inhibitor_manager.m_acquire_calls, 2);

    machine.HandleEvent(LockEvent::LockerExited(KilledBy(SIGTERM)));

    // Already held, so the exit does not take another one.
    EXPECT_EQ(m_inhibitor_manager.m_acquire_calls, 2);
    EXPECT_TRUE(machine.IsInhibitorHeld());
}

TEST_F(LockStateMachineTest, UnlockDuringPendingSleepDoesNotTakeInhibitor)
{
    LockStateMachine& machine = Machine();
    Lock(machine);

    machine.HandleEvent(LockEvent::PrepareForSleep(true));
    machine.HandleEvent(LockEvent::UnlockRequested());

    EXPECT_FALSE(machine.IsInhibitorHeld());
    EXPECT_EQ(m_inhibitor_manager.m_acquire_calls, 1);
}

// ============================================================================
// Inhibitor degradation
// ============================================================================

TEST_F(LockStateMachineTest, DeniedInhibitorStillLocks)
{
    m_inhibitor_manager.m_deny = true;
    LockStateMachine& machine = Machine();

    EXPECT_FALSE(machine.IsInhibitorHeld());

    machine.HandleEvent(LockEvent::ScreenIdleChanged(true));

    EXPECT_EQ(m_supervisor.m_start_calls, 1);
    EXPECT_FALSE(m_supervisor.m_last_inherited);
    EXPECT_EQ(m_inhibitor_manager.m_transfer_calls, 0);
    EXPECT_EQ(machine.GetState(), LockStateMachine::LOCKING);

    machine.HandleEvent(LockEvent::LockerReady());
    EXPECT_EQ(machine.GetState(), LockStateMachine::LOCKED);
}

TEST_F(LockStateMachineTest, InhibitorRetriedWhenNextLockerStarts)
{
    m_inhibitor_manager.m_deny = true;
    LockStateMachine& machine = Machine();

    m_inhibitor_manager.m_deny = false;
    machine.HandleEvent(LockEvent::LockRequested());

    EXPECT_EQ(m_inhibitor_manager.m_acquire_calls, 2);
    EXPECT_TRUE(m_supervisor.m_last_inherited);
}

// ============================================================================
// Scenario D: inhibitor passing disabled
// ============================================================================

TEST_F(LockStateMachineTest, NoInhibitorCallsWhenPassingDisabled)
{
    LockStateMachine& machine = Machine(false);

    const std::vector<LockEvent> events = {
        LockEvent::PrepareForSleep(true),
        LockEvent::LockerReady(),
        LockEvent::PrepareForSleep(false),
        LockEvent::PrepareForSleep(true),
        LockEvent::UnlockRequested(),
        LockEvent::LockRequested(),
        LockEvent::LockerExited(KilledBy(SIGTERM)),
        LockEvent::LockerReady(),
        LockEvent::LockerExited(ExitedWith(2)),
        LockEvent::ScreenIdleChanged(true)
    };

    for (const auto& event : events) {
        machine.HandleEvent(event);
    }

    machine.Cleanup();

    EXPECT_EQ(m_inhibitor_manager.Calls(), 0);
    EXPECT_FALSE(m_supervisor.m_last_inherited);
    EXPECT_FALSE(machine.IsInhibitorHeld());
}

// ============================================================================
// Idle hint
// ============================================================================

TEST_F(LockStateMachineTest, IdleHintFollowsState)
{
    LockStateMachine& machine = Machine();
    Lock(machine);

    machine.HandleEvent(LockEvent::UnlockRequested());
    machine.HandleEvent(LockEvent::LockerExited(KilledBy(SIGTERM)));

    // LOCKING, LOCKED and UNLOCKING all publish true, debounced to one call.
    EXPECT_EQ(m_sink.m_published, (std::vector<bool> {false, true, false}));
}

TEST_F(LockStateMachineTest, IdleHintFailureDoesNotAffectLocking)
{
    m_sink.m_fail = true;
    LockStateMachine& machine = Machine();

    EXPECT_NO_THROW(Lock(machine));
    EXPECT_TRUE(m_sink.m_published.empty());
}

// ============================================================================
// Fatal errors and cleanup (Scenario C)
// ============================================================================

TEST_F(LockStateMachineTest, SpawnErrorPropagatesFromHandleEvent)
{
    m_supervisor.m_fail_start = true;
    LockStateMachine& machine = Machine();

    int releases_before = m_inhibitor_manager.m_release_calls;

    EXPECT_THROW(machine.HandleEvent(LockEvent::LockRequested()), SpawnError);
    EXPECT_EQ(machine.GetState(), LockStateMachine::UNLOCKED);

    // The duplicate meant for the child is released.
    EXPECT_EQ(m_inhibitor_manager.m_release_calls, releases_before + 1);
}

TEST_F(LockStateMachineTest, SpawnErrorEndsRunWithNoInhibitorHeld)
{
    m_supervisor.m_fail_start = true;

    LockStateMachine::Options options;
    options.m_locker_command = {"no-such-locker"};
    LockStateMachine machine(m_queue, m_supervisor, m_inhibitor_manager, m_publisher, options);

    m_queue.Push(LockEvent::ScreenIdleChanged(true));

    EXPECT_EQ(machine.Run(), 1);
    EXPECT_FALSE(machine.IsInhibitorHeld());
    EXPECT_EQ(machine.GetState(), LockStateMachine::UNLOCKED);
}

TEST_F(LockStateMachineTest, ConnectionLostEndsRunAndStopsLocker)
{
    LockStateMachine::Options options;
    options.m_locker_command = {"xsecurelock"};
    LockStateMachine machine(m_queue, m_supervisor, m_inhibitor_manager, m_publisher, options);

    m_queue.Push(LockEvent::LockRequested());
    m_queue.Push(LockEvent::ConnectionLost("PowerSource"));
    m_queue.Push(LockEvent::LockerReady());

    EXPECT_EQ(machine.Run(), 1);
    EXPECT_EQ(m_supervisor.m_shutdown_calls, 1);
    EXPECT_FALSE(m_supervisor.HasProcess());
    EXPECT_FALSE(machine.IsInhibitorHeld());
    EXPECT_EQ(machine.GetState(), LockStateMachine::UNLOCKED);
}

TEST_F(LockStateMachineTest, ConnectionLostThrowsFromHandleEvent)
{
    LockStateMachine& machine = Machine();

    EXPECT_THROW(machine.HandleEvent(LockEvent::ConnectionLost("SessionSource")), ConnectionError);
}

TEST_F(LockStateMachineTest, InterruptedQueueEndsRunCleanly)
{
    LockStateMachine::Options options;
    options.m_locker_command = {"xsecurelock"};
    LockStateMachine machine(m_queue, m_supervisor, m_inhibitor_manager, m_publisher, options);

    m_queue.Interrupt();

    EXPECT_EQ(machine.Run(), 0);
    EXPECT_FALSE(machine.IsInhibitorHeld());
    EXPECT_EQ(m_supervisor.m_shutdown_calls, 0);
}

TEST_F(LockStateMachineTest, CleanupStopsLiveLockerAndReleases)
{
    LockStateMachine& machine = Machine();
    machine.HandleEvent(LockEvent::LockRequested());

    machine.Cleanup();

    EXPECT_EQ(m_supervisor.m_shutdown_calls, 1);
    EXPECT_FALSE(machine.IsInhibitorHeld());
    EXPECT_EQ(machine.GetState(), LockStateMachine::UNLOCKED);
}
