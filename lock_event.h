/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef LOCK_EVENT_H
#define LOCK_EVENT_H

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace DeskLocker {

//!
//! \brief The LockEvent class is the uniform event type produced by the event sources (and the locker supervisor)
//! and consumed by the lock state machine. It is a tagged variant: the event type plus a boolean argument for the
//! two events that carry one, an exit status for LOCKER_EXITED, and a source name for CONNECTION_LOST.
//!
class LockEvent
{
public:
    //!
    //! \brief The EventType enum. Note that if this enum is expanded, EventTypeToString must also be updated.
    //!
    enum EventType {
        UNKNOWN,
        SCREEN_IDLE_CHANGED,
        PREPARE_FOR_SLEEP,
        LOCK_REQUESTED,
        UNLOCK_REQUESTED,
        LOCKER_READY,
        LOCKER_EXITED,
        CONNECTION_LOST
    };

    //!
    //! \brief Constructs an "empty" LockEvent of type UNKNOWN.
    //!
    LockEvent();

    //!
    //! \brief Constructs a LockEvent of the given type with no argument.
    //! \param event_type
    //!
    explicit LockEvent(EventType event_type);

    //!
    //! \brief Constructs a LockEvent of the given type with a boolean argument (SCREEN_IDLE_CHANGED, PREPARE_FOR_SLEEP).
    //! \param event_type
    //! \param active
    //!
    LockEvent(EventType event_type, bool active);

    static LockEvent ScreenIdleChanged(bool idle);
    static LockEvent PrepareForSleep(bool sleeping);
    static LockEvent LockRequested();
    static LockEvent UnlockRequested();
    static LockEvent LockerReady();
    static LockEvent LockerExited(int wait_status);
    static LockEvent ConnectionLost(const std::string& source);

    //!
    //! \brief Converts m_event_type member variable in the LockEvent object to a string.
    //! \return string representation of enum value
    //!
    std::string EventTypeToString() const;

    //!
    //! \brief Static version that takes the event_type enum as a parameter and provides the string representation.
    //! \param event_type
    //! \return string representation of enum value
    //!
    static std::string EventTypeToString(const EventType& event_type);

    //!
    //! \brief Returns true for the events that ask for the screen to be locked: SCREEN_IDLE_CHANGED(true),
    //! PREPARE_FOR_SLEEP(true) and LOCK_REQUESTED.
    //!
    bool IsLockTrigger() const;

    //!
    //! \brief Human readable form for logging, i.e. SCREEN_IDLE_CHANGED(true) or LOCKER_EXITED(status 0).
    //!
    std::string ToString() const;

    bool operator==(const LockEvent& other) const;

    EventType m_event_type;
    bool m_active;
    int m_wait_status;
    std::string m_source;
};

//!
//! \brief The EventQueue class is the merged event stream. Any number of producer threads push events; the single
//! consumer (the lock state machine) pops them in arrival order.
//!
class EventQueue
{
public:
    EventQueue();

    //!
    //! \brief Appends an event. Never blocks on the consumer. Events pushed after Interrupt() are dropped.
    //! \param event
    //!
    void Push(const LockEvent& event);

    //!
    //! \brief Blocks until an event is available or the queue is interrupted.
    //! \return the next event, or std::nullopt once the queue has been interrupted.
    //!
    std::optional<LockEvent> Pop();

    //!
    //! \brief Non-blocking version of Pop().
    //! \return the next event, or std::nullopt if the queue is empty or interrupted.
    //!
    std::optional<LockEvent> TryPop();

    //!
    //! \brief Wakes the consumer and makes every subsequent Pop() return std::nullopt.
    //!
    void Interrupt();

    bool IsInterrupted() const;

    size_t Size() const;

private:
    mutable std::mutex mtx_queue;
    std::condition_variable cv_queue;
    std::deque<LockEvent> m_events;
    bool m_interrupted;
};

} // namespace DeskLocker

#endif // LOCK_EVENT_H
