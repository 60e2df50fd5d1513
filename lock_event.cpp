/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <lock_event.h>
#include <util.h>

#include <sys/wait.h>

using namespace DeskLocker;

// Class LockEvent

LockEvent::LockEvent()
    : m_event_type(UNKNOWN)
    , m_active(false)
    , m_wait_status(0)
    , m_source()
{}

LockEvent::LockEvent(EventType event_type)
    : m_event_type(event_type)
    , m_active(false)
    , m_wait_status(0)
    , m_source()
{}

LockEvent::LockEvent(EventType event_type, bool active)
    : m_event_type(event_type)
    , m_active(active)
    , m_wait_status(0)
    , m_source()
{}

LockEvent LockEvent::ScreenIdleChanged(bool idle)
{
    return LockEvent(SCREEN_IDLE_CHANGED, idle);
}

LockEvent LockEvent::PrepareForSleep(bool sleeping)
{
    return LockEvent(PREPARE_FOR_SLEEP, sleeping);
}

LockEvent LockEvent::LockRequested()
{
    return LockEvent(LOCK_REQUESTED);
}

LockEvent LockEvent::UnlockRequested()
{
    return LockEvent(UNLOCK_REQUESTED);
}

LockEvent LockEvent::LockerReady()
{
    return LockEvent(LOCKER_READY);
}

LockEvent LockEvent::LockerExited(int wait_status)
{
    LockEvent event(LOCKER_EXITED);
    event.m_wait_status = wait_status;

    return event;
}

LockEvent LockEvent::ConnectionLost(const std::string& source)
{
    LockEvent event(CONNECTION_LOST);
    event.m_source = source;

    return event;
}

std::string LockEvent::EventTypeToString() const
{
    return EventTypeToString(m_event_type);
}

std::string LockEvent::EventTypeToString(const EventType& event_type)
{
    std::string out;

    switch (event_type) {
    case UNKNOWN:
        out = "UNKNOWN";
        break;
    case SCREEN_IDLE_CHANGED:
        out = "SCREEN_IDLE_CHANGED";
        break;
    case PREPARE_FOR_SLEEP:
        out = "PREPARE_FOR_SLEEP";
        break;
    case LOCK_REQUESTED:
        out = "LOCK_REQUESTED";
        break;
    case UNLOCK_REQUESTED:
        out = "UNLOCK_REQUESTED";
        break;
    case LOCKER_READY:
        out = "LOCKER_READY";
        break;
    case LOCKER_EXITED:
        out = "LOCKER_EXITED";
        break;
    case CONNECTION_LOST:
        out = "CONNECTION_LOST";
        break;
    }

    return out;
}

bool LockEvent::IsLockTrigger() const
{
    switch (m_event_type) {
    case SCREEN_IDLE_CHANGED:
    case PREPARE_FOR_SLEEP:
        return m_active;
    case LOCK_REQUESTED:
        return true;
    default:
        return false;
    }
}

std::string LockEvent::ToString() const
{
    std::string out = EventTypeToString();

    switch (m_event_type) {
    case SCREEN_IDLE_CHANGED:
    case PREPARE_FOR_SLEEP:
        out += m_active ? "(true)" : "(false)";
        break;
    case LOCKER_EXITED:
        if (WIFEXITED(m_wait_status)) {
            out += "(status " + ::ToString(WEXITSTATUS(m_wait_status)) + ")";
        } else if (WIFSIGNALED(m_wait_status)) {
            out += "(signal " + ::ToString(WTERMSIG(m_wait_status)) + ")";
        }
        break;
    case CONNECTION_LOST:
        out += "(" + m_source + ")";
        break;
    default:
        break;
    }

    return out;
}

bool LockEvent::operator==(const LockEvent& other) const
{
    return m_event_type == other.m_event_type
           && m_active == other.m_active
           && m_wait_status == other.m_wait_status
           && m_source == other.m_source;
}

// Class EventQueue

EventQueue::EventQueue()
    : m_events()
    , m_interrupted(false)
{}

void EventQueue::Push(const LockEvent& event)
{
    {
        std::unique_lock<std::mutex> lock(mtx_queue);

        if (m_interrupted) {
            debug_log("INFO: %s: queue interrupted, dropping event %s",
                      __func__,
                      event.ToString());
            return;
        }

        m_events.push_back(event);
    }

    cv_queue.notify_one();
}

std::optional<LockEvent> EventQueue::Pop()
{
    std::unique_lock<std::mutex> lock(mtx_queue);

    cv_queue.wait(lock, [this]{ return m_interrupted || !m_events.empty(); });

    if (m_interrupted) {
        return std::nullopt;
    }

    LockEvent event = m_events.front();
    m_events.pop_front();

    return event;
}

std::optional<LockEvent> EventQueue::TryPop()
{
    std::unique_lock<std::mutex> lock(mtx_queue);

    if (m_interrupted || m_events.empty()) {
        return std::nullopt;
    }

    LockEvent event = m_events.front();
    m_events.pop_front();

    return event;
}

void EventQueue::Interrupt()
{
    {
        std::unique_lock<std::mutex> lock(mtx_queue);
        m_interrupted = true;
    }

    cv_queue.notify_all();
}

bool EventQueue::IsInterrupted() const
{
    std::unique_lock<std::mutex> lock(mtx_queue);

    return m_interrupted;
}

size_t EventQueue::Size() const
{
    std::unique_lock<std::mutex> lock(mtx_queue);

    return m_events.size();
}
