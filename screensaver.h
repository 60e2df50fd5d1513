/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef SCREENSAVER_H
#define SCREENSAVER_H

#include <atomic>
#include <optional>
#include <thread>

#include <lock_event.h>

// Forward declare Xlib types
typedef struct _XDisplay Display;

namespace DeskLocker {

//!
//! \brief The ScreenSaverSource class posts SCREEN_IDLE_CHANGED events from the X11 MIT-SCREEN-SAVER extension. It owns
//! the display connection and one monitor thread that polls the X connection descriptor and an interrupt pipe. Loss of
//! the display connection posts CONNECTION_LOST.
//!
class ScreenSaverSource
{
public:
    //! \brief Constructor
    explicit ScreenSaverSource(EventQueue& queue);

    //! \brief Destructor
    ~ScreenSaverSource();

    //! \brief Deleted copy and move constructors and assignment operators to prevent copying.
    ScreenSaverSource(const ScreenSaverSource&) = delete;
    ScreenSaverSource& operator=(const ScreenSaverSource&) = delete;
    ScreenSaverSource(ScreenSaverSource&&) = delete;
    ScreenSaverSource& operator=(ScreenSaverSource&&) = delete;

    //!
    //! \brief Opens the display (with bounded retries), selects screensaver events and starts the monitor thread.
    //! Throws ConnectionError.
    //!
    void Start();

    //! \brief Stops the monitor thread and closes the display.
    void Stop();

    //! \brief Checks if the monitor thread is running.
    bool IsRunning() const;

    //!
    //! \brief Maps a ScreenSaverNotify state (ScreenSaverOn, ScreenSaverOff, ScreenSaverCycle, ScreenSaverDisabled) to
    //! the idle flag of a SCREEN_IDLE_CHANGED event.
    //! \param state
    //! \return std::nullopt for states that produce no event.
    //!
    static std::optional<bool> IdleFromNotifyState(int state);

public: // Accessible to static C callbacks
    EventQueue& m_queue;
    std::atomic<bool> m_connection_lost;

private:
    //! \brief The monitor thread.
    std::thread m_monitor_thread;

    //! \brief Interrupt flag for the monitor thread.
    std::atomic<bool> m_interrupt_monitor;

    //! \brief Pipe for thread interrupt handling
    int m_interrupt_pipe_fd[2];

    std::atomic<bool> m_running;

    Display* m_display;

    //! \brief The first event code of the screensaver extension.
    int m_event_base;

    void MonitorThread();

    //! \brief Reads and dispatches all queued X events. Returns false if the connection failed.
    bool DrainEvents();

    void Cleanup();
};

} // namespace DeskLocker

#endif // SCREENSAVER_H
