/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <screensaver.h>
#include <util.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <system_error>

#include <X11/Xlib.h>
#include <X11/extensions/scrnsaver.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

using namespace DeskLocker;

namespace {
const int MAX_X_CONNECT_RETRIES = 6;
const int X_RETRY_DELAY_MS = 500;

//!
//! \brief Xlib calls this on a fatal I/O error (the server went away). The exit handler below takes over the default
//! exit(1) so the source can report CONNECTION_LOST and the daemon can clean up.
//!
int HandleXIOError(Display* display)
{
    error_log("%s: fatal I/O error on X display %s",
              __func__,
              display ? DisplayString(display) : "(null)");

    return 0;
}

void HandleXIOErrorExit(Display* display, void* user_data)
{
    (void) display;

    ScreenSaverSource* source = static_cast<ScreenSaverSource*>(user_data);

    source->m_connection_lost = true;
}
} // anonymous namespace

ScreenSaverSource::ScreenSaverSource(EventQueue& queue)
    : m_queue(queue)
    , m_connection_lost(false)
    , m_interrupt_monitor(false)
    , m_running(false)
    , m_display(nullptr)
    , m_event_base(0)
{
    m_interrupt_pipe_fd[0] = -1; // read end
    m_interrupt_pipe_fd[1] = -1; // write end
}

ScreenSaverSource::~ScreenSaverSource()
{
    Stop();
}

void ScreenSaverSource::Start()
{
    if (m_running.load()) {
        debug_log("INFO: %s: Screensaver source already running.", __func__);
        return;
    }

    log("INFO: %s: Starting X11 screensaver source.", __func__);

    if (pipe2(m_interrupt_pipe_fd, O_CLOEXEC | O_NONBLOCK) == -1) {
        throw ConnectionError(std::string("Failed to create interrupt pipe: ") + strerror(errno));
    }

    // Retries apply only to the initial connection, which may race the X server coming up at session start.
    for (int attempt = 1; attempt <= MAX_X_CONNECT_RETRIES; ++attempt) {
        m_display = XOpenDisplay(nullptr);
        if (m_display) break;
        if (attempt < MAX_X_CONNECT_RETRIES) {
            error_log("WARNING: %s: Could not open X display (attempt %d/%d). Retrying...",
                      __func__, attempt, MAX_X_CONNECT_RETRIES);
            std::this_thread::sleep_for(std::chrono::milliseconds(X_RETRY_DELAY_MS));
        }
    }

    if (!m_display) {
        Cleanup();
        throw ConnectionError("Could not open X display after " + ::ToString(MAX_X_CONNECT_RETRIES) + " attempts.");
    }

    XSetIOErrorHandler(HandleXIOError);
    XSetIOErrorExitHandler(m_display, HandleXIOErrorExit, this);

    int error_base = 0;
    if (!XScreenSaverQueryExtension(m_display, &m_event_base, &error_base)) {
        Cleanup();
        throw ConnectionError("XScreenSaver extension unavailable.");
    }

    XScreenSaverSelectInput(m_display, DefaultRootWindow(m_display), ScreenSaverNotifyMask | ScreenSaverCycleMask);
    XFlush(m_display);

    m_interrupt_monitor.store(false);
    m_connection_lost.store(false);

    try {
        m_monitor_thread = std::thread(&ScreenSaverSource::MonitorThread, this);
    } catch (const std::system_error& e) {
        Cleanup();
        throw ThreadException(std::string("Failed to start screensaver monitor thread: ") + e.what());
    }

    m_running = true;

    log("INFO: %s: X11 screensaver source started on display %s.", __func__, DisplayString(m_display));
}

void ScreenSaverSource::Stop()
{
    if (!m_running.exchange(false)) {
        Cleanup();
        return;
    }

    log("INFO: %s: Stopping X11 screensaver source...", __func__);

    m_interrupt_monitor = true;

    // Wake the monitor thread from poll().
    if (m_interrupt_pipe_fd[1] != -1) {
        char buf = 'X';
        ssize_t written = write(m_interrupt_pipe_fd[1], &buf, 1);
        if (written <= 0 && errno != EAGAIN) {
            error_log("%s: Failed to write to interrupt pipe: %s (%d)", __func__, strerror(errno), errno);
        }
    }

    if (m_monitor_thread.joinable() && m_monitor_thread.get_id() != std::this_thread::get_id()) {
        try {
            m_monitor_thread.join();
        } catch (const std::system_error& e) {
            error_log("%s: Error joining screensaver monitor thread: %s", __func__, e.what());
        }
    }

    Cleanup();

    log("INFO: %s: X11 screensaver source stopped.", __func__);
}

bool ScreenSaverSource::IsRunning() const
{
    return m_running.load();
}

std::optional<bool> ScreenSaverSource::IdleFromNotifyState(int state)
{
    switch (state) {
    case ScreenSaverOn:
    case ScreenSaverCycle:
        return true;
    case ScreenSaverOff:
        return false;
    default:
        return std::nullopt;
    }
}

void ScreenSaverSource::MonitorThread()
{
    debug_log("INFO: %s: Screensaver monitor thread started.", __func__);

    struct pollfd fds[2];
    fds[0].fd = ConnectionNumber(m_display);
    fds[0].events = POLLIN;
    fds[1].fd = m_interrupt_pipe_fd[0];
    fds[1].events = POLLIN;

    bool connection_lost = false;

    // Events may already be queued from the initial round trips.
    if (!DrainEvents()) {
        connection_lost = true;
    }

    while (!connection_lost && !m_interrupt_monitor.load(std::memory_order_relaxed)) {
        int poll_ret = poll(fds, 2, -1);

        if (poll_ret < 0) {
            if (errno == EINTR) continue;
            error_log("%s: poll() failed: %s (%d).", __func__, strerror(errno), errno);
            connection_lost = true;
            break;
        }

        if (fds[1].revents & (POLLIN | POLLERR | POLLHUP)) {
            debug_log("INFO: %s: Interrupt detected.", __func__);
            if (fds[1].revents & POLLIN) {
                char buf[8]; [[maybe_unused]] ssize_t drain = read(m_interrupt_pipe_fd[0], buf, sizeof(buf));
            }
            break;
        }

        if (fds[0].revents & POLLIN) {
            if (!DrainEvents()) {
                connection_lost = true;
            }
        } else if (fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) {
            error_log("%s: Error/Hangup on X display connection.", __func__);
            connection_lost = true;
        }
    }

    if (connection_lost && !m_interrupt_monitor.load()) {
        m_queue.Push(LockEvent::ConnectionLost("ScreenSaverSource"));
    }

    debug_log("INFO: %s: Screensaver monitor thread exiting.", __func__);
}

bool ScreenSaverSource::DrainEvents()
{
    // XPending reads from the socket; an EOF there ends up in HandleXIOErrorExit.
    while (!m_connection_lost.load() && XPending(m_display) > 0) {
        XEvent event;
        XNextEvent(m_display, &event);

        if (event.type != m_event_base + ScreenSaverNotify) {
            continue;
        }

        const XScreenSaverNotifyEvent* notify = reinterpret_cast<const XScreenSaverNotifyEvent*>(&event);

        std::optional<bool> idle = IdleFromNotifyState(notify->state);

        if (!idle) {
            log("INFO: %s: screensaver disabled on display (state %i), no event posted.", __func__, notify->state);
            continue;
        }

        m_queue.Push(LockEvent::ScreenIdleChanged(*idle));
    }

    return !m_connection_lost.load();
}

void ScreenSaverSource::Cleanup()
{
    if (m_display) {
        // After an I/O error the connection is unusable; XCloseDisplay still frees the client side.
        XCloseDisplay(m_display);
        m_display = nullptr;
    }

    if (m_interrupt_pipe_fd[0] != -1) { close(m_interrupt_pipe_fd[0]); m_interrupt_pipe_fd[0] = -1; }
    if (m_interrupt_pipe_fd[1] != -1) { close(m_interrupt_pipe_fd[1]); m_interrupt_pipe_fd[1] = -1; }
}
