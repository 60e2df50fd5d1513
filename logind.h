/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef LOGIND_H
#define LOGIND_H

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include <idle_hint.h>
#include <inhibitor.h>
#include <lock_event.h>

// Forward declare GLib/GIO types
typedef struct _GDBusConnection GDBusConnection;
typedef struct _GMainContext GMainContext;
typedef struct _GMainLoop GMainLoop;
typedef struct _GVariant GVariant;
typedef struct _GError GError;

namespace DeskLocker {

//!
//! \brief The SessionId class is the immutable session identifier read once from XDG_SESSION_ID at startup.
//!
class SessionId
{
public:
    explicit SessionId(const std::string& id);

    //!
    //! \brief Reads XDG_SESSION_ID. Throws DeskLockerException if it is not set.
    //!
    static SessionId FromEnvironment();

    const std::string& str() const;

private:
    std::string m_id;
};

//!
//! \brief The LogindClient class wraps the synchronous method calls this project makes on org.freedesktop.login1
//! over a private system bus connection. GDBusConnection method calls are thread-safe, so one client is shared by the
//! coordinator (inhibitors, idle hint) and main.
//!
class LogindClient
{
public:
    LogindClient();
    ~LogindClient();

    LogindClient(const LogindClient&) = delete;
    LogindClient& operator=(const LogindClient&) = delete;

    //!
    //! \brief Opens the client's private system bus connection. Throws ConnectionError.
    //!
    void Connect();

    bool IsConnected() const;

    //!
    //! \brief Opens a new private (non-shared) connection to the system bus. The caller owns the returned reference.
    //! Throws ConnectionError.
    //!
    static GDBusConnection* OpenSystemBus();

    //!
    //! \brief Manager.GetSession(id)
    //! \return the session object path. Throws ConnectionError.
    //!
    std::string GetSessionPath(const SessionId& session_id);

    //!
    //! \brief Manager.Inhibit(what, who, why, mode)
    //! \return the inhibitor file descriptor, owned by the caller. Throws AcquisitionDenied.
    //!
    int Inhibit(const std::string& what, const std::string& who, const std::string& why, const std::string& mode);

    //!
    //! \brief Session.SetIdleHint(idle) on the given session object. Throws PublishError.
    //!
    void SetIdleHint(const std::string& session_path, bool idle);

    //!
    //! \brief Manager.LockSession(id). Throws DeskLockerException.
    //!
    void LockSession(const SessionId& session_id);

    //!
    //! \brief Calls one of the Manager power methods that take a single "interactive" boolean: Suspend, Hibernate,
    //! Reboot or PowerOff. Throws DeskLockerException.
    //!
    void CallPowerAction(const std::string& method);

private:
    //!
    //! \brief Synchronous call on login1. Returns the reply (caller unrefs) or nullptr with error_message set.
    //!
    GVariant* Call(const std::string& object_path,
                   const std::string& interface_name,
                   const std::string& method,
                   GVariant* parameters,
                   const char* reply_type,
                   std::string& error_message);

    GDBusConnection* m_connection;
};

//!
//! \brief The LogindInhibitorManager class acquires delay-mode sleep inhibitors from logind.
//!
class LogindInhibitorManager : public InhibitorManager
{
public:
    LogindInhibitorManager(LogindClient& client, const std::string& who);

    InhibitorLock Acquire(const std::string& reason) override;

private:
    LogindClient& m_client;
    std::string m_who;
};

//!
//! \brief The SessionIdleHintSink class publishes the idle hint to the session object through logind.
//!
class SessionIdleHintSink : public IdleHintSink
{
public:
    SessionIdleHintSink(LogindClient& client, const std::string& session_path);

    void SetIdleHint(bool idle) override;

private:
    LogindClient& m_client;
    std::string m_session_path;
};

//!
//! \brief The LogindSignalSource class is the base for the event sources fed by login1 D-Bus signals. Each source
//! owns a private system bus connection and a GMainContext iterated by its own thread, so that signal delivery is
//! independent of the other sources. A closed connection posts CONNECTION_LOST.
//!
class LogindSignalSource
{
public:
    LogindSignalSource(EventQueue& queue, const std::string& name);
    virtual ~LogindSignalSource();

    LogindSignalSource(const LogindSignalSource&) = delete;
    LogindSignalSource& operator=(const LogindSignalSource&) = delete;

    //!
    //! \brief Connects, subscribes and starts the source thread. Throws ConnectionError.
    //!
    void Start();

    //!
    //! \brief Stops the source thread and closes the connection. Safe to call more than once.
    //!
    void Stop();

    bool IsRunning() const;

    const std::string& GetName() const;

    //! Posts an event to the merged stream. Called from the signal callbacks.
    void Post(const LockEvent& event);

protected:
    //!
    //! \brief Verifies the remote objects exist and registers the signal subscriptions on the connection. Called with
    //! the source's main context as thread default. Throws ConnectionError.
    //!
    virtual void Subscribe(GDBusConnection* connection) = 0;

    //! Records a subscription id so that Stop() can remove it.
    void AddSubscription(unsigned int subscription_id);

public: // Accessible to static C callbacks
    static void HandleConnectionClosed(GDBusConnection* connection, int remote_peer_vanished, GError* error, void* user_data);

private:
    void SourceThread();

    void Cleanup();

    static int QuitLoop(void* user_data);

    EventQueue& m_queue;
    std::string m_name;

    GDBusConnection* m_connection;
    GMainContext* m_context;
    GMainLoop* m_loop;

    std::vector<unsigned int> m_subscriptions;
    unsigned long m_closed_handler_id;

    std::thread m_source_thread;
    std::atomic<bool> m_running;
};

//!
//! \brief The PowerSource class posts PREPARE_FOR_SLEEP events from Manager.PrepareForSleep.
//!
class PowerSource : public LogindSignalSource
{
public:
    explicit PowerSource(EventQueue& queue);

    //! Stops the source thread before this part of the object goes away.
    ~PowerSource() override;

    //!
    //! \brief Posts PREPARE_FOR_SLEEP for a (b) PrepareForSleep payload. Other signatures are logged and dropped.
    //!
    static void HandlePrepareForSleep(GDBusConnection* connection,
                                      const char* sender_name,
                                      const char* object_path,
                                      const char* interface_name,
                                      const char* signal_name,
                                      GVariant* parameters,
                                      void* user_data);

protected:
    void Subscribe(GDBusConnection* connection) override;
};

//!
//! \brief The SessionSource class posts LOCK_REQUESTED and UNLOCK_REQUESTED from the Lock and Unlock signals of the
//! session object.
//!
class SessionSource : public LogindSignalSource
{
public:
    SessionSource(EventQueue& queue, const SessionId& session_id);

    ~SessionSource() override;

    //! The resolved session object path. Empty until Start() succeeds.
    std::string GetSessionPath() const;

    //!
    //! \brief Maps the Lock and Unlock signals to LOCK_REQUESTED and UNLOCK_REQUESTED. Other names are dropped.
    //!
    static void HandleLockSignal(GDBusConnection* connection,
                                 const char* sender_name,
                                 const char* object_path,
                                 const char* interface_name,
                                 const char* signal_name,
                                 GVariant* parameters,
                                 void* user_data);

protected:
    void Subscribe(GDBusConnection* connection) override;

private:
    SessionId m_session_id;
    std::string m_session_path;
};

} // namespace DeskLocker

#endif // LOGIND_H
