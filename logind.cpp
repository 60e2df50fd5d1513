/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <logind.h>
#include <util.h>

#include <system_error>

#include <gio/gio.h>
#include <gio/gunixfdlist.h>

using namespace DeskLocker;

namespace {
const char* const LOGIND_BUS_NAME = "org.freedesktop.login1";
const char* const LOGIND_PATH = "/org/freedesktop/login1";
const char* const MANAGER_INTERFACE = "org.freedesktop.login1.Manager";
const char* const SESSION_INTERFACE = "org.freedesktop.login1.Session";

const int DBUS_CALL_TIMEOUT_MS = 5000;

//!
//! \brief Synchronous method call on login1 over the provided connection.
//! \return the reply, which the caller must unref, or nullptr with error_message populated.
//!
GVariant* CallLogind(GDBusConnection* connection,
                     const std::string& object_path,
                     const std::string& interface_name,
                     const std::string& method,
                     GVariant* parameters,
                     const char* reply_type,
                     int timeout_ms,
                     std::string& error_message)
{
    GError* dbus_error = nullptr;

    GVariant* dbus_result = g_dbus_connection_call_sync(connection,
                                                        LOGIND_BUS_NAME,
                                                        object_path.c_str(),
                                                        interface_name.c_str(),
                                                        method.c_str(),
                                                        parameters, // floating reference consumed by the call
                                                        reply_type ? G_VARIANT_TYPE(reply_type) : nullptr,
                                                        G_DBUS_CALL_FLAGS_NONE,
                                                        timeout_ms,
                                                        nullptr,
                                                        &dbus_error);

    if (dbus_error) {
        error_message = dbus_error->message;
        g_error_free(dbus_error);

        if (dbus_result) {
            g_variant_unref(dbus_result);
        }

        return nullptr;
    }

    if (!dbus_result) {
        error_message = "call returned no result and no error";
    }

    return dbus_result;
}

std::string ResolveSessionPath(GDBusConnection* connection, const SessionId& session_id)
{
    std::string error_message;

    GVariant* reply = CallLogind(connection,
                                 LOGIND_PATH,
                                 MANAGER_INTERFACE,
                                 "GetSession",
                                 g_variant_new("(s)", session_id.str().c_str()),
                                 "(o)",
                                 DBUS_CALL_TIMEOUT_MS,
                                 error_message);

    if (!reply) {
        throw ConnectionError("Unable to resolve session " + session_id.str() + ": " + error_message);
    }

    const gchar* path = nullptr;
    g_variant_get(reply, "(&o)", &path);

    std::string session_path(path);
    g_variant_unref(reply);

    return session_path;
}
} // anonymous namespace

// Class SessionId

SessionId::SessionId(const std::string& id)
    : m_id(id)
{}

SessionId SessionId::FromEnvironment()
{
    std::optional<std::string> id = GetEnvVariable("XDG_SESSION_ID");

    if (!id) {
        throw DeskLockerException("XDG_SESSION_ID is not set. desk_locker must be started inside a logind session.");
    }

    return SessionId(*id);
}

const std::string& SessionId::str() const
{
    return m_id;
}

// Class LogindClient

LogindClient::LogindClient()
    : m_connection(nullptr)
{}

LogindClient::~LogindClient()
{
    if (m_connection) {
        g_dbus_connection_close_sync(m_connection, nullptr, nullptr);
        g_object_unref(m_connection);
        m_connection = nullptr;
    }
}

void LogindClient::Connect()
{
    if (m_connection) {
        return;
    }

    m_connection = OpenSystemBus();

    debug_log("INFO: %s: connected to the system bus as %s",
              __func__,
              g_dbus_connection_get_unique_name(m_connection));
}

bool LogindClient::IsConnected() const
{
    return m_connection != nullptr && !g_dbus_connection_is_closed(m_connection);
}

GDBusConnection* LogindClient::OpenSystemBus()
{
    GError* dbus_error = nullptr;

    gchar* address = g_dbus_address_get_for_bus_sync(G_BUS_TYPE_SYSTEM, nullptr, &dbus_error);

    if (!address) {
        std::string message = dbus_error ? dbus_error->message : "unknown error";

        if (dbus_error) {
            g_error_free(dbus_error);
        }

        throw ConnectionError("Unable to determine the system bus address: " + message);
    }

    GDBusConnection* connection =
        g_dbus_connection_new_for_address_sync(address,
                                               static_cast<GDBusConnectionFlags>(
                                                   G_DBUS_CONNECTION_FLAGS_AUTHENTICATION_CLIENT
                                                   | G_DBUS_CONNECTION_FLAGS_MESSAGE_BUS_CONNECTION),
                                               nullptr,
                                               nullptr,
                                               &dbus_error);
    g_free(address);

    if (!connection) {
        std::string message = dbus_error ? dbus_error->message : "unknown error";

        if (dbus_error) {
            g_error_free(dbus_error);
        }

        throw ConnectionError("Unable to connect to the system bus: " + message);
    }

    g_dbus_connection_set_exit_on_close(connection, FALSE);

    return connection;
}

GVariant* LogindClient::Call(const std::string& object_path,
                             const std::string& interface_name,
                             const std::string& method,
                             GVariant* parameters,
                             const char* reply_type,
                             std::string& error_message)
{
    if (!m_connection) {
        if (parameters) {
            g_variant_unref(g_variant_ref_sink(parameters));
        }

        error_message = "not connected to the system bus";
        return nullptr;
    }

    return CallLogind(m_connection,
                      object_path,
                      interface_name,
                      method,
                      parameters,
                      reply_type,
                      DBUS_CALL_TIMEOUT_MS,
                      error_message);
}

std::string LogindClient::GetSessionPath(const SessionId& session_id)
{
    if (!m_connection) {
        throw ConnectionError("Unable to resolve session " + session_id.str() + ": not connected to the system bus");
    }

    return ResolveSessionPath(m_connection, session_id);
}

int LogindClient::Inhibit(const std::string& what,
                          const std::string& who,
                          const std::string& why,
                          const std::string& mode)
{
    if (!m_connection) {
        throw AcquisitionDenied("Inhibit: not connected to the system bus");
    }

    GError* dbus_error = nullptr;
    GUnixFDList* out_fd_list = nullptr;

    GVariant* dbus_result =
        g_dbus_connection_call_with_unix_fd_list_sync(m_connection,
                                                      LOGIND_BUS_NAME,
                                                      LOGIND_PATH,
                                                      MANAGER_INTERFACE,
                                                      "Inhibit",
                                                      g_variant_new("(ssss)",
                                                                    what.c_str(),
                                                                    who.c_str(),
                                                                    why.c_str(),
                                                                    mode.c_str()),
                                                      G_VARIANT_TYPE("(h)"),
                                                      G_DBUS_CALL_FLAGS_NONE,
                                                      DBUS_CALL_TIMEOUT_MS,
                                                      nullptr,
                                                      &out_fd_list,
                                                      nullptr,
                                                      &dbus_error);

    if (!dbus_result) {
        std::string message = dbus_error ? dbus_error->message : "unknown error";

        if (dbus_error) {
            g_error_free(dbus_error);
        }

        throw AcquisitionDenied("Inhibit(" + what + ", " + mode + ") failed: " + message);
    }

    gint32 fd_index = -1;
    g_variant_get(dbus_result, "(h)", &fd_index);
    g_variant_unref(dbus_result);

    if (!out_fd_list) {
        throw AcquisitionDenied("Inhibit(" + what + ", " + mode + ") reply carried no file descriptor");
    }

    // g_unix_fd_list_get() returns a close-on-exec duplicate owned by the caller.
    int fd = g_unix_fd_list_get(out_fd_list, fd_index, &dbus_error);
    g_object_unref(out_fd_list);

    if (fd < 0) {
        std::string message = dbus_error ? dbus_error->message : "unknown error";

        if (dbus_error) {
            g_error_free(dbus_error);
        }

        throw AcquisitionDenied("Inhibit(" + what + ", " + mode + ") file descriptor unavailable: " + message);
    }

    debug_log("INFO: %s: took %s inhibitor for %s as fd %i",
              __func__,
              mode,
              what,
              fd);

    return fd;
}

void LogindClient::SetIdleHint(const std::string& session_path, bool idle)
{
    std::string error_message;

    GVariant* reply = Call(session_path,
                           SESSION_INTERFACE,
                           "SetIdleHint",
                           g_variant_new("(b)", idle ? TRUE : FALSE),
                           nullptr,
                           error_message);

    if (!reply) {
        throw PublishError("SetIdleHint(" + std::string(idle ? "true" : "false") + ") failed: " + error_message);
    }

    g_variant_unref(reply);
}

void LogindClient::LockSession(const SessionId& session_id)
{
    std::string error_message;

    GVariant* reply = Call(LOGIND_PATH,
                           MANAGER_INTERFACE,
                           "LockSession",
                           g_variant_new("(s)", session_id.str().c_str()),
                           nullptr,
                           error_message);

    if (!reply) {
        throw DeskLockerException("LockSession(" + session_id.str() + ") failed: " + error_message);
    }

    g_variant_unref(reply);
}

void LogindClient::CallPowerAction(const std::string& method)
{
    if (!m_connection) {
        throw DeskLockerException(method + " failed: not connected to the system bus");
    }

    std::string error_message;

    // Interactive: polkit may prompt, so use the default (long) D-Bus timeout.
    GVariant* reply = CallLogind(m_connection,
                                 LOGIND_PATH,
                                 MANAGER_INTERFACE,
                                 method,
                                 g_variant_new("(b)", TRUE),
                                 nullptr,
                                 -1,
                                 error_message);

    if (!reply) {
        throw DeskLockerException(method + " failed: " + error_message);
    }

    g_variant_unref(reply);
}

// Class LogindInhibitorManager

LogindInhibitorManager::LogindInhibitorManager(LogindClient& client, const std::string& who)
    : m_client(client)
    , m_who(who)
{}

InhibitorLock LogindInhibitorManager::Acquire(const std::string& reason)
{
    InhibitorLock lock(m_client.Inhibit("sleep", m_who, reason, "delay"));

    debug_log("INFO: %s: acquired sleep delay inhibitor (%s)",
              __func__,
              lock.ToString());

    return lock;
}

// Class SessionIdleHintSink

SessionIdleHintSink::SessionIdleHintSink(LogindClient& client, const std::string& session_path)
    : m_client(client)
    , m_session_path(session_path)
{}

void SessionIdleHintSink::SetIdleHint(bool idle)
{
    m_client.SetIdleHint(m_session_path, idle);
}

// Class LogindSignalSource

LogindSignalSource::LogindSignalSource(EventQueue& queue, const std::string& name)
    : m_queue(queue)
    , m_name(name)
    , m_connection(nullptr)
    , m_context(nullptr)
    , m_loop(nullptr)
    , m_subscriptions()
    , m_closed_handler_id(0)
    , m_running(false)
{}

LogindSignalSource::~LogindSignalSource()
{
    Stop();
}

void LogindSignalSource::Start()
{
    if (m_running.load()) {
        debug_log("INFO: %s: %s already running.", __func__, m_name);
        return;
    }

    log("INFO: %s: Starting %s.", __func__, m_name);

    m_context = g_main_context_new();

    // The connection's "closed" signal and the signal subscriptions are dispatched to the thread-default context
    // current at the time they are made, which is the one the source thread iterates.
    g_main_context_push_thread_default(m_context);

    try {
        m_connection = LogindClient::OpenSystemBus();

        m_closed_handler_id = g_signal_connect(m_connection,
                                               "closed",
                                               G_CALLBACK(LogindSignalSource::HandleConnectionClosed),
                                               this);

        Subscribe(m_connection);
    } catch (const ConnectionError& e) {
        g_main_context_pop_thread_default(m_context);
        Cleanup();

        error_log("%s: %s failed to start: %s", __func__, m_name, e.what());
        throw;
    }

    g_main_context_pop_thread_default(m_context);

    m_loop = g_main_loop_new(m_context, FALSE);

    m_running = true;

    try {
        m_source_thread = std::thread(&LogindSignalSource::SourceThread, this);
    } catch (const std::system_error& e) {
        m_running = false;
        Cleanup();

        throw ThreadException(m_name + ": failed to start source thread: " + e.what());
    }

    log("INFO: %s: %s started.", __func__, m_name);
}

void LogindSignalSource::Stop()
{
    if (!m_running.exchange(false)) {
        Cleanup();
        return;
    }

    log("INFO: %s: Stopping %s...", __func__, m_name);

    // g_main_loop_quit() before the loop has started running would be lost, so quit from inside the loop.
    GSource* quit_source = g_idle_source_new();
    g_source_set_callback(quit_source, LogindSignalSource::QuitLoop, m_loop, nullptr);
    g_source_attach(quit_source, m_context);
    g_source_unref(quit_source);

    if (m_source_thread.joinable() && m_source_thread.get_id() != std::this_thread::get_id()) {
        try {
            m_source_thread.join();
        } catch (const std::system_error& e) {
            error_log("%s: Error joining %s thread: %s", __func__, m_name, e.what());
        }
    }

    Cleanup();

    log("INFO: %s: %s stopped.", __func__, m_name);
}

bool LogindSignalSource::IsRunning() const
{
    return m_running.load();
}

const std::string& LogindSignalSource::GetName() const
{
    return m_name;
}

void LogindSignalSource::Post(const LockEvent& event)
{
    debug_log("INFO: %s: %s: %s", __func__, m_name, event.ToString());

    m_queue.Push(event);
}

void LogindSignalSource::AddSubscription(unsigned int subscription_id)
{
    m_subscriptions.push_back(subscription_id);
}

void LogindSignalSource::SourceThread()
{
    debug_log("INFO: %s: %s thread started.", __func__, m_name);

    g_main_context_push_thread_default(m_context);
    g_main_loop_run(m_loop);
    g_main_context_pop_thread_default(m_context);

    debug_log("INFO: %s: %s thread exiting.", __func__, m_name);
}

void LogindSignalSource::Cleanup()
{
    if (m_connection) {
        if (m_closed_handler_id != 0) {
            g_signal_handler_disconnect(m_connection, m_closed_handler_id);
            m_closed_handler_id = 0;
        }

        for (const auto& subscription_id : m_subscriptions) {
            g_dbus_connection_signal_unsubscribe(m_connection, subscription_id);
        }

        g_dbus_connection_close_sync(m_connection, nullptr, nullptr);
        g_object_unref(m_connection);
        m_connection = nullptr;
    }

    m_subscriptions.clear();

    if (m_loop) {
        g_main_loop_unref(m_loop);
        m_loop = nullptr;
    }

    if (m_context) {
        g_main_context_unref(m_context);
        m_context = nullptr;
    }
}

void LogindSignalSource::HandleConnectionClosed(GDBusConnection* connection,
                                                int remote_peer_vanished,
                                                GError* error,
                                                void* user_data)
{
    (void) connection;

    LogindSignalSource* source = static_cast<LogindSignalSource*>(user_data);

    error_log("%s: %s: system bus connection closed (remote peer vanished: %s): %s",
              __func__,
              source->m_name,
              remote_peer_vanished ? "true" : "false",
              error ? error->message : "no error reported");

    source->Post(LockEvent::ConnectionLost(source->m_name));
}

int LogindSignalSource::QuitLoop(void* user_data)
{
    g_main_loop_quit(static_cast<GMainLoop*>(user_data));

    return G_SOURCE_REMOVE;
}

// Class PowerSource

PowerSource::PowerSource(EventQueue& queue)
    : LogindSignalSource(queue, "PowerSource")
{}

PowerSource::~PowerSource()
{
    // The signal callbacks cast user_data to PowerSource, so the thread must be gone before the base destructor.
    Stop();
}

void PowerSource::Subscribe(GDBusConnection* connection)
{
    std::string error_message;

    GVariant* reply = CallLogind(connection,
                                 LOGIND_PATH,
                                 "org.freedesktop.DBus.Peer",
                                 "Ping",
                                 nullptr,
                                 nullptr,
                                 DBUS_CALL_TIMEOUT_MS,
                                 error_message);

    if (!reply) {
        throw ConnectionError("login1 is not reachable on the system bus: " + error_message);
    }

    g_variant_unref(reply);

    AddSubscription(g_dbus_connection_signal_subscribe(connection,
                                                       LOGIND_BUS_NAME,
                                                       MANAGER_INTERFACE,
                                                       "PrepareForSleep",
                                                       LOGIND_PATH,
                                                       nullptr,
                                                       G_DBUS_SIGNAL_FLAGS_NONE,
                                                       PowerSource::HandlePrepareForSleep,
                                                       this,
                                                       nullptr));

    debug_log("INFO: %s: subscribed to %s.PrepareForSleep", __func__, MANAGER_INTERFACE);
}

void PowerSource::HandlePrepareForSleep(GDBusConnection* connection,
                                        const char* sender_name,
                                        const char* object_path,
                                        const char* interface_name,
                                        const char* signal_name,
                                        GVariant* parameters,
                                        void* user_data)
{
    (void) connection; (void) sender_name; (void) object_path; (void) interface_name;

    PowerSource* source = static_cast<PowerSource*>(user_data);

    if (!g_variant_is_of_type(parameters, G_VARIANT_TYPE("(b)"))) {
        error_log("%s: ignoring %s with unexpected signature %s",
                  __func__,
                  signal_name,
                  g_variant_get_type_string(parameters));
        return;
    }

    gboolean start = FALSE;
    g_variant_get(parameters, "(b)", &start);

    source->Post(LockEvent::PrepareForSleep(start));
}

// Class SessionSource

SessionSource::SessionSource(EventQueue& queue, const SessionId& session_id)
    : LogindSignalSource(queue, "SessionSource")
    , m_session_id(session_id)
    , m_session_path()
{}

SessionSource::~SessionSource()
{
    Stop();
}

std::string SessionSource::GetSessionPath() const
{
    return m_session_path;
}

void SessionSource::Subscribe(GDBusConnection* connection)
{
    m_session_path = ResolveSessionPath(connection, m_session_id);

    for (const char* member : {"Lock", "Unlock"}) {
        AddSubscription(g_dbus_connection_signal_subscribe(connection,
                                                           LOGIND_BUS_NAME,
                                                           SESSION_INTERFACE,
                                                           member,
                                                           m_session_path.c_str(),
                                                           nullptr,
                                                           G_DBUS_SIGNAL_FLAGS_NONE,
                                                           SessionSource::HandleLockSignal,
                                                           this,
                                                           nullptr));
    }

    log("INFO: %s: subscribed to Lock/Unlock of session %s (%s)",
        __func__,
        m_session_id.str(),
        m_session_path);
}

void SessionSource::HandleLockSignal(GDBusConnection* connection,
                                     const char* sender_name,
                                     const char* object_path,
                                     const char* interface_name,
                                     const char* signal_name,
                                     GVariant* parameters,
                                     void* user_data)
{
    (void) connection; (void) sender_name; (void) object_path; (void) interface_name; (void) parameters;

    SessionSource* source = static_cast<SessionSource*>(user_data);

    if (g_strcmp0(signal_name, "Lock") == 0) {
        source->Post(LockEvent::LockRequested());
    } else if (g_strcmp0(signal_name, "Unlock") == 0) {
        source->Post(LockEvent::UnlockRequested());
    } else {
        debug_log("INFO: %s: ignoring signal %s", __func__, signal_name ? signal_name : "(null)");
    }
}
