/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <idle_hint.h>
#include <util.h>

using namespace DeskLocker;

IdleHintPublisher::IdleHintPublisher(IdleHintSink* sink, bool enabled)
    : m_sink(sink)
    , m_enabled(enabled && sink != nullptr)
    , m_last_published()
{}

bool IdleHintPublisher::Update(bool idle)
{
    std::unique_lock<std::mutex> lock(mtx_idle_hint);

    if (!m_enabled) {
        return false;
    }

    if (m_last_published && *m_last_published == idle) {
        debug_log("INFO: %s: idle hint already %s, not republished",
                  __func__,
                  idle ? "true" : "false");
        return false;
    }

    try {
        m_sink->SetIdleHint(idle);
    } catch (const PublishError& e) {
        error_log("%s: unable to publish idle hint: %s",
                  __func__,
                  e.what());
        return false;
    }

    m_last_published = idle;

    debug_log("INFO: %s: published idle hint %s",
              __func__,
              idle ? "true" : "false");

    return true;
}

bool IdleHintPublisher::IsEnabled() const
{
    return m_enabled;
}

std::optional<bool> IdleHintPublisher::GetLastPublished() const
{
    std::unique_lock<std::mutex> lock(mtx_idle_hint);

    return m_last_published;
}
