/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef IDLE_HINT_H
#define IDLE_HINT_H

#include <mutex>
#include <optional>

namespace DeskLocker {

//!
//! \brief The IdleHintSink class is the destination of the idle hint. The production implementation is
//! SessionIdleHintSink (logind.h).
//!
class IdleHintSink
{
public:
    virtual ~IdleHintSink() = default;

    //!
    //! \brief Publishes the hint. Throws PublishError on failure.
    //! \param idle
    //!
    virtual void SetIdleHint(bool idle) = 0;
};

//!
//! \brief The IdleHintPublisher class reflects whether a locker is active back to the session manager. Publishing is
//! best effort and debounced on the last successfully published value. Failures are logged and never propagate.
//!
class IdleHintPublisher
{
public:
    //!
    //! \brief Constructor.
    //! \param sink destination of the hint. May be nullptr when the feature is disabled.
    //! \param enabled
    //!
    IdleHintPublisher(IdleHintSink* sink, bool enabled);

    //!
    //! \brief Publishes the hint unless it equals the last successfully published value.
    //! \param idle
    //! \return true if the sink was called and succeeded.
    //!
    bool Update(bool idle);

    bool IsEnabled() const;

    //!
    //! \brief The last value the sink accepted, or std::nullopt if none has been published yet.
    //!
    std::optional<bool> GetLastPublished() const;

private:
    mutable std::mutex mtx_idle_hint;

    IdleHintSink* m_sink;
    bool m_enabled;
    std::optional<bool> m_last_published;
};

} // namespace DeskLocker

#endif // IDLE_HINT_H
