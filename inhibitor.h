/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef INHIBITOR_H
#define INHIBITOR_H

#include <memory>
#include <mutex>
#include <string>

#include <sys/types.h>

namespace DeskLocker {

//!
//! \brief The InhibitorLock class is a reference-counted handle on a sleep inhibitor file descriptor. Copies of the
//! handle share one descriptor. Release() closes the descriptor exactly once; releasing an already released handle
//! (through any copy) is a no-op. The descriptor is also closed when the last copy is destroyed.
//!
//! A second, independent reference to the same inhibition (for a child process) is produced by Duplicate(), which
//! dup()s the descriptor. The session manager only lifts the inhibition once every duplicate has been closed.
//!
class InhibitorLock
{
public:
    //! Constructs an empty (not held) handle.
    InhibitorLock();

    //!
    //! \brief Takes ownership of the provided descriptor.
    //! \param fd
    //!
    explicit InhibitorLock(int fd);

    //!
    //! \brief Returns true while the descriptor is open.
    //!
    bool IsHeld() const;

    //!
    //! \brief Returns the descriptor number, or -1 if not held.
    //!
    int GetFd() const;

    //!
    //! \brief Creates an independent handle on a dup() of the descriptor. The duplicate is close-on-exec; whoever
    //! hands it to a child process must clear the flag in the child.
    //! \return the duplicate handle. Throws DeskLockerException if the handle is not held or dup fails.
    //!
    InhibitorLock Duplicate() const;

    //!
    //! \brief Closes the descriptor. Idempotent.
    //!
    void Release();

    //!
    //! \brief Returns true if both handles share the same descriptor (are copies of each other).
    //!
    bool SharesDescriptorWith(const InhibitorLock& other) const;

    std::string ToString() const;

private:
    struct Descriptor
    {
        explicit Descriptor(int fd);
        ~Descriptor();

        Descriptor(const Descriptor&) = delete;
        Descriptor& operator=(const Descriptor&) = delete;

        void Close();

        mutable std::mutex mtx_descriptor;
        int m_fd;
    };

    std::shared_ptr<Descriptor> m_descriptor;
};

//!
//! \brief The InhibitorManager class acquires, transfers and releases sleep inhibitors. Acquire() is implemented by
//! the session manager binding (see LogindInhibitorManager). Transfer() and Release() operate on the descriptor and
//! are virtual only so that they can be observed in tests.
//!
class InhibitorManager
{
public:
    virtual ~InhibitorManager() = default;

    //!
    //! \brief Requests a delay-type sleep inhibitor.
    //! \param reason
    //! \return the held inhibitor. Throws AcquisitionDenied on failure.
    //!
    virtual InhibitorLock Acquire(const std::string& reason) = 0;

    //!
    //! \brief Produces a second reference to the same inhibition, suitable for inheritance by a child process. The
    //! original handle is not consumed.
    //! \param handle
    //! \return the duplicate handle. Throws DeskLockerException on failure.
    //!
    virtual InhibitorLock Transfer(const InhibitorLock& handle);

    //!
    //! \brief Releases the handle. Releasing an already released handle is a no-op.
    //! \param handle
    //!
    virtual void Release(InhibitorLock& handle);
};

} // namespace DeskLocker

#endif // INHIBITOR_H
