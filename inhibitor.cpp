/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <inhibitor.h>
#include <util.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

using namespace DeskLocker;

// Class InhibitorLock::Descriptor

InhibitorLock::Descriptor::Descriptor(int fd)
    : m_fd(fd)
{}

InhibitorLock::Descriptor::~Descriptor()
{
    Close();
}

void InhibitorLock::Descriptor::Close()
{
    std::unique_lock<std::mutex> lock(mtx_descriptor);

    if (m_fd < 0) {
        return;
    }

    if (close(m_fd) == -1) {
        error_log("%s: close(%i) on inhibitor descriptor failed: %s",
                  __func__,
                  m_fd,
                  strerror(errno));
    }

    m_fd = -1;
}

// Class InhibitorLock

InhibitorLock::InhibitorLock()
    : m_descriptor(nullptr)
{}

InhibitorLock::InhibitorLock(int fd)
    : m_descriptor(fd >= 0 ? std::make_shared<Descriptor>(fd) : nullptr)
{}

bool InhibitorLock::IsHeld() const
{
    return GetFd() >= 0;
}

int InhibitorLock::GetFd() const
{
    if (!m_descriptor) {
        return -1;
    }

    std::unique_lock<std::mutex> lock(m_descriptor->mtx_descriptor);

    return m_descriptor->m_fd;
}

InhibitorLock InhibitorLock::Duplicate() const
{
    int fd = GetFd();

    if (fd < 0) {
        throw DeskLockerException("Cannot duplicate an inhibitor lock that is not held");
    }

    int dup_fd = fcntl(fd, F_DUPFD_CLOEXEC, 0);

    if (dup_fd == -1) {
        throw DeskLockerException(std::string("Duplicating inhibitor lock file descriptor failed: ") + strerror(errno));
    }

    return InhibitorLock(dup_fd);
}

void InhibitorLock::Release()
{
    if (m_descriptor) {
        m_descriptor->Close();
    }
}

bool InhibitorLock::SharesDescriptorWith(const InhibitorLock& other) const
{
    return m_descriptor != nullptr && m_descriptor == other.m_descriptor;
}

std::string InhibitorLock::ToString() const
{
    int fd = GetFd();

    return fd >= 0 ? "fd " + ::ToString(fd) : "released";
}

// Class InhibitorManager

InhibitorLock InhibitorManager::Transfer(const InhibitorLock& handle)
{
    InhibitorLock duplicate = handle.Duplicate();

    debug_log("INFO: %s: duplicated inhibitor %s as %s",
              __func__,
              handle.ToString(),
              duplicate.ToString());

    return duplicate;
}

void InhibitorManager::Release(InhibitorLock& handle)
{
    if (!handle.IsHeld()) {
        return;
    }

    debug_log("INFO: %s: releasing inhibitor %s",
              __func__,
              handle.ToString());

    handle.Release();
}
