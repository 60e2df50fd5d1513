/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <gtest/gtest.h>
#include <inhibitor.h>
#include <util.h>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

using namespace DeskLocker;

//!
//! \brief Stands in for a session manager inhibitor with a pipe: the write end is the lock handed out, and the read
//! end reports EOF once every copy of the write end has been closed, which is exactly when logind would lift the
//! inhibition.
//!
class PipeInhibitorTest : public ::testing::Test
{
protected:
    int m_read_fd = -1;
    int m_write_fd = -1;

    void SetUp() override
    {
        int fds[2];
        ASSERT_EQ(pipe2(fds, O_CLOEXEC), 0);
        m_read_fd = fds[0];
        m_write_fd = fds[1];
    }

    void TearDown() override
    {
        if (m_read_fd >= 0) {
            close(m_read_fd);
        }
    }

    //! True once all write ends are closed.
    bool InhibitionLifted() const
    {
        struct pollfd pfd = {m_read_fd, POLLIN, 0};

        if (poll(&pfd, 1, 0) != 1) {
            return false;
        }

        char c;
        return read(m_read_fd, &c, 1) == 0;
    }

    static bool IsOpen(int fd)
    {
        return fcntl(fd, F_GETFD) != -1;
    }
};

// ============================================================================
// InhibitorLock
// ============================================================================

TEST(InhibitorLock, DefaultIsNotHeld)
{
    InhibitorLock lock;
    EXPECT_FALSE(lock.IsHeld());
    EXPECT_EQ(lock.GetFd(), -1);
    EXPECT_EQ(lock.ToString(), "released");
}

TEST(InhibitorLock, NegativeDescriptorIsNotHeld)
{
    InhibitorLock lock(-1);
    EXPECT_FALSE(lock.IsHeld());
    EXPECT_NO_THROW(lock.Release());
}

TEST_F(PipeInhibitorTest, HeldUntilReleased)
{
    InhibitorLock lock(m_write_fd);

    EXPECT_TRUE(lock.IsHeld());
    EXPECT_EQ(lock.GetFd(), m_write_fd);
    EXPECT_EQ(lock.ToString(), "fd " + std::to_string(m_write_fd));
    EXPECT_FALSE(InhibitionLifted());

    lock.Release();

    EXPECT_FALSE(lock.IsHeld());
    EXPECT_TRUE(InhibitionLifted());
}

TEST_F(PipeInhibitorTest, ReleaseIsIdempotent)
{
    InhibitorLock lock(m_write_fd);

    lock.Release();
    EXPECT_NO_THROW(lock.Release());
    EXPECT_FALSE(lock.IsHeld());
}

TEST_F(PipeInhibitorTest, CopiesShareOneDescriptor)
{
    InhibitorLock lock(m_write_fd);
    InhibitorLock copy = lock;

    EXPECT_TRUE(lock.SharesDescriptorWith(copy));
    EXPECT_EQ(copy.GetFd(), m_write_fd);

    // Releasing through the copy releases the original too, and only once.
    copy.Release();

    EXPECT_FALSE(lock.IsHeld());
    EXPECT_NO_THROW(lock.Release());
    EXPECT_TRUE(InhibitionLifted());
}

TEST_F(PipeInhibitorTest, LastCopyDestructionCloses)
{
    {
        InhibitorLock lock(m_write_fd);
        {
            InhibitorLock copy = lock;
        }
        EXPECT_TRUE(IsOpen(m_write_fd));
        EXPECT_FALSE(InhibitionLifted());
    }

    EXPECT_TRUE(InhibitionLifted());
}

// ============================================================================
// Duplicate
// ============================================================================

TEST_F(PipeInhibitorTest, DuplicateIsIndependent)
{
    InhibitorLock lock(m_write_fd);
    InhibitorLock duplicate = lock.Duplicate();

    ASSERT_TRUE(duplicate.IsHeld());
    EXPECT_NE(duplicate.GetFd(), lock.GetFd());
    EXPECT_FALSE(duplicate.SharesDescriptorWith(lock));

    // The duplicate is close-on-exec until a child clears the flag.
    EXPECT_TRUE(fcntl(duplicate.GetFd(), F_GETFD) & FD_CLOEXEC);

    // The inhibition outlives the original while the duplicate is open.
    lock.Release();
    EXPECT_FALSE(InhibitionLifted());

    duplicate.Release();
    EXPECT_TRUE(InhibitionLifted());
}

TEST(InhibitorLock, DuplicateOfReleasedHandleThrows)
{
    InhibitorLock lock;
    EXPECT_THROW(lock.Duplicate(), DeskLockerException);
}

// ============================================================================
// InhibitorManager Transfer/Release
// ============================================================================

//!
//! \brief Manager whose Acquire() hands out the write end of a pipe.
//!
class PipeInhibitorManager : public InhibitorManager
{
public:
    explicit PipeInhibitorManager(int fd) : m_fd(fd) {}

    InhibitorLock Acquire(const std::string& reason) override
    {
        if (m_fd < 0) {
            throw AcquisitionDenied("no descriptor left for " + reason);
        }

        int fd = m_fd;
        m_fd = -1;

        return InhibitorLock(fd);
    }

private:
    int m_fd;
};

TEST_F(PipeInhibitorTest, ManagerTransferLeavesOriginalHeld)
{
    PipeInhibitorManager manager(m_write_fd);

    InhibitorLock lock = manager.Acquire("test");
    InhibitorLock transferred = manager.Transfer(lock);

    EXPECT_TRUE(lock.IsHeld());
    EXPECT_TRUE(transferred.IsHeld());

    manager.Release(lock);
    EXPECT_FALSE(lock.IsHeld());
    EXPECT_FALSE(InhibitionLifted());

    manager.Release(transferred);
    EXPECT_TRUE(InhibitionLifted());
}

TEST_F(PipeInhibitorTest, ManagerReleaseOfReleasedHandleIsNoOp)
{
    PipeInhibitorManager manager(m_write_fd);

    InhibitorLock lock = manager.Acquire("test");

    manager.Release(lock);
    EXPECT_NO_THROW(manager.Release(lock));

    EXPECT_THROW(manager.Acquire("again"), AcquisitionDenied);
}

TEST(InhibitorManager, TransferOfReleasedHandleThrows)
{
    PipeInhibitorManager manager(-1);
    InhibitorLock lock;

    EXPECT_THROW(manager.Transfer(lock), DeskLockerException);
}
