#include <gtest/gtest.h>

#include "io/fd.hpp"

#include <fcntl.h>
#include <unistd.h>

namespace {

TEST(FdTests, ClosesFileDescriptorOnDestruct) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    {
        relup::Fd holder(fd);
        ASSERT_TRUE(holder.Valid());
        EXPECT_EQ(holder.Get(), fd);
    }

    errno = 0;
    int rc = ::close(fd);
    EXPECT_EQ(rc, -1);
    EXPECT_EQ(errno, EBADF);
}

TEST(FdTests, ReleaseHandsOwnershipBack) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    int released = -1;
    {
        relup::Fd holder(fd);
        released = holder.Release();
        EXPECT_FALSE(holder.Valid());
    }

    EXPECT_EQ(released, fd);
    EXPECT_EQ(::close(released), 0);
}

TEST(FdTests, MoveTransfersOwnership) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    relup::Fd a(fd);
    relup::Fd b(std::move(a));
    EXPECT_FALSE(a.Valid());
    ASSERT_TRUE(b.Valid());
    EXPECT_EQ(b.Get(), fd);
}

} // namespace
