#include <gtest/gtest.h>

#include "CaptureError.hpp"
#include "SharedMemory.hpp"

#include <sys/stat.h>
#include <fcntl.h>

#include <stdexcept>
#include <utility>

using namespace Capture;

TEST(SharedMemory, SizesAndMaps) {
    SharedMemory memory = SharedMemory::create();
    ASSERT_GE(memory.fd(), 0);
    EXPECT_FALSE(memory.mapped());

    memory.resize(4096 * 3);
    memory.map();
    ASSERT_TRUE(memory.mapped());
    EXPECT_EQ(memory.size(), 4096u * 3);

    struct stat st;
    ASSERT_EQ(fstat(memory.fd(), &st), 0);
    EXPECT_EQ(st.st_size, 4096 * 3);

    memory.data()[0] = 0x5a;
    memory.data()[memory.size() - 1] = 0xa5;
    EXPECT_EQ(memory.data()[0], 0x5a);
}

TEST(SharedMemory, DescriptorIsCloseOnExec) {
    SharedMemory memory = SharedMemory::create();
    const int flags = fcntl(memory.fd(), F_GETFD);
    ASSERT_GE(flags, 0);
    EXPECT_TRUE(flags & FD_CLOEXEC);
}

TEST(SharedMemory, ResizeOnlyOnceAndBeforeMap) {
    SharedMemory memory = SharedMemory::create();
    EXPECT_THROW(memory.map(), std::logic_error);

    memory.resize(64);
    EXPECT_THROW(memory.resize(128), std::logic_error);
    memory.map();
}

TEST(SharedMemory, MoveTransfersOwnership) {
    SharedMemory a = SharedMemory::create();
    a.resize(16);
    a.map();
    const int fd = a.fd();

    SharedMemory b = std::move(a);
    EXPECT_EQ(b.fd(), fd);
    EXPECT_TRUE(b.mapped());
    EXPECT_EQ(a.fd(), -1);
    EXPECT_FALSE(a.mapped());
}

TEST(SharedMemory, ReleaseClosesDescriptor) {
    SharedMemory memory = SharedMemory::create();
    memory.resize(16);
    memory.map();
    const int fd = memory.fd();

    memory.release();
    EXPECT_FALSE(memory.mapped());
    EXPECT_EQ(memory.fd(), -1);
    EXPECT_EQ(fcntl(fd, F_GETFD), -1);
}
