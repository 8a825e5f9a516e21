#include "SharedMemory.hpp"
#include "CaptureError.hpp"
#include "Log.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>
#include <utility>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <unistd.h>

#ifndef MFD_CLOEXEC
#define MFD_CLOEXEC 0x0001U
#endif

#ifndef MFD_ALLOW_SEALING
#define MFD_ALLOW_SEALING 0x0002U
#endif

namespace Capture {

namespace {

[[noreturn]] void fail(const std::string& what, int err) {
    throw CaptureError(ErrorKind::ResourceExhaustion, what + ": " + std::strerror(err));
}

// Returns -1 with errno == ENOSYS when memfd is not available.
int createMemfd() {
    for (;;) {
        int fd = static_cast<int>(syscall(SYS_memfd_create, "wlsnap", MFD_CLOEXEC | MFD_ALLOW_SEALING));
        if (fd >= 0) {
#if defined(F_ADD_SEALS) && defined(F_SEAL_SHRINK) && defined(F_SEAL_SEAL)
            // Only an optimisation, failures are harmless.
            if (fcntl(fd, F_ADD_SEALS, F_SEAL_SHRINK | F_SEAL_SEAL) < 0) {
                Log::debug() << "memfd sealing failed: " << std::strerror(errno) << std::endl;
            }
#endif
            return fd;
        }
        if (errno == EINTR) continue;
        if (errno == ENOSYS) return -1;
        fail("memfd_create failed", errno);
    }
}

std::string uniqueShmName() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count() % 1000000000;
    return "/wlsnap-" + std::to_string(nanos);
}

int createShmFile() {
    std::string name = uniqueShmName();
    for (;;) {
        int fd = shm_open(name.c_str(), O_CREAT | O_EXCL | O_RDWR | O_CLOEXEC, S_IRUSR | S_IWUSR);
        if (fd >= 0) {
            if (shm_unlink(name.c_str()) < 0) {
                const int err = errno;
                close(fd);
                fail("shm_unlink failed", err);
            }
            return fd;
        }
        if (errno == EEXIST) {
            name = uniqueShmName();
            continue;
        }
        if (errno == EINTR) continue;
        fail("shm_open failed", errno);
    }
}

} // namespace

SharedMemory SharedMemory::create() {
    int fd = createMemfd();
    if (fd < 0) {
        Log::debug() << "memfd_create unsupported, falling back to shm_open" << std::endl;
        fd = createShmFile();
    }
    return SharedMemory(fd);
}

SharedMemory::~SharedMemory() {
    release();
}

SharedMemory::SharedMemory(SharedMemory&& other) noexcept
    : m_fd(std::exchange(other.m_fd, -1)),
      m_data(std::exchange(other.m_data, nullptr)),
      m_size(std::exchange(other.m_size, 0)),
      m_resized(std::exchange(other.m_resized, false)) {}

SharedMemory& SharedMemory::operator=(SharedMemory&& other) noexcept {
    if (this != &other) {
        release();
        m_fd = std::exchange(other.m_fd, -1);
        m_data = std::exchange(other.m_data, nullptr);
        m_size = std::exchange(other.m_size, 0);
        m_resized = std::exchange(other.m_resized, false);
    }
    return *this;
}

void SharedMemory::resize(std::size_t size) {
    if (m_fd < 0) {
        throw std::logic_error("resize on a released shared memory region");
    }
    if (m_resized || m_data) {
        throw std::logic_error("shared memory region can only be sized once, before mapping");
    }

    for (;;) {
        if (ftruncate(m_fd, static_cast<off_t>(size)) == 0) break;
        if (errno == EINTR) continue;
        fail("ftruncate to " + std::to_string(size) + " bytes failed", errno);
    }
    m_size = size;
    m_resized = true;
}

void SharedMemory::map() {
    if (!m_resized || m_size == 0) {
        throw std::logic_error("shared memory region must be sized before mapping");
    }
    if (m_data) return;

    void* data = mmap(nullptr, m_size, PROT_READ | PROT_WRITE, MAP_SHARED, m_fd, 0);
    if (data == MAP_FAILED) {
        fail("mmap failed", errno);
    }
    m_data = data;
}

void SharedMemory::release() noexcept {
    if (m_data) {
        munmap(m_data, m_size);
        m_data = nullptr;
    }

    if (m_fd >= 0) {
        close(m_fd);
        m_fd = -1;
    }

    m_size = 0;
    m_resized = false;
}

} // namespace Capture
