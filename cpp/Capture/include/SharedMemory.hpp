#pragma once
#include <cstddef>
#include <cstdint>

namespace Capture {

/**
 * @brief Anonymous shared memory region backing a wl_shm pool
 *
 * The descriptor is never visible in the filesystem: memfd_create is used
 * where available, otherwise shm_open followed by an immediate shm_unlink.
 * The region is sized once with resize() and then mapped. Destruction unmaps
 * and closes; the object is move-only.
 *
 * Failures throw CaptureError(ErrorKind::ResourceExhaustion).
 */
class SharedMemory {
public:
    static SharedMemory create();

    SharedMemory() = default;
    ~SharedMemory();

    SharedMemory(SharedMemory&& other) noexcept;
    SharedMemory& operator=(SharedMemory&& other) noexcept;
    SharedMemory(const SharedMemory&) = delete;
    SharedMemory& operator=(const SharedMemory&) = delete;

    // Grows the region to size bytes. Allowed exactly once, before map().
    void resize(std::size_t size);
    void map();

    int fd() const noexcept { return m_fd; }
    std::size_t size() const noexcept { return m_size; }
    bool mapped() const noexcept { return m_data != nullptr; }

    std::uint8_t* data() noexcept { return static_cast<std::uint8_t*>(m_data); }
    const std::uint8_t* data() const noexcept { return static_cast<const std::uint8_t*>(m_data); }

    void release() noexcept;

private:
    explicit SharedMemory(int fd) : m_fd(fd) {}

    int m_fd = -1;
    void* m_data = nullptr;
    std::size_t m_size = 0;
    bool m_resized = false;
};

} // namespace Capture
