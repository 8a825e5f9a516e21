#pragma once
#include "Geometry.hpp"

#include <cstdint>
#include <string>

namespace Capture {

// Client-side handle for a protocol object. 0 is never a valid object.
using ObjectId = uint32_t;
constexpr ObjectId kNoObject = 0;

// Interface names of the globals the session cares about.
namespace Interface {
constexpr const char* Shm = "wl_shm";
constexpr const char* Output = "wl_output";
constexpr const char* ScreencopyManager = "zwlr_screencopy_manager_v1";
constexpr const char* XdgOutputManager = "zxdg_output_manager_v1";
} // namespace Interface

// zwlr_screencopy_frame_v1.flags
constexpr uint32_t kFrameFlagYInvert = 1;

/**
 * @brief Receives protocol events during roundtrip() and dispatch()
 */
class IProtocolListener {
public:
    virtual ~IProtocolListener() = default;

    virtual void onGlobal(uint32_t name, const std::string& interface, uint32_t version) = 0;

    virtual void onOutputName(ObjectId output, const std::string& name) = 0;
    // Logical position and size arrive through the geometry object created
    // by requestOutputGeometry(), but are reported against the output.
    virtual void onOutputPosition(ObjectId output, int32_t x, int32_t y) = 0;
    virtual void onOutputSize(ObjectId output, int32_t width, int32_t height) = 0;
    virtual void onOutputDone(ObjectId output) = 0;

    virtual void onFrameBuffer(ObjectId frame, uint32_t format, uint32_t width, uint32_t height, uint32_t stride) = 0;
    virtual void onFrameFlags(ObjectId frame, uint32_t flags) = 0;
    virtual void onFrameReady(ObjectId frame) = 0;
    virtual void onFrameFailed(ObjectId frame) = 0;
};

/**
 * @brief Connection to the compositor
 *
 * Requests are queued; nothing reaches the compositor or comes back from it
 * until roundtrip() or dispatch() runs, and listener callbacks only fire
 * from inside those two calls.
 */
class IProtocolClient {
public:
    virtual ~IProtocolClient() = default;

    virtual void setListener(IProtocolListener* listener) = 0;

    /**
     * @brief Binds an advertised global
     * @return kNoObject if the interface is not one this client can bind
     */
    virtual ObjectId bind(uint32_t name, const std::string& interface, uint32_t version) = 0;

    // Creates the logical-geometry object for output (zxdg_output_v1).
    virtual ObjectId requestOutputGeometry(ObjectId manager, ObjectId output) = 0;

    /**
     * @brief Flushes requests and blocks until the compositor has processed them
     * @return number of events dispatched, or -1 on connection failure
     */
    virtual int roundtrip() = 0;

    /**
     * @brief Flushes requests and blocks until at least one event arrives
     * @return number of events dispatched, or -1 on connection failure
     */
    virtual int dispatch() = 0;

    // region is in output-local logical coordinates.
    virtual ObjectId requestFrame(ObjectId manager, ObjectId output, bool withCursor, const Rect& region) = 0;

    virtual ObjectId createPool(ObjectId shm, int fd, int32_t size) = 0;
    virtual ObjectId createBuffer(ObjectId pool, int32_t offset, int32_t width, int32_t height,
                                  int32_t stride, uint32_t format) = 0;
    virtual void copyFrame(ObjectId frame, ObjectId buffer) = 0;

    // Destroys any object returned by this client. Unknown ids are ignored.
    virtual void destroy(ObjectId object) = 0;
};

} // namespace Capture
