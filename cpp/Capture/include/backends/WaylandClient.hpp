#pragma once
#include "IProtocolClient.hpp"

#include <wayland-client.h>

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

struct zwlr_screencopy_frame_v1;
struct zwlr_screencopy_frame_v1_listener;
struct zxdg_output_v1;
struct zxdg_output_v1_listener;

namespace Capture {

/**
 * @brief IProtocolClient over libwayland-client
 *
 * Connects to the compositor named by WAYLAND_DISPLAY. Knows wl_shm,
 * wl_output, zxdg_output_manager_v1 and zwlr_screencopy_manager_v1;
 * every other global is reported but cannot be bound.
 */
class WaylandClient : public IProtocolClient {
public:
    // @throws CaptureError(ErrorKind::Protocol) if no compositor is reachable
    WaylandClient();
    ~WaylandClient() override;

    WaylandClient(const WaylandClient&) = delete;
    WaylandClient& operator=(const WaylandClient&) = delete;

    // Setting a listener creates a fresh wl_registry, so every global is
    // announced again on the next roundtrip.
    void setListener(IProtocolListener* listener) override;

    ObjectId bind(uint32_t name, const std::string& interface, uint32_t version) override;
    ObjectId requestOutputGeometry(ObjectId manager, ObjectId output) override;

    int roundtrip() override;
    int dispatch() override;

    ObjectId requestFrame(ObjectId manager, ObjectId output, bool withCursor, const Rect& region) override;
    ObjectId createPool(ObjectId shm, int fd, int32_t size) override;
    ObjectId createBuffer(ObjectId pool, int32_t offset, int32_t width, int32_t height,
                          int32_t stride, uint32_t format) override;
    void copyFrame(ObjectId frame, ObjectId buffer) override;
    void destroy(ObjectId object) override;

private:
    enum class Kind {
        Shm,
        Output,
        ScreencopyManager,
        XdgOutputManager,
        XdgOutput,
        Frame,
        Pool,
        Buffer
    };

    // Listener user data: maps a proxy back to its id.
    struct Object {
        WaylandClient* client = nullptr;
        ObjectId id = kNoObject;
        Kind kind = Kind::Shm;
        void* proxy = nullptr;
        uint32_t version = 0;
        ObjectId owner = kNoObject; // the wl_output of an xdg output
    };

    Object& track(Kind kind, void* proxy, uint32_t version, ObjectId owner = kNoObject);
    Object* lookup(ObjectId id, Kind kind);
    void destroyProxy(Object& object);
    void resetRegistry();

    // Wayland callbacks
    static void registry_global(void* data, struct wl_registry* registry,
                                uint32_t name, const char* interface, uint32_t version);
    static void registry_global_remove(void* data, struct wl_registry* registry, uint32_t name);

    static void output_geometry(void* data, struct wl_output* output, int32_t x, int32_t y,
                                int32_t physical_width, int32_t physical_height, int32_t subpixel,
                                const char* make, const char* model, int32_t transform);
    static void output_mode(void* data, struct wl_output* output, uint32_t flags,
                            int32_t width, int32_t height, int32_t refresh);
    static void output_done(void* data, struct wl_output* output);
    static void output_scale(void* data, struct wl_output* output, int32_t factor);
    static void output_name(void* data, struct wl_output* output, const char* name);
    static void output_description(void* data, struct wl_output* output, const char* description);

    static void xdg_output_logical_position(void* data, struct zxdg_output_v1* xdg_output, int32_t x, int32_t y);
    static void xdg_output_logical_size(void* data, struct zxdg_output_v1* xdg_output, int32_t width, int32_t height);
    static void xdg_output_done(void* data, struct zxdg_output_v1* xdg_output);
    static void xdg_output_name(void* data, struct zxdg_output_v1* xdg_output, const char* name);
    static void xdg_output_description(void* data, struct zxdg_output_v1* xdg_output, const char* description);

    static void frame_buffer(void* data, struct zwlr_screencopy_frame_v1* frame,
                             uint32_t format, uint32_t width, uint32_t height, uint32_t stride);
    static void frame_flags(void* data, struct zwlr_screencopy_frame_v1* frame, uint32_t flags);
    static void frame_ready(void* data, struct zwlr_screencopy_frame_v1* frame,
                            uint32_t tv_sec_hi, uint32_t tv_sec_lo, uint32_t tv_nsec);
    static void frame_failed(void* data, struct zwlr_screencopy_frame_v1* frame);
    static void frame_damage(void* data, struct zwlr_screencopy_frame_v1* frame,
                             uint32_t x, uint32_t y, uint32_t width, uint32_t height);
    static void frame_linux_dmabuf(void* data, struct zwlr_screencopy_frame_v1* frame,
                                   uint32_t format, uint32_t width, uint32_t height);
    static void frame_buffer_done(void* data, struct zwlr_screencopy_frame_v1* frame);

    static const struct wl_registry_listener s_registryListener;
    static const struct wl_output_listener s_outputListener;
    static const struct zxdg_output_v1_listener s_xdgOutputListener;
    static const struct zwlr_screencopy_frame_v1_listener s_frameListener;

    struct wl_display* m_display = nullptr;
    struct wl_registry* m_registry = nullptr;
    IProtocolListener* m_listener = nullptr;

    std::unordered_map<ObjectId, std::unique_ptr<Object>> m_objects;
    ObjectId m_nextId = 1;
};

} // namespace Capture
