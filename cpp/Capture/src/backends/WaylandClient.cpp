// backends/WaylandClient.cpp
#include "backends/WaylandClient.hpp"
#include "CaptureError.hpp"
#include "Log.hpp"

#include "wlr-screencopy-unstable-v1-client-protocol.h"
#include "xdg-output-unstable-v1-client-protocol.h"

#include <algorithm>
#include <cstring>

namespace Capture {

const struct wl_registry_listener WaylandClient::s_registryListener = {
    WaylandClient::registry_global,
    WaylandClient::registry_global_remove
};

const struct wl_output_listener WaylandClient::s_outputListener = {
    WaylandClient::output_geometry,
    WaylandClient::output_mode,
    WaylandClient::output_done,
    WaylandClient::output_scale,
    WaylandClient::output_name,
    WaylandClient::output_description
};

const struct zxdg_output_v1_listener WaylandClient::s_xdgOutputListener = {
    WaylandClient::xdg_output_logical_position,
    WaylandClient::xdg_output_logical_size,
    WaylandClient::xdg_output_done,
    WaylandClient::xdg_output_name,
    WaylandClient::xdg_output_description
};

const struct zwlr_screencopy_frame_v1_listener WaylandClient::s_frameListener = {
    WaylandClient::frame_buffer,
    WaylandClient::frame_flags,
    WaylandClient::frame_ready,
    WaylandClient::frame_failed,
    WaylandClient::frame_damage,
    WaylandClient::frame_linux_dmabuf,
    WaylandClient::frame_buffer_done
};

WaylandClient::WaylandClient() {
    m_display = wl_display_connect(nullptr);
    if (!m_display) {
        throw CaptureError(ErrorKind::Protocol, "Failed to connect to Wayland display");
    }
    Log::debug() << "Connected to Wayland display" << std::endl;
}

WaylandClient::~WaylandClient() {
    // Frames before buffers, buffers before pools.
    const Kind order[] = {Kind::Frame, Kind::Buffer, Kind::Pool, Kind::XdgOutput, Kind::Output,
                          Kind::ScreencopyManager, Kind::XdgOutputManager, Kind::Shm};
    for (Kind kind : order) {
        for (auto& entry : m_objects) {
            if (entry.second->kind == kind) {
                destroyProxy(*entry.second);
            }
        }
    }
    m_objects.clear();

    if (m_registry) {
        wl_registry_destroy(m_registry);
        m_registry = nullptr;
    }

    if (m_display) {
        wl_display_flush(m_display);
        wl_display_disconnect(m_display);
        m_display = nullptr;
    }
}

void WaylandClient::resetRegistry() {
    if (m_registry) {
        wl_registry_destroy(m_registry);
        m_registry = nullptr;
    }
    m_registry = wl_display_get_registry(m_display);
    wl_registry_add_listener(m_registry, &s_registryListener, this);
}

void WaylandClient::setListener(IProtocolListener* listener) {
    m_listener = listener;
    if (listener) {
        resetRegistry();
    }
}

WaylandClient::Object& WaylandClient::track(Kind kind, void* proxy, uint32_t version, ObjectId owner) {
    auto object = std::make_unique<Object>();
    object->client = this;
    object->id = m_nextId++;
    object->kind = kind;
    object->proxy = proxy;
    object->version = version;
    object->owner = owner;

    Object& ref = *object;
    m_objects.emplace(ref.id, std::move(object));
    return ref;
}

WaylandClient::Object* WaylandClient::lookup(ObjectId id, Kind kind) {
    auto it = m_objects.find(id);
    if (it == m_objects.end() || it->second->kind != kind || !it->second->proxy) {
        return nullptr;
    }
    return it->second.get();
}

ObjectId WaylandClient::bind(uint32_t name, const std::string& interface, uint32_t version) {
    if (!m_registry) return kNoObject;

    if (interface == wl_shm_interface.name) {
        version = std::min<uint32_t>(version, 1);
        auto* shm = static_cast<struct wl_shm*>(
            wl_registry_bind(m_registry, name, &wl_shm_interface, version));
        return track(Kind::Shm, shm, version).id;
    }

    if (interface == wl_output_interface.name) {
        version = std::min<uint32_t>(version, static_cast<uint32_t>(wl_output_interface.version));
        auto* output = static_cast<struct wl_output*>(
            wl_registry_bind(m_registry, name, &wl_output_interface, version));
        Object& object = track(Kind::Output, output, version);
        wl_output_add_listener(output, &s_outputListener, &object);
        return object.id;
    }

    if (interface == zwlr_screencopy_manager_v1_interface.name) {
        version = std::min<uint32_t>(version, static_cast<uint32_t>(zwlr_screencopy_manager_v1_interface.version));
        auto* manager = static_cast<struct zwlr_screencopy_manager_v1*>(
            wl_registry_bind(m_registry, name, &zwlr_screencopy_manager_v1_interface, version));
        return track(Kind::ScreencopyManager, manager, version).id;
    }

    if (interface == zxdg_output_manager_v1_interface.name) {
        version = std::min<uint32_t>(version, static_cast<uint32_t>(zxdg_output_manager_v1_interface.version));
        auto* manager = static_cast<struct zxdg_output_manager_v1*>(
            wl_registry_bind(m_registry, name, &zxdg_output_manager_v1_interface, version));
        return track(Kind::XdgOutputManager, manager, version).id;
    }

    Log::debug() << "Cannot bind unknown interface " << interface << std::endl;
    return kNoObject;
}

ObjectId WaylandClient::requestOutputGeometry(ObjectId managerId, ObjectId outputId) {
    Object* manager = lookup(managerId, Kind::XdgOutputManager);
    Object* output = lookup(outputId, Kind::Output);
    if (!manager || !output) return kNoObject;

    auto* xdgOutput = zxdg_output_manager_v1_get_xdg_output(
        static_cast<struct zxdg_output_manager_v1*>(manager->proxy),
        static_cast<struct wl_output*>(output->proxy));
    Object& object = track(Kind::XdgOutput, xdgOutput, manager->version, outputId);
    zxdg_output_v1_add_listener(xdgOutput, &s_xdgOutputListener, &object);
    return object.id;
}

int WaylandClient::roundtrip() {
    return wl_display_roundtrip(m_display);
}

int WaylandClient::dispatch() {
    return wl_display_dispatch(m_display);
}

ObjectId WaylandClient::requestFrame(ObjectId managerId, ObjectId outputId, bool withCursor, const Rect& region) {
    Object* manager = lookup(managerId, Kind::ScreencopyManager);
    Object* output = lookup(outputId, Kind::Output);
    if (!manager || !output) return kNoObject;

    auto* frame = zwlr_screencopy_manager_v1_capture_output_region(
        static_cast<struct zwlr_screencopy_manager_v1*>(manager->proxy),
        withCursor ? 1 : 0,
        static_cast<struct wl_output*>(output->proxy),
        region.x, region.y, region.width, region.height);
    if (!frame) {
        Log::error() << "Failed to create screencopy frame" << std::endl;
        return kNoObject;
    }

    Object& object = track(Kind::Frame, frame, manager->version);
    zwlr_screencopy_frame_v1_add_listener(frame, &s_frameListener, &object);
    return object.id;
}

ObjectId WaylandClient::createPool(ObjectId shmId, int fd, int32_t size) {
    Object* shm = lookup(shmId, Kind::Shm);
    if (!shm) return kNoObject;

    struct wl_shm_pool* pool = wl_shm_create_pool(static_cast<struct wl_shm*>(shm->proxy), fd, size);
    if (!pool) {
        Log::error() << "Failed to create wl_shm_pool" << std::endl;
        return kNoObject;
    }
    return track(Kind::Pool, pool, 1).id;
}

ObjectId WaylandClient::createBuffer(ObjectId poolId, int32_t offset, int32_t width, int32_t height,
                                     int32_t stride, uint32_t format) {
    Object* pool = lookup(poolId, Kind::Pool);
    if (!pool) return kNoObject;

    struct wl_buffer* buffer = wl_shm_pool_create_buffer(
        static_cast<struct wl_shm_pool*>(pool->proxy), offset, width, height, stride, format);
    if (!buffer) {
        Log::error() << "Failed to create wl_buffer" << std::endl;
        return kNoObject;
    }
    return track(Kind::Buffer, buffer, 1).id;
}

void WaylandClient::copyFrame(ObjectId frameId, ObjectId bufferId) {
    Object* frame = lookup(frameId, Kind::Frame);
    Object* buffer = lookup(bufferId, Kind::Buffer);
    if (!frame || !buffer) {
        Log::error() << "copyFrame called with unknown frame or buffer" << std::endl;
        return;
    }
    zwlr_screencopy_frame_v1_copy(static_cast<struct zwlr_screencopy_frame_v1*>(frame->proxy),
                                  static_cast<struct wl_buffer*>(buffer->proxy));
}

void WaylandClient::destroy(ObjectId id) {
    auto it = m_objects.find(id);
    if (it == m_objects.end()) return;

    destroyProxy(*it->second);
    m_objects.erase(it);
}

void WaylandClient::destroyProxy(Object& object) {
    if (!object.proxy) return;

    switch (object.kind) {
        case Kind::Shm:
            wl_shm_destroy(static_cast<struct wl_shm*>(object.proxy));
            break;
        case Kind::Output:
            if (object.version >= WL_OUTPUT_RELEASE_SINCE_VERSION) {
                wl_output_release(static_cast<struct wl_output*>(object.proxy));
            } else {
                wl_output_destroy(static_cast<struct wl_output*>(object.proxy));
            }
            break;
        case Kind::ScreencopyManager:
            zwlr_screencopy_manager_v1_destroy(static_cast<struct zwlr_screencopy_manager_v1*>(object.proxy));
            break;
        case Kind::XdgOutputManager:
            zxdg_output_manager_v1_destroy(static_cast<struct zxdg_output_manager_v1*>(object.proxy));
            break;
        case Kind::XdgOutput:
            zxdg_output_v1_destroy(static_cast<struct zxdg_output_v1*>(object.proxy));
            break;
        case Kind::Frame:
            zwlr_screencopy_frame_v1_destroy(static_cast<struct zwlr_screencopy_frame_v1*>(object.proxy));
            break;
        case Kind::Pool:
            wl_shm_pool_destroy(static_cast<struct wl_shm_pool*>(object.proxy));
            break;
        case Kind::Buffer:
            wl_buffer_destroy(static_cast<struct wl_buffer*>(object.proxy));
            break;
    }
    object.proxy = nullptr;
}

// Static callback implementations
void WaylandClient::registry_global(void* data, struct wl_registry* registry,
                                    uint32_t name, const char* interface, uint32_t version) {
    auto* client = static_cast<WaylandClient*>(data);
    if (client->m_listener && registry == client->m_registry) {
        client->m_listener->onGlobal(name, interface, version);
    }
}

void WaylandClient::registry_global_remove(void* data, struct wl_registry* registry, uint32_t name) {
    Log::debug() << "Global #" << name << " removed" << std::endl;
}

void WaylandClient::output_geometry(void* data, struct wl_output* output, int32_t x, int32_t y,
                                    int32_t physical_width, int32_t physical_height, int32_t subpixel,
                                    const char* make, const char* model, int32_t transform) {
    // Logical geometry comes from xdg-output.
}

void WaylandClient::output_mode(void* data, struct wl_output* output, uint32_t flags,
                                int32_t width, int32_t height, int32_t refresh) {}

void WaylandClient::output_done(void* data, struct wl_output* output) {
    auto* object = static_cast<Object*>(data);
    if (object->client->m_listener) {
        object->client->m_listener->onOutputDone(object->id);
    }
}

void WaylandClient::output_scale(void* data, struct wl_output* output, int32_t factor) {}

void WaylandClient::output_name(void* data, struct wl_output* output, const char* name) {
    auto* object = static_cast<Object*>(data);
    if (object->client->m_listener) {
        object->client->m_listener->onOutputName(object->id, name);
    }
}

void WaylandClient::output_description(void* data, struct wl_output* output, const char* description) {}

void WaylandClient::xdg_output_logical_position(void* data, struct zxdg_output_v1* xdg_output, int32_t x, int32_t y) {
    auto* object = static_cast<Object*>(data);
    if (object->client->m_listener) {
        object->client->m_listener->onOutputPosition(object->owner, x, y);
    }
}

void WaylandClient::xdg_output_logical_size(void* data, struct zxdg_output_v1* xdg_output,
                                            int32_t width, int32_t height) {
    auto* object = static_cast<Object*>(data);
    if (object->client->m_listener) {
        object->client->m_listener->onOutputSize(object->owner, width, height);
    }
}

void WaylandClient::xdg_output_done(void* data, struct zxdg_output_v1* xdg_output) {
    // Sent up to version 2; from version 3 on wl_output.done covers it.
    auto* object = static_cast<Object*>(data);
    if (object->client->m_listener) {
        object->client->m_listener->onOutputDone(object->owner);
    }
}

void WaylandClient::xdg_output_name(void* data, struct zxdg_output_v1* xdg_output, const char* name) {
    // Lets wl_output versions before 4 still be selected by name.
    auto* object = static_cast<Object*>(data);
    if (object->client->m_listener) {
        object->client->m_listener->onOutputName(object->owner, name);
    }
}

void WaylandClient::xdg_output_description(void* data, struct zxdg_output_v1* xdg_output,
                                           const char* description) {}

void WaylandClient::frame_buffer(void* data, struct zwlr_screencopy_frame_v1* frame,
                                 uint32_t format, uint32_t width, uint32_t height, uint32_t stride) {
    auto* object = static_cast<Object*>(data);
    if (object->client->m_listener) {
        object->client->m_listener->onFrameBuffer(object->id, format, width, height, stride);
    }
}

void WaylandClient::frame_flags(void* data, struct zwlr_screencopy_frame_v1* frame, uint32_t flags) {
    auto* object = static_cast<Object*>(data);
    if (object->client->m_listener) {
        object->client->m_listener->onFrameFlags(object->id, flags);
    }
}

void WaylandClient::frame_ready(void* data, struct zwlr_screencopy_frame_v1* frame,
                                uint32_t tv_sec_hi, uint32_t tv_sec_lo, uint32_t tv_nsec) {
    auto* object = static_cast<Object*>(data);
    if (object->client->m_listener) {
        object->client->m_listener->onFrameReady(object->id);
    }
}

void WaylandClient::frame_failed(void* data, struct zwlr_screencopy_frame_v1* frame) {
    auto* object = static_cast<Object*>(data);
    if (object->client->m_listener) {
        object->client->m_listener->onFrameFailed(object->id);
    }
}

void WaylandClient::frame_damage(void* data, struct zwlr_screencopy_frame_v1* frame,
                                 uint32_t x, uint32_t y, uint32_t width, uint32_t height) {}

void WaylandClient::frame_linux_dmabuf(void* data, struct zwlr_screencopy_frame_v1* frame,
                                       uint32_t format, uint32_t width, uint32_t height) {
    Log::debug() << "Ignoring linux_dmabuf offer, using wl_shm" << std::endl;
}

void WaylandClient::frame_buffer_done(void* data, struct zwlr_screencopy_frame_v1* frame) {
    Log::debug() << "Received buffer_done event" << std::endl;
}

} // namespace Capture
