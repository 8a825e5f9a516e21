#include "CaptureSession.hpp"
#include "CaptureError.hpp"
#include "Compositor.hpp"
#include "Log.hpp"

#include <pixel_format.hpp>

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace Capture {

namespace {

constexpr uint32_t kShmVersion = 1;
constexpr uint32_t kOutputVersion = 4;
constexpr uint32_t kScreencopyVersion = 3;
constexpr uint32_t kXdgOutputManagerVersion = 3;

// Extra roundtrips allowed for outputs to describe themselves.
constexpr int kDescribeRounds = 2;
// Roundtrips allowed for frames to report their buffer format.
constexpr int kFormatRounds = 3;

std::string describe(const Rect& r) {
    return std::to_string(r.width) + "x" + std::to_string(r.height) + "+" +
           std::to_string(r.x) + "+" + std::to_string(r.y);
}

} // namespace

CaptureSession::CaptureSession(IProtocolClient& client)
    : m_client(client) {}

CaptureSession::~CaptureSession() {
    std::vector<Output> outputs = m_outputs.takeAll();
    release(outputs);

    if (m_screencopy != kNoObject) m_client.destroy(m_screencopy);
    if (m_xdgOutputManager != kNoObject) m_client.destroy(m_xdgOutputManager);
    if (m_shm != kNoObject) m_client.destroy(m_shm);
    m_client.setListener(nullptr);
}

void CaptureSession::checkedRoundtrip() {
    if (m_client.roundtrip() < 0) {
        throw CaptureError(ErrorKind::Protocol, "Lost connection to the compositor");
    }
}

bool CaptureSession::dispatchUntil(const std::function<bool()>& done, Wait wait, int maxRounds) {
    for (int round = 0; !done(); ++round) {
        if (maxRounds > 0 && round >= maxRounds) {
            return false;
        }
        const int events = wait == Wait::Roundtrip ? m_client.roundtrip() : m_client.dispatch();
        if (events < 0) {
            throw CaptureError(ErrorKind::Protocol, "Lost connection to the compositor");
        }
        Log::debug() << "Dispatch round " << round + 1 << ": " << events << " events" << std::endl;
    }
    return true;
}

void CaptureSession::connect() {
    if (m_connected) return;
    m_client.setListener(this);

    // First roundtrip: bind all globals and outputs
    checkedRoundtrip();

    if (m_shm == kNoObject) {
        throw CaptureError(ErrorKind::FatalCapability, "Compositor is missing the wl_shm interface");
    }
    if (m_screencopy == kNoObject) {
        throw CaptureError(ErrorKind::FatalCapability,
                           "Compositor is missing the zwlr_screencopy_manager_v1 interface");
    }
    if (m_xdgOutputManager == kNoObject) {
        Log::warn() << "Compositor is missing zxdg_output_manager_v1, output geometry will be unknown" << std::endl;
    }

    // Second roundtrip: learn output names and geometry
    checkedRoundtrip();
    if (!dispatchUntil([this] { return m_outputs.allDescribed(); }, Wait::Roundtrip, kDescribeRounds)) {
        Log::warn() << "Some outputs did not describe themselves" << std::endl;
    }

    std::vector<Output> incomplete = m_outputs.pruneIncomplete();
    for (const auto& output : incomplete) {
        Log::warn() << "Output " << label(output) << " did not report its "
                    << (output.nameKnown ? "geometry" : "name") << ", ignoring it" << std::endl;
    }
    release(incomplete);

    if (m_outputs.empty()) {
        throw CaptureError(ErrorKind::FatalGeometry, "No usable outputs");
    }

    m_connected = true;
    for (const auto& output : m_outputs.outputs()) {
        Log::debug() << "Output " << label(output) << " at " << describe(output.logical) << std::endl;
    }
}

std::vector<OutputInfo> CaptureSession::listOutputs() const {
    return m_outputs.list();
}

IMGBuffer::Buffer CaptureSession::capture(const CaptureOptions& options) {
    if (!m_connected) {
        throw std::logic_error("CaptureSession::capture called before connect");
    }
    if (m_captured) {
        throw std::logic_error("CaptureSession can only capture once");
    }
    m_captured = true;

    selectOutputs(options);

    // Third roundtrip: learn frame parameters for each request
    requestFrames(options);
    const int formatRounds = options.maxRounds > 0 ? options.maxRounds : kFormatRounds;
    if (!dispatchUntil([this] { return m_outputs.allFormatsKnown(); }, Wait::Roundtrip, formatRounds)) {
        abandonPendingFrames();
        throw CaptureError(ErrorKind::Protocol, "Output did not specify a frame format");
    }

    try {
        attachBuffers();
    } catch (const std::exception&) {
        abandonPendingFrames();
        throw;
    }

    // Fourth and later rounds: wait for every copy to succeed or fail. A
    // bounded wait syncs each round so a silent compositor cannot block it.
    const Wait copyWait = options.maxRounds > 0 ? Wait::Roundtrip : Wait::Dispatch;
    if (!dispatchUntil([this] { return m_outputs.allTerminal(); }, copyWait, options.maxRounds)) {
        abandonPendingFrames();
        throw CaptureError(ErrorKind::Protocol,
                           "Frames still pending after " + std::to_string(options.maxRounds) + " dispatch rounds");
    }

    return composite(options.region);
}

void CaptureSession::selectOutputs(const CaptureOptions& options) {
    if (options.region.empty()) {
        throw CaptureError(ErrorKind::FatalGeometry, "Capture region " + describe(options.region) + " is empty");
    }

    if (options.outputName) {
        const std::string& chosen = *options.outputName;
        std::vector<Output> others = m_outputs.filter([&](const Output& output) { return output.name == chosen; });
        release(others);
        if (m_outputs.empty()) {
            throw CaptureError(ErrorKind::FatalGeometry, "No output named '" + chosen + "'");
        }
    }

    std::vector<Output> outside = m_outputs.filter([&](const Output& output) {
        return intersect(output.logical, options.region).has_value();
    });
    release(outside);

    if (m_outputs.empty()) {
        throw CaptureError(ErrorKind::FatalGeometry, "Provided capture region doesn't intersect with any outputs");
    }
}

void CaptureSession::requestFrames(const CaptureOptions& options) {
    for (auto& output : m_outputs.outputs()) {
        const Rect overlap = *intersect(output.logical, options.region);

        // The screencopy region is in output-local logical coordinates.
        const Rect local{overlap.x - output.logical.x, overlap.y - output.logical.y, overlap.width, overlap.height};

        const ObjectId frame = m_client.requestFrame(m_screencopy, output.handle, options.withCursor, local);
        if (frame == kNoObject) {
            throw CaptureError(ErrorKind::Protocol, "Failed to request a frame for output " + label(output));
        }
        m_outputs.markRequested(output, frame);
        Log::debug() << "Requested " << describe(local) << " of output " << label(output) << std::endl;
    }
}

void CaptureSession::attachBuffers() {
    for (auto& output : m_outputs.outputs()) {
        if (output.stage != CaptureStage::FormatKnown) {
            continue; // already failed
        }

        const IMGBuffer::FrameLayout& layout = *output.format;
        if (!IMGBuffer::isSupported(layout.format)) {
            throw CaptureError(ErrorKind::UnsupportedFormat,
                               "Unsupported buffer format " + IMGBuffer::formatName(layout.format) +
                               " on output " + label(output));
        }
        if (layout.width == 0 || layout.height == 0 || layout.stride < layout.width * 4 ||
            layout.byteSize() > static_cast<std::size_t>(std::numeric_limits<int32_t>::max())) {
            throw CaptureError(ErrorKind::Protocol, "Output " + label(output) + " reported an invalid " +
                               std::to_string(layout.width) + "x" + std::to_string(layout.height) +
                               " frame with stride " + std::to_string(layout.stride));
        }

        const auto bytes = static_cast<int32_t>(layout.byteSize());
        output.memory = SharedMemory::create();
        output.memory.resize(layout.byteSize());
        output.memory.map();

        const ObjectId pool = m_client.createPool(m_shm, output.memory.fd(), bytes);
        if (pool == kNoObject) {
            throw CaptureError(ErrorKind::Protocol, "Failed to create a shm pool for output " + label(output));
        }
        const ObjectId buffer = m_client.createBuffer(pool, 0,
                                                      static_cast<int32_t>(layout.width),
                                                      static_cast<int32_t>(layout.height),
                                                      static_cast<int32_t>(layout.stride),
                                                      layout.format);
        // The buffer keeps the pool's memory alive.
        m_client.destroy(pool);
        if (buffer == kNoObject) {
            throw CaptureError(ErrorKind::Protocol, "Failed to create a buffer for output " + label(output));
        }

        m_outputs.markBound(output, buffer);
        m_client.copyFrame(output.frame, buffer);
        Log::debug() << "Copying " << IMGBuffer::formatName(layout.format) << " " << layout.width << "x"
                     << layout.height << " frame of output " << label(output) << std::endl;
    }
}

void CaptureSession::abandonPendingFrames() {
    bool any = false;
    for (auto& output : m_outputs.outputs()) {
        if (output.stage != CaptureStage::Terminal && output.frame != kNoObject) {
            m_client.destroy(output.frame);
            output.frame = kNoObject;
            any = true;
        }
    }
    // Make sure the compositor has dropped the frames before any buffer
    // backing them is released.
    if (any && m_client.roundtrip() < 0) {
        Log::warn() << "Connection lost while cancelling frames" << std::endl;
    }
}

IMGBuffer::Buffer CaptureSession::composite(const Rect& region) {
    for (const auto& output : m_outputs.outputs()) {
        if (output.outcome == FrameState::Failed) {
            throw CaptureError(ErrorKind::PerOutputFailure, "Frame copy failed for output " + label(output));
        }
    }

    std::vector<Rect> overlaps;
    for (const auto& output : m_outputs.outputs()) {
        overlaps.push_back(*intersect(output.logical, region));
    }
    const std::optional<Rect> bounds = boundingBox(overlaps);
    if (!bounds) {
        throw CaptureError(ErrorKind::FatalGeometry, "Capture area is too large");
    }
    Log::debug() << "Compositing " << m_outputs.size() << " outputs into " << describe(*bounds) << std::endl;

    Compositor compositor(*bounds);
    for (std::size_t i = 0; i < m_outputs.size(); ++i) {
        Output& output = m_outputs.outputs()[i];

        IMGBuffer::Buffer frame;
        try {
            frame = IMGBuffer::normalize(output.memory.data(), output.memory.size(), *output.format);
        } catch (const IMGBuffer::UnsupportedFormat& e) {
            throw CaptureError(ErrorKind::UnsupportedFormat, e.what());
        } catch (const std::invalid_argument& e) {
            throw CaptureError(ErrorKind::Protocol, "Output " + label(output) + ": " + e.what());
        }
        if (output.yInvert) {
            frame.flipVertical();
        }

        // Pixels are in our own copy now.
        release(output);

        try {
            compositor.place(frame, overlaps[i]);
        } catch (const std::out_of_range& e) {
            throw CaptureError(ErrorKind::FatalGeometry,
                               "Failed to copy output image onto the destination image: " + std::string(e.what()));
        }
    }

    return compositor.take();
}

void CaptureSession::release(Output& output) {
    if (output.frame != kNoObject) {
        m_client.destroy(output.frame);
        output.frame = kNoObject;
    }
    if (output.buffer != kNoObject) {
        m_client.destroy(output.buffer);
        output.buffer = kNoObject;
    }
    if (output.geometryHandle != kNoObject) {
        m_client.destroy(output.geometryHandle);
        output.geometryHandle = kNoObject;
    }
    if (output.handle != kNoObject) {
        m_client.destroy(output.handle);
        output.handle = kNoObject;
    }
    output.memory.release();
}

void CaptureSession::release(std::vector<Output>& outputs) {
    for (auto& output : outputs) {
        release(output);
    }
}

void CaptureSession::requestGeometry(Output& output) {
    if (m_xdgOutputManager == kNoObject || output.geometryHandle != kNoObject) {
        return;
    }
    output.geometryHandle = m_client.requestOutputGeometry(m_xdgOutputManager, output.handle);
}

void CaptureSession::onGlobal(uint32_t name, const std::string& interface, uint32_t version) {
    if (interface == Interface::Shm) {
        if (m_shm == kNoObject) {
            m_shm = m_client.bind(name, interface, std::min(version, kShmVersion));
        }
    } else if (interface == Interface::ScreencopyManager) {
        if (m_screencopy == kNoObject) {
            m_screencopy = m_client.bind(name, interface, std::min(version, kScreencopyVersion));
        }
    } else if (interface == Interface::XdgOutputManager) {
        if (m_xdgOutputManager == kNoObject) {
            m_xdgOutputManager = m_client.bind(name, interface, std::min(version, kXdgOutputManagerVersion));
            for (auto& output : m_outputs.outputs()) {
                requestGeometry(output);
            }
        }
    } else if (interface == Interface::Output) {
        if (m_connected) {
            Log::debug() << "Ignoring output #" << name << " announced after connecting" << std::endl;
            return;
        }
        const ObjectId handle = m_client.bind(name, interface, std::min(version, kOutputVersion));
        if (handle == kNoObject) {
            Log::warn() << "Failed to bind output #" << name << std::endl;
            return;
        }
        Output& output = m_outputs.add(name, handle);
        requestGeometry(output);
    } else {
        return;
    }
    Log::debug() << "Bound " << interface << " v" << version << std::endl;
}

void CaptureSession::onOutputName(ObjectId handle, const std::string& name) {
    if (Output* output = m_outputs.findByHandle(handle)) {
        Log::debug() << "Output #" << output->globalName << " is named '" << name << "'" << std::endl;
        m_outputs.setName(*output, name);
    }
}

void CaptureSession::onOutputPosition(ObjectId handle, int32_t x, int32_t y) {
    if (Output* output = m_outputs.findByHandle(handle)) {
        m_outputs.setPendingPosition(*output, x, y);
    }
}

void CaptureSession::onOutputSize(ObjectId handle, int32_t width, int32_t height) {
    if (Output* output = m_outputs.findByHandle(handle)) {
        m_outputs.setPendingSize(*output, width, height);
    }
}

void CaptureSession::onOutputDone(ObjectId handle) {
    if (Output* output = m_outputs.findByHandle(handle)) {
        m_outputs.commitGeometry(*output);
    }
}

void CaptureSession::onFrameBuffer(ObjectId frame, uint32_t format, uint32_t width, uint32_t height, uint32_t stride) {
    Output* output = m_outputs.findByFrame(frame);
    if (!output) return;

    Log::debug() << "Received buffer event for output " << label(*output) << ": "
                 << IMGBuffer::formatName(format) << " " << width << "x" << height
                 << " stride " << stride << std::endl;
    m_outputs.setFormat(*output, IMGBuffer::FrameLayout{format, width, height, stride});
}

void CaptureSession::onFrameFlags(ObjectId frame, uint32_t flags) {
    if (Output* output = m_outputs.findByFrame(frame)) {
        output->yInvert = (flags & kFrameFlagYInvert) != 0;
    }
}

void CaptureSession::onFrameReady(ObjectId frame) {
    if (Output* output = m_outputs.findByFrame(frame)) {
        Log::debug() << "Received ready event for output " << label(*output) << std::endl;
        m_outputs.finish(*output, FrameState::Finished);
    }
}

void CaptureSession::onFrameFailed(ObjectId frame) {
    if (Output* output = m_outputs.findByFrame(frame)) {
        Log::error() << "Compositor failed to copy output " << label(*output) << std::endl;
        m_outputs.finish(*output, FrameState::Failed);
    }
}

} // namespace Capture
