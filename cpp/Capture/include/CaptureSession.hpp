#pragma once
#include "Geometry.hpp"
#include "IProtocolClient.hpp"
#include "OutputRegistry.hpp"

#include <buffer.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Capture {

struct CaptureOptions {
    std::optional<std::string> outputName; // capture only this output
    Rect region = Rect::unbounded();       // global logical coordinates
    bool withCursor = false;
    int maxRounds = 0;                     // dispatch rounds per wait, 0 = no limit
};

/**
 * @brief One screenshot over one protocol connection
 *
 * connect() binds the globals and learns every output's name and logical
 * geometry. capture() requests a frame from each output the options select,
 * waits until all of them succeed or fail, and composites the result.
 * A session captures at most once.
 *
 * All protocol objects the session created are destroyed with it.
 */
class CaptureSession : public IProtocolListener {
public:
    explicit CaptureSession(IProtocolClient& client);
    ~CaptureSession() override;

    CaptureSession(const CaptureSession&) = delete;
    CaptureSession& operator=(const CaptureSession&) = delete;

    /**
     * @throws CaptureError FatalCapability if wl_shm or the screencopy
     *         manager is missing, FatalGeometry if no output is usable,
     *         Protocol if the connection fails
     */
    void connect();

    std::vector<OutputInfo> listOutputs() const;

    /**
     * @throws CaptureError FatalGeometry when nothing is selected (no frame is
     *         requested in that case), PerOutputFailure if any frame fails,
     *         UnsupportedFormat, ResourceExhaustion or Protocol
     */
    IMGBuffer::Buffer capture(const CaptureOptions& options);

    const OutputRegistry& registry() const noexcept { return m_outputs; }

    // IProtocolListener
    void onGlobal(uint32_t name, const std::string& interface, uint32_t version) override;
    void onOutputName(ObjectId output, const std::string& name) override;
    void onOutputPosition(ObjectId output, int32_t x, int32_t y) override;
    void onOutputSize(ObjectId output, int32_t width, int32_t height) override;
    void onOutputDone(ObjectId output) override;
    void onFrameBuffer(ObjectId frame, uint32_t format, uint32_t width, uint32_t height, uint32_t stride) override;
    void onFrameFlags(ObjectId frame, uint32_t flags) override;
    void onFrameReady(ObjectId frame) override;
    void onFrameFailed(ObjectId frame) override;

private:
    enum class Wait {
        Roundtrip, // sync with the compositor each round
        Dispatch   // block until any event arrives
    };

    // Runs rounds until done() holds. Returns false if maxRounds (> 0) ran out.
    bool dispatchUntil(const std::function<bool()>& done, Wait wait, int maxRounds);
    void checkedRoundtrip();

    void requestGeometry(Output& output);
    void selectOutputs(const CaptureOptions& options);
    void requestFrames(const CaptureOptions& options);
    void attachBuffers();
    void abandonPendingFrames();
    IMGBuffer::Buffer composite(const Rect& region);

    void release(Output& output);
    void release(std::vector<Output>& outputs);

    IProtocolClient& m_client;
    OutputRegistry m_outputs;

    ObjectId m_shm = kNoObject;
    ObjectId m_screencopy = kNoObject;
    ObjectId m_xdgOutputManager = kNoObject;

    bool m_connected = false;
    bool m_captured = false;
};

} // namespace Capture
