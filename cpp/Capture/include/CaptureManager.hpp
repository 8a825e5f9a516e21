#pragma once
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "CaptureSession.hpp"
#include "IProtocolClient.hpp"

namespace Capture {

/**
 * @brief Entry point used by the command line tool and the Python module
 *
 * Every call opens its own connection and session, so one manager can take
 * any number of screenshots. Each capture is a new shared image, so one
 * returned earlier stays valid after the next call. The last successful
 * capture can be read back with getLastFrame().
 */
class CaptureManager {
public:
    using ClientFactory = std::function<std::unique_ptr<IProtocolClient>()>;

    // factory opens one compositor connection per call
    explicit CaptureManager(ClientFactory factory);
    ~CaptureManager();

    // Checks the compositor offers everything a capture needs. Throws CaptureError.
    void init();

    std::vector<OutputInfo> listOutputs();
    std::shared_ptr<IMGBuffer::Buffer> capture(const CaptureOptions& options);

    uint64_t getFrameCount() const { return m_frameCount; }
    std::shared_ptr<IMGBuffer::Buffer> getLastFrame() const { return m_lastFrame; }

private:
    std::unique_ptr<IProtocolClient> connect();

    ClientFactory m_factory;
    std::shared_ptr<IMGBuffer::Buffer> m_lastFrame = std::make_shared<IMGBuffer::Buffer>();
    uint64_t m_frameCount = 0;
};

} // namespace Capture
