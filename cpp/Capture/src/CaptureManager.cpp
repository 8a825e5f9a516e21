#include "CaptureManager.hpp"
#include "CaptureError.hpp"
#include "Log.hpp"

#include <utility>

namespace Capture {

CaptureManager::CaptureManager(ClientFactory factory)
    : m_factory(std::move(factory)) {}

CaptureManager::~CaptureManager() = default;

std::unique_ptr<IProtocolClient> CaptureManager::connect() {
    std::unique_ptr<IProtocolClient> client = m_factory();
    if (!client) {
        throw CaptureError(ErrorKind::Protocol, "Failed to create a protocol client");
    }
    return client;
}

void CaptureManager::init() {
    std::unique_ptr<IProtocolClient> client = connect();
    CaptureSession session(*client);
    session.connect();
    Log::debug() << "Compositor supports screencopy, " << session.registry().size()
                 << " usable outputs" << std::endl;
}

std::vector<OutputInfo> CaptureManager::listOutputs() {
    std::unique_ptr<IProtocolClient> client = connect();
    CaptureSession session(*client);
    session.connect();
    return session.listOutputs();
}

std::shared_ptr<IMGBuffer::Buffer> CaptureManager::capture(const CaptureOptions& options) {
    std::unique_ptr<IProtocolClient> client = connect();
    IMGBuffer::Buffer frame;
    {
        // The session must go before the client it talks through.
        CaptureSession session(*client);
        session.connect();
        frame = session.capture(options);
    }

    m_lastFrame = std::make_shared<IMGBuffer::Buffer>(std::move(frame));
    ++m_frameCount;
    Log::debug() << "Captured " << m_lastFrame->width() << "x" << m_lastFrame->height()
                 << " image (#" << m_frameCount << ")" << std::endl;
    return m_lastFrame;
}

} // namespace Capture
