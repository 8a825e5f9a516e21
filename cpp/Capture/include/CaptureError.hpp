#pragma once
#include <stdexcept>
#include <string>

namespace Capture {

enum class ErrorKind {
    FatalCapability,    // compositor lacks a required global
    FatalGeometry,      // bad region, or nothing to capture
    PerOutputFailure,   // compositor failed a frame copy
    UnsupportedFormat,  // no conversion for the reported pixel layout
    ResourceExhaustion, // shared memory allocation or mapping failed
    Protocol            // connection failed or was lost
};

inline const char* errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::FatalCapability: return "missing capability";
        case ErrorKind::FatalGeometry: return "geometry";
        case ErrorKind::PerOutputFailure: return "capture failed";
        case ErrorKind::UnsupportedFormat: return "unsupported format";
        case ErrorKind::ResourceExhaustion: return "resource exhaustion";
        case ErrorKind::Protocol: return "protocol";
    }
    return "unknown";
}

class CaptureError : public std::runtime_error {
public:
    CaptureError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), m_kind(kind) {}

    ErrorKind kind() const noexcept { return m_kind; }

private:
    ErrorKind m_kind;
};

} // namespace Capture
