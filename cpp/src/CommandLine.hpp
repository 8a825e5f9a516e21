#pragma once
#include <optional>
#include <string>

#include "CaptureSession.hpp"
#include "Geometry.hpp"
#include <encoder.hpp>

namespace Capture {

struct CommandLine {
    CaptureOptions capture;
    std::optional<std::string> region;  // -s, kept even when empty
    std::optional<std::string> window;  // -w
    std::string file;                   // -f
    bool toStdout = false;
    bool listOutputs = false;
    bool json = false;
    bool help = false;
    IMGBuffer::EncodingFormat encoding = IMGBuffer::EncodingFormat::Png;
};

void print_usage(const char* prog);

// Returns false with a diagnostic on bad usage.
bool parse_arguments(int argc, const char* const argv[], CommandLine& cmd);

/**
 * @brief Turns -s or -w into the capture region
 *
 * Without either option the whole desktop is captured. An empty or
 * malformed geometry, an empty title, or a window that cannot be found
 * throws CaptureError (FatalGeometry).
 */
Rect resolve_region(const CommandLine& cmd);

} // namespace Capture
