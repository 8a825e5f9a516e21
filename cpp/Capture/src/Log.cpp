#include "Log.hpp"

#include <iostream>
#include <streambuf>

namespace Capture {
namespace Log {

namespace {

class NullBuffer : public std::streambuf {
protected:
    int overflow(int c) override { return traits_type::not_eof(c); }
};

bool g_debug = false;

std::ostream& nullStream() {
    static NullBuffer buffer;
    static std::ostream stream(&buffer);
    return stream;
}

} // namespace

void setDebug(bool enabled) {
    g_debug = enabled;
}

bool debugEnabled() {
    return g_debug;
}

std::ostream& debug() {
    if (!g_debug) return nullStream();
    return std::cerr << "[debug] ";
}

std::ostream& info() {
    return std::cerr << "[info] ";
}

std::ostream& warn() {
    return std::cerr << "[warn] ";
}

std::ostream& error() {
    return std::cerr << "[error] ";
}

} // namespace Log
} // namespace Capture
