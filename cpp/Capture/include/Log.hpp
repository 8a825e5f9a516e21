#pragma once
#include <ostream>

namespace Capture {

/**
 * @brief Diagnostic streams
 *
 * Everything goes to stderr so stdout stays free for image data.
 * debug() discards its input unless debug logging is enabled.
 */
namespace Log {

void setDebug(bool enabled);
bool debugEnabled();

std::ostream& debug();
std::ostream& info();
std::ostream& warn();
std::ostream& error();

} // namespace Log

} // namespace Capture
