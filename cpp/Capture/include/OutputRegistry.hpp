#pragma once
#include "Geometry.hpp"
#include "IProtocolClient.hpp"
#include "SharedMemory.hpp"

#include <pixel_format.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Capture {

// Capture progress of one output. Never moves backwards.
enum class CaptureStage {
    Discovered,       // bound, name and/or geometry still missing
    Described,        // name and logical geometry known
    CaptureRequested, // frame requested, waiting for its format
    FormatKnown,      // buffer allocated and copy issued
    Terminal          // outcome recorded
};

enum class FrameState {
    Finished,
    Failed
};

const char* stageName(CaptureStage stage) noexcept;

struct Output {
    uint32_t globalName = 0;
    ObjectId handle = kNoObject;
    ObjectId geometryHandle = kNoObject;

    std::string name;
    Rect logical;
    bool nameKnown = false;
    bool geometryKnown = false;

    // Logical geometry received since the last done event.
    std::optional<std::pair<int32_t, int32_t>> pendingPosition;
    std::optional<std::pair<int32_t, int32_t>> pendingSize;

    ObjectId frame = kNoObject;
    ObjectId buffer = kNoObject;
    bool yInvert = false;

    std::optional<IMGBuffer::FrameLayout> format;
    std::optional<FrameState> outcome;
    SharedMemory memory;

    CaptureStage stage = CaptureStage::Discovered;
};

// 'name' once the name is known, #global before that.
std::string label(const Output& output);

// Read-only view of an output for listings.
struct OutputInfo {
    std::string name;
    Rect logical;
    bool described = false;
};

/**
 * @brief Owns every known output and enforces its stage ordering
 *
 * Event handlers look outputs up by protocol object and report what they
 * learnt; stage changes happen only here.
 */
class OutputRegistry {
public:
    Output& add(uint32_t globalName, ObjectId handle);

    Output* findByHandle(ObjectId handle);
    Output* findByFrame(ObjectId frame);

    void setName(Output& output, const std::string& name);
    void setPendingPosition(Output& output, int32_t x, int32_t y);
    void setPendingSize(Output& output, int32_t width, int32_t height);
    // Applies pending geometry once both position and size have arrived.
    void commitGeometry(Output& output);

    void markRequested(Output& output, ObjectId frame);
    void setFormat(Output& output, const IMGBuffer::FrameLayout& layout);
    void markBound(Output& output, ObjectId buffer);
    void finish(Output& output, FrameState state);

    std::vector<OutputInfo> list() const;

    // Removes outputs that never became Described and returns them.
    std::vector<Output> pruneIncomplete();

    /**
     * @brief Keeps only outputs for which keep returns true
     * @return the removed outputs, for the caller to release
     * @throws std::logic_error if an output has not been Described yet
     */
    std::vector<Output> filter(const std::function<bool(const Output&)>& keep);

    bool allTerminal() const;
    bool allFormatsKnown() const;
    bool allDescribed() const;

    bool empty() const noexcept { return m_outputs.empty(); }
    std::size_t size() const noexcept { return m_outputs.size(); }

    std::vector<Output>& outputs() noexcept { return m_outputs; }
    const std::vector<Output>& outputs() const noexcept { return m_outputs; }

    // Hands every output to the caller and leaves the registry empty.
    std::vector<Output> takeAll();

private:
    // Moves output to stage. Returns false (and leaves it alone) if that
    // would go backwards or leave Terminal.
    bool advance(Output& output, CaptureStage stage);
    std::vector<Output> partition(const std::function<bool(const Output&)>& keep);

    std::vector<Output> m_outputs;
};

} // namespace Capture
