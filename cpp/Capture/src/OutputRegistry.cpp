#include "OutputRegistry.hpp"
#include "Log.hpp"

#include <algorithm>
#include <stdexcept>

namespace Capture {

std::string label(const Output& output) {
    if (output.nameKnown) return "'" + output.name + "'";
    return "#" + std::to_string(output.globalName);
}

const char* stageName(CaptureStage stage) noexcept {
    switch (stage) {
        case CaptureStage::Discovered: return "discovered";
        case CaptureStage::Described: return "described";
        case CaptureStage::CaptureRequested: return "capture requested";
        case CaptureStage::FormatKnown: return "format known";
        case CaptureStage::Terminal: return "terminal";
    }
    return "unknown";
}

Output& OutputRegistry::add(uint32_t globalName, ObjectId handle) {
    Output output;
    output.globalName = globalName;
    output.handle = handle;
    m_outputs.push_back(std::move(output));
    return m_outputs.back();
}

Output* OutputRegistry::findByHandle(ObjectId handle) {
    if (handle == kNoObject) return nullptr;
    for (auto& output : m_outputs) {
        if (output.handle == handle) return &output;
    }
    return nullptr;
}

Output* OutputRegistry::findByFrame(ObjectId frame) {
    if (frame == kNoObject) return nullptr;
    for (auto& output : m_outputs) {
        if (output.frame == frame) return &output;
    }
    return nullptr;
}

bool OutputRegistry::advance(Output& output, CaptureStage stage) {
    if (output.stage == CaptureStage::Terminal || stage < output.stage) {
        Log::debug() << "Output " << label(output) << ": ignoring move from "
                     << stageName(output.stage) << " to " << stageName(stage) << std::endl;
        return false;
    }
    output.stage = stage;
    return true;
}

void OutputRegistry::setName(Output& output, const std::string& name) {
    if (output.nameKnown) {
        Log::debug() << "Output " << label(output) << " renamed to '" << name << "', keeping first name" << std::endl;
        return;
    }
    output.name = name;
    output.nameKnown = true;
    if (output.geometryKnown) {
        advance(output, CaptureStage::Described);
    }
}

void OutputRegistry::setPendingPosition(Output& output, int32_t x, int32_t y) {
    output.pendingPosition = std::make_pair(x, y);
}

void OutputRegistry::setPendingSize(Output& output, int32_t width, int32_t height) {
    output.pendingSize = std::make_pair(width, height);
}

void OutputRegistry::commitGeometry(Output& output) {
    if (!output.pendingPosition || !output.pendingSize) {
        return;
    }

    if (output.stage > CaptureStage::Described) {
        // Overlaps were computed from the old geometry; keep it for this run.
        Log::debug() << "Output " << label(output) << ": ignoring geometry change after capture started" << std::endl;
    } else {
        output.logical = Rect{output.pendingPosition->first, output.pendingPosition->second,
                              output.pendingSize->first, output.pendingSize->second};
        output.geometryKnown = true;
        if (output.nameKnown) {
            advance(output, CaptureStage::Described);
        }
    }

    output.pendingPosition.reset();
    output.pendingSize.reset();
}

void OutputRegistry::markRequested(Output& output, ObjectId frame) {
    if (output.stage != CaptureStage::Described) {
        throw std::logic_error("Output " + label(output) + ": cannot request a frame while " +
                               stageName(output.stage));
    }
    output.frame = frame;
    advance(output, CaptureStage::CaptureRequested);
}

void OutputRegistry::setFormat(Output& output, const IMGBuffer::FrameLayout& layout) {
    if (output.stage != CaptureStage::CaptureRequested) {
        Log::debug() << "Output " << label(output) << ": ignoring buffer format while "
                     << stageName(output.stage) << std::endl;
        return;
    }
    output.format = layout;
    advance(output, CaptureStage::FormatKnown);
}

void OutputRegistry::markBound(Output& output, ObjectId buffer) {
    if (output.stage != CaptureStage::FormatKnown) {
        throw std::logic_error("Output " + label(output) + ": cannot bind a buffer while " +
                               stageName(output.stage));
    }
    output.buffer = buffer;
}

void OutputRegistry::finish(Output& output, FrameState state) {
    if (output.outcome) {
        Log::debug() << "Output " << label(output) << ": outcome already recorded" << std::endl;
        return;
    }
    if (state == FrameState::Finished && (output.stage != CaptureStage::FormatKnown || output.buffer == kNoObject)) {
        Log::warn() << "Output " << label(output) << " reported ready before a buffer was attached" << std::endl;
        state = FrameState::Failed;
    }
    if (advance(output, CaptureStage::Terminal)) {
        output.outcome = state;
    }
}

std::vector<OutputInfo> OutputRegistry::list() const {
    std::vector<OutputInfo> result;
    result.reserve(m_outputs.size());
    for (const auto& output : m_outputs) {
        result.push_back(OutputInfo{output.name, output.logical, output.stage >= CaptureStage::Described});
    }
    return result;
}

std::vector<Output> OutputRegistry::pruneIncomplete() {
    return partition([](const Output& output) { return output.stage >= CaptureStage::Described; });
}

std::vector<Output> OutputRegistry::filter(const std::function<bool(const Output&)>& keep) {
    for (const auto& output : m_outputs) {
        if (output.stage < CaptureStage::Described) {
            throw std::logic_error("Output " + label(output) + " cannot be filtered before its name and geometry are known");
        }
    }
    return partition(keep);
}

std::vector<Output> OutputRegistry::partition(const std::function<bool(const Output&)>& keep) {
    std::vector<Output> kept;
    std::vector<Output> removed;

    for (auto& output : m_outputs) {
        if (keep(output)) {
            kept.push_back(std::move(output));
        } else {
            removed.push_back(std::move(output));
        }
    }
    m_outputs = std::move(kept);
    return removed;
}

bool OutputRegistry::allTerminal() const {
    return std::all_of(m_outputs.begin(), m_outputs.end(),
                       [](const Output& output) { return output.stage == CaptureStage::Terminal; });
}

bool OutputRegistry::allFormatsKnown() const {
    return std::all_of(m_outputs.begin(), m_outputs.end(),
                       [](const Output& output) { return output.stage >= CaptureStage::FormatKnown; });
}

bool OutputRegistry::allDescribed() const {
    return std::all_of(m_outputs.begin(), m_outputs.end(),
                       [](const Output& output) { return output.stage >= CaptureStage::Described; });
}

std::vector<Output> OutputRegistry::takeAll() {
    std::vector<Output> all = std::move(m_outputs);
    m_outputs.clear();
    return all;
}

} // namespace Capture
