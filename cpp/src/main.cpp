#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "CaptureError.hpp"
#include "CommandLine.hpp"
#include "CaptureManager.hpp"
#include "Log.hpp"
#include "backends/WaylandClient.hpp"
#include <encoder.hpp>

using namespace Capture;

namespace {

void print_outputs(const std::vector<OutputInfo>& outputs, bool json) {
    if (!json) {
        for (const auto& output : outputs) {
            std::cout << output.name << "\n";
        }
        std::cout.flush();
        return;
    }

    nlohmann::json list = nlohmann::json::array();
    for (const auto& output : outputs) {
        list.push_back({
            {"name", output.name},
            {"x", output.logical.x},
            {"y", output.logical.y},
            {"width", output.logical.width},
            {"height", output.logical.height}
        });
    }
    std::cout << list.dump(2) << std::endl;
}

std::string default_file_name(IMGBuffer::EncodingFormat format) {
    return std::to_string(static_cast<long long>(std::time(nullptr))) + "-wlsnap." +
           IMGBuffer::extension(format);
}

void write_output(const CommandLine& cmd, const IMGBuffer::Buffer& image) {
    if (cmd.toStdout || cmd.file == "-") {
        IMGBuffer::writeImage(std::cout, image, cmd.encoding);
        std::cout.flush();
        if (!std::cout) {
            throw std::runtime_error("Failed to write image to standard output");
        }
        return;
    }

    const std::string path = cmd.file.empty() ? default_file_name(cmd.encoding) : cmd.file;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Failed to open '" + path + "' for writing: " + std::strerror(errno));
    }
    IMGBuffer::writeImage(file, image, cmd.encoding);
    file.close();
    if (!file) {
        throw std::runtime_error("Failed to write '" + path + "'");
    }
    Log::info() << "Saved " << image.width() << "x" << image.height() << " screenshot to " << path << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine cmd;
    if (!parse_arguments(argc, argv, cmd)) {
        return 1;
    }
    if (cmd.help) {
        print_usage(argv[0]);
        return 0;
    }

    try {
        CaptureManager manager([] { return std::make_unique<WaylandClient>(); });

        if (cmd.listOutputs) {
            print_outputs(manager.listOutputs(), cmd.json);
            return 0;
        }

        cmd.capture.region = resolve_region(cmd);
        std::shared_ptr<IMGBuffer::Buffer> image = manager.capture(cmd.capture);
        write_output(cmd, *image);
    } catch (const CaptureError& e) {
        Log::error() << errorKindName(e.kind()) << ": " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        Log::error() << e.what() << std::endl;
        return 1;
    }

    return 0;
}
