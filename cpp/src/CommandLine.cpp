#include "CommandLine.hpp"
#include "CaptureError.hpp"
#include "Log.hpp"
#include "i3ipc.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace Capture {

void print_usage(const char* prog) {
    printf("Usage: %s [options]\n", prog);
    printf("Options:\n");
    printf("  -o, --output <name>       Capture only the named output\n");
    printf("  -s, --slurp <geometry>    Capture a region, \"x,y WxH\" or \"x y w h\"\n");
    printf("  -w, --window <title>      Capture the Sway window whose title contains <title>\n");
    printf("  -c, --cursor              Include the cursor\n");
    printf("  -l, --list-outputs        List outputs and exit\n");
    printf("  --json                    With --list-outputs, print a JSON array\n");
    printf("  -f, --file <path>         Destination (default: <unix-time>-wlsnap.<ext>)\n");
    printf("  --stdout                  Write the image to standard output\n");
    printf("  -e, --extension <ext>     png, jpg, jpeg or ppm (default: png)\n");
    printf("  --max-rounds <n>          Give up after n dispatch rounds (0 = never)\n");
    printf("  -d, --debug               Debug logging\n");
    printf("  -h, --help                Show this help\n");
}

bool parse_arguments(int argc, const char* const argv[], CommandLine& cmd) {
    for (int i = 1; i < argc; i++) {
        const bool hasValue = i + 1 < argc;

        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            cmd.help = true;
            return true;
        } else if ((strcmp(argv[i], "-o") == 0 || strcmp(argv[i], "--output") == 0) && hasValue) {
            cmd.capture.outputName = std::string(argv[++i]);
        } else if ((strcmp(argv[i], "-s") == 0 || strcmp(argv[i], "--slurp") == 0) && hasValue) {
            cmd.region = std::string(argv[++i]);
        } else if ((strcmp(argv[i], "-w") == 0 || strcmp(argv[i], "--window") == 0) && hasValue) {
            cmd.window = std::string(argv[++i]);
        } else if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--cursor") == 0) {
            cmd.capture.withCursor = true;
        } else if (strcmp(argv[i], "-l") == 0 || strcmp(argv[i], "--list-outputs") == 0) {
            cmd.listOutputs = true;
        } else if (strcmp(argv[i], "--json") == 0) {
            cmd.json = true;
        } else if ((strcmp(argv[i], "-f") == 0 || strcmp(argv[i], "--file") == 0) && hasValue) {
            cmd.file = argv[++i];
        } else if (strcmp(argv[i], "--stdout") == 0) {
            cmd.toStdout = true;
        } else if ((strcmp(argv[i], "-e") == 0 || strcmp(argv[i], "--extension") == 0) && hasValue) {
            const char* name = argv[++i];
            auto format = IMGBuffer::parseEncodingFormat(name);
            if (!format) {
                Log::error() << "Unknown extension '" << name << "', expected png, jpg, jpeg or ppm" << std::endl;
                return false;
            }
            cmd.encoding = *format;
        } else if (strcmp(argv[i], "--max-rounds") == 0 && hasValue) {
            const char* value = argv[++i];
            char* end = nullptr;
            long rounds = std::strtol(value, &end, 10);
            if (*value == '\0' || *end != '\0' || rounds < 0 || rounds > 1000000) {
                Log::error() << "Invalid --max-rounds value '" << value << "'" << std::endl;
                return false;
            }
            cmd.capture.maxRounds = static_cast<int>(rounds);
        } else if (strcmp(argv[i], "-d") == 0 || strcmp(argv[i], "--debug") == 0) {
            Log::setDebug(true);
        } else {
            Log::error() << "Unknown or incomplete option '" << argv[i] << "', see --help" << std::endl;
            return false;
        }
    }

    if (cmd.region && cmd.window) {
        Log::error() << "--slurp and --window cannot be combined" << std::endl;
        return false;
    }
    if (cmd.toStdout && !cmd.file.empty()) {
        Log::error() << "--stdout and --file cannot be combined" << std::endl;
        return false;
    }
    return true;
}

Rect resolve_region(const CommandLine& cmd) {
    if (cmd.region) {
        if (cmd.region->empty()) {
            throw CaptureError(ErrorKind::FatalGeometry, "Failed to receive geometry: empty region");
        }
        auto region = parseRegion(*cmd.region);
        if (!region) {
            throw CaptureError(ErrorKind::FatalGeometry, "Invalid geometry '" + *cmd.region + "'");
        }
        return *region;
    }

    if (cmd.window) {
        if (cmd.window->empty()) {
            throw CaptureError(ErrorKind::FatalGeometry, "Empty window title");
        }
        I3Scanner scanner;
        WindowInfo info = scanner.scanForWindow(*cmd.window);
        if (!info.found) {
            throw CaptureError(ErrorKind::FatalGeometry, "Could not find window '" + *cmd.window + "'");
        }
        return info.rect;
    }

    return Rect::unbounded();
}

} // namespace Capture
