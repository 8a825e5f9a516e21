#include "i3ipc.hpp"
#include "Log.hpp"
#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <vector>
#include <cstring>
#include <cstdlib>

namespace Capture {

namespace {

constexpr uint32_t kGetTree = 4;
constexpr std::size_t kHeaderSize = 14; // "i3-ipc" + length + type

bool isWindow(const nlohmann::json& node) {
    if (!node.contains("type") || !node["type"].is_string()) return false;
    const std::string type = node["type"].get<std::string>();
    if (type != "con" && type != "floating_con") return false;

    // Split containers have children but no client of their own.
    const bool hasClient = (node.contains("pid") && node["pid"].is_number()) ||
                           (node.contains("window") && node["window"].is_number());
    return hasClient;
}

bool readAll(int fd, char* data, std::size_t length) {
    std::size_t total = 0;
    while (total < length) {
        ssize_t r = read(fd, data + total, length - total);
        if (r < 0 && errno == EINTR) continue;
        if (r <= 0) return false;
        total += static_cast<std::size_t>(r);
    }
    return true;
}

// Recursive function to find window in tree
void find_node_recursive(const nlohmann::json& node, const std::string& name,
                         bool visibleOnly, WindowInfo& info) {
    if (isWindow(node) && node.contains("name") && node["name"].is_string()) {
        std::string nodeName = node["name"].get<std::string>();
        const bool visible = node.value("visible", false);

        if (nodeName.find(name) != std::string::npos && (visible || !visibleOnly)) {
            const auto& rect = node["rect"];
            info.rect = Rect{rect["x"].get<int32_t>(), rect["y"].get<int32_t>(),
                             rect["width"].get<int32_t>(), rect["height"].get<int32_t>()};
            info.title = nodeName;
            info.found = true;

            if (node.contains("app_id") && node["app_id"].is_string()) {
                info.app_id = node["app_id"].get<std::string>();
            }
            return;
        }
    }

    // Recurse into child nodes, then floating nodes
    for (const char* key : {"nodes", "floating_nodes"}) {
        if (node.contains(key) && node[key].is_array()) {
            for (const auto& child : node[key]) {
                find_node_recursive(child, name, visibleOnly, info);
                if (info.found) return;
            }
        }
    }
}

} // namespace

I3Scanner::I3Scanner() {
    connectToSocket();
}

I3Scanner::~I3Scanner() {
    if (m_sock != -1) close(m_sock);
}

std::string I3Scanner::getSocketPath() {
    // Check Sway first, then i3
    const char* env = std::getenv("SWAYSOCK");
    if (!env) env = std::getenv("I3SOCK");
    return env ? env : "";
}

bool I3Scanner::connectToSocket() {
    std::string path = getSocketPath();
    if (path.empty()) {
        Log::error() << "Neither SWAYSOCK nor I3SOCK is set" << std::endl;
        return false;
    }

    m_sock = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (m_sock == -1) {
        Log::error() << "Failed to create socket: " << std::strerror(errno) << std::endl;
        return false;
    }

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (connect(m_sock, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        Log::error() << "Failed to connect to " << path << ": " << std::strerror(errno) << std::endl;
        close(m_sock);
        m_sock = -1;
        return false;
    }

    Log::debug() << "Connected to IPC socket: " << path << std::endl;
    return true;
}

bool I3Scanner::sendGetTree() {
    if (m_sock == -1) return false;

    const std::string magic = "i3-ipc";
    uint32_t payload_len = 0;
    uint32_t type = kGetTree;

    // Build 14 byte header
    std::vector<uint8_t> header;
    header.insert(header.end(), magic.begin(), magic.end());
    header.insert(header.end(), (uint8_t*)&payload_len, (uint8_t*)&payload_len + 4);
    header.insert(header.end(), (uint8_t*)&type, (uint8_t*)&type + 4);

    std::size_t sent = 0;
    while (sent < header.size()) {
        ssize_t w = write(m_sock, header.data() + sent, header.size() - sent);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) {
            Log::error() << "Failed to send GET_TREE: " << std::strerror(errno) << std::endl;
            return false;
        }
        sent += static_cast<std::size_t>(w);
    }
    return true;
}

std::string I3Scanner::receiveResponse() {
    if (m_sock == -1) return "";

    char header[kHeaderSize];
    if (!readAll(m_sock, header, kHeaderSize) || std::memcmp(header, "i3-ipc", 6) != 0) {
        Log::error() << "Failed to read IPC reply header" << std::endl;
        return "";
    }

    // Payload length lives in bytes 6-9, native byte order
    uint32_t length;
    std::memcpy(&length, &header[6], 4);

    std::string json_data;
    json_data.resize(length);
    if (!readAll(m_sock, &json_data[0], length)) {
        Log::error() << "Failed to read IPC reply payload" << std::endl;
        return "";
    }
    return json_data;
}

WindowInfo I3Scanner::findInTree(const nlohmann::json& tree, const std::string& name) {
    WindowInfo info;
    find_node_recursive(tree, name, true, info);
    if (!info.found) {
        find_node_recursive(tree, name, false, info);
    }
    return info;
}

WindowInfo I3Scanner::scanForWindow(const std::string& name) {
    WindowInfo info;

    if (m_sock == -1 && !connectToSocket()) {
        return info;
    }

    if (!sendGetTree()) {
        return info;
    }
    std::string json_str = receiveResponse();
    if (json_str.empty()) {
        Log::error() << "Received empty layout tree" << std::endl;
        return info;
    }

    try {
        auto tree = nlohmann::json::parse(json_str);
        info = findInTree(tree, name);
    } catch (const nlohmann::json::exception& e) {
        Log::error() << "JSON parse error: " << e.what() << std::endl;
        return info;
    }

    if (info.found) {
        Log::debug() << "Found window '" << info.title << "' at " << info.rect.width << "x" << info.rect.height
                     << "+" << info.rect.x << "+" << info.rect.y << std::endl;
    } else {
        Log::error() << "Window '" << name << "' not found in tree" << std::endl;
    }
    return info;
}

} // namespace Capture
