#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include "Geometry.hpp"

namespace Capture {

struct WindowInfo {
    Rect rect;           // global logical coordinates
    bool found = false;
    std::string title;
    std::string app_id;  // Wayland app_id, empty for XWayland windows
};

/**
 * @brief Looks windows up in the Sway (or i3) layout tree
 *
 * Talks the i3 IPC protocol over the socket named by SWAYSOCK or I3SOCK.
 */
class I3Scanner {
public:
    I3Scanner();
    ~I3Scanner();

    I3Scanner(const I3Scanner&) = delete;
    I3Scanner& operator=(const I3Scanner&) = delete;

    /**
     * @brief Finds the first window whose title contains name
     *
     * Visible windows are preferred over hidden ones. Returns an info with
     * found == false if there is no match or the IPC socket is unavailable.
     */
    WindowInfo scanForWindow(const std::string& name);

    // Searches an already parsed GET_TREE reply.
    static WindowInfo findInTree(const nlohmann::json& tree, const std::string& name);

private:
    int m_sock = -1;

    std::string getSocketPath();
    bool connectToSocket();
    bool sendGetTree();
    std::string receiveResponse();
};

} // namespace Capture
