#include "ui/browser.hpp"
#include "logger.hpp"
#include <gio/gio.h>
#include <algorithm>
#include <iostream>

namespace ui {

bool open_in_browser(const std::string& url) {
    GError* error = nullptr;
    gboolean launched = g_app_info_launch_default_for_uri(url.c_str(), nullptr, &error);
    if (!launched) {
        std::string reason = error ? error->message : "unknown error";
        if (error) g_error_free(error);
        Logger::error("Failed to open browser: " + reason);
        return false;
    }
    return true;
}

void print_banner(const protocol::DeviceDescriptor& device, const std::filesystem::path& directory) {
    const std::string url = device.url();
    const size_t width = std::max<size_t>(url.size(), 24) + 4;
    const std::string rule(width, '-');

    std::cout << "+" << rule << "+\n";
    std::cout << "|  lanshare" << std::string(width - 10, ' ') << "|\n";
    std::cout << "|  " << url << std::string(width - 2 - url.size(), ' ') << "|\n";
    std::cout << "+" << rule << "+\n";
    std::cout << "Serving: " << directory.string() << "\n";
    std::cout << "Device:  " << device.name << " (" << device.os << ")\n" << std::flush;
}

} // namespace ui
