#pragma once

#include <string>
#include <filesystem>
#include "protocol/device_info.hpp"

namespace ui {

// Hands `url` to the desktop's default handler. Returns false (and logs)
// when no handler could be launched.
bool open_in_browser(const std::string& url);

// Boxed startup banner with the address to type on other devices.
void print_banner(const protocol::DeviceDescriptor& device, const std::filesystem::path& directory);

} // namespace ui
