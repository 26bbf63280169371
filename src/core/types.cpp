/**
 * @file types.cpp
 * @brief Text parsing for protocol and device enumerations.
 */

#include "core/types.hpp"

namespace lan_beacon {

std::optional<Protocol> parse_protocol(std::string_view text) noexcept {
    if (text == "http") return Protocol::Http;
    if (text == "https") return Protocol::Https;
    return std::nullopt;
}

std::optional<DeviceType> parse_device_type(std::string_view text) noexcept {
    if (text == "mobile") return DeviceType::Mobile;
    if (text == "desktop") return DeviceType::Desktop;
    if (text == "web") return DeviceType::Web;
    if (text == "headless") return DeviceType::Headless;
    if (text == "server") return DeviceType::Server;
    return std::nullopt;
}

}  // namespace lan_beacon
