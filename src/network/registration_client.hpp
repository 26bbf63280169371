/**
 * @file registration_client.hpp
 * @brief Unicast reachability confirmation sent to newly seen peers.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

namespace lan_beacon {

/// Path of the registration endpoint on a peer's HTTP server.
inline constexpr std::string_view REGISTER_PATH = "/api/localsend/v2/register";

/// Shared-secret marker header sent with every registration call.
inline constexpr std::string_view REGISTER_HEADER_NAME = "X-My-Header";
inline constexpr std::string_view REGISTER_HEADER_VALUE = "Secret";

/// `{protocol}://{address}:{port}/api/localsend/v2/register`
[[nodiscard]] std::string registration_url(const PeerRecord& target);

class RegistrationClient {
public:
    virtual ~RegistrationClient() = default;

    /**
     * @brief POST `body` (the local announce JSON) to the target's
     *        registration endpoint.
     *
     * Success means the peer answered with a non-error HTTP status. The
     * response body is ignored.
     */
    virtual Result<void> register_with(const PeerRecord& target, std::string_view body) = 0;
};

}  // namespace lan_beacon
