/**
 * @file http_registration_client.hpp
 * @brief libcurl implementation of RegistrationClient.
 */

#pragma once

#include "network/registration_client.hpp"

#include <chrono>

namespace lan_beacon {

/**
 * @brief Issues the registration POST with a bounded total timeout.
 *
 * Each call uses its own easy handle, so concurrent calls from the
 * confirmation workers are safe. https peers present self-signed
 * certificates, so certificate verification is disabled for them.
 */
class HttpRegistrationClient : public RegistrationClient {
public:
    explicit HttpRegistrationClient(std::chrono::milliseconds timeout);
    ~HttpRegistrationClient() override;

    HttpRegistrationClient(const HttpRegistrationClient&) = delete;
    HttpRegistrationClient& operator=(const HttpRegistrationClient&) = delete;

    Result<void> register_with(const PeerRecord& target, std::string_view body) override;

    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
};

}  // namespace lan_beacon
