/**
 * @file http_registration_client.cpp
 * @brief HttpRegistrationClient implementation using libcurl.
 */

#include "network/http_registration_client.hpp"

#include <curl/curl.h>

#include <memory>

namespace lan_beacon {

namespace {

bool ensure_curl_initialized() {
    static const bool ready = [] {
        return curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
    }();
    return ready;
}

size_t discard_body(char* /*ptr*/, size_t size, size_t nmemb, void* /*userdata*/) {
    return size * nmemb;
}

struct CurlDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

}  // anonymous namespace

std::string registration_url(const PeerRecord& target) {
    return std::string{to_string(target.protocol)} + "://" + target.address + ":"
         + std::to_string(target.port) + std::string{REGISTER_PATH};
}

HttpRegistrationClient::HttpRegistrationClient(std::chrono::milliseconds timeout)
    : timeout_(timeout) {
    ensure_curl_initialized();
}

HttpRegistrationClient::~HttpRegistrationClient() = default;

Result<void> HttpRegistrationClient::register_with(const PeerRecord& target,
                                                   std::string_view body) {
    if (!ensure_curl_initialized()) {
        return Error{ErrorKind::Io, "Unable to initialize libcurl"};
    }

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        return Error{ErrorKind::Io, "Unable to allocate curl handle"};
    }

    const auto url = registration_url(target);
    const std::string header = std::string{REGISTER_HEADER_NAME} + ": "
                             + std::string{REGISTER_HEADER_VALUE};

    curl_slist* raw_headers = curl_slist_append(nullptr, "Content-Type: application/json");
    raw_headers = curl_slist_append(raw_headers, header.c_str());
    std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

    auto timeout_ms = static_cast<long>(timeout_.count());

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    // Peers live on the local segment.
    curl_easy_setopt(curl.get(), CURLOPT_NOPROXY, "*");
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "lan-beacon/1.0");
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, discard_body);
    if (target.protocol == Protocol::Https) {
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 0L);
    }

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        return Error{ErrorKind::Io, url + ": " + curl_easy_strerror(rc)};
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status >= 400) {
        return Error{ErrorKind::Io, url + ": HTTP status " + std::to_string(status)};
    }
    return {};
}

}  // namespace lan_beacon
