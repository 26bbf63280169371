/**
 * @file announce_message.cpp
 * @brief AnnounceMessage JSON codec using nlohmann/json.
 */

#include "discovery/announce_message.hpp"

#include <nlohmann/json.hpp>

namespace lan_beacon {

using json = nlohmann::json;

namespace {

Result<std::string> required_string(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return Error{ErrorKind::Decode, std::string{"missing field '"} + key + "'"};
    }
    if (!it->is_string()) {
        return Error{ErrorKind::Decode, std::string{"field '"} + key + "' is not a string"};
    }
    return it->get<std::string>();
}

bool optional_bool(const json& obj, const char* key) {
    auto it = obj.find(key);
    return it != obj.end() && it->is_boolean() && it->get<bool>();
}

}  // anonymous namespace

AnnounceMessage AnnounceMessage::from_record(const PeerRecord& record, bool announce) {
    AnnounceMessage msg;
    msg.alias = record.alias;
    msg.version = record.version;
    msg.device_model = record.device_model;
    msg.device_type = record.device_type;
    msg.fingerprint = record.fingerprint;
    msg.port = record.port;
    msg.protocol = record.protocol;
    msg.download = record.download;
    msg.announce = announce;
    return msg;
}

PeerRecord AnnounceMessage::to_record(std::string observed_address) const {
    PeerRecord record;
    record.fingerprint = fingerprint;
    record.address = std::move(observed_address);
    record.port = port;
    record.protocol = protocol;
    record.alias = alias;
    record.version = version;
    record.device_model = device_model;
    record.device_type = device_type;
    record.download = download;
    return record;
}

std::string encode_announce(const AnnounceMessage& message) {
    json j;
    j["alias"] = message.alias;
    j["version"] = message.version;
    if (message.device_model) {
        j["deviceModel"] = *message.device_model;
    } else {
        j["deviceModel"] = nullptr;
    }
    j["deviceType"] = std::string{to_string(message.device_type)};
    j["fingerprint"] = message.fingerprint;
    j["port"] = message.port;
    j["protocol"] = std::string{to_string(message.protocol)};
    j["download"] = message.download;
    j["announce"] = message.announce;
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

Result<AnnounceMessage> decode_announce(std::string_view payload) {
    auto j = json::parse(payload.begin(), payload.end(), nullptr, false);
    if (j.is_discarded()) {
        return Error{ErrorKind::Decode, "payload is not valid JSON"};
    }
    if (!j.is_object()) {
        return Error{ErrorKind::Decode, "payload is not a JSON object"};
    }

    AnnounceMessage msg;

    auto alias = required_string(j, "alias");
    if (!alias) return alias.error();
    msg.alias = std::move(alias).value();

    auto fingerprint = required_string(j, "fingerprint");
    if (!fingerprint) return fingerprint.error();
    if (fingerprint->empty()) {
        return Error{ErrorKind::Decode, "field 'fingerprint' is empty"};
    }
    msg.fingerprint = std::move(fingerprint).value();

    auto device_type = required_string(j, "deviceType");
    if (!device_type) return device_type.error();
    // Newer peers may advertise types this build does not know about.
    msg.device_type = parse_device_type(*device_type).value_or(DeviceType::Desktop);

    auto protocol_text = required_string(j, "protocol");
    if (!protocol_text) return protocol_text.error();
    auto protocol = parse_protocol(*protocol_text);
    if (!protocol) {
        return Error{ErrorKind::Decode, "unknown protocol '" + *protocol_text + "'"};
    }
    msg.protocol = *protocol;

    auto port_it = j.find("port");
    if (port_it == j.end() || !port_it->is_number_integer()) {
        return Error{ErrorKind::Decode, "field 'port' is missing or not an integer"};
    }
    auto port = port_it->get<int64_t>();
    if (port < 1 || port > 65535) {
        return Error{ErrorKind::Decode, "field 'port' out of range: " + std::to_string(port)};
    }
    msg.port = static_cast<uint16_t>(port);

    if (auto it = j.find("version"); it != j.end() && it->is_string()) {
        msg.version = it->get<std::string>();
    }
    if (auto it = j.find("deviceModel"); it != j.end() && it->is_string()) {
        msg.device_model = it->get<std::string>();
    }
    msg.download = optional_bool(j, "download");
    msg.announce = optional_bool(j, "announce");

    return msg;
}

}  // namespace lan_beacon
