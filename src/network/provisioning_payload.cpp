/**
 * @file provisioning_payload.cpp
 * @brief Provisioning payload JSON codec (ArduinoJson)
 */

#include "provisioning_payload.h"
#include <ArduinoJson.h>

namespace Provisioning {
namespace PayloadCodec {

namespace {
    // Pool headroom for member slots and duplicated strings
    constexpr size_t DECODE_POOL_FACTOR = 4;
    constexpr size_t DECODE_POOL_BASE = 512;

    // Lenient string read: absent/null -> "", non-string -> JSON text
    std::string stringValue(JsonVariantConst value) {
        if (value.isNull()) {
            return std::string();
        }
        if (value.is<const char*>()) {
            return std::string(value.as<const char*>());
        }
        std::string text;
        serializeJson(value, text);
        return text;
    }
}

std::string encode(const std::string& targetSsid,
                   const std::string& targetPassphrase,
                   int64_t timestampMs) {
    DynamicJsonDocument doc(JSON_OBJECT_SIZE(3) + targetSsid.size() + targetPassphrase.size() + 64);
    doc[KEY_TARGET_SSID] = targetSsid;
    doc[KEY_TARGET_PASSPHRASE] = targetPassphrase;
    doc[KEY_TIMESTAMP] = timestampMs;

    std::string out;
    serializeJson(doc, out);
    return out;
}

bool decode(const std::string& body, ProvisioningPayload* out, std::string* error) {
    DynamicJsonDocument doc(body.size() * DECODE_POOL_FACTOR + DECODE_POOL_BASE);
    DeserializationError err = deserializeJson(doc, body);
    if (err) {
        if (error) *error = err.c_str();
        return false;
    }
    if (!doc.is<JsonObject>()) {
        if (error) *error = "expected a JSON object";
        return false;
    }

    JsonObjectConst object = doc.as<JsonObjectConst>();

    ProvisioningPayload payload;
    payload.targetNetworkName = stringValue(object[KEY_TARGET_SSID]);
    payload.targetSecret = stringValue(object[KEY_TARGET_PASSPHRASE]);

    JsonVariantConst timestamp = object[KEY_TIMESTAMP];
    payload.submittedAtEpochMillis = timestamp.is<int64_t>() ? timestamp.as<int64_t>() : 0;

    for (JsonPairConst member : object) {
        payload.extensions[member.key().c_str()] = stringValue(member.value());
    }

    if (out) *out = payload;
    return true;
}

} // namespace PayloadCodec
} // namespace Provisioning
