/**
 * @file provisioning_payload.h
 * @brief Provisioning payload and its JSON wire form
 *
 * Wire format (POST body, application/json; charset=utf-8):
 *   {
 *     "targetSsid": "<string>",
 *     "targetPassphrase": "<string, may be empty>",
 *     "timestamp": <int64 epoch milliseconds>
 *   }
 *
 * Decoding is lenient the way the listener needs it: an absent
 * targetSsid or targetPassphrase decodes as an empty string, non-string
 * values decode as their JSON text. Only malformed JSON or a non-object
 * top level is an error.
 */

#ifndef PROVISIONING_PAYLOAD_H
#define PROVISIONING_PAYLOAD_H

#include <cstdint>
#include <map>
#include <string>

namespace Provisioning {

/**
 * @brief Peer-submitted configuration (immutable once built)
 */
struct ProvisioningPayload {
    std::string targetNetworkName;
    std::string targetSecret;                        ///< May be empty
    int64_t submittedAtEpochMillis = 0;              ///< 0 if the peer sent none
    std::map<std::string, std::string> extensions;   ///< Every member of the request object
};

namespace PayloadCodec {

constexpr const char* KEY_TARGET_SSID = "targetSsid";
constexpr const char* KEY_TARGET_PASSPHRASE = "targetPassphrase";
constexpr const char* KEY_TIMESTAMP = "timestamp";

/**
 * @brief Serialize the three wire fields
 */
std::string encode(const std::string& targetSsid,
                   const std::string& targetPassphrase,
                   int64_t timestampMs);

/**
 * @brief Parse a request body into a payload
 *
 * @param body Request body (UTF-8 JSON text)
 * @param out Output payload, untouched on failure
 * @param error Output: parse failure reason
 * @return true if body is a JSON object
 */
bool decode(const std::string& body, ProvisioningPayload* out, std::string* error);

} // namespace PayloadCodec

} // namespace Provisioning

#endif // PROVISIONING_PAYLOAD_H
