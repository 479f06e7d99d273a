#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace rconbridge {

// EventSub delivery headers (lowercased, as WebhookServer stores them)
namespace eventsub_headers {
    constexpr const char* MessageId        = "twitch-eventsub-message-id";
    constexpr const char* MessageTimestamp = "twitch-eventsub-message-timestamp";
    constexpr const char* MessageSignature = "twitch-eventsub-message-signature";
    constexpr const char* MessageType      = "twitch-eventsub-message-type";
} // namespace eventsub_headers

// Lowercase hex HMAC-SHA256 / SHA-256 (OpenSSL libcrypto)
std::string hmac_sha256_hex(const std::string& key, const std::string& data);
std::string sha256_hex(const std::string& data);

// Length is not secret; content comparison is constant-time.
bool constant_time_equals(const std::string& a, const std::string& b);

struct VerifiedDelivery {
    std::string message_id;
    std::string message_type;  // "notification", "webhook_callback_verification", "revocation"
    std::string fingerprint;
};

// Authenticates webhook deliveries:
//   expected = "sha256=" + hex(HMAC_SHA256(secret, id + timestamp + raw_body))
// and derives the dedup fingerprint. A nullopt result means Unauthenticated:
// missing headers, signature mismatch, or a timestamp outside the tolerance.
class SignatureVerifier {
public:
    SignatureVerifier(std::string secret, uint32_t tolerance_seconds);

    std::optional<VerifiedDelivery> verify(const std::map<std::string, std::string>& headers,
                                           const std::string& raw_body,
                                           uint64_t now_epoch) const;

    std::optional<VerifiedDelivery> verify(const std::map<std::string, std::string>& headers,
                                           const std::string& raw_body) const;

    std::string expected_signature(const std::string& message_id,
                                   const std::string& timestamp,
                                   const std::string& raw_body) const;

    // "msg:<id>" when the platform supplied a message id, otherwise
    // "sha256:<hex>" over the key-sorted re-serialization of the body.
    static std::string fingerprint_for(const std::string& message_id,
                                       const std::string& raw_body);

private:
    std::string secret_;
    uint32_t tolerance_seconds_;
};

} // namespace rconbridge
