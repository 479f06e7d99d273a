#include "signature.hpp"
#include "log.hpp"
#include "util.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <nlohmann/json.hpp>

#include <stdexcept>

namespace rconbridge {

std::string hmac_sha256_hex(const std::string& key, const std::string& data) {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char*>(data.data()), data.size(),
             mac, &mac_len) == nullptr) {
        throw std::runtime_error("HMAC(EVP_sha256) failed");
    }
    return hex_encode(mac, mac_len);
}

std::string sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return hex_encode(hash, SHA256_DIGEST_LENGTH);
}

bool constant_time_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

SignatureVerifier::SignatureVerifier(std::string secret, uint32_t tolerance_seconds)
    : secret_(std::move(secret)), tolerance_seconds_(tolerance_seconds) {}

std::string SignatureVerifier::expected_signature(const std::string& message_id,
                                                  const std::string& timestamp,
                                                  const std::string& raw_body) const {
    return "sha256=" + hmac_sha256_hex(secret_, message_id + timestamp + raw_body);
}

static const std::string* find_header(const std::map<std::string, std::string>& headers,
                                      const char* name) {
    auto it = headers.find(name);
    if (it == headers.end() || it->second.empty()) return nullptr;
    return &it->second;
}

std::optional<VerifiedDelivery> SignatureVerifier::verify(
        const std::map<std::string, std::string>& headers,
        const std::string& raw_body,
        uint64_t now_epoch) const {
    if (secret_.empty()) return std::nullopt;

    const std::string* id  = find_header(headers, eventsub_headers::MessageId);
    const std::string* ts  = find_header(headers, eventsub_headers::MessageTimestamp);
    const std::string* sig = find_header(headers, eventsub_headers::MessageSignature);
    if (!id || !ts || !sig) {
        log_debug("verify", "Delivery missing signature headers");
        return std::nullopt;
    }

    if (!constant_time_equals(expected_signature(*id, *ts, raw_body), to_lower(*sig))) {
        return std::nullopt;
    }

    // Signed but stale: a captured delivery replayed after the dedup window
    uint64_t sent_at = 0;
    if (!parse_rfc3339(*ts, sent_at)) return std::nullopt;
    uint64_t age = now_epoch > sent_at ? now_epoch - sent_at : sent_at - now_epoch;
    if (tolerance_seconds_ > 0 && age > tolerance_seconds_) {
        log_info("verify", "Rejecting delivery " + *id + " with timestamp " + *ts);
        return std::nullopt;
    }

    VerifiedDelivery out;
    out.message_id = *id;
    if (const std::string* type = find_header(headers, eventsub_headers::MessageType))
        out.message_type = *type;
    out.fingerprint = fingerprint_for(*id, raw_body);
    return out;
}

std::optional<VerifiedDelivery> SignatureVerifier::verify(
        const std::map<std::string, std::string>& headers,
        const std::string& raw_body) const {
    return verify(headers, raw_body, epoch_seconds());
}

std::string SignatureVerifier::fingerprint_for(const std::string& message_id,
                                               const std::string& raw_body) {
    if (!message_id.empty()) return "msg:" + message_id;

    // nlohmann::json objects are std::map-backed, so dump() is key-sorted
    std::string normalized;
    try {
        normalized = nlohmann::json::parse(raw_body).dump();
    } catch (const nlohmann::json::parse_error&) {
        normalized = raw_body;
    }
    return "sha256:" + sha256_hex(normalized);
}

} // namespace rconbridge
