#include <catch2/catch.hpp>
#include "signature.hpp"
#include "util.hpp"
#include <cctype>

using namespace rconbridge;

static const std::string SECRET = "s3cr3t-webhook-key";
static const std::string BODY = R"({"subscription":{"type":"channel.cheer"},"event":{"bits":100}})";
static const std::string TS = "2024-03-21T20:39:14.123Z";
static const uint64_t TS_EPOCH = 1711053554;

static std::map<std::string, std::string> signed_headers(const SignatureVerifier& v,
                                                         const std::string& id,
                                                         const std::string& ts,
                                                         const std::string& body) {
    return {
        {eventsub_headers::MessageId, id},
        {eventsub_headers::MessageTimestamp, ts},
        {eventsub_headers::MessageSignature, v.expected_signature(id, ts, body)},
        {eventsub_headers::MessageType, "notification"},
    };
}

// ── Primitives ───────────────────────────────────────────────────

TEST_CASE("hmac_sha256_hex: RFC 4231 test case 2", "[signature]") {
    REQUIRE(hmac_sha256_hex("Jefe", "what do ya want for nothing?") ==
            "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST_CASE("sha256_hex: known digest", "[signature]") {
    REQUIRE(sha256_hex("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("constant_time_equals: content and length", "[signature]") {
    REQUIRE(constant_time_equals("sha256=ab", "sha256=ab"));
    REQUIRE_FALSE(constant_time_equals("sha256=ab", "sha256=ac"));
    REQUIRE_FALSE(constant_time_equals("sha256=ab", "sha256=abc"));
}

// ── verify ───────────────────────────────────────────────────────

TEST_CASE("SignatureVerifier: accepts a correctly signed delivery", "[signature]") {
    SignatureVerifier v(SECRET, 600);
    auto headers = signed_headers(v, "msg-1", TS, BODY);

    auto d = v.verify(headers, BODY, TS_EPOCH + 5);
    REQUIRE(d.has_value());
    REQUIRE(d->message_id == "msg-1");
    REQUIRE(d->message_type == "notification");
    REQUIRE(d->fingerprint == "msg:msg-1");
}

TEST_CASE("SignatureVerifier: signature covers id, timestamp and body", "[signature]") {
    SignatureVerifier v(SECRET, 600);
    auto headers = signed_headers(v, "msg-1", TS, BODY);

    REQUIRE_FALSE(v.verify(headers, BODY + " ", TS_EPOCH).has_value());

    auto other_id = headers;
    other_id[eventsub_headers::MessageId] = "msg-2";
    REQUIRE_FALSE(v.verify(other_id, BODY, TS_EPOCH).has_value());

    auto other_ts = headers;
    other_ts[eventsub_headers::MessageTimestamp] = "2024-03-21T20:39:15.123Z";
    REQUIRE_FALSE(v.verify(other_ts, BODY, TS_EPOCH).has_value());
}

TEST_CASE("SignatureVerifier: wrong secret is rejected", "[signature]") {
    SignatureVerifier signer("another-secret-value", 600);
    SignatureVerifier v(SECRET, 600);
    auto headers = signed_headers(signer, "msg-1", TS, BODY);
    REQUIRE_FALSE(v.verify(headers, BODY, TS_EPOCH).has_value());
}

TEST_CASE("SignatureVerifier: uppercase hex signature still matches", "[signature]") {
    SignatureVerifier v(SECRET, 600);
    auto headers = signed_headers(v, "msg-1", TS, BODY);
    std::string sig = headers[eventsub_headers::MessageSignature];
    for (size_t i = 7; i < sig.size(); ++i) sig[i] = static_cast<char>(std::toupper(sig[i]));
    headers[eventsub_headers::MessageSignature] = sig;
    REQUIRE(v.verify(headers, BODY, TS_EPOCH).has_value());
}

TEST_CASE("SignatureVerifier: missing headers are unauthenticated", "[signature]") {
    SignatureVerifier v(SECRET, 600);
    auto headers = signed_headers(v, "msg-1", TS, BODY);

    for (const char* name : {eventsub_headers::MessageId,
                             eventsub_headers::MessageTimestamp,
                             eventsub_headers::MessageSignature}) {
        auto h = headers;
        h.erase(name);
        REQUIRE_FALSE(v.verify(h, BODY, TS_EPOCH).has_value());
    }
}

TEST_CASE("SignatureVerifier: stale or unparseable timestamp is rejected", "[signature]") {
    SignatureVerifier v(SECRET, 600);
    auto headers = signed_headers(v, "msg-1", TS, BODY);

    REQUIRE(v.verify(headers, BODY, TS_EPOCH + 600).has_value());
    REQUIRE_FALSE(v.verify(headers, BODY, TS_EPOCH + 601).has_value());
    REQUIRE_FALSE(v.verify(headers, BODY, TS_EPOCH - 601).has_value());

    auto bad = signed_headers(v, "msg-1", "not-a-time", BODY);
    REQUIRE_FALSE(v.verify(bad, BODY, TS_EPOCH).has_value());
}

TEST_CASE("SignatureVerifier: empty secret never authenticates", "[signature]") {
    SignatureVerifier v("", 600);
    auto headers = signed_headers(v, "msg-1", TS, BODY);
    REQUIRE_FALSE(v.verify(headers, BODY, TS_EPOCH).has_value());
}

// ── Fingerprints ─────────────────────────────────────────────────

TEST_CASE("fingerprint_for: message id wins", "[signature]") {
    REQUIRE(SignatureVerifier::fingerprint_for("abc", BODY) == "msg:abc");
}

TEST_CASE("fingerprint_for: payload hash ignores key order and spacing", "[signature]") {
    std::string a = R"({"b": 2, "a": {"y": 1, "x": [1, 2]}})";
    std::string b = R"({"a":{"x":[1,2],"y":1},"b":2})";
    std::string fa = SignatureVerifier::fingerprint_for("", a);
    REQUIRE(starts_with(fa, "sha256:"));
    REQUIRE(fa == SignatureVerifier::fingerprint_for("", b));
    REQUIRE(fa != SignatureVerifier::fingerprint_for("", R"({"a":{"x":[2,1],"y":1},"b":2})"));
}
