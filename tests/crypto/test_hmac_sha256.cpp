#include <catch2/catch_test_macros.hpp>
#include "airmesh/crypto/hmac_sha256.hpp"
#include "airmesh/util/encoding.hpp"
#include <string>
#include <vector>

using namespace airmesh::crypto;
using airmesh::util::to_hex;

namespace {

std::vector<uint8_t> bytes(const std::string& text) {
    return {text.begin(), text.end()};
}

} // anonymous namespace

TEST_CASE("HMAC-SHA256 RFC 4231 vectors", "[crypto][hmac]") {
    SECTION("Test case 1") {
        std::vector<uint8_t> key(20, 0x0b);
        auto mac = hmac_sha256(key, bytes("Hi There"));
        REQUIRE(to_hex(mac.span()) == "b0344c61d8db38535ca8afceaf0bf12b881dc200c9833da726e9376c2e32cff7");
    }

    SECTION("Test case 2") {
        auto mac = hmac_sha256(bytes("Jefe"), bytes("what do ya want for nothing?"));
        REQUIRE(to_hex(mac.span()) == "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
    }
}

TEST_CASE("HMAC-SHA256 verification", "[crypto][hmac]") {
    auto key = bytes("session hmac key");
    auto data = bytes("header and ciphertext");
    auto mac = hmac_sha256(key, data);

    REQUIRE(verify_hmac_sha256(mac.span(), key, data));

    SECTION("Flipped bit fails") {
        auto tampered = mac.to_vector();
        tampered[5] ^= 0x01;
        REQUIRE_FALSE(verify_hmac_sha256(tampered, key, data));
    }

    SECTION("Truncated MAC fails") {
        auto truncated = mac.to_vector();
        truncated.resize(16);
        REQUIRE_FALSE(verify_hmac_sha256(truncated, key, data));
    }

    SECTION("Different data fails") {
        REQUIRE_FALSE(verify_hmac_sha256(mac.span(), key, bytes("other data")));
    }
}

TEST_CASE("HKDF-SHA256 RFC 5869 test case 1", "[crypto][hkdf]") {
    std::vector<uint8_t> ikm(22, 0x0b);
    std::vector<uint8_t> salt = {0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0x0a, 0x0b, 0x0c};
    std::vector<uint8_t> info = {0xf0, 0xf1, 0xf2, 0xf3, 0xf4, 0xf5, 0xf6, 0xf7, 0xf8, 0xf9};

    auto prk = hkdf_extract(salt, ikm);
    REQUIRE(to_hex(prk.span()) == "077709362c2e32df0ddc3f0dc47bba6390b6c73bb50f9c3122ec844ad7c2b3e5");

    // OKM is 42 bytes: all of T(1) and the first 10 bytes of T(2)
    auto okm = hkdf<2>(salt, ikm, info);
    REQUIRE(to_hex(okm[0].span()) == "3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56ecc4c5bf");
    REQUIRE(to_hex(okm[1].span(), 10) == "34007208d5b887185865");

    auto expanded = hkdf_expand<2>(prk, info);
    REQUIRE(expanded[0] == okm[0]);
    REQUIRE(expanded[1] == okm[1]);
}

TEST_CASE("HKDF with empty salt uses zero bytes", "[crypto][hkdf]") {
    std::vector<uint8_t> ikm = bytes("input key material");
    std::vector<uint8_t> zeros(MAC_SIZE, 0x00);

    REQUIRE(hkdf_extract({}, ikm) == hkdf_extract(zeros, ikm));
}

TEST_CASE("HKDF output blocks are distinct", "[crypto][hkdf]") {
    auto keys = hkdf<4>(bytes("salt"), bytes("shared secret"), bytes("info"));
    for (size_t i = 0; i < keys.size(); ++i) {
        for (size_t j = i + 1; j < keys.size(); ++j) {
            REQUIRE(keys[i] != keys[j]);
        }
    }
}

TEST_CASE("Key ratchet", "[crypto][ratchet]") {
    SymmetricKey key;
    key.span()[0] = 0x42;

    SECTION("Deterministic") {
        REQUIRE(ratchet_key(key, "airmesh.ratchet.enc", 3) == ratchet_key(key, "airmesh.ratchet.enc", 3));
    }

    SECTION("Counter and label separate the outputs") {
        auto a = ratchet_key(key, "airmesh.ratchet.enc", 0);
        auto b = ratchet_key(key, "airmesh.ratchet.enc", 1);
        auto c = ratchet_key(key, "airmesh.ratchet.mac", 0);
        REQUIRE(a != b);
        REQUIRE(a != c);
        REQUIRE(a != key);
    }

    SECTION("Matches HMAC over label and big-endian counter") {
        std::vector<uint8_t> input = bytes("label");
        std::vector<uint8_t> counter = {0, 0, 0, 0, 0, 0, 0x01, 0x02};
        input.insert(input.end(), counter.begin(), counter.end());

        REQUIRE(ratchet_key(key, "label", 0x0102) == hmac_sha256(key.span(), input));
    }
}
