#include <catch2/catch_test_macros.hpp>
#include "airmesh/crypto/chacha20poly1305.hpp"
#include "airmesh/crypto/random.hpp"
#include <string>

using namespace airmesh::crypto;

namespace {

SymmetricKey random_key() {
    SymmetricKey key;
    random_bytes(key.span());
    return key;
}

} // anonymous namespace

TEST_CASE("ChaCha20-Poly1305 seal and open", "[crypto][chacha20poly1305]") {
    ChaCha20Poly1305 cipher(random_key());

    SECTION("Empty message carries only the tag") {
        std::vector<uint8_t> plaintext;
        std::vector<uint8_t> aad;

        auto ciphertext = cipher.seal(plaintext, aad, 0);
        REQUIRE(ciphertext.size() == ChaCha20Poly1305::overhead());

        auto opened = cipher.open(ciphertext, aad, 0);
        REQUIRE(opened.has_value());
        REQUIRE(opened->empty());
    }

    SECTION("Message with associated data") {
        std::vector<uint8_t> plaintext = {0x01, 0x02, 0x03, 0x04, 0x05};
        std::vector<uint8_t> aad = {0xAA, 0xBB};

        auto ciphertext = cipher.seal(plaintext, aad, 1);
        REQUIRE(ciphertext.size() == plaintext.size() + TAG_SIZE);

        auto opened = cipher.open(ciphertext, aad, 1);
        REQUIRE(opened.has_value());
        REQUIRE(*opened == plaintext);
    }

    SECTION("Wrong counter fails") {
        std::vector<uint8_t> plaintext = {0x01, 0x02, 0x03};
        auto ciphertext = cipher.seal(plaintext, {}, 0);
        REQUIRE_FALSE(cipher.open(ciphertext, {}, 1).has_value());
    }

    SECTION("Wrong associated data fails") {
        std::vector<uint8_t> plaintext = {0x01, 0x02, 0x03};
        std::vector<uint8_t> aad1 = {0xAA};
        std::vector<uint8_t> aad2 = {0xBB};

        auto ciphertext = cipher.seal(plaintext, aad1, 0);
        REQUIRE_FALSE(cipher.open(ciphertext, aad2, 0).has_value());
    }

    SECTION("Tampered ciphertext fails") {
        std::vector<uint8_t> plaintext = {0x01, 0x02, 0x03, 0x04};
        auto ciphertext = cipher.seal(plaintext, {}, 0);
        ciphertext[0] ^= 0xFF;
        REQUIRE_FALSE(cipher.open(ciphertext, {}, 0).has_value());
    }

    SECTION("Input shorter than the tag fails") {
        std::vector<uint8_t> short_input(TAG_SIZE - 1, 0x00);
        REQUIRE_FALSE(cipher.open(short_input, {}, 0).has_value());
    }

    SECTION("Different key fails") {
        std::vector<uint8_t> plaintext = {0x42};
        auto ciphertext = cipher.seal(plaintext, {}, 7);

        ChaCha20Poly1305 other(random_key());
        REQUIRE_FALSE(other.open(ciphertext, {}, 7).has_value());
    }
}

TEST_CASE("ChaCha20-Poly1305 nonce layout", "[crypto][chacha20poly1305]") {
    SECTION("Four zero bytes then the little-endian counter") {
        auto nonce = ChaCha20Poly1305::make_nonce(0x0807060504030201ULL);
        Nonce expected = {0, 0, 0, 0, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
        REQUIRE(nonce == expected);
    }

    SECTION("Different counters produce different ciphertexts") {
        ChaCha20Poly1305 cipher(random_key());
        std::vector<uint8_t> plaintext = {0x01, 0x02, 0x03, 0x04};

        REQUIRE(cipher.seal(plaintext, {}, 0) != cipher.seal(plaintext, {}, 1));
    }

    SECTION("Largest counter round-trips") {
        ChaCha20Poly1305 cipher(random_key());
        std::string text = "Ladies and Gentlemen of the class of '99";
        std::vector<uint8_t> plaintext(text.begin(), text.end());

        Counter counter = 0xFFFFFFFFFFFFFFFFULL;
        auto opened = cipher.open(cipher.seal(plaintext, {}, counter), {}, counter);
        REQUIRE(opened.has_value());
        REQUIRE(*opened == plaintext);
    }
}
