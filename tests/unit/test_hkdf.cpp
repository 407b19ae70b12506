#include <catch2/catch_test_macros.hpp>
#include "blackipher/crypto/hkdf.hpp"
#include "blackipher/crypto/sodium_interop.hpp"
#include <string>
using namespace blackipher::protocol;
using namespace blackipher::protocol::crypto;
namespace {
std::vector<uint8_t> FromHex(const std::string& hex) {
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i + 1 < hex.size(); i += 2) {
        out.push_back(static_cast<uint8_t>(std::stoul(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}
}

TEST_CASE("HKDF - RFC 5869 vectors", "[hkdf][crypto][vectors]") {
    const std::vector<uint8_t> ikm(22, 0x0b);

    SECTION("Test case 1: salt and info") {
        const auto salt = FromHex("000102030405060708090a0b0c");
        const auto info = FromHex("f0f1f2f3f4f5f6f7f8f9");
        auto result = Hkdf::DeriveKeyBytes(ikm, 42, salt, info);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == FromHex(
            "3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56ecc4c5bf"
            "34007208d5b887185865"));
    }
    SECTION("Test case 3: empty salt and info") {
        auto result = Hkdf::DeriveKeyBytes(ikm, 42);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == FromHex(
            "8da4e775a563c18f715f802a063c5a31b8a11f5c5ee1879ec3454e5f3c738d2d"
            "9d201395faa4b61a96c8"));
    }
}

TEST_CASE("HKDF - Input validation", "[hkdf][crypto]") {
    const std::vector<uint8_t> ikm(32, 0x11);

    SECTION("Empty IKM is rejected") {
        auto result = Hkdf::DeriveKeyBytes({}, 32);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::InvalidInput));
    }
    SECTION("Zero output size is rejected") {
        REQUIRE(Hkdf::DeriveKeyBytes(ikm, 0).IsErr());
    }
    SECTION("Output larger than 255 blocks is rejected") {
        auto result = Hkdf::DeriveKeyBytes(ikm, Hkdf::MAX_OUTPUT_LEN + 1);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(ProtocolFailureType::InvalidInput));
    }
    SECTION("Maximum output size is accepted") {
        auto result = Hkdf::DeriveKeyBytes(ikm, Hkdf::MAX_OUTPUT_LEN);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().size() == Hkdf::MAX_OUTPUT_LEN);
    }
}

TEST_CASE("HKDF - Domain separation", "[hkdf][crypto]") {
    const std::vector<uint8_t> ikm(32, 0x22);
    const std::string info_a = "BlacKipher-Agreement-v1";
    const std::string info_b = "BlacKipher-Message-v1";
    auto as_bytes = [](const std::string& s) {
        return std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    };

    auto a = Hkdf::DeriveKeyBytes(ikm, 32, {}, as_bytes(info_a));
    auto b = Hkdf::DeriveKeyBytes(ikm, 32, {}, as_bytes(info_b));
    auto a_again = Hkdf::DeriveKeyBytes(ikm, 32, {}, as_bytes(info_a));
    REQUIRE(a.IsOk());
    REQUIRE(b.IsOk());
    REQUIRE(a_again.IsOk());
    REQUIRE(a.Unwrap() != b.Unwrap());
    REQUIRE(a.Unwrap() == a_again.Unwrap());
}

TEST_CASE("HKDF - Derive into secure memory", "[hkdf][crypto][secure_memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> ikm(32, 0x33);
    auto bytes = Hkdf::DeriveKeyBytes(ikm, 32);
    auto handle = Hkdf::DeriveKeyHandle(ikm, 32);
    REQUIRE(bytes.IsOk());
    REQUIRE(handle.IsOk());
    REQUIRE(handle.Unwrap().Size() == 32);
    REQUIRE(handle.Unwrap().ReadBytes(32).Unwrap() == bytes.Unwrap());
}
