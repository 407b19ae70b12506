#include <catch2/catch_test_macros.hpp>
#include "blackipher/crypto/sodium_secure_memory_handle.hpp"
#include "blackipher/crypto/sodium_interop.hpp"
using namespace blackipher::protocol;
using namespace blackipher::protocol::crypto;
TEST_CASE("SecureMemoryHandle - Allocation", "[secure_memory][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Allocate returns a valid handle") {
        auto result = SecureMemoryHandle::Allocate(32);
        REQUIRE(result.IsOk());
        auto handle = std::move(result).Unwrap();
        REQUIRE_FALSE(handle.IsInvalid());
        REQUIRE(handle.Size() == 32);
    }
    SECTION("Zero-size allocation fails") {
        auto result = SecureMemoryHandle::Allocate(0);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SodiumFailureType::AllocationFailed);
    }
    SECTION("Default handle is invalid") {
        SecureMemoryHandle handle;
        REQUIRE(handle.IsInvalid());
        REQUIRE(handle.Size() == 0);
    }
}

TEST_CASE("SecureMemoryHandle - Read and write", "[secure_memory][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto handle = SecureMemoryHandle::Allocate(8).Unwrap();
    SECTION("Round trip") {
        std::vector<uint8_t> data = {1, 2, 3, 4, 5, 6, 7, 8};
        REQUIRE(handle.Write(data).IsOk());
        REQUIRE(handle.ReadBytes(8).Unwrap() == data);
    }
    SECTION("Short write zeroes the tail") {
        REQUIRE(handle.Write(std::vector<uint8_t>(8, 0xFF)).IsOk());
        REQUIRE(handle.Write(std::vector<uint8_t>{0xAA, 0xBB}).IsOk());
        REQUIRE(handle.ReadBytes(8).Unwrap() == std::vector<uint8_t>{0xAA, 0xBB, 0, 0, 0, 0, 0, 0});
    }
    SECTION("Oversized write fails") {
        auto result = handle.Write(std::vector<uint8_t>(9, 0x01));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SodiumFailureType::BufferTooSmall);
    }
    SECTION("Oversized read fails") {
        REQUIRE(handle.ReadBytes(9).IsErr());
        std::vector<uint8_t> small(4);
        REQUIRE(handle.Read(small).IsErr());
    }
    SECTION("WithReadAccess sees the stored bytes") {
        REQUIRE(handle.Write(std::vector<uint8_t>(8, 0x11)).IsOk());
        auto sum = handle.WithReadAccess([](std::span<const uint8_t> bytes) {
            int total = 0;
            for (auto b : bytes) {
                total += b;
            }
            return total;
        });
        REQUIRE(sum.IsOk());
        REQUIRE(sum.Unwrap() == 8 * 0x11);
    }
}

TEST_CASE("SecureMemoryHandle - Ownership", "[secure_memory][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto original = SecureMemoryHandle::FromBytes(std::vector<uint8_t>{9, 8, 7}).Unwrap();
    SECTION("Move leaves the source invalid") {
        SecureMemoryHandle moved = std::move(original);
        REQUIRE(original.IsInvalid());
        REQUIRE(moved.ReadBytes(3).Unwrap() == std::vector<uint8_t>{9, 8, 7});
    }
    SECTION("Clone is independent") {
        auto copy = original.Clone().Unwrap();
        REQUIRE(copy.Write(std::vector<uint8_t>{1, 1, 1}).IsOk());
        REQUIRE(original.ReadBytes(3).Unwrap() == std::vector<uint8_t>{9, 8, 7});
    }
    SECTION("Access to a disposed handle fails") {
        SecureMemoryHandle moved = std::move(original);
        auto access = original.WithReadAccess([](std::span<const uint8_t>) { return 0; });
        REQUIRE(access.IsErr());
        REQUIRE(access.UnwrapErr().type == SodiumFailureType::InvalidOperation);
    }
}
