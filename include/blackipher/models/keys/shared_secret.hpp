#pragma once
#include "blackipher/crypto/sodium_secure_memory_handle.hpp"
#include "blackipher/core/result.hpp"
#include "blackipher/core/failures.hpp"
#include <cstdint>
#include <span>
namespace blackipher::protocol::models {

/// 32-byte agreement output held in secure memory.
class SharedSecret {
public:
    explicit SharedSecret(crypto::SecureMemoryHandle handle) noexcept
        : handle_(std::move(handle)) {}
    SharedSecret(SharedSecret&&) noexcept = default;
    SharedSecret& operator=(SharedSecret&&) noexcept = default;
    SharedSecret(const SharedSecret&) = delete;
    SharedSecret& operator=(const SharedSecret&) = delete;
    [[nodiscard]] const crypto::SecureMemoryHandle& GetHandle() const noexcept {
        return handle_;
    }
    [[nodiscard]] size_t Size() const noexcept {
        return handle_.Size();
    }
    [[nodiscard]] Result<bool, ProtocolFailure> ConstantTimeEquals(const SharedSecret& other) const;
private:
    crypto::SecureMemoryHandle handle_;
};
}
