#pragma once

#include "blackipher/core/result.hpp"
#include "blackipher/core/failures.hpp"

#include <span>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace blackipher::protocol::crypto {

/**
 * @brief Move-only owner of a block of libsodium guarded memory.
 *
 * The block comes from sodium_malloc (guard pages, mlock'ed, canary) and is
 * zeroed by sodium_free when the handle is destroyed or reassigned. Private
 * scalars, shared secrets and message keys live only in these handles; code
 * that needs the bytes borrows them through WithReadAccess.
 *
 * Not internally synchronised. Owners guard concurrent access.
 */
class SecureMemoryHandle {
public:
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    /// Allocates a handle sized to @p data and copies it in.
    static Result<SecureMemoryHandle, SodiumFailure> FromBytes(std::span<const uint8_t> data);

    ~SecureMemoryHandle();

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    Result<Unit, SodiumFailure> Read(std::span<uint8_t> output) const;

    /// Copies the first @p size bytes out. The caller owns wiping the copy.
    Result<std::vector<uint8_t>, SodiumFailure> ReadBytes(size_t size) const;

    /// Deep copy into a fresh guarded allocation.
    Result<SecureMemoryHandle, SodiumFailure> Clone() const;

    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }
        std::span<const uint8_t> secure_span(static_cast<const uint8_t*>(ptr_), size_);
        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
    }

    template<typename F>
    auto WithWriteAccess(F&& func) -> Result<std::invoke_result_t<F, std::span<uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }
        std::span<uint8_t> secure_span(static_cast<uint8_t*>(ptr_), size_);
        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
    }

    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    void Release() noexcept;

    void* ptr_;
    size_t size_;
};

} // namespace blackipher::protocol::crypto
