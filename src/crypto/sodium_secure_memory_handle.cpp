#include "blackipher/crypto/sodium_secure_memory_handle.hpp"
#include "blackipher/crypto/sodium_interop.hpp"
#include "blackipher/core/constants.hpp"

#include <cstring>

namespace blackipher::protocol::crypto {

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Allocate(size_t size) {
    if (!SodiumInterop::IsInitialized()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (size == 0) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed("Cannot allocate zero-sized secure memory"));
    }
    if (size > Constants::MAX_SECURE_BUFFER_SIZE) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                "Requested " + std::to_string(size) + " bytes of secure memory"));
    }
    void* ptr = SodiumInterop::AllocateSecure(size);
    if (ptr == nullptr) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed(
                std::string(ErrorMessages::FAILED_TO_ALLOCATE_SECURE_MEMORY) +
                std::to_string(size) + " bytes"));
    }
    return Result<SecureMemoryHandle, SodiumFailure>::Ok(SecureMemoryHandle(ptr, size));
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::FromBytes(std::span<const uint8_t> data) {
    auto alloc_result = Allocate(data.size());
    if (alloc_result.IsErr()) {
        return alloc_result;
    }
    auto handle = std::move(alloc_result).Unwrap();
    if (auto write_result = handle.Write(data); write_result.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(write_result.UnwrapErr());
    }
    return Result<SecureMemoryHandle, SodiumFailure>::Ok(std::move(handle));
}

SecureMemoryHandle::~SecureMemoryHandle() {
    Release();
}

SecureMemoryHandle::SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
    : ptr_(other.ptr_)
    , size_(other.size_) {
    other.ptr_ = nullptr;
    other.size_ = 0;
}

SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
    if (this != &other) {
        Release();
        ptr_ = other.ptr_;
        size_ = other.size_;
        other.ptr_ = nullptr;
        other.size_ = 0;
    }
    return *this;
}

void SecureMemoryHandle::Release() noexcept {
    if (ptr_ != nullptr) {
        SodiumInterop::FreeSecure(ptr_);
        ptr_ = nullptr;
        size_ = 0;
    }
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Write(std::span<const uint8_t> data) {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED)));
    }
    if (data.size() > size_) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                std::string(ErrorMessages::DATA_EXCEEDS_BUFFER) +
                " (data: " + std::to_string(data.size()) +
                ", buffer: " + std::to_string(size_) + ")"));
    }
    if (!data.empty()) {
        std::memcpy(ptr_, data.data(), data.size());
    }
    // Tail of a short write must not keep stale key bytes.
    if (data.size() < size_) {
        sodium_memzero(static_cast<uint8_t*>(ptr_) + data.size(), size_ - data.size());
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Read(std::span<uint8_t> output) const {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED)));
    }
    if (output.size() < size_) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                "Output buffer too small (requested: " + std::to_string(size_) +
                ", provided: " + std::to_string(output.size()) + ")"));
    }
    std::memcpy(output.data(), ptr_, size_);
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, SodiumFailure> SecureMemoryHandle::ReadBytes(size_t size) const {
    if (IsInvalid()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED)));
    }
    if (size > size_) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::ReadOperationFailed(
                std::string(ErrorMessages::FAILED_TO_READ_SECURE_MEMORY) +
                "requested " + std::to_string(size) + " of " + std::to_string(size_) + " bytes"));
    }
    std::vector<uint8_t> result(size);
    std::memcpy(result.data(), ptr_, size);
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(result));
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Clone() const {
    if (IsInvalid()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED)));
    }
    return FromBytes(std::span<const uint8_t>(static_cast<const uint8_t*>(ptr_), size_));
}

} // namespace blackipher::protocol::crypto
