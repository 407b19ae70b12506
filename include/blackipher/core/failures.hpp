#pragma once
#include <string>
#include <string_view>
namespace blackipher::protocol {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    AllocationFailed,
    ReadOperationFailed,
    ComparisonFailed,
    InvalidOperation
};
enum class ProtocolFailureType {
    Generic,
    KeyGeneration,
    DeriveKey,
    InvalidInput,
    PeerPubKey,
    SignatureVerification,
    StalePreKey,
    Decryption,
    UnknownContact,
    Decode,
    Encode,
    InvalidState
};
/// Failure raised by the libsodium wrappers; folded into ProtocolFailure at module seams.
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/// Error value carried by every fallible protocol operation.
///
/// SignatureVerification and Decryption are terminal for the message they
/// concern; the caller reports them and never retries.
class ProtocolFailure {
public:
    ProtocolFailureType type;
    std::string message;
    ProtocolFailure(const ProtocolFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static ProtocolFailure Generic(std::string msg) {
        return {ProtocolFailureType::Generic, std::move(msg)};
    }
    static ProtocolFailure KeyGeneration(std::string msg) {
        return {ProtocolFailureType::KeyGeneration, std::move(msg)};
    }
    static ProtocolFailure DeriveKey(std::string msg) {
        return {ProtocolFailureType::DeriveKey, std::move(msg)};
    }
    static ProtocolFailure InvalidInput(std::string msg) {
        return {ProtocolFailureType::InvalidInput, std::move(msg)};
    }
    static ProtocolFailure PeerPubKey(std::string msg) {
        return {ProtocolFailureType::PeerPubKey, std::move(msg)};
    }
    static ProtocolFailure SignatureVerification(std::string msg) {
        return {ProtocolFailureType::SignatureVerification, std::move(msg)};
    }
    static ProtocolFailure StalePreKey(std::string msg) {
        return {ProtocolFailureType::StalePreKey, std::move(msg)};
    }
    static ProtocolFailure Decryption(std::string msg) {
        return {ProtocolFailureType::Decryption, std::move(msg)};
    }
    static ProtocolFailure UnknownContact(std::string msg) {
        return {ProtocolFailureType::UnknownContact, std::move(msg)};
    }
    static ProtocolFailure Decode(std::string msg) {
        return {ProtocolFailureType::Decode, std::move(msg)};
    }
    static ProtocolFailure Encode(std::string msg) {
        return {ProtocolFailureType::Encode, std::move(msg)};
    }
    static ProtocolFailure InvalidState(std::string msg) {
        return {ProtocolFailureType::InvalidState, std::move(msg)};
    }
    static ProtocolFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
    [[nodiscard]] bool Is(const ProtocolFailureType t) const noexcept {
        return type == t;
    }
};

[[nodiscard]] std::string_view ToString(ProtocolFailureType type) noexcept;
}
