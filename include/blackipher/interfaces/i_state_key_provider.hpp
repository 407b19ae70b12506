#pragma once
#include "blackipher/crypto/sodium_secure_memory_handle.hpp"

namespace blackipher::protocol::interfaces {

/// Supplies the 32-byte key that seals persisted identity state.
class IStateKeyProvider {
public:
    virtual ~IStateKeyProvider() = default;

    [[nodiscard]] virtual Result<crypto::SecureMemoryHandle, ProtocolFailure> GetStateEncryptionKey() = 0;
};

}
