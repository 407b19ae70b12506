#include "blackipher/models/keys/shared_secret.hpp"
#include "blackipher/crypto/sodium_interop.hpp"

namespace blackipher::protocol::models {
    Result<bool, ProtocolFailure> SharedSecret::ConstantTimeEquals(const SharedSecret &other) const {
        auto outer = handle_.WithReadAccess([&other](std::span<const uint8_t> mine) {
            return other.handle_.WithReadAccess([mine](std::span<const uint8_t> theirs) {
                return crypto::SodiumInterop::ConstantTimeEquals(mine, theirs);
            });
        });
        if (outer.IsErr()) {
            return Result<bool, ProtocolFailure>::Err(ProtocolFailure::FromSodiumFailure(outer.UnwrapErr()));
        }
        auto inner = std::move(outer).Unwrap();
        if (inner.IsErr()) {
            return Result<bool, ProtocolFailure>::Err(ProtocolFailure::FromSodiumFailure(inner.UnwrapErr()));
        }
        auto compared = std::move(inner).Unwrap();
        if (compared.IsErr()) {
            return Result<bool, ProtocolFailure>::Err(ProtocolFailure::FromSodiumFailure(compared.UnwrapErr()));
        }
        return Result<bool, ProtocolFailure>::Ok(compared.Unwrap());
    }
}
