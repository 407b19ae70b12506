#include "blackipher/core/failures.hpp"

namespace blackipher::protocol {
    std::string_view ToString(const ProtocolFailureType type) noexcept {
        switch (type) {
            case ProtocolFailureType::Generic: return "Generic";
            case ProtocolFailureType::KeyGeneration: return "KeyGeneration";
            case ProtocolFailureType::DeriveKey: return "DeriveKey";
            case ProtocolFailureType::InvalidInput: return "InvalidInput";
            case ProtocolFailureType::PeerPubKey: return "PeerPubKey";
            case ProtocolFailureType::SignatureVerification: return "SignatureVerification";
            case ProtocolFailureType::StalePreKey: return "StalePreKey";
            case ProtocolFailureType::Decryption: return "Decryption";
            case ProtocolFailureType::UnknownContact: return "UnknownContact";
            case ProtocolFailureType::Decode: return "Decode";
            case ProtocolFailureType::Encode: return "Encode";
            case ProtocolFailureType::InvalidState: return "InvalidState";
        }
        return "Unknown";
    }
}
