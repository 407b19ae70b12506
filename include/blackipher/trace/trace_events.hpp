#pragma once
#include "blackipher/core/failures.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
namespace blackipher::protocol::trace {

/// Public values observed while sealing one outgoing message.
/// Never carries private scalars, DH outputs or derived keys.
struct SendTrace {
    std::string sender_id;
    std::string receiver_id;
    bool signed_pre_key_verified = false;
    std::vector<uint8_t> ephemeral_public;
    size_t dh_output_bytes = 0;
    uint32_t signed_pre_key_id = 0;
    std::optional<uint32_t> one_time_pre_key_id;
    std::vector<uint8_t> nonce;
    std::vector<uint8_t> ciphertext;
};

struct ReceiveTrace {
    std::string receiver_id;
    std::string sender_id;
    size_t dh_output_bytes = 0;
    uint32_t signed_pre_key_id = 0;
    std::optional<uint32_t> one_time_pre_key_id;
    std::vector<uint8_t> nonce;
    std::vector<uint8_t> ciphertext;
    std::string plaintext;
};

enum class TraceDirection {
    Send,
    Receive
};

struct FailureTrace {
    TraceDirection direction = TraceDirection::Send;
    std::string local_id;
    std::string peer_id;
    ProtocolFailureType failure_type = ProtocolFailureType::Generic;
    std::string message;
};
}
