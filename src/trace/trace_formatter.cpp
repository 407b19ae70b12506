#include "blackipher/trace/trace_formatter.hpp"
#include <format>

namespace blackipher::protocol::trace {
    std::string TraceFormatter::ToHex(const std::span<const uint8_t> data) {
        static constexpr char hex_chars[] = "0123456789abcdef";
        std::string result;
        result.reserve(data.size() * 2);
        for (const auto byte : data) {
            result.push_back(hex_chars[(byte >> 4) & 0x0F]);
            result.push_back(hex_chars[byte & 0x0F]);
        }
        return result;
    }

    std::string TraceFormatter::FormatSend(const SendTrace &event) {
        return std::format(
            "== log ==\n"
            "Sender: {}\n"
            "Receiver: {}\n"
            "Verify(peer.SPK signed by peer.ID) = {}\n"
            "Ephemeral PK: {}\n"
            "DH(ephemeral, peer.SPK): precomputed ({} bytes)\n"
            "Nonce: {}\n"
            "Ciphertext: {}\n",
            event.sender_id,
            event.receiver_id,
            event.signed_pre_key_verified,
            ToHex(event.ephemeral_public),
            event.dh_output_bytes,
            ToHex(event.nonce),
            ToHex(event.ciphertext));
    }

    std::string TraceFormatter::FormatReceive(const ReceiveTrace &event) {
        return std::format(
            "== log (recv) ==\n"
            "Receiver: {}\n"
            "Sender: {}\n"
            "DH(sender.ephemeral, self.SPK): precomputed ({} bytes)\n"
            "Nonce: {}\n"
            "Ciphertext: {}\n"
            "Plaintext: {}\n",
            event.receiver_id,
            event.sender_id,
            event.dh_output_bytes,
            ToHex(event.nonce),
            ToHex(event.ciphertext),
            event.plaintext);
    }

    std::string TraceFormatter::FormatFailure(const FailureTrace &event) {
        const bool sending = event.direction == TraceDirection::Send;
        return std::format(
            "== log ({} failed) ==\n"
            "{}: {}\n"
            "{}: {}\n"
            "Error: {} ({})\n",
            sending ? "send" : "recv",
            sending ? "Sender" : "Receiver", event.local_id,
            sending ? "Receiver" : "Sender", event.peer_id,
            ToString(event.failure_type), event.message);
    }
}
