#pragma once
#include "blackipher/trace/trace_events.hpp"
#include <span>
#include <string>
#include <cstdint>
namespace blackipher::protocol::trace {

/**
 * @brief Renders trace events as the human-readable exchange log.
 *
 * Send layout:
 * @code
 * == log ==
 * Sender: a
 * Receiver: b
 * Verify(peer.SPK signed by peer.ID) = true
 * Ephemeral PK: <hex>
 * DH(ephemeral, peer.SPK): precomputed (32 bytes)
 * Nonce: <hex>
 * Ciphertext: <hex>
 * @endcode
 * Receive layout starts with "== log (recv) ==" and ends with the
 * decoded plaintext. Hex is lower case.
 */
class TraceFormatter {
public:
    [[nodiscard]] static std::string FormatSend(const SendTrace& event);
    [[nodiscard]] static std::string FormatReceive(const ReceiveTrace& event);
    [[nodiscard]] static std::string FormatFailure(const FailureTrace& event);
    [[nodiscard]] static std::string ToHex(std::span<const uint8_t> data);
private:
    TraceFormatter() = delete;
};
}
