#pragma once
#include "blackipher/interfaces/i_trace_sink.hpp"
#include <mutex>
#include <ostream>
namespace blackipher::protocol::trace {

/// Writes every event through TraceFormatter to a borrowed stream.
/// The stream must outlive the sink.
class StreamTraceSink final : public interfaces::ITraceSink {
public:
    explicit StreamTraceSink(std::ostream& out) noexcept : out_(out) {}
    void OnMessageSent(const SendTrace& event) override;
    void OnMessageReceived(const ReceiveTrace& event) override;
    void OnExchangeFailed(const FailureTrace& event) override;
private:
    std::ostream& out_;
    std::mutex lock_;
};
}
