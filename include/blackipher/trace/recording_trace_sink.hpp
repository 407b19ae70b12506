#pragma once
#include "blackipher/interfaces/i_trace_sink.hpp"
#include <mutex>
#include <vector>
namespace blackipher::protocol::trace {
class RecordingTraceSink final : public interfaces::ITraceSink {
public:
    void OnMessageSent(const SendTrace& event) override;
    void OnMessageReceived(const ReceiveTrace& event) override;
    void OnExchangeFailed(const FailureTrace& event) override;
    [[nodiscard]] std::vector<SendTrace> Sent() const;
    [[nodiscard]] std::vector<ReceiveTrace> Received() const;
    [[nodiscard]] std::vector<FailureTrace> Failures() const;
private:
    mutable std::mutex lock_;
    std::vector<SendTrace> sent_;
    std::vector<ReceiveTrace> received_;
    std::vector<FailureTrace> failures_;
};
}
