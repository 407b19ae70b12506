#include "blackipher/trace/recording_trace_sink.hpp"

namespace blackipher::protocol::trace {
    void RecordingTraceSink::OnMessageSent(const SendTrace &event) {
        std::lock_guard lock(lock_);
        sent_.push_back(event);
    }

    void RecordingTraceSink::OnMessageReceived(const ReceiveTrace &event) {
        std::lock_guard lock(lock_);
        received_.push_back(event);
    }

    void RecordingTraceSink::OnExchangeFailed(const FailureTrace &event) {
        std::lock_guard lock(lock_);
        failures_.push_back(event);
    }

    std::vector<SendTrace> RecordingTraceSink::Sent() const {
        std::lock_guard lock(lock_);
        return sent_;
    }

    std::vector<ReceiveTrace> RecordingTraceSink::Received() const {
        std::lock_guard lock(lock_);
        return received_;
    }

    std::vector<FailureTrace> RecordingTraceSink::Failures() const {
        std::lock_guard lock(lock_);
        return failures_;
    }
}
