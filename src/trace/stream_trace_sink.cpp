#include "blackipher/trace/stream_trace_sink.hpp"
#include "blackipher/trace/trace_formatter.hpp"

namespace blackipher::protocol::trace {
    void StreamTraceSink::OnMessageSent(const SendTrace &event) {
        const auto text = TraceFormatter::FormatSend(event);
        std::lock_guard lock(lock_);
        out_ << text << std::flush;
    }

    void StreamTraceSink::OnMessageReceived(const ReceiveTrace &event) {
        const auto text = TraceFormatter::FormatReceive(event);
        std::lock_guard lock(lock_);
        out_ << text << std::flush;
    }

    void StreamTraceSink::OnExchangeFailed(const FailureTrace &event) {
        const auto text = TraceFormatter::FormatFailure(event);
        std::lock_guard lock(lock_);
        out_ << text << std::flush;
    }
}
