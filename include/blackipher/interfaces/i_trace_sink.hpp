#pragma once
#include "blackipher/trace/trace_events.hpp"
namespace blackipher::protocol::interfaces {
class ITraceSink {
public:
    virtual ~ITraceSink() = default;
    virtual void OnMessageSent(const trace::SendTrace& event) = 0;
    virtual void OnMessageReceived(const trace::ReceiveTrace& event) = 0;
    virtual void OnExchangeFailed(const trace::FailureTrace& event) = 0;
};
}
