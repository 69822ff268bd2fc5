#pragma once
#include "../json_rpc.hpp"
#include <chrono>
#include <exception>
#include <functional>

namespace mcpconn {

/// Callback for incoming messages
using MessageCallback = std::function<void(JsonRpcMessage)>;
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// Abstract transport interface. Only the pipe (stdio) transport exists;
/// sse and websocket are reserved protocol names.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Run the read loop in the calling thread. Returns when the peer closes
    /// its output or shutdown() is called.
    virtual void start(MessageCallback on_message,
                       ErrorCallback on_error = nullptr) = 0;

    /// Write one message and flush it within `timeout`. Throws TransportError
    /// on failure, TimeoutError if nothing was written in time, and
    /// DesynchronizedError if time ran out after part of the line went out.
    virtual void send(const JsonRpcMessage& msg, std::chrono::milliseconds timeout) = 0;

    /// Interrupt start() and refuse further sends.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace mcpconn
