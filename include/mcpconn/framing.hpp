#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace mcpconn {

/// Reassembles newline-delimited messages from arbitrary read() chunks.
/// A line is only handed out once its terminating '\n' has arrived.
class LineFramer {
public:
    static constexpr std::size_t DEFAULT_MAX_LINE = 16 * 1024 * 1024;

    explicit LineFramer(std::size_t max_line_bytes = DEFAULT_MAX_LINE);

    /// Append raw bytes. Throws TransportError if an unterminated line grows
    /// beyond the configured maximum.
    void feed(std::string_view chunk);

    /// Pop the next complete line without its "\n" (and "\r", if CRLF).
    /// Blank lines are skipped. Returns false when no full line is buffered.
    bool next_line(std::string& out);

    /// Bytes of an incomplete trailing line still waiting for '\n'.
    [[nodiscard]] std::size_t pending_bytes() const noexcept;

    /// Frame a serialized message for writing.
    [[nodiscard]] static std::string frame(std::string_view message);

private:
    std::string buffer_;
    std::size_t pos_{0};
    std::size_t max_line_bytes_;
};

} // namespace mcpconn
