#include "mcpconn/framing.hpp"
#include "mcpconn/error.hpp"

namespace mcpconn {

LineFramer::LineFramer(std::size_t max_line_bytes)
    : max_line_bytes_(max_line_bytes) {
    buffer_.reserve(4096);
}

void LineFramer::feed(std::string_view chunk) {
    // Compact consumed prefix before growing.
    if (pos_ > 0) {
        buffer_.erase(0, pos_);
        pos_ = 0;
    }
    buffer_.append(chunk.data(), chunk.size());

    if (buffer_.find('\n') == std::string::npos && buffer_.size() > max_line_bytes_) {
        buffer_.clear();
        throw TransportError("Incoming line exceeds " + std::to_string(max_line_bytes_)
                             + " bytes without a newline");
    }
}

bool LineFramer::next_line(std::string& out) {
    while (true) {
        size_t nl = buffer_.find('\n', pos_);
        if (nl == std::string::npos) return false;

        size_t len = nl - pos_;
        if (len > 0 && buffer_[nl - 1] == '\r') --len;
        std::string_view line(buffer_.data() + pos_, len);
        pos_ = nl + 1;

        if (line.find_first_not_of(" \t") == std::string_view::npos) continue;

        out.assign(line.data(), line.size());
        return true;
    }
}

std::size_t LineFramer::pending_bytes() const noexcept {
    return buffer_.size() - pos_;
}

std::string LineFramer::frame(std::string_view message) {
    std::string framed;
    framed.reserve(message.size() + 1);
    framed.append(message.data(), message.size());
    framed += '\n';
    return framed;
}

} // namespace mcpconn
