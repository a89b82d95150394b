#include "pty/replay_buffer.hpp"

#include <algorithm>

namespace turnstile::pty {

ReplayBuffer::ReplayBuffer(const std::size_t capacity)
    : buffer_(std::max<std::size_t>(capacity, 1)) {}

void ReplayBuffer::append(std::string_view bytes) {
    total_written_ += bytes.size();
    const std::size_t cap = buffer_.size();
    if (bytes.size() >= cap) {
        // Only the tail survives.
        bytes.remove_prefix(bytes.size() - cap);
        std::copy(bytes.begin(), bytes.end(), buffer_.begin());
        head_ = 0;
        size_ = cap;
        return;
    }

    std::size_t tail = (head_ + size_) % cap;
    for (const char c : bytes) {
        buffer_[tail] = c;
        tail = (tail + 1) % cap;
        if (size_ == cap) {
            head_ = (head_ + 1) % cap;
        } else {
            ++size_;
        }
    }
}

std::string ReplayBuffer::snapshot() const {
    std::string out;
    out.reserve(size_);
    const std::size_t cap = buffer_.size();
    const std::size_t first = std::min(size_, cap - head_);
    out.append(buffer_.data() + head_, first);
    out.append(buffer_.data(), size_ - first);
    return out;
}

}  // namespace turnstile::pty
