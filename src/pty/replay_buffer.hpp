#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace turnstile::pty {

// Fixed-capacity byte ring holding the most recent output of a terminal.
// Not synchronized; the owning session's lock covers it.
class ReplayBuffer {
public:
    explicit ReplayBuffer(std::size_t capacity);

    void append(std::string_view bytes);
    // Current contents, oldest byte first.
    std::string snapshot() const;

    std::size_t size() const { return size_; }
    std::size_t capacity() const { return buffer_.size(); }
    std::uint64_t total_written() const { return total_written_; }

private:
    std::vector<char> buffer_;
    std::size_t head_ = 0;  // index of the oldest byte
    std::size_t size_ = 0;
    std::uint64_t total_written_ = 0;
};

}  // namespace turnstile::pty
