// Length-prefixed framing helpers for stream sockets.
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace Engine::Net {

// Frames larger than this are treated as a corrupt stream.
constexpr uint32_t kMaxFrameBytes = 4u * 1024u * 1024u;
constexpr std::size_t kFrameHeaderBytes = 4;

class NetWriter {
public:
    void writeU32(uint32_t v) {
        // Network byte order.
        for (int i = 3; i >= 0; --i) {
            data_.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
        }
    }
    void writeBytes(std::string_view s) { data_.insert(data_.end(), s.begin(), s.end()); }
    void writeBytes(const uint8_t* data, std::size_t len) { data_.insert(data_.end(), data, data + len); }

    const std::vector<uint8_t>& buffer() const { return data_; }
    std::vector<uint8_t>& buffer() { return data_; }

private:
    std::vector<uint8_t> data_;
};

inline std::vector<uint8_t> encodeFrame(std::string_view body) {
    NetWriter writer;
    writer.writeU32(static_cast<uint32_t>(body.size()));
    writer.writeBytes(body);
    return std::move(writer.buffer());
}

// Accumulates stream bytes and yields complete frames in order.
class FrameReader {
public:
    void append(const uint8_t* data, std::size_t len) { data_.insert(data_.end(), data, data + len); }

    // Returns false once the stream is corrupt; `ready` is set when out holds a frame.
    bool next(std::vector<uint8_t>& out, bool& ready) {
        ready = false;
        if (data_.size() - offset_ < kFrameHeaderBytes) {
            compact();
            return true;
        }
        uint32_t len = 0;
        for (std::size_t i = 0; i < kFrameHeaderBytes; ++i) {
            len = (len << 8) | data_[offset_ + i];
        }
        if (len > kMaxFrameBytes) {
            return false;
        }
        if (data_.size() - offset_ - kFrameHeaderBytes < len) {
            compact();
            return true;
        }
        const auto begin = data_.begin() + static_cast<std::ptrdiff_t>(offset_ + kFrameHeaderBytes);
        out.assign(begin, begin + len);
        offset_ += kFrameHeaderBytes + len;
        ready = true;
        return true;
    }

    std::size_t buffered() const { return data_.size() - offset_; }

private:
    void compact() {
        if (offset_ > 0) {
            data_.erase(data_.begin(), data_.begin() + static_cast<std::ptrdiff_t>(offset_));
            offset_ = 0;
        }
    }

    std::vector<uint8_t> data_;
    std::size_t offset_{0};
};

}  // namespace Engine::Net
