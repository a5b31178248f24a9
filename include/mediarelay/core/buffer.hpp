// MediaRelay - WebRTC SFU Signaling Server
// Byte buffer and big-endian reader/writer used by the wire codecs

#ifndef MEDIARELAY_CORE_BUFFER_HPP
#define MEDIARELAY_CORE_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace mediarelay {
namespace core {

/**
 * @brief Growable byte buffer.
 *
 * Thin wrapper over std::vector<uint8_t> shared by the network PAL and the
 * WebSocket/HTTP codecs.
 */
class Buffer {
public:
    Buffer() = default;

    explicit Buffer(size_t size) : data_(size, 0) {}

    Buffer(const uint8_t* data, size_t size)
        : data_(data, data + size) {}

    explicit Buffer(const std::string& text)
        : data_(text.begin(), text.end()) {}

    explicit Buffer(std::vector<uint8_t> vec)
        : data_(std::move(vec)) {}

    Buffer(const Buffer&) = default;
    Buffer& operator=(const Buffer&) = default;
    Buffer(Buffer&&) noexcept = default;
    Buffer& operator=(Buffer&&) noexcept = default;

    [[nodiscard]] size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    [[nodiscard]] uint8_t* data() noexcept { return data_.data(); }
    [[nodiscard]] const uint8_t* data() const noexcept { return data_.data(); }

    uint8_t& operator[](size_t index) { return data_[index]; }
    const uint8_t& operator[](size_t index) const { return data_[index]; }

    void append(const uint8_t* data, size_t size) {
        data_.insert(data_.end(), data, data + size);
    }

    void append(const Buffer& other) {
        data_.insert(data_.end(), other.data_.begin(), other.data_.end());
    }

    void append(const std::string& text) {
        data_.insert(data_.end(), text.begin(), text.end());
    }

    /**
     * @brief Drop the first count bytes.
     */
    void consume(size_t count) {
        if (count >= data_.size()) {
            data_.clear();
            return;
        }
        data_.erase(data_.begin(), data_.begin() + static_cast<std::ptrdiff_t>(count));
    }

    void clear() noexcept { data_.clear(); }
    void reserve(size_t capacity) { data_.reserve(capacity); }
    void resize(size_t size) { data_.resize(size); }

    [[nodiscard]] std::string toString() const {
        return std::string(data_.begin(), data_.end());
    }

    [[nodiscard]] const std::vector<uint8_t>& vector() const noexcept { return data_; }

    auto begin() noexcept { return data_.begin(); }
    auto end() noexcept { return data_.end(); }
    auto begin() const noexcept { return data_.begin(); }
    auto end() const noexcept { return data_.end(); }

private:
    std::vector<uint8_t> data_;
};

/**
 * @brief Sequential big-endian reader over a byte range.
 *
 * Reads past the end throw std::out_of_range; callers check remaining()
 * first when a short read is an expected condition (partial frames).
 */
class BufferReader {
public:
    explicit BufferReader(const Buffer& buffer)
        : data_(buffer.data()), size_(buffer.size()) {}

    BufferReader(const uint8_t* data, size_t size)
        : data_(data), size_(size) {}

    uint8_t readUint8() {
        checkRemaining(1);
        return data_[position_++];
    }

    uint16_t readUint16BE() {
        checkRemaining(2);
        uint16_t value = static_cast<uint16_t>(
            (static_cast<uint32_t>(data_[position_]) << 8) |
            static_cast<uint32_t>(data_[position_ + 1]));
        position_ += 2;
        return value;
    }

    uint64_t readUint64BE() {
        checkRemaining(8);
        uint64_t value = 0;
        for (size_t i = 0; i < 8; ++i) {
            value = (value << 8) | data_[position_ + i];
        }
        position_ += 8;
        return value;
    }

    std::vector<uint8_t> readBytes(size_t count) {
        checkRemaining(count);
        std::vector<uint8_t> result(data_ + position_, data_ + position_ + count);
        position_ += count;
        return result;
    }

    [[nodiscard]] size_t remaining() const noexcept { return size_ - position_; }
    [[nodiscard]] size_t position() const noexcept { return position_; }

private:
    void checkRemaining(size_t count) const {
        if (position_ + count > size_) {
            throw std::out_of_range("BufferReader: read past end of buffer");
        }
    }

    const uint8_t* data_;
    size_t size_;
    size_t position_ = 0;
};

/**
 * @brief Big-endian writer appending to a Buffer.
 */
class BufferWriter {
public:
    explicit BufferWriter(Buffer& target) : target_(target) {}

    void writeUint8(uint8_t value) {
        target_.append(&value, 1);
    }

    void writeUint16BE(uint16_t value) {
        uint8_t bytes[2] = {
            static_cast<uint8_t>(value >> 8),
            static_cast<uint8_t>(value & 0xFF)
        };
        target_.append(bytes, 2);
    }

    void writeUint64BE(uint64_t value) {
        uint8_t bytes[8];
        for (int i = 7; i >= 0; --i) {
            bytes[i] = static_cast<uint8_t>(value & 0xFF);
            value >>= 8;
        }
        target_.append(bytes, 8);
    }

    void writeBytes(const uint8_t* data, size_t size) {
        target_.append(data, size);
    }

private:
    Buffer& target_;
};

} // namespace core
} // namespace mediarelay

#endif // MEDIARELAY_CORE_BUFFER_HPP
