#pragma once

#include <vector>
#include <deque>
#include <cstdint>
#include <cstring>
#include <string>
#include <stdexcept>
#include <type_traits>

namespace rl_replay {
namespace memory {

// Flat byte encoding for buffer snapshots. Values are stored in host byte
// order; snapshots are meant to be read back on the machine that wrote them.
//
// encode()/decode() are free functions so that aggregate types (transitions,
// episodes) can add overloads in their own namespace and be found through ADL.
class ByteWriter {
private:
    std::vector<uint8_t> buffer_;

public:
    void write_bytes(const void* data, size_t count) {
        const uint8_t* ptr = static_cast<const uint8_t*>(data);
        buffer_.insert(buffer_.end(), ptr, ptr + count);
    }

    void write_tag(const char (&tag)[5]) { write_bytes(tag, 4); }

    size_t size() const { return buffer_.size(); }
    std::vector<uint8_t> release() { return std::move(buffer_); }
};

class ByteReader {
private:
    const std::vector<uint8_t>& data_;
    size_t offset_ = 0;

public:
    explicit ByteReader(const std::vector<uint8_t>& data) : data_(data) {}

    void ensure(size_t count) const {
        if (count > data_.size() - offset_) {
            throw std::runtime_error("Truncated snapshot: needed " + std::to_string(count) +
                                     " bytes at offset " + std::to_string(offset_));
        }
    }

    void read_bytes(void* out, size_t count) {
        ensure(count);
        std::memcpy(out, data_.data() + offset_, count);
        offset_ += count;
    }

    void expect_tag(const char (&tag)[5]) {
        ensure(4);
        if (std::memcmp(data_.data() + offset_, tag, 4) != 0) {
            throw std::runtime_error(std::string("Snapshot tag mismatch, expected ") + tag);
        }
        offset_ += 4;
    }

    bool at_end() const { return offset_ == data_.size(); }
    size_t offset() const { return offset_; }
};

// Containers nest (vector<vector<double>> states), so declare them up front
template<typename T> void encode(ByteWriter& writer, const std::vector<T>& values);
template<typename T> void encode(ByteWriter& writer, const std::deque<T>& values);
template<typename T> void decode(ByteReader& reader, std::vector<T>& out);
template<typename T> void decode(ByteReader& reader, std::deque<T>& out);

template<typename T>
std::enable_if_t<std::is_arithmetic<T>::value || std::is_enum<T>::value>
encode(ByteWriter& writer, const T& value) {
    writer.write_bytes(&value, sizeof(T));
}

template<typename T>
std::enable_if_t<std::is_arithmetic<T>::value || std::is_enum<T>::value>
decode(ByteReader& reader, T& out) {
    reader.read_bytes(&out, sizeof(T));
}

inline void encode(ByteWriter& writer, bool value) {
    const uint8_t byte = value ? 1 : 0;
    writer.write_bytes(&byte, 1);
}

inline void decode(ByteReader& reader, bool& out) {
    uint8_t byte = 0;
    reader.read_bytes(&byte, 1);
    if (byte > 1) {
        throw std::runtime_error("Corrupted snapshot: invalid boolean");
    }
    out = byte != 0;
}

template<typename T>
void encode(ByteWriter& writer, const std::vector<T>& values) {
    encode(writer, static_cast<uint64_t>(values.size()));
    for (const auto& value : values) {
        encode(writer, static_cast<const T&>(value));
    }
}

template<typename T>
void encode(ByteWriter& writer, const std::deque<T>& values) {
    encode(writer, static_cast<uint64_t>(values.size()));
    for (const auto& value : values) {
        encode(writer, value);
    }
}

template<typename Container>
void decode_elements(ByteReader& reader, Container& out) {
    uint64_t count = 0;
    decode(reader, count);
    // Every element takes at least one byte, so a bogus count fails here
    reader.ensure(static_cast<size_t>(count));
    out.clear();
    for (uint64_t i = 0; i < count; ++i) {
        typename Container::value_type value{};
        decode(reader, value);
        out.push_back(std::move(value));
    }
}

template<typename T>
void decode(ByteReader& reader, std::vector<T>& out) {
    decode_elements(reader, out);
}

template<typename T>
void decode(ByteReader& reader, std::deque<T>& out) {
    decode_elements(reader, out);
}

} // namespace memory
} // namespace rl_replay
