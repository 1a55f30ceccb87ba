#pragma once

#include "lumen/error.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lumen::codec {

/// Little-endian byte stream writer.
/// Fields are appended back-to-back; structures add no framing of their own.
class Encoder {
  public:
    Encoder() = default;
    explicit Encoder(size_t reserve) { bytes_.reserve(reserve); }

    void write_u8(uint8_t v) { bytes_.push_back(v); }
    void write_u16(uint16_t v) { write_le(v); }
    void write_u32(uint32_t v) { write_le(v); }
    void write_u64(uint64_t v) { write_le(v); }

    void write_i8(int8_t v) { write_u8(static_cast<uint8_t>(v)); }
    void write_i16(int16_t v) { write_le(static_cast<uint16_t>(v)); }
    void write_i32(int32_t v) { write_le(static_cast<uint32_t>(v)); }
    void write_i64(int64_t v) { write_le(static_cast<uint64_t>(v)); }

    void write_f32(float v);
    void write_f64(double v);

    void write_bool(bool v) { write_u8(v ? 1 : 0); }

    /// UTF-8 bytes followed by a single 0x00 terminator.
    /// Throws EncodeError if the string contains a NUL byte.
    void write_str(std::string_view s);

    /// Fixed-width string field: the bytes of s, zero-padded to exactly width.
    /// A string of exactly width bytes is written without a terminator.
    /// Throws EncodeError if s is longer than width or contains a NUL byte.
    void write_fixed_str(std::string_view s, size_t width);

    /// Raw bytes, no length prefix.
    void write_bytes(std::span<const uint8_t> data);

    /// Reserved field.
    void write_zeros(size_t count);

    [[nodiscard]] const std::vector<uint8_t> &bytes() const { return bytes_; }
    [[nodiscard]] size_t size() const { return bytes_.size(); }

    std::vector<uint8_t> take() { return std::move(bytes_); }

  private:
    template <typename U> void write_le(U v) {
        for (size_t i = 0; i < sizeof(U); ++i) {
            bytes_.push_back(static_cast<uint8_t>(v >> (8 * i)));
        }
    }

    std::vector<uint8_t> bytes_;
};

/// Little-endian byte stream reader over a borrowed buffer.
/// Every read past the end of the input throws DecodeError.
class Decoder {
  public:
    explicit Decoder(std::span<const uint8_t> data) : data_(data) {}

    uint8_t read_u8();
    uint16_t read_u16() { return read_le<uint16_t>(); }
    uint32_t read_u32() { return read_le<uint32_t>(); }
    uint64_t read_u64() { return read_le<uint64_t>(); }

    int8_t read_i8() { return static_cast<int8_t>(read_u8()); }
    int16_t read_i16() { return static_cast<int16_t>(read_le<uint16_t>()); }
    int32_t read_i32() { return static_cast<int32_t>(read_le<uint32_t>()); }
    int64_t read_i64() { return static_cast<int64_t>(read_le<uint64_t>()); }

    float read_f32();
    double read_f64();

    bool read_bool() { return read_u8() != 0; }

    /// Reads until a 0x00 terminator (consumed) or until max_len bytes were read.
    /// Throws DecodeError if the input ends first.
    std::string read_str(size_t max_len);

    /// Consumes exactly width bytes and returns those before the first 0x00.
    std::string read_fixed_str(size_t width);

    template <size_t N> std::array<uint8_t, N> read_array() {
        require(N);
        std::array<uint8_t, N> out{};
        for (size_t i = 0; i < N; ++i) {
            out[i] = data_[pos_ + i];
        }
        pos_ += N;
        return out;
    }

    void skip(size_t count);

    [[nodiscard]] size_t position() const { return pos_; }
    [[nodiscard]] size_t remaining() const { return data_.size() - pos_; }
    [[nodiscard]] bool at_end() const { return pos_ == data_.size(); }

  private:
    void require(size_t count) const;

    template <typename U> U read_le() {
        require(sizeof(U));
        U v = 0;
        for (size_t i = 0; i < sizeof(U); ++i) {
            v |= static_cast<U>(static_cast<U>(data_[pos_ + i]) << (8 * i));
        }
        pos_ += sizeof(U);
        return v;
    }

    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

/// Serialize any type exposing `void encode(Encoder &) const`.
template <typename T> std::vector<uint8_t> encode(const T &value) {
    Encoder enc;
    value.encode(enc);
    return enc.take();
}

/// Deserialize any type exposing `static T decode(Decoder &)`.
template <typename T> T decode(std::span<const uint8_t> bytes) {
    Decoder dec(bytes);
    return T::decode(dec);
}

} // namespace lumen::codec
