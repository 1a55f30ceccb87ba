#include "lumen/codec/byte_codec.hpp"

#include <bit>

namespace lumen::codec {

void Encoder::write_f32(float v) { write_le(std::bit_cast<uint32_t>(v)); }

void Encoder::write_f64(double v) { write_le(std::bit_cast<uint64_t>(v)); }

void Encoder::write_str(std::string_view s) {
    if (s.find('\0') != std::string_view::npos) {
        throw EncodeError("string contains an embedded NUL byte");
    }
    bytes_.insert(bytes_.end(), s.begin(), s.end());
    write_u8(0);
}

void Encoder::write_fixed_str(std::string_view s, size_t width) {
    if (s.size() > width) {
        throw EncodeError("string of " + std::to_string(s.size()) +
                          " bytes exceeds field width " + std::to_string(width));
    }
    if (s.find('\0') != std::string_view::npos) {
        throw EncodeError("string contains an embedded NUL byte");
    }
    bytes_.insert(bytes_.end(), s.begin(), s.end());
    write_zeros(width - s.size());
}

void Encoder::write_bytes(std::span<const uint8_t> data) {
    bytes_.insert(bytes_.end(), data.begin(), data.end());
}

void Encoder::write_zeros(size_t count) { bytes_.insert(bytes_.end(), count, 0); }

uint8_t Decoder::read_u8() {
    require(1);
    return data_[pos_++];
}

float Decoder::read_f32() { return std::bit_cast<float>(read_le<uint32_t>()); }

double Decoder::read_f64() { return std::bit_cast<double>(read_le<uint64_t>()); }

std::string Decoder::read_str(size_t max_len) {
    std::string s;
    while (s.size() < max_len) {
        if (at_end()) {
            throw DecodeError("string terminator missing before end of input");
        }
        const uint8_t b = data_[pos_++];
        if (b == 0) {
            break;
        }
        s.push_back(static_cast<char>(b));
    }
    return s;
}

std::string Decoder::read_fixed_str(size_t width) {
    require(width);
    const auto *begin = data_.data() + pos_;
    size_t len = 0;
    while (len < width && begin[len] != 0) {
        ++len;
    }
    pos_ += width;
    return std::string(begin, begin + len);
}

void Decoder::skip(size_t count) {
    require(count);
    pos_ += count;
}

void Decoder::require(size_t count) const {
    if (count > data_.size() - pos_) {
        throw DecodeError("need " + std::to_string(count) + " bytes at offset " +
                          std::to_string(pos_) + ", " + std::to_string(data_.size() - pos_) +
                          " available");
    }
}

} // namespace lumen::codec
