/// @file binary_codec.cpp
/// @brief Scalar and length-prefix handling of the binary backend.

#include "csb/codec/binary_codec.hpp"

#include <bit>
#include <cstring>
#include <limits>

namespace csb::codec {

using foundation::CodecError;
using foundation::CodecOptions;
using foundation::CodecResult;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

void appendLittleEndian(std::vector<uint8_t>& buf, uint64_t value, std::size_t width) {
    for (std::size_t i = 0; i < width; ++i) {
        buf.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

}  // namespace

// ── BinaryEncoder ───────────────────────────────────────────────────────────

BinaryEncoder::BinaryEncoder(CodecOptions options)
    : tracker_("binary", LogCategory::Encode, options) {
    buf_.reserve(128);
}

CodecResult<void> BinaryEncoder::emitBool(bool value) {
    buf_.push_back(value ? 1 : 0);
    return CodecResult<void>::ok();
}

CodecResult<void> BinaryEncoder::emitInt(int64_t value) {
    appendLittleEndian(buf_, static_cast<uint64_t>(value), 8);
    return CodecResult<void>::ok();
}

CodecResult<void> BinaryEncoder::emitUint(uint64_t value) {
    appendLittleEndian(buf_, value, 8);
    return CodecResult<void>::ok();
}

CodecResult<void> BinaryEncoder::emitDouble(double value) {
    appendLittleEndian(buf_, std::bit_cast<uint64_t>(value), 8);
    return CodecResult<void>::ok();
}

CodecResult<void> BinaryEncoder::emitString(std::string_view value) {
    if (value.size() > std::numeric_limits<uint32_t>::max()) {
        return CodecResult<void>::err(
            tracker_.fail(ErrorCode::FrameTooLarge, "string longer than 4 GiB"));
    }
    appendLittleEndian(buf_, value.size(), 4);
    const auto* p = reinterpret_cast<const uint8_t*>(value.data());
    buf_.insert(buf_.end(), p, p + value.size());
    return CodecResult<void>::ok();
}

void BinaryEncoder::writeHeader() {
    buf_.insert(buf_.end(), std::begin(kBinaryMagic), std::end(kBinaryMagic));
    appendLittleEndian(buf_, kBinaryFormatVersion, 4);
}

CodecResult<void> BinaryEncoder::writeLength(std::size_t length) {
    if (length > std::numeric_limits<uint32_t>::max()) {
        return CodecResult<void>::err(
            tracker_.fail(ErrorCode::FrameTooLarge,
                          "frame length " + std::to_string(length) + " exceeds uint32"));
    }
    appendLittleEndian(buf_, length, 4);
    return CodecResult<void>::ok();
}

// ── BinaryDecoder ───────────────────────────────────────────────────────────

BinaryDecoder::BinaryDecoder(std::span<const uint8_t> data, CodecOptions options)
    : data_(data), tracker_("binary", LogCategory::Decode, options) {}

CodecResult<uint64_t> BinaryDecoder::readFixed(std::size_t width, std::string_view what) {
    if (!canRead(width)) {
        return CodecResult<uint64_t>::err(
            tracker_.fail(ErrorCode::UnexpectedEnd,
                          "truncated " + std::string(what) + " at offset " +
                              std::to_string(pos_)));
    }
    uint64_t value = 0;
    for (std::size_t i = 0; i < width; ++i) {
        value |= static_cast<uint64_t>(data_[pos_ + i]) << (8 * i);
    }
    pos_ += width;
    return CodecResult<uint64_t>::ok(value);
}

CodecResult<bool> BinaryDecoder::readBool() {
    auto raw = readFixed(1, "bool");
    if (!raw) {
        return CodecResult<bool>::err(std::move(raw).error());
    }
    if (raw.value() > 1) {
        return CodecResult<bool>::err(
            tracker_.fail(ErrorCode::InvalidBinaryData,
                          "bool byte " + std::to_string(raw.value()) + " is neither 0 nor 1"));
    }
    return CodecResult<bool>::ok(raw.value() == 1);
}

CodecResult<int64_t> BinaryDecoder::readInt() {
    auto raw = readFixed(8, "int");
    if (!raw) {
        return CodecResult<int64_t>::err(std::move(raw).error());
    }
    return CodecResult<int64_t>::ok(static_cast<int64_t>(raw.value()));
}

CodecResult<uint64_t> BinaryDecoder::readUint() {
    return readFixed(8, "uint");
}

CodecResult<double> BinaryDecoder::readDouble() {
    auto raw = readFixed(8, "double");
    if (!raw) {
        return CodecResult<double>::err(std::move(raw).error());
    }
    return CodecResult<double>::ok(std::bit_cast<double>(raw.value()));
}

CodecResult<std::string> BinaryDecoder::readString() {
    auto len = readFixed(4, "string length");
    if (!len) {
        return CodecResult<std::string>::err(std::move(len).error());
    }
    if (!canRead(len.value())) {
        return CodecResult<std::string>::err(
            tracker_.fail(ErrorCode::UnexpectedEnd,
                          "string of " + std::to_string(len.value()) + " bytes, " +
                              std::to_string(remaining()) + " left"));
    }
    std::string value(reinterpret_cast<const char*>(data_.data() + pos_), len.value());
    pos_ += len.value();
    return CodecResult<std::string>::ok(std::move(value));
}

CodecError BinaryDecoder::outOfRange(std::string message) const {
    return tracker_.fail(ErrorCode::ValueOutOfRange, std::move(message));
}

CodecResult<void> BinaryDecoder::readHeader() {
    if (!canRead(sizeof(kBinaryMagic)) ||
        std::memcmp(data_.data() + pos_, kBinaryMagic, sizeof(kBinaryMagic)) != 0) {
        return CodecResult<void>::err(
            tracker_.fail(ErrorCode::InvalidBinaryData, "invalid magic bytes"));
    }
    pos_ += sizeof(kBinaryMagic);
    auto version = readFixed(4, "format version");
    if (!version) {
        return CodecResult<void>::err(std::move(version).error());
    }
    if (version.value() != kBinaryFormatVersion) {
        return CodecResult<void>::err(
            tracker_.fail(ErrorCode::InvalidBinaryData,
                          "unsupported format version " + std::to_string(version.value())));
    }
    return CodecResult<void>::ok();
}

CodecResult<void> BinaryDecoder::finish() const {
    if (remaining() != 0) {
        return CodecResult<void>::err(
            tracker_.fail(ErrorCode::TrailingData,
                          std::to_string(remaining()) + " unread bytes after document"));
    }
    return CodecResult<void>::ok();
}

CodecResult<std::size_t> BinaryDecoder::readLength(FrameKind kind) {
    auto raw = readFixed(4, "frame length");
    if (!raw) {
        return CodecResult<std::size_t>::err(std::move(raw).error());
    }
    auto length = static_cast<std::size_t>(raw.value());
    if (length > tracker_.options().maxFrameLength) {
        return CodecResult<std::size_t>::err(
            tracker_.fail(ErrorCode::LengthLimitExceeded,
                          "frame length " + std::to_string(length) + " exceeds max_frame_length " +
                              std::to_string(tracker_.options().maxFrameLength)));
    }
    // Every element takes at least one byte, every pair at least two.
    const std::size_t minBytes = kind == FrameKind::Map ? 2 : 1;
    if (length > remaining() / minBytes) {
        return CodecResult<std::size_t>::err(
            tracker_.fail(ErrorCode::UnexpectedEnd,
                          "frame length " + std::to_string(length) + " larger than remaining input"));
    }
    return CodecResult<std::size_t>::ok(length);
}

}  // namespace csb::codec
