#pragma once

/// @file binary_codec.hpp
/// @brief Length-prefixed binary encoder/decoder backend.
///
/// Wire layout (all integers little-endian):
/// | Item          | Encoding                                  |
/// |---------------|-------------------------------------------|
/// | bool          | 1 byte, 0 or 1                            |
/// | signed int    | 8 bytes, two's complement                 |
/// | unsigned int  | 8 bytes                                   |
/// | double        | 8 bytes, IEEE-754 bit pattern             |
/// | string        | uint32 byte length, then the bytes        |
/// | sequence      | uint32 element count, then the elements   |
/// | map           | uint32 pair count, then key, value, ...   |
///
/// The format is not self-describing: the reader must know the type it
/// expects, exactly as the writer did.

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "csb/codec/frame_tracker.hpp"
#include "csb/foundation/codec_options.hpp"
#include "csb/foundation/codec_result.hpp"

namespace csb::codec {

/// Magic bytes identifying a CSB binary document.
inline constexpr uint8_t kBinaryMagic[4] = {'C', 'S', 'B', 'F'};

/// Version written after the magic bytes.
inline constexpr uint32_t kBinaryFormatVersion = 1;

// ── BinaryEncoder ───────────────────────────────────────────────────────────

/// Encoder writing the length of every frame before its payload.
class BinaryEncoder {
public:
    using Error = foundation::CodecError;

    explicit BinaryEncoder(foundation::CodecOptions options = {});

    BinaryEncoder(const BinaryEncoder&) = delete;
    BinaryEncoder& operator=(const BinaryEncoder&) = delete;

    template <typename F>
    foundation::CodecResult<void> emitSeq(std::size_t length, F&& body) {
        return emitFrame(FrameKind::Sequence, length, body);
    }

    template <typename F>
    foundation::CodecResult<void> emitSeqElt(std::size_t index, F&& f) {
        auto r = tracker_.element(index);
        if (!r) {
            return r;
        }
        return f(*this);
    }

    template <typename F>
    foundation::CodecResult<void> emitMap(std::size_t length, F&& body) {
        return emitFrame(FrameKind::Map, length, body);
    }

    template <typename F>
    foundation::CodecResult<void> emitMapEltKey(std::size_t index, F&& f) {
        auto r = tracker_.key(index);
        if (!r) {
            return r;
        }
        return f(*this);
    }

    template <typename F>
    foundation::CodecResult<void> emitMapEltVal(std::size_t index, F&& f) {
        auto r = tracker_.value(index);
        if (!r) {
            return r;
        }
        return f(*this);
    }

    foundation::CodecResult<void> emitBool(bool value);
    foundation::CodecResult<void> emitInt(int64_t value);
    foundation::CodecResult<void> emitUint(uint64_t value);
    foundation::CodecResult<void> emitDouble(double value);
    foundation::CodecResult<void> emitString(std::string_view value);

    /// Append the magic bytes and format version.
    void writeHeader();

    /// Bytes written so far.
    [[nodiscard]] const std::vector<uint8_t>& bytes() const noexcept { return buf_; }

    /// Move the written bytes out, leaving the encoder empty.
    [[nodiscard]] std::vector<uint8_t> takeBytes() noexcept { return std::move(buf_); }

private:
    template <typename F>
    foundation::CodecResult<void> emitFrame(FrameKind kind, std::size_t length, F& body) {
        auto r = tracker_.checkDepth();
        if (!r) {
            return r;
        }
        r = writeLength(length);
        if (!r) {
            return r;
        }
        auto scope = tracker_.open(kind, length);
        r = body(*this);
        if (!r) {
            return r;
        }
        return tracker_.close();
    }

    foundation::CodecResult<void> writeLength(std::size_t length);

    std::vector<uint8_t> buf_;
    FrameTracker tracker_;
};

// ── BinaryDecoder ───────────────────────────────────────────────────────────

/// Decoder reading the length prefix of every frame before its payload.
///
/// A frame length is rejected when it exceeds max_frame_length or when the
/// remaining input cannot hold that many entries.
class BinaryDecoder {
public:
    using Error = foundation::CodecError;

    explicit BinaryDecoder(std::span<const uint8_t> data,
                           foundation::CodecOptions options = {});

    BinaryDecoder(const BinaryDecoder&) = delete;
    BinaryDecoder& operator=(const BinaryDecoder&) = delete;

    template <typename F>
    auto readSeq(F&& body) -> std::invoke_result_t<F&, BinaryDecoder&, std::size_t> {
        return readFrame(FrameKind::Sequence, body);
    }

    template <typename F>
    auto readSeqElt(std::size_t index, F&& f) -> std::invoke_result_t<F&, BinaryDecoder&> {
        using R = std::invoke_result_t<F&, BinaryDecoder&>;
        auto r = tracker_.element(index);
        if (!r) {
            return R::err(std::move(r).error());
        }
        return f(*this);
    }

    template <typename F>
    auto readMap(F&& body) -> std::invoke_result_t<F&, BinaryDecoder&, std::size_t> {
        return readFrame(FrameKind::Map, body);
    }

    template <typename F>
    auto readMapEltKey(std::size_t index, F&& f) -> std::invoke_result_t<F&, BinaryDecoder&> {
        using R = std::invoke_result_t<F&, BinaryDecoder&>;
        auto r = tracker_.key(index);
        if (!r) {
            return R::err(std::move(r).error());
        }
        return f(*this);
    }

    template <typename F>
    auto readMapEltVal(std::size_t index, F&& f) -> std::invoke_result_t<F&, BinaryDecoder&> {
        using R = std::invoke_result_t<F&, BinaryDecoder&>;
        auto r = tracker_.value(index);
        if (!r) {
            return R::err(std::move(r).error());
        }
        return f(*this);
    }

    foundation::CodecResult<bool> readBool();
    foundation::CodecResult<int64_t> readInt();
    foundation::CodecResult<uint64_t> readUint();
    foundation::CodecResult<double> readDouble();
    foundation::CodecResult<std::string> readString();

    /// Error for a decoded value that does not fit its target type.
    [[nodiscard]] Error outOfRange(std::string message) const;

    /// Largest SparseMap key this decoder accepts.
    [[nodiscard]] std::size_t maxSparseKey() const noexcept {
        return tracker_.options().maxSparseKey;
    }

    /// Consume and verify the magic bytes and format version.
    foundation::CodecResult<void> readHeader();

    /// Fail with TrailingData unless all input was consumed.
    [[nodiscard]] foundation::CodecResult<void> finish() const;

    /// Bytes not yet consumed.
    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }

private:
    template <typename F>
    auto readFrame(FrameKind kind, F& body)
        -> std::invoke_result_t<F&, BinaryDecoder&, std::size_t> {
        using R = std::invoke_result_t<F&, BinaryDecoder&, std::size_t>;
        auto d = tracker_.checkDepth();
        if (!d) {
            return R::err(std::move(d).error());
        }
        auto length = readLength(kind);
        if (!length) {
            return R::err(std::move(length).error());
        }
        auto scope = tracker_.open(kind, length.value());
        auto result = body(*this, length.value());
        if (!result) {
            return result;
        }
        auto c = tracker_.close();
        if (!c) {
            return R::err(std::move(c).error());
        }
        return result;
    }

    [[nodiscard]] bool canRead(std::size_t n) const noexcept { return n <= remaining(); }

    foundation::CodecResult<uint64_t> readFixed(std::size_t width, std::string_view what);
    foundation::CodecResult<std::size_t> readLength(FrameKind kind);

    std::span<const uint8_t> data_;
    std::size_t pos_ = 0;
    FrameTracker tracker_;
};

}  // namespace csb::codec
