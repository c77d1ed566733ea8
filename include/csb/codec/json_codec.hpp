#pragma once

/// @file json_codec.hpp
/// @brief JSON encoder/decoder backend.
///
/// Sequences map to JSON arrays and maps to JSON objects. Object member
/// names are always strings, so scalar map keys are written in quoted text
/// form ({"1":"a"}) and parsed back from that text on decode. Map keys that
/// are themselves containers are rejected with UnsupportedMapKey.
///
/// Unlike the binary format, JSON does not carry frame lengths; the decoder
/// counts the entries of a frame before handing its length to the adapter.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "csb/codec/frame_tracker.hpp"
#include "csb/foundation/codec_options.hpp"
#include "csb/foundation/codec_result.hpp"

namespace csb::codec {

// ── JsonEncoder ─────────────────────────────────────────────────────────────

class JsonEncoder {
public:
    using Error = foundation::CodecError;

    explicit JsonEncoder(foundation::CodecOptions options = {});

    JsonEncoder(const JsonEncoder&) = delete;
    JsonEncoder& operator=(const JsonEncoder&) = delete;

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
        if (index > 0) {
            out_ += ',';
        }
        return f(*this);
    }

    template <typename F>
    foundation::CodecResult<void> emitMap(std::size_t length, F&& body) {
        return emitFrame(FrameKind::Map, length, body);
    }

    /// Emit the member name of pair @p index. @p f must emit exactly one scalar.
    template <typename F>
    foundation::CodecResult<void> emitMapEltKey(std::size_t index, F&& f) {
        auto r = tracker_.key(index);
        if (!r) {
            return r;
        }
        if (index > 0) {
            out_ += ',';
        }
        inKey_ = true;
        keyScalars_ = 0;
        r = f(*this);
        inKey_ = false;
        if (!r) {
            return r;
        }
        if (keyScalars_ != 1) {
            return foundation::CodecResult<void>::err(
                tracker_.fail(foundation::ErrorCode::UnsupportedMapKey,
                              "map key must be a single scalar"));
        }
        out_ += ':';
        return foundation::CodecResult<void>::ok();
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

    /// Text written so far.
    [[nodiscard]] const std::string& str() const noexcept { return out_; }

    /// Move the written text out, leaving the encoder empty.
    [[nodiscard]] std::string takeString() noexcept { return std::move(out_); }

private:
    template <typename F>
    foundation::CodecResult<void> emitFrame(FrameKind kind, std::size_t length, F& body) {
        if (inKey_) {
            return foundation::CodecResult<void>::err(
                tracker_.fail(foundation::ErrorCode::UnsupportedMapKey,
                              "container used as map key"));
        }
        auto r = tracker_.checkDepth();
        if (!r) {
            return r;
        }
        out_ += kind == FrameKind::Map ? '{' : '[';
        auto scope = tracker_.open(kind, length);
        r = body(*this);
        if (!r) {
            return r;
        }
        r = tracker_.close();
        if (!r) {
            return r;
        }
        out_ += kind == FrameKind::Map ? '}' : ']';
        return r;
    }

    /// Write an unquoted scalar token, quoting it when in key position.
    foundation::CodecResult<void> writeToken(std::string_view token);

    std::string out_;
    FrameTracker tracker_;
    bool inKey_ = false;
    std::size_t keyScalars_ = 0;
};

// ── JsonDecoder ─────────────────────────────────────────────────────────────

class JsonDecoder {
public:
    using Error = foundation::CodecError;

    explicit JsonDecoder(std::string_view text, foundation::CodecOptions options = {});

    JsonDecoder(const JsonDecoder&) = delete;
    JsonDecoder& operator=(const JsonDecoder&) = delete;

    template <typename F>
    auto readSeq(F&& body) -> std::invoke_result_t<F&, JsonDecoder&, std::size_t> {
        return readFrame(FrameKind::Sequence, body);
    }

    template <typename F>
    auto readSeqElt(std::size_t index, F&& f) -> std::invoke_result_t<F&, JsonDecoder&> {
        using R = std::invoke_result_t<F&, JsonDecoder&>;
        auto r = tracker_.element(index);
        if (r && index > 0) {
            r = expect(',');
        }
        if (!r) {
            return R::err(std::move(r).error());
        }
        return f(*this);
    }

    template <typename F>
    auto readMap(F&& body) -> std::invoke_result_t<F&, JsonDecoder&, std::size_t> {
        return readFrame(FrameKind::Map, body);
    }

    /// Read the member name of pair @p index; scalar reads inside @p f parse
    /// the name text instead of the input stream.
    template <typename F>
    auto readMapEltKey(std::size_t index, F&& f) -> std::invoke_result_t<F&, JsonDecoder&> {
        using R = std::invoke_result_t<F&, JsonDecoder&>;
        auto r = tracker_.key(index);
        if (r && index > 0) {
            r = expect(',');
        }
        if (!r) {
            return R::err(std::move(r).error());
        }
        auto name = parseString();
        if (!name) {
            return R::err(std::move(name).error());
        }
        key_ = std::move(name).value();
        inKey_ = true;
        keyConsumed_ = false;
        auto result = f(*this);
        inKey_ = false;
        if (!result) {
            return result;
        }
        auto colon = expect(':');
        if (!colon) {
            return R::err(std::move(colon).error());
        }
        return result;
    }

    template <typename F>
    auto readMapEltVal(std::size_t index, F&& f) -> std::invoke_result_t<F&, JsonDecoder&> {
        using R = std::invoke_result_t<F&, JsonDecoder&>;
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

    /// Fail with TrailingData unless only whitespace remains.
    [[nodiscard]] foundation::CodecResult<void> finish();

private:
    template <typename F>
    auto readFrame(FrameKind kind, F& body)
        -> std::invoke_result_t<F&, JsonDecoder&, std::size_t> {
        using R = std::invoke_result_t<F&, JsonDecoder&, std::size_t>;
        if (inKey_) {
            return R::err(tracker_.fail(foundation::ErrorCode::InvalidJsonData,
                                        "container used as map key"));
        }
        auto d = tracker_.checkDepth();
        if (d) {
            d = expect(kind == FrameKind::Map ? '{' : '[');
        }
        if (!d) {
            return R::err(std::move(d).error());
        }
        auto length = countEntries(kind);
        if (!length) {
            return R::err(std::move(length).error());
        }
        auto scope = tracker_.open(kind, length.value());
        auto result = body(*this, length.value());
        if (!result) {
            return result;
        }
        auto c = tracker_.close();
        if (c) {
            c = expect(kind == FrameKind::Map ? '}' : ']');
        }
        if (!c) {
            return R::err(std::move(c).error());
        }
        return result;
    }

    void skipWhitespace() noexcept;
    foundation::CodecResult<void> expect(char c);

    /// Count top-level entries of the frame whose opening bracket was just
    /// consumed, without consuming anything.
    foundation::CodecResult<std::size_t> countEntries(FrameKind kind);

    /// Next scalar token: the key text in key position, else an unquoted
    /// literal or number from the input.
    foundation::CodecResult<std::string_view> scalarToken(std::string_view what);

    foundation::CodecResult<std::string> parseString();

    std::string_view data_;
    std::size_t pos_ = 0;
    FrameTracker tracker_;
    std::string key_;
    bool inKey_ = false;
    bool keyConsumed_ = false;
};

}  // namespace csb::codec
