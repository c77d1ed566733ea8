#pragma once

/// @file trace_codec.hpp
/// @brief Test double backends that speak the frame protocol without a wire
///        format.
///
/// TraceEncoder records every protocol call as a token:
///   seq(N) elt(i) map(N) key(i) val(i) end bool:x int:x uint:x double:x str:x
/// TraceDecoder replays such a token list, so an encoder trace can be fed
/// straight back for a round trip, or hand-written to script malformed input.
/// Either side can be told to fail at a given token.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "csb/core/result.hpp"

namespace csb::test {

/// Error type distinct from CodecError, so tests can prove the adapters
/// return the backend's own error unchanged.
struct TraceError {
    std::string what;
    std::size_t token = 0;
};

using TraceResult = csb::Result<void, TraceError>;

// ── TraceEncoder ────────────────────────────────────────────────────────────

class TraceEncoder {
public:
    using Error = TraceError;

    template <typename F>
    TraceResult emitSeq(std::size_t length, F&& body) {
        return frame("seq(" + std::to_string(length) + ")", body);
    }

    template <typename F>
    TraceResult emitSeqElt(std::size_t index, F&& f) {
        return step("elt(" + std::to_string(index) + ")", f);
    }

    template <typename F>
    TraceResult emitMap(std::size_t length, F&& body) {
        return frame("map(" + std::to_string(length) + ")", body);
    }

    template <typename F>
    TraceResult emitMapEltKey(std::size_t index, F&& f) {
        return step("key(" + std::to_string(index) + ")", f);
    }

    template <typename F>
    TraceResult emitMapEltVal(std::size_t index, F&& f) {
        return step("val(" + std::to_string(index) + ")", f);
    }

    TraceResult emitBool(bool v) { return record(std::string("bool:") + (v ? "true" : "false")); }
    TraceResult emitInt(int64_t v) { return record("int:" + std::to_string(v)); }
    TraceResult emitUint(uint64_t v) { return record("uint:" + std::to_string(v)); }
    TraceResult emitDouble(double v) { return record("double:" + std::to_string(v)); }
    TraceResult emitString(std::string_view v) { return record("str:" + std::string(v)); }

    /// Fail when the token with this position is about to be recorded.
    void failAt(std::size_t token) { failAt_ = token; }

    [[nodiscard]] const std::vector<std::string>& tokens() const noexcept { return tokens_; }

private:
    TraceResult record(std::string token) {
        if (failAt_ && *failAt_ == tokens_.size()) {
            return TraceResult::err(TraceError{"injected at " + token, tokens_.size()});
        }
        tokens_.push_back(std::move(token));
        return TraceResult::ok();
    }

    template <typename F>
    TraceResult frame(std::string open, F& body) {
        auto r = record(std::move(open));
        if (!r) {
            return r;
        }
        r = body(*this);
        if (!r) {
            return r;
        }
        return record("end");
    }

    template <typename F>
    TraceResult step(std::string token, F& f) {
        auto r = record(std::move(token));
        if (!r) {
            return r;
        }
        return f(*this);
    }

    std::vector<std::string> tokens_;
    std::optional<std::size_t> failAt_;
};

// ── TraceDecoder ────────────────────────────────────────────────────────────

class TraceDecoder {
public:
    using Error = TraceError;

    explicit TraceDecoder(std::vector<std::string> tokens) : tokens_(std::move(tokens)) {}

    template <typename F>
    auto readSeq(F&& body) -> std::invoke_result_t<F&, TraceDecoder&, std::size_t> {
        return frame("seq(", body);
    }

    template <typename F>
    auto readSeqElt(std::size_t index, F&& f) -> std::invoke_result_t<F&, TraceDecoder&> {
        return step("elt(" + std::to_string(index) + ")", f);
    }

    template <typename F>
    auto readMap(F&& body) -> std::invoke_result_t<F&, TraceDecoder&, std::size_t> {
        return frame("map(", body);
    }

    template <typename F>
    auto readMapEltKey(std::size_t index, F&& f) -> std::invoke_result_t<F&, TraceDecoder&> {
        return step("key(" + std::to_string(index) + ")", f);
    }

    template <typename F>
    auto readMapEltVal(std::size_t index, F&& f) -> std::invoke_result_t<F&, TraceDecoder&> {
        return step("val(" + std::to_string(index) + ")", f);
    }

    csb::Result<bool, TraceError> readBool() {
        using R = csb::Result<bool, TraceError>;
        auto text = scalar("bool:");
        if (!text) {
            return R::err(std::move(text).error());
        }
        return R::ok(text.value() == "true");
    }

    csb::Result<int64_t, TraceError> readInt() {
        using R = csb::Result<int64_t, TraceError>;
        auto text = scalar("int:");
        if (!text) {
            return R::err(std::move(text).error());
        }
        return R::ok(std::stoll(text.value()));
    }

    csb::Result<uint64_t, TraceError> readUint() {
        using R = csb::Result<uint64_t, TraceError>;
        auto text = scalar("uint:");
        if (!text) {
            return R::err(std::move(text).error());
        }
        return R::ok(std::stoull(text.value()));
    }

    csb::Result<double, TraceError> readDouble() {
        using R = csb::Result<double, TraceError>;
        auto text = scalar("double:");
        if (!text) {
            return R::err(std::move(text).error());
        }
        return R::ok(std::stod(text.value()));
    }

    csb::Result<std::string, TraceError> readString() { return scalar("str:"); }

    TraceError outOfRange(std::string message) const {
        return TraceError{"range: " + message, pos_};
    }

    /// Fail when the token at this position is about to be consumed.
    void failAt(std::size_t token) { failAt_ = token; }

    /// Tokens consumed so far.
    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

    /// Number of frame bodies entered.
    [[nodiscard]] std::size_t framesOpened() const noexcept { return framesOpened_; }

private:
    csb::Result<std::string, TraceError> take(std::string_view prefix) {
        using R = csb::Result<std::string, TraceError>;
        if (failAt_ && *failAt_ == pos_) {
            return R::err(TraceError{"injected", pos_});
        }
        if (pos_ >= tokens_.size()) {
            return R::err(TraceError{"expected " + std::string(prefix) + " at end", pos_});
        }
        const auto& token = tokens_[pos_];
        if (token.compare(0, prefix.size(), prefix) != 0) {
            return R::err(TraceError{"expected " + std::string(prefix) + ", got " + token, pos_});
        }
        ++pos_;
        return R::ok(token);
    }

    csb::Result<std::string, TraceError> scalar(std::string_view prefix) {
        using R = csb::Result<std::string, TraceError>;
        auto token = take(prefix);
        if (!token) {
            return token;
        }
        return R::ok(token.value().substr(prefix.size()));
    }

    template <typename F>
    auto frame(std::string_view prefix, F& body)
        -> std::invoke_result_t<F&, TraceDecoder&, std::size_t> {
        using R = std::invoke_result_t<F&, TraceDecoder&, std::size_t>;
        auto open = take(prefix);
        if (!open) {
            return R::err(std::move(open).error());
        }
        auto length = static_cast<std::size_t>(std::stoull(open.value().substr(prefix.size())));
        ++framesOpened_;
        auto result = body(*this, length);
        if (!result) {
            return result;
        }
        auto end = take("end");
        if (!end) {
            return R::err(std::move(end).error());
        }
        return result;
    }

    template <typename F>
    auto step(std::string expected, F& f) -> std::invoke_result_t<F&, TraceDecoder&> {
        using R = std::invoke_result_t<F&, TraceDecoder&>;
        auto token = take(expected);
        if (!token) {
            return R::err(std::move(token).error());
        }
        if (token.value() != expected) {
            return R::err(TraceError{"expected " + expected + ", got " + token.value(), pos_ - 1});
        }
        return f(*this);
    }

    std::vector<std::string> tokens_;
    std::size_t pos_ = 0;
    std::size_t framesOpened_ = 0;
    std::optional<std::size_t> failAt_;
};

}  // namespace csb::test
