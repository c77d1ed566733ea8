/// @file json_codec.cpp
/// @brief Scalar formatting and parsing of the JSON backend.

#include "csb/codec/json_codec.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <system_error>

namespace csb::codec {

using foundation::CodecError;
using foundation::CodecOptions;
using foundation::CodecResult;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

void appendJsonString(std::string& out, std::string_view value) {
    out += '"';
    for (char c : value) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf,
                                  sizeof(buf),
                                  "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    out += '"';
}

void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

bool isWhitespace(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool isTokenChar(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || c == '-' || c == '+' ||
           c == '.' || c == 'E';
}

/// Parse all of @p token as a T; errc::result_out_of_range is reported apart
/// from malformed text.
template <typename T>
std::errc parseWhole(std::string_view token, T& out) {
    const char* first = token.data();
    const char* last = first + token.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec == std::errc() && ptr != last) {
        return std::errc::invalid_argument;
    }
    return ec;
}

}  // namespace

// ── JsonEncoder ─────────────────────────────────────────────────────────────

JsonEncoder::JsonEncoder(CodecOptions options)
    : tracker_("json", LogCategory::Encode, options) {}

CodecResult<void> JsonEncoder::writeToken(std::string_view token) {
    if (inKey_) {
        if (++keyScalars_ > 1) {
            return CodecResult<void>::err(
                tracker_.fail(ErrorCode::UnsupportedMapKey, "map key must be a single scalar"));
        }
        out_ += '"';
        out_ += token;
        out_ += '"';
    } else {
        out_ += token;
    }
    return CodecResult<void>::ok();
}

CodecResult<void> JsonEncoder::emitBool(bool value) {
    return writeToken(value ? "true" : "false");
}

CodecResult<void> JsonEncoder::emitInt(int64_t value) {
    char buf[24];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    return writeToken(std::string_view(buf, static_cast<std::size_t>(ptr - buf)));
}

CodecResult<void> JsonEncoder::emitUint(uint64_t value) {
    char buf[24];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    return writeToken(std::string_view(buf, static_cast<std::size_t>(ptr - buf)));
}

CodecResult<void> JsonEncoder::emitDouble(double value) {
    if (!std::isfinite(value)) {
        return CodecResult<void>::err(
            tracker_.fail(ErrorCode::NonFiniteNumber, "JSON cannot represent NaN or infinity"));
    }
    // Shortest representation that parses back to the same value.
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc()) {
        return CodecResult<void>::err(
            tracker_.fail(ErrorCode::EncodeError, "failed to format double"));
    }
    return writeToken(std::string_view(buf, static_cast<std::size_t>(ptr - buf)));
}

CodecResult<void> JsonEncoder::emitString(std::string_view value) {
    if (inKey_ && ++keyScalars_ > 1) {
        return CodecResult<void>::err(
            tracker_.fail(ErrorCode::UnsupportedMapKey, "map key must be a single scalar"));
    }
    appendJsonString(out_, value);
    return CodecResult<void>::ok();
}

// ── JsonDecoder ─────────────────────────────────────────────────────────────

JsonDecoder::JsonDecoder(std::string_view text, CodecOptions options)
    : data_(text), tracker_("json", LogCategory::Decode, options) {}

void JsonDecoder::skipWhitespace() noexcept {
    while (pos_ < data_.size() && isWhitespace(data_[pos_])) {
        ++pos_;
    }
}

CodecResult<void> JsonDecoder::expect(char c) {
    skipWhitespace();
    if (pos_ >= data_.size()) {
        return CodecResult<void>::err(tracker_.fail(
            ErrorCode::UnexpectedEnd, std::string("expected '") + c + "' at end of input"));
    }
    if (data_[pos_] != c) {
        return CodecResult<void>::err(tracker_.fail(
            ErrorCode::InvalidJsonData,
            std::string("expected '") + c + "' at offset " + std::to_string(pos_) +
                ", found '" + data_[pos_] + "'"));
    }
    ++pos_;
    return CodecResult<void>::ok();
}

CodecResult<std::size_t> JsonDecoder::countEntries(FrameKind kind) {
    const char close = kind == FrameKind::Map ? '}' : ']';
    skipWhitespace();
    if (pos_ < data_.size() && data_[pos_] == close) {
        return CodecResult<std::size_t>::ok(0);
    }

    std::size_t count = 1;
    std::size_t nesting = 0;
    bool inString = false;
    for (std::size_t i = pos_; i < data_.size(); ++i) {
        char c = data_[i];
        if (inString) {
            if (c == '\\') {
                ++i;
            } else if (c == '"') {
                inString = false;
            }
            continue;
        }
        switch (c) {
            case '"':
                inString = true;
                break;
            case '[':
            case '{':
                ++nesting;
                break;
            case ']':
            case '}':
                if (nesting == 0) {
                    if (c != close) {
                        return CodecResult<std::size_t>::err(tracker_.fail(
                            ErrorCode::InvalidJsonData,
                            "mismatched bracket at offset " + std::to_string(i)));
                    }
                    if (count > tracker_.options().maxFrameLength) {
                        return CodecResult<std::size_t>::err(tracker_.fail(
                            ErrorCode::LengthLimitExceeded,
                            "frame of " + std::to_string(count) +
                                " entries exceeds max_frame_length " +
                                std::to_string(tracker_.options().maxFrameLength)));
                    }
                    return CodecResult<std::size_t>::ok(count);
                }
                --nesting;
                break;
            case ',':
                if (nesting == 0) {
                    ++count;
                }
                break;
            default:
                break;
        }
    }
    return CodecResult<std::size_t>::err(
        tracker_.fail(ErrorCode::UnexpectedEnd, "unterminated JSON frame"));
}

CodecResult<std::string> JsonDecoder::parseString() {
    skipWhitespace();
    if (pos_ >= data_.size()) {
        return CodecResult<std::string>::err(
            tracker_.fail(ErrorCode::UnexpectedEnd, "expected string at end of input"));
    }
    if (data_[pos_] != '"') {
        return CodecResult<std::string>::err(tracker_.fail(
            ErrorCode::InvalidJsonData, "expected string at offset " + std::to_string(pos_)));
    }
    ++pos_;

    auto readHex4 = [this](uint32_t& out) {
        if (data_.size() - pos_ < 4) {
            return false;
        }
        auto [ptr, ec] = std::from_chars(data_.data() + pos_, data_.data() + pos_ + 4, out, 16);
        if (ec != std::errc() || ptr != data_.data() + pos_ + 4) {
            return false;
        }
        pos_ += 4;
        return true;
    };

    std::string out;
    while (pos_ < data_.size() && data_[pos_] != '"') {
        char c = data_[pos_++];
        if (c != '\\') {
            out += c;
            continue;
        }
        if (pos_ >= data_.size()) {
            break;
        }
        char esc = data_[pos_++];
        switch (esc) {
            case '"':  out += '"'; break;
            case '\\': out += '\\'; break;
            case '/':  out += '/'; break;
            case 'b':  out += '\b'; break;
            case 'f':  out += '\f'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 't':  out += '\t'; break;
            case 'u': {
                uint32_t cp = 0;
                if (!readHex4(cp)) {
                    return CodecResult<std::string>::err(tracker_.fail(
                        ErrorCode::InvalidJsonData, "malformed \\u escape"));
                }
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    uint32_t low = 0;
                    if (data_.substr(pos_, 2) != "\\u" || (pos_ += 2, !readHex4(low)) ||
                        low < 0xDC00 || low > 0xDFFF) {
                        return CodecResult<std::string>::err(tracker_.fail(
                            ErrorCode::InvalidJsonData, "unpaired surrogate in \\u escape"));
                    }
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                    return CodecResult<std::string>::err(tracker_.fail(
                        ErrorCode::InvalidJsonData, "unpaired surrogate in \\u escape"));
                }
                appendUtf8(out, cp);
                break;
            }
            default:
                return CodecResult<std::string>::err(tracker_.fail(
                    ErrorCode::InvalidJsonData,
                    std::string("invalid escape '\\") + esc + "'"));
        }
    }
    if (pos_ >= data_.size()) {
        return CodecResult<std::string>::err(
            tracker_.fail(ErrorCode::UnexpectedEnd, "unterminated string"));
    }
    ++pos_;  // closing quote
    return CodecResult<std::string>::ok(std::move(out));
}

CodecResult<std::string_view> JsonDecoder::scalarToken(std::string_view what) {
    if (inKey_) {
        if (keyConsumed_) {
            return CodecResult<std::string_view>::err(tracker_.fail(
                ErrorCode::InvalidJsonData, "map key must be a single scalar"));
        }
        keyConsumed_ = true;
        return CodecResult<std::string_view>::ok(std::string_view(key_));
    }
    skipWhitespace();
    std::size_t start = pos_;
    while (pos_ < data_.size() && isTokenChar(data_[pos_])) {
        ++pos_;
    }
    if (pos_ == start) {
        if (start >= data_.size()) {
            return CodecResult<std::string_view>::err(tracker_.fail(
                ErrorCode::UnexpectedEnd, "expected " + std::string(what) + " at end of input"));
        }
        return CodecResult<std::string_view>::err(tracker_.fail(
            ErrorCode::InvalidJsonData,
            "expected " + std::string(what) + " at offset " + std::to_string(start)));
    }
    return CodecResult<std::string_view>::ok(data_.substr(start, pos_ - start));
}

CodecResult<bool> JsonDecoder::readBool() {
    auto token = scalarToken("bool");
    if (!token) {
        return CodecResult<bool>::err(std::move(token).error());
    }
    if (token.value() == "true") {
        return CodecResult<bool>::ok(true);
    }
    if (token.value() == "false") {
        return CodecResult<bool>::ok(false);
    }
    return CodecResult<bool>::err(tracker_.fail(
        ErrorCode::InvalidJsonData, "'" + std::string(token.value()) + "' is not a bool"));
}

CodecResult<int64_t> JsonDecoder::readInt() {
    auto token = scalarToken("integer");
    if (!token) {
        return CodecResult<int64_t>::err(std::move(token).error());
    }
    int64_t value = 0;
    auto ec = parseWhole(token.value(), value);
    if (ec == std::errc::result_out_of_range) {
        return CodecResult<int64_t>::err(
            outOfRange("integer " + std::string(token.value()) + " exceeds 64 bits"));
    }
    if (ec != std::errc()) {
        return CodecResult<int64_t>::err(tracker_.fail(
            ErrorCode::InvalidJsonData, "'" + std::string(token.value()) + "' is not an integer"));
    }
    return CodecResult<int64_t>::ok(value);
}

CodecResult<uint64_t> JsonDecoder::readUint() {
    auto token = scalarToken("unsigned integer");
    if (!token) {
        return CodecResult<uint64_t>::err(std::move(token).error());
    }
    auto text = token.value();
    if (!text.empty() && text.front() == '-') {
        int64_t negative = 0;
        auto signedEc = parseWhole(text, negative);
        if (signedEc == std::errc() && negative == 0) {
            return CodecResult<uint64_t>::ok(0);  // "-0"
        }
        if (signedEc == std::errc() || signedEc == std::errc::result_out_of_range) {
            return CodecResult<uint64_t>::err(
                outOfRange("negative value " + std::string(text) + " for unsigned integer"));
        }
    }
    uint64_t value = 0;
    auto ec = parseWhole(text, value);
    if (ec == std::errc::result_out_of_range) {
        return CodecResult<uint64_t>::err(
            outOfRange("integer " + std::string(text) + " exceeds 64 bits"));
    }
    if (ec != std::errc()) {
        return CodecResult<uint64_t>::err(tracker_.fail(
            ErrorCode::InvalidJsonData, "'" + std::string(text) + "' is not an unsigned integer"));
    }
    return CodecResult<uint64_t>::ok(value);
}

CodecResult<double> JsonDecoder::readDouble() {
    auto token = scalarToken("number");
    if (!token) {
        return CodecResult<double>::err(std::move(token).error());
    }
    double value = 0.0;
    auto ec = parseWhole(token.value(), value);
    if (ec == std::errc::result_out_of_range) {
        return CodecResult<double>::err(
            outOfRange("number " + std::string(token.value()) + " is not representable"));
    }
    if (ec != std::errc() || !std::isfinite(value)) {
        return CodecResult<double>::err(tracker_.fail(
            ErrorCode::InvalidJsonData, "'" + std::string(token.value()) + "' is not a number"));
    }
    return CodecResult<double>::ok(value);
}

CodecResult<std::string> JsonDecoder::readString() {
    if (inKey_) {
        if (keyConsumed_) {
            return CodecResult<std::string>::err(tracker_.fail(
                ErrorCode::InvalidJsonData, "map key must be a single scalar"));
        }
        keyConsumed_ = true;
        return CodecResult<std::string>::ok(key_);
    }
    return parseString();
}

CodecError JsonDecoder::outOfRange(std::string message) const {
    return tracker_.fail(ErrorCode::ValueOutOfRange, std::move(message));
}

CodecResult<void> JsonDecoder::finish() {
    skipWhitespace();
    if (pos_ != data_.size()) {
        return CodecResult<void>::err(tracker_.fail(
            ErrorCode::TrailingData,
            std::to_string(data_.size() - pos_) + " unread characters after document"));
    }
    return CodecResult<void>::ok();
}

}  // namespace csb::codec
