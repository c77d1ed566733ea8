#pragma once

/// @file scalars.hpp
/// @brief Encodable/Decodable building blocks for primitive element types.
///
/// Integers travel as 64-bit signed or unsigned values and floating point
/// values as double; narrowing on decode is range-checked by the backend
/// through its outOfRange hook so the error keeps the backend's own type.
/// The same holds for a finite double that overflows float.

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>

#include "csb/codec/protocol.hpp"

namespace csb::codec {

template <>
struct Encodable<bool> {
    static constexpr bool is_encodable = true;

    template <typename Encoder>
    static EncodeResult<Encoder> encode(bool value, Encoder& encoder) {
        return encoder.emitBool(value);
    }
};

template <>
struct Decodable<bool> {
    static constexpr bool is_decodable = true;

    template <typename Decoder>
    static DecodeResult<bool, Decoder> decode(Decoder& decoder) {
        return decoder.readBool();
    }
};

/// Signed and unsigned integers other than bool.
template <typename T>
struct Encodable<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static constexpr bool is_encodable = true;

    template <typename Encoder>
    static EncodeResult<Encoder> encode(T value, Encoder& encoder) {
        if constexpr (std::is_signed_v<T>) {
            return encoder.emitInt(static_cast<int64_t>(value));
        } else {
            return encoder.emitUint(static_cast<uint64_t>(value));
        }
    }
};

template <typename T>
struct Decodable<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static constexpr bool is_decodable = true;

    template <typename Decoder>
    static DecodeResult<T, Decoder> decode(Decoder& decoder) {
        if constexpr (std::is_signed_v<T>) {
            auto raw = decoder.readInt();
            if (!raw) {
                return DecodeResult<T, Decoder>::err(std::move(raw).error());
            }
            auto v = raw.value();
            if (v < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
                v > static_cast<int64_t>(std::numeric_limits<T>::max())) {
                return DecodeResult<T, Decoder>::err(
                    decoder.outOfRange("integer " + std::to_string(v) +
                                       " does not fit the target type"));
            }
            return DecodeResult<T, Decoder>::ok(static_cast<T>(v));
        } else {
            auto raw = decoder.readUint();
            if (!raw) {
                return DecodeResult<T, Decoder>::err(std::move(raw).error());
            }
            auto v = raw.value();
            if (v > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
                return DecodeResult<T, Decoder>::err(
                    decoder.outOfRange("integer " + std::to_string(v) +
                                       " does not fit the target type"));
            }
            return DecodeResult<T, Decoder>::ok(static_cast<T>(v));
        }
    }
};

template <typename T>
struct Encodable<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static constexpr bool is_encodable = true;

    template <typename Encoder>
    static EncodeResult<Encoder> encode(T value, Encoder& encoder) {
        return encoder.emitDouble(static_cast<double>(value));
    }
};

template <typename T>
struct Decodable<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static constexpr bool is_decodable = true;

    template <typename Decoder>
    static DecodeResult<T, Decoder> decode(Decoder& decoder) {
        auto raw = decoder.readDouble();
        if (!raw) {
            return DecodeResult<T, Decoder>::err(std::move(raw).error());
        }
        auto v = raw.value();
        if constexpr (std::numeric_limits<T>::max() < std::numeric_limits<double>::max()) {
            // Infinities and NaN convert as-is; finite values must be representable.
            constexpr auto limit = static_cast<double>(std::numeric_limits<T>::max());
            if (std::isfinite(v) && std::fabs(v) > limit) {
                return DecodeResult<T, Decoder>::err(
                    decoder.outOfRange("floating value " + std::to_string(v) +
                                       " does not fit the target type"));
            }
        }
        return DecodeResult<T, Decoder>::ok(static_cast<T>(v));
    }
};

template <>
struct Encodable<std::string> {
    static constexpr bool is_encodable = true;

    template <typename Encoder>
    static EncodeResult<Encoder> encode(const std::string& value, Encoder& encoder) {
        return encoder.emitString(value);
    }
};

template <>
struct Decodable<std::string> {
    static constexpr bool is_decodable = true;

    template <typename Decoder>
    static DecodeResult<std::string, Decoder> decode(Decoder& decoder) {
        return decoder.readString();
    }
};

}  // namespace csb::codec
