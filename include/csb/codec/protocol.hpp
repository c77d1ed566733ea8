#pragma once

/// @file protocol.hpp
/// @brief Visitor protocol binding containers to encoder/decoder backends.
///
/// A backend is any class exposing the frame operations below. Containers
/// never see the wire format and backends never see container internals:
/// an adapter opens one frame per container, announces its length, then
/// visits every element (or key then value) with a zero-based index.
///
/// Encoder contract:
/// @code
///   using Error = ...;
///   Result<void, Error> emitSeq(std::size_t len, F body);        // body(Encoder&)
///   Result<void, Error> emitSeqElt(std::size_t idx, F f);        // f(Encoder&)
///   Result<void, Error> emitMap(std::size_t len, F body);
///   Result<void, Error> emitMapEltKey(std::size_t idx, F f);
///   Result<void, Error> emitMapEltVal(std::size_t idx, F f);
///   Result<void, Error> emitBool / emitInt / emitUint / emitDouble / emitString
/// @endcode
///
/// Decoder contract:
/// @code
///   using Error = ...;
///   R readSeq(F body);                  // body(Decoder&, std::size_t len) -> R
///   R readSeqElt(std::size_t idx, F f); // f(Decoder&) -> R
///   R readMap(F body);
///   R readMapEltKey(std::size_t idx, F f);
///   R readMapEltVal(std::size_t idx, F f);
///   Result<bool, Error> readBool(); readInt(); readUint(); readDouble(); readString();
///   Error outOfRange(std::string message);  // narrowing failure in scalars.hpp
/// @endcode
///
/// For a frame of length N the body issues exactly N element visits (or N
/// key/value pairs, key first) with indices 0..N-1 in increasing order.
/// The first failure ends the frame and is returned unchanged.

#include <cstddef>
#include <type_traits>
#include <utility>

#include "csb/core/result.hpp"

namespace csb::codec {

/// Result of encoding anything with @p Encoder.
template <typename Encoder>
using EncodeResult = csb::Result<void, typename Encoder::Error>;

/// Result of decoding a @p T with @p Decoder.
template <typename T, typename Decoder>
using DecodeResult = csb::Result<T, typename Decoder::Error>;

// ── Capability traits ───────────────────────────────────────────────────────

/// Specialization point for the encode capability of a type.
///
/// A specialization sets is_encodable and provides
/// @code
///   template <typename Encoder>
///   static EncodeResult<Encoder> encode(const T& value, Encoder& encoder);
/// @endcode
template <typename T, typename Enable = void>
struct Encodable {
    static constexpr bool is_encodable = false;
};

/// Specialization point for the decode capability of a type.
///
/// A specialization sets is_decodable and provides
/// @code
///   template <typename Decoder>
///   static DecodeResult<T, Decoder> decode(Decoder& decoder);
/// @endcode
template <typename T, typename Enable = void>
struct Decodable {
    static constexpr bool is_decodable = false;
};

// ── Backend detection ───────────────────────────────────────────────────────

namespace detail {

template <typename Encoder>
struct EncodeProbe {
    EncodeResult<Encoder> operator()(Encoder&) const {
        return EncodeResult<Encoder>::ok();
    }
};

template <typename Decoder>
struct ReadFrameProbe {
    DecodeResult<int, Decoder> operator()(Decoder&, std::size_t) const {
        return DecodeResult<int, Decoder>::ok(0);
    }
};

template <typename Decoder>
struct ReadEltProbe {
    DecodeResult<int, Decoder> operator()(Decoder&) const {
        return DecodeResult<int, Decoder>::ok(0);
    }
};

template <typename E, typename = void>
struct is_encoder : std::false_type {};

template <typename E>
struct is_encoder<
    E, std::void_t<
           typename E::Error,
           decltype(std::declval<E&>().emitSeq(std::size_t{}, EncodeProbe<E>{})),
           decltype(std::declval<E&>().emitSeqElt(std::size_t{}, EncodeProbe<E>{})),
           decltype(std::declval<E&>().emitMap(std::size_t{}, EncodeProbe<E>{})),
           decltype(std::declval<E&>().emitMapEltKey(std::size_t{}, EncodeProbe<E>{})),
           decltype(std::declval<E&>().emitMapEltVal(std::size_t{}, EncodeProbe<E>{}))>>
    : std::true_type {};

template <typename D, typename = void>
struct is_decoder : std::false_type {};

template <typename D>
struct is_decoder<
    D, std::void_t<
           typename D::Error,
           decltype(std::declval<D&>().readSeq(ReadFrameProbe<D>{})),
           decltype(std::declval<D&>().readSeqElt(std::size_t{}, ReadEltProbe<D>{})),
           decltype(std::declval<D&>().readMap(ReadFrameProbe<D>{})),
           decltype(std::declval<D&>().readMapEltKey(std::size_t{}, ReadEltProbe<D>{})),
           decltype(std::declval<D&>().readMapEltVal(std::size_t{}, ReadEltProbe<D>{}))>>
    : std::true_type {};

}  // namespace detail

/// True when @p E implements the encoder frame operations.
template <typename E>
inline constexpr bool is_encoder_v = detail::is_encoder<E>::value;

/// True when @p D implements the decoder frame operations.
template <typename D>
inline constexpr bool is_decoder_v = detail::is_decoder<D>::value;

template <typename T>
inline constexpr bool is_encodable_v = Encodable<T>::is_encodable;

template <typename T>
inline constexpr bool is_decodable_v = Decodable<T>::is_decodable;

// ── Public surface ──────────────────────────────────────────────────────────

/// Encode @p value through @p encoder.
template <typename T, typename Encoder>
EncodeResult<Encoder> encode(const T& value, Encoder& encoder) {
    static_assert(is_encodable_v<T>, "Type has no Encodable specialization");
    static_assert(is_encoder_v<Encoder>, "Encoder does not implement the frame protocol");
    return Encodable<T>::encode(value, encoder);
}

/// Decode a freshly constructed @p T from @p decoder.
/// On failure nothing partially built is returned.
template <typename T, typename Decoder>
DecodeResult<T, Decoder> decode(Decoder& decoder) {
    static_assert(is_decodable_v<T>, "Type has no Decodable specialization");
    static_assert(is_decoder_v<Decoder>, "Decoder does not implement the frame protocol");
    return Decodable<T>::decode(decoder);
}

// ── Shared frame drivers ────────────────────────────────────────────────────
//
// Every sequence-like adapter drives the protocol through emitElements /
// readElements and every map-like adapter through emitEntries / readEntries.
// The container kind contributes only its length, its native iteration and
// its insertion step.

namespace detail {

/// Run one insert step. A step returning void cannot fail; a step returning
/// Result<void, Decoder::Error> may reject the decoded entry.
template <typename Decoder, typename Insert, typename... Args>
csb::Result<void, typename Decoder::Error> applyInsert(Insert& insert, Args&&... args) {
    if constexpr (std::is_void_v<std::invoke_result_t<Insert&, Args&&...>>) {
        insert(std::forward<Args>(args)...);
        return csb::Result<void, typename Decoder::Error>::ok();
    } else {
        return insert(std::forward<Args>(args)...);
    }
}

/// Emit @p length elements of @p range, in its iteration order.
template <typename Encoder, typename Range>
EncodeResult<Encoder> emitElements(Encoder& encoder, std::size_t length,
                                   const Range& range) {
    return encoder.emitSeq(length, [&range](Encoder& s) -> EncodeResult<Encoder> {
        std::size_t i = 0;
        for (const auto& elem : range) {
            auto r = s.emitSeqElt(i, [&elem](Encoder& e) { return encode(elem, e); });
            if (!r) {
                return r;
            }
            ++i;
        }
        return EncodeResult<Encoder>::ok();
    });
}

/// Emit @p length key/value pairs of @p range, key before value.
/// @p range yields anything with `first` and `second` members.
template <typename Encoder, typename Range>
EncodeResult<Encoder> emitEntries(Encoder& encoder, std::size_t length,
                                  const Range& range) {
    return encoder.emitMap(length, [&range](Encoder& s) -> EncodeResult<Encoder> {
        std::size_t i = 0;
        for (const auto& [key, val] : range) {
            auto r = s.emitMapEltKey(i, [&key = key](Encoder& e) { return encode(key, e); });
            if (!r) {
                return r;
            }
            r = s.emitMapEltVal(i, [&val = val](Encoder& e) { return encode(val, e); });
            if (!r) {
                return r;
            }
            ++i;
        }
        return EncodeResult<Encoder>::ok();
    });
}

/// Read one sequence frame into a new @p Container.
///
/// @p prepare(container, length) runs once on the empty container before
/// any element is read; @p insert(container, elem) adds one decoded element
/// and may return an error that ends the frame (see applyInsert).
template <typename Container, typename Elem, typename Decoder,
          typename Prepare, typename Insert>
DecodeResult<Container, Decoder> readElements(Decoder& decoder, Prepare prepare,
                                              Insert insert) {
    return decoder.readSeq(
        [&](Decoder& d, std::size_t length) -> DecodeResult<Container, Decoder> {
            Container out;
            prepare(out, length);
            for (std::size_t i = 0; i < length; ++i) {
                auto elem = d.readSeqElt(i, [](Decoder& e) { return decode<Elem>(e); });
                if (!elem) {
                    return DecodeResult<Container, Decoder>::err(std::move(elem).error());
                }
                auto added = applyInsert<Decoder>(insert, out, std::move(elem).value());
                if (!added) {
                    return DecodeResult<Container, Decoder>::err(std::move(added).error());
                }
            }
            return DecodeResult<Container, Decoder>::ok(std::move(out));
        });
}

/// Read one map frame into a new @p Container.
/// @p insert(container, key, value) adds one decoded pair, with the same
/// failure rule as readElements.
template <typename Container, typename Key, typename Value, typename Decoder,
          typename Prepare, typename Insert>
DecodeResult<Container, Decoder> readEntries(Decoder& decoder, Prepare prepare,
                                             Insert insert) {
    return decoder.readMap(
        [&](Decoder& d, std::size_t length) -> DecodeResult<Container, Decoder> {
            Container out;
            prepare(out, length);
            for (std::size_t i = 0; i < length; ++i) {
                auto key = d.readMapEltKey(i, [](Decoder& e) { return decode<Key>(e); });
                if (!key) {
                    return DecodeResult<Container, Decoder>::err(std::move(key).error());
                }
                auto val = d.readMapEltVal(i, [](Decoder& e) { return decode<Value>(e); });
                if (!val) {
                    return DecodeResult<Container, Decoder>::err(std::move(val).error());
                }
                auto added = applyInsert<Decoder>(insert, out, std::move(key).value(),
                                                  std::move(val).value());
                if (!added) {
                    return DecodeResult<Container, Decoder>::err(std::move(added).error());
                }
            }
            return DecodeResult<Container, Decoder>::ok(std::move(out));
        });
}

/// Prepare step for containers that need no pre-sizing.
struct NoReserve {
    template <typename Container>
    void operator()(Container&, std::size_t) const noexcept {}
};

/// Prepare step that pre-sizes the destination to the announced length.
struct ReserveLength {
    template <typename Container>
    void operator()(Container& c, std::size_t length) const {
        c.reserve(length);
    }
};

}  // namespace detail

}  // namespace csb::codec
