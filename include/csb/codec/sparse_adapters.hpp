#pragma once

/// @file sparse_adapters.hpp
/// @brief Map frame for csb::collections::SparseMap.

#include <cstddef>
#include <string>
#include <type_traits>
#include <utility>

#include "csb/codec/protocol.hpp"
#include "csb/collections/sparse_map.hpp"

namespace csb::codec {

/// Key bound used with decoders that do not report maxSparseKey().
inline constexpr std::size_t kDefaultMaxSparseKey = std::size_t{1} << 24;

namespace detail {

template <typename D, typename = void>
struct has_sparse_key_limit : std::false_type {};

template <typename D>
struct has_sparse_key_limit<D, std::void_t<decltype(std::declval<const D&>().maxSparseKey())>>
    : std::true_type {};

template <typename Decoder>
std::size_t sparseKeyLimit(const Decoder& decoder) {
    if constexpr (has_sparse_key_limit<Decoder>::value) {
        return decoder.maxSparseKey();
    } else {
        return kDefaultMaxSparseKey;
    }
}

}  // namespace detail

/// Pairs are emitted in ascending key order. Decoding inserts by key, so
/// the frame order has no effect on the result.
template <typename V>
struct Encodable<collections::SparseMap<V>> {
    static constexpr bool is_encodable = true;

    template <typename Encoder>
    static EncodeResult<Encoder> encode(const collections::SparseMap<V>& map,
                                        Encoder& encoder) {
        return detail::emitEntries(encoder, map.Size(), map);
    }
};

template <typename V>
struct Decodable<collections::SparseMap<V>> {
    static constexpr bool is_decodable = true;

    using Map = collections::SparseMap<V>;

    /// Keys above the decoder's maxSparseKey() fail with its outOfRange
    /// error before any slot is allocated.
    template <typename Decoder>
    static DecodeResult<Map, Decoder> decode(Decoder& decoder) {
        using Step = csb::Result<void, typename Decoder::Error>;
        const std::size_t limit = detail::sparseKeyLimit(decoder);
        return detail::readEntries<Map, std::size_t, V>(
            decoder, detail::NoReserve{},
            [&decoder, limit](Map& map, std::size_t&& key, V&& val) -> Step {
                if (key > limit) {
                    return Step::err(decoder.outOfRange(
                        "sparse key " + std::to_string(key) + " exceeds max_sparse_key " +
                        std::to_string(limit)));
                }
                map.Insert(key, std::move(val));
                return Step::ok();
            });
    }
};

}  // namespace csb::codec
