#pragma once

/// @file ordered_adapters.hpp
/// @brief Map and sequence frames for std::map and std::set.
///
/// Encoding visits entries in ascending order of the container's
/// comparator. Decoding relies on the container's own ordered insert, so
/// the frame order does not need to be sorted for the result to be.

#include <map>
#include <set>
#include <utility>

#include "csb/codec/protocol.hpp"

namespace csb::codec {

template <typename K, typename V, typename Compare, typename Alloc>
struct Encodable<std::map<K, V, Compare, Alloc>> {
    static constexpr bool is_encodable = true;

    template <typename Encoder>
    static EncodeResult<Encoder> encode(const std::map<K, V, Compare, Alloc>& map,
                                        Encoder& encoder) {
        return detail::emitEntries(encoder, map.size(), map);
    }
};

template <typename K, typename V, typename Compare, typename Alloc>
struct Decodable<std::map<K, V, Compare, Alloc>> {
    static constexpr bool is_decodable = true;

    using Map = std::map<K, V, Compare, Alloc>;

    /// A key repeated within one frame keeps the last value.
    template <typename Decoder>
    static DecodeResult<Map, Decoder> decode(Decoder& decoder) {
        return detail::readEntries<Map, K, V>(
            decoder, detail::NoReserve{},
            [](Map& map, K&& key, V&& val) {
                map.insert_or_assign(std::move(key), std::move(val));
            });
    }
};

template <typename T, typename Compare, typename Alloc>
struct Encodable<std::set<T, Compare, Alloc>> {
    static constexpr bool is_encodable = true;

    template <typename Encoder>
    static EncodeResult<Encoder> encode(const std::set<T, Compare, Alloc>& set,
                                        Encoder& encoder) {
        return detail::emitElements(encoder, set.size(), set);
    }
};

template <typename T, typename Compare, typename Alloc>
struct Decodable<std::set<T, Compare, Alloc>> {
    static constexpr bool is_decodable = true;

    using Set = std::set<T, Compare, Alloc>;

    template <typename Decoder>
    static DecodeResult<Set, Decoder> decode(Decoder& decoder) {
        return detail::readElements<Set, T>(
            decoder, detail::NoReserve{},
            [](Set& set, T&& elem) { set.insert(std::move(elem)); });
    }
};

}  // namespace csb::codec
