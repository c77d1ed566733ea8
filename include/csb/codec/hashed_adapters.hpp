#pragma once

/// @file hashed_adapters.hpp
/// @brief Map and sequence frames for std::unordered_map and std::unordered_set.
///
/// Encoding visits entries in whatever order the live hash table yields;
/// two encodings of equal content may differ in order. Decoding reserves
/// the announced length before inserting. Equality of the decoded result
/// is by membership.

#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "csb/codec/protocol.hpp"

namespace csb::codec {

template <typename K, typename V, typename Hash, typename KeyEqual, typename Alloc>
struct Encodable<std::unordered_map<K, V, Hash, KeyEqual, Alloc>> {
    static constexpr bool is_encodable = true;

    template <typename Encoder>
    static EncodeResult<Encoder> encode(
        const std::unordered_map<K, V, Hash, KeyEqual, Alloc>& map, Encoder& encoder) {
        return detail::emitEntries(encoder, map.size(), map);
    }
};

template <typename K, typename V, typename Hash, typename KeyEqual, typename Alloc>
struct Decodable<std::unordered_map<K, V, Hash, KeyEqual, Alloc>> {
    static constexpr bool is_decodable = true;

    using Map = std::unordered_map<K, V, Hash, KeyEqual, Alloc>;

    /// A key repeated within one frame keeps the last value.
    template <typename Decoder>
    static DecodeResult<Map, Decoder> decode(Decoder& decoder) {
        return detail::readEntries<Map, K, V>(
            decoder, detail::ReserveLength{},
            [](Map& map, K&& key, V&& val) {
                map.insert_or_assign(std::move(key), std::move(val));
            });
    }
};

template <typename T, typename Hash, typename KeyEqual, typename Alloc>
struct Encodable<std::unordered_set<T, Hash, KeyEqual, Alloc>> {
    static constexpr bool is_encodable = true;

    template <typename Encoder>
    static EncodeResult<Encoder> encode(
        const std::unordered_set<T, Hash, KeyEqual, Alloc>& set, Encoder& encoder) {
        return detail::emitElements(encoder, set.size(), set);
    }
};

template <typename T, typename Hash, typename KeyEqual, typename Alloc>
struct Decodable<std::unordered_set<T, Hash, KeyEqual, Alloc>> {
    static constexpr bool is_decodable = true;

    using Set = std::unordered_set<T, Hash, KeyEqual, Alloc>;

    template <typename Decoder>
    static DecodeResult<Set, Decoder> decode(Decoder& decoder) {
        return detail::readElements<Set, T>(
            decoder, detail::ReserveLength{},
            [](Set& set, T&& elem) { set.insert(std::move(elem)); });
    }
};

}  // namespace csb::codec
