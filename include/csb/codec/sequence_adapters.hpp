#pragma once

/// @file sequence_adapters.hpp
/// @brief Sequence frames for std::list, std::deque and std::vector.
///
/// Decoding appends every element at the tail, so the decoded container
/// iterates in exactly the encoded order.

#include <deque>
#include <list>
#include <type_traits>
#include <utility>
#include <vector>

#include "csb/codec/protocol.hpp"

namespace csb::codec {

template <typename T, typename Alloc>
struct Encodable<std::list<T, Alloc>> {
    static constexpr bool is_encodable = true;

    template <typename Encoder>
    static EncodeResult<Encoder> encode(const std::list<T, Alloc>& list, Encoder& encoder) {
        return detail::emitElements(encoder, list.size(), list);
    }
};

template <typename T, typename Alloc>
struct Decodable<std::list<T, Alloc>> {
    static constexpr bool is_decodable = true;

    template <typename Decoder>
    static DecodeResult<std::list<T, Alloc>, Decoder> decode(Decoder& decoder) {
        return detail::readElements<std::list<T, Alloc>, T>(
            decoder, detail::NoReserve{},
            [](std::list<T, Alloc>& list, T&& elem) { list.push_back(std::move(elem)); });
    }
};

template <typename T, typename Alloc>
struct Encodable<std::deque<T, Alloc>> {
    static constexpr bool is_encodable = true;

    template <typename Encoder>
    static EncodeResult<Encoder> encode(const std::deque<T, Alloc>& deque, Encoder& encoder) {
        return detail::emitElements(encoder, deque.size(), deque);
    }
};

template <typename T, typename Alloc>
struct Decodable<std::deque<T, Alloc>> {
    static constexpr bool is_decodable = true;

    template <typename Decoder>
    static DecodeResult<std::deque<T, Alloc>, Decoder> decode(Decoder& decoder) {
        return detail::readElements<std::deque<T, Alloc>, T>(
            decoder, detail::NoReserve{},
            [](std::deque<T, Alloc>& deque, T&& elem) { deque.push_back(std::move(elem)); });
    }
};

// std::vector<bool> is a bit-packed proxy container and is left out.
template <typename T, typename Alloc>
struct Encodable<std::vector<T, Alloc>, std::enable_if_t<!std::is_same_v<T, bool>>> {
    static constexpr bool is_encodable = true;

    template <typename Encoder>
    static EncodeResult<Encoder> encode(const std::vector<T, Alloc>& vec, Encoder& encoder) {
        return detail::emitElements(encoder, vec.size(), vec);
    }
};

template <typename T, typename Alloc>
struct Decodable<std::vector<T, Alloc>, std::enable_if_t<!std::is_same_v<T, bool>>> {
    static constexpr bool is_decodable = true;

    template <typename Decoder>
    static DecodeResult<std::vector<T, Alloc>, Decoder> decode(Decoder& decoder) {
        return detail::readElements<std::vector<T, Alloc>, T>(
            decoder, detail::ReserveLength{},
            [](std::vector<T, Alloc>& vec, T&& elem) { vec.push_back(std::move(elem)); });
    }
};

}  // namespace csb::codec
