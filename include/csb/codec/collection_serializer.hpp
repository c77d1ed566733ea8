#pragma once

/// @file collection_serializer.hpp
/// @brief One-call binary and JSON serialization of supported containers.
///
/// CollectionSerializer wraps the backends with document framing: a binary
/// document is the magic "CSBF", a uint32 format version and one encoded
/// value; a JSON document is one encoded value. Both decoders reject
/// anything left after the value.
///
/// Example:
/// @code
///   CollectionSerializer s;
///   std::map<int, std::string> scores{{1, "a"}, {2, "b"}};
///   auto bin = s.serializeBinary(scores);
///   auto back = s.deserializeBinary<std::map<int, std::string>>(bin.value());
///   auto json = s.serializeJson(scores);   // {"1":"a","2":"b"}
/// @endcode

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "csb/codec/binary_codec.hpp"
#include "csb/codec/collections.hpp"
#include "csb/codec/json_codec.hpp"
#include "csb/foundation/codec_options.hpp"
#include "csb/foundation/codec_result.hpp"

namespace csb::foundation {
class ConfigManager;
}

namespace csb::codec {

class CollectionSerializer {
public:
    CollectionSerializer();
    explicit CollectionSerializer(foundation::CodecOptions options);
    ~CollectionSerializer();

    CollectionSerializer(const CollectionSerializer&) = delete;
    CollectionSerializer& operator=(const CollectionSerializer&) = delete;
    CollectionSerializer(CollectionSerializer&&) noexcept;
    CollectionSerializer& operator=(CollectionSerializer&&) noexcept;

    /// Build a serializer from the "codec.*" keys of @p config.
    static foundation::CodecResult<CollectionSerializer> fromConfig(
        const foundation::ConfigManager& config);

    [[nodiscard]] const foundation::CodecOptions& options() const noexcept;
    void setOptions(foundation::CodecOptions options);

    // ── Binary ──────────────────────────────────────────────────────────

    template <typename T>
    [[nodiscard]] foundation::CodecResult<std::vector<uint8_t>> serializeBinary(
        const T& value) const {
        using R = foundation::CodecResult<std::vector<uint8_t>>;
        BinaryEncoder encoder(options());
        encoder.writeHeader();
        auto r = encode(value, encoder);
        if (!r) {
            return R::err(std::move(r).error());
        }
        return R::ok(encoder.takeBytes());
    }

    template <typename T>
    [[nodiscard]] foundation::CodecResult<T> deserializeBinary(
        std::span<const uint8_t> data) const {
        using R = foundation::CodecResult<T>;
        BinaryDecoder decoder(data, options());
        auto header = decoder.readHeader();
        if (!header) {
            return R::err(std::move(header).error());
        }
        auto value = decode<T>(decoder);
        if (!value) {
            return value;
        }
        auto end = decoder.finish();
        if (!end) {
            return R::err(std::move(end).error());
        }
        return value;
    }

    // ── JSON ────────────────────────────────────────────────────────────

    template <typename T>
    [[nodiscard]] foundation::CodecResult<std::string> serializeJson(const T& value) const {
        using R = foundation::CodecResult<std::string>;
        JsonEncoder encoder(options());
        auto r = encode(value, encoder);
        if (!r) {
            return R::err(std::move(r).error());
        }
        return R::ok(encoder.takeString());
    }

    template <typename T>
    [[nodiscard]] foundation::CodecResult<T> deserializeJson(std::string_view json) const {
        using R = foundation::CodecResult<T>;
        JsonDecoder decoder(json, options());
        auto value = decode<T>(decoder);
        if (!value) {
            return value;
        }
        auto end = decoder.finish();
        if (!end) {
            return R::err(std::move(end).error());
        }
        return value;
    }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace csb::codec
