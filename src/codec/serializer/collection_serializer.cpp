/// @file collection_serializer.cpp
/// @brief Non-template parts of CollectionSerializer.

#include "csb/codec/collection_serializer.hpp"

#include "csb/foundation/codec_logger.hpp"
#include "csb/foundation/config_manager.hpp"

namespace csb::codec {

using foundation::CodecOptions;
using foundation::CodecResult;

struct CollectionSerializer::Impl {
    CodecOptions options;
};

CollectionSerializer::CollectionSerializer() : impl_(std::make_unique<Impl>()) {}

CollectionSerializer::CollectionSerializer(CodecOptions options)
    : impl_(std::make_unique<Impl>(Impl{options})) {}

CollectionSerializer::~CollectionSerializer() = default;

CollectionSerializer::CollectionSerializer(CollectionSerializer&&) noexcept = default;

CollectionSerializer& CollectionSerializer::operator=(CollectionSerializer&&) noexcept = default;

CodecResult<CollectionSerializer> CollectionSerializer::fromConfig(
    const foundation::ConfigManager& config) {
    auto options = CodecOptions::fromConfig(config);
    if (!options) {
        return CodecResult<CollectionSerializer>::err(std::move(options).error());
    }
    CSB_LOG_INFO(foundation::LogCategory::Core,
                 "serializer configured: max_frame_length=" +
                     std::to_string(options.value().maxFrameLength) +
                     " max_depth=" + std::to_string(options.value().maxDepth) +
                     " strict_arity=" + (options.value().strictArity ? "true" : "false"));
    return CodecResult<CollectionSerializer>::ok(CollectionSerializer(options.value()));
}

const CodecOptions& CollectionSerializer::options() const noexcept {
    return impl_->options;
}

void CollectionSerializer::setOptions(CodecOptions options) {
    impl_->options = options;
}

}  // namespace csb::codec
