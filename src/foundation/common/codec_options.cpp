#include "csb/foundation/codec_options.hpp"

#include <string>

#include "csb/foundation/codec_logger.hpp"
#include "csb/foundation/config_manager.hpp"

namespace csb::foundation {

namespace {

/// Overwrite @p target with the value under @p key when the key is present.
template <typename T>
CodecResult<void> readOptional(const ConfigManager& config, const char* key,
                               T& target) {
    if (!config.hasKey(key)) {
        return CodecResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (!value) {
        return CodecResult<void>::err(std::move(value).error());
    }
    target = value.value();
    return CodecResult<void>::ok();
}

}  // namespace

CodecResult<CodecOptions> CodecOptions::fromConfig(const ConfigManager& config) {
    CodecOptions options;

    auto r = readOptional(config, "codec.max_frame_length", options.maxFrameLength);
    if (!r) {
        return CodecResult<CodecOptions>::err(std::move(r).error());
    }
    r = readOptional(config, "codec.max_depth", options.maxDepth);
    if (!r) {
        return CodecResult<CodecOptions>::err(std::move(r).error());
    }
    r = readOptional(config, "codec.strict_arity", options.strictArity);
    if (!r) {
        return CodecResult<CodecOptions>::err(std::move(r).error());
    }
    r = readOptional(config, "codec.max_sparse_key", options.maxSparseKey);
    if (!r) {
        return CodecResult<CodecOptions>::err(std::move(r).error());
    }

    if (options.maxDepth == 0) {
        return CodecResult<CodecOptions>::err(
            CodecError(ErrorCode::InvalidArgument, "codec.max_depth must be positive"));
    }

    CSB_LOG_DEBUG(LogCategory::Config,
                  "codec options: max_frame_length=" +
                      std::to_string(options.maxFrameLength) +
                      " max_depth=" + std::to_string(options.maxDepth) +
                      " max_sparse_key=" + std::to_string(options.maxSparseKey));
    return CodecResult<CodecOptions>::ok(options);
}

} // namespace csb::foundation
