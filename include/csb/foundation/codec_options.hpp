#pragma once

/// @file codec_options.hpp
/// @brief Limits and checks applied by the bundled encoder/decoder backends.

#include <cstddef>
#include <cstdint>

#include "csb/foundation/codec_result.hpp"

namespace csb::foundation {

class ConfigManager;

/// Backend limits. Defaults apply to every key absent from the config.
///
/// | Key                      | Default   |
/// |--------------------------|-----------|
/// | codec.max_frame_length   | 1 << 24   |
/// | codec.max_depth          | 64        |
/// | codec.strict_arity       | true      |
/// | codec.max_sparse_key     | 1 << 24   |
struct CodecOptions {
    /// Largest sequence/map length a decoder accepts.
    std::size_t maxFrameLength = std::size_t{1} << 24;

    /// Deepest frame nesting an encoder or decoder accepts.
    std::size_t maxDepth = 64;

    /// Verify that a frame body visited exactly the announced element count.
    bool strictArity = true;

    /// Largest key a decoder accepts for a SparseMap. Slot storage grows to
    /// the largest key, so this bounds the memory one decoded key can claim.
    std::size_t maxSparseKey = std::size_t{1} << 24;

    /// Read options from the "codec.*" keys of @p config.
    /// @return The options or ConfigTypeMismatch / InvalidArgument error.
    static CodecResult<CodecOptions> fromConfig(const ConfigManager& config);
};

} // namespace csb::foundation
