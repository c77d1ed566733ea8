#pragma once

/// @file codec_result.hpp
/// @brief CodecResult<T> type alias for the bundled backends.

#include "csb/core/result.hpp"
#include "csb/foundation/codec_error.hpp"

namespace csb::foundation {

/// Result type specialized with CodecError.
///
/// The binary and JSON backends, the configuration layer and the logger
/// return CodecResult<T>. Container adapters do not name this type: they
/// return whatever Result the backend they are driven by declares.
///
/// Example:
/// @code
///   CodecResult<uint32_t> readLength(BinaryDecoder& dec) {
///       auto len = dec.readUint();
///       if (!len) {
///           return CodecResult<uint32_t>::err(std::move(len).error());
///       }
///       return CodecResult<uint32_t>::ok(static_cast<uint32_t>(len.value()));
///   }
/// @endcode
template <typename T>
using CodecResult = csb::Result<T, CodecError>;

}  // namespace csb::foundation
