#pragma once

/// @file csb.hpp
/// @brief Umbrella header for the collection serialization bindings.

#include "csb/version.hpp"
#include "csb/core/result.hpp"
#include "csb/codec/collections.hpp"
#include "csb/codec/binary_codec.hpp"
#include "csb/codec/json_codec.hpp"
#include "csb/codec/collection_serializer.hpp"
