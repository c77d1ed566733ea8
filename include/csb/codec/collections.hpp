#pragma once

/// @file collections.hpp
/// @brief Aggregate header for every container adapter.
///
/// Include this (rather than single adapter headers) when element types
/// nest containers of different kinds, e.g. std::map<std::string,
/// std::deque<int>>, so that every specialization is visible at the point
/// of use.

#include "csb/codec/hashed_adapters.hpp"
#include "csb/codec/ordered_adapters.hpp"
#include "csb/codec/protocol.hpp"
#include "csb/codec/scalars.hpp"
#include "csb/codec/sequence_adapters.hpp"
#include "csb/codec/sparse_adapters.hpp"
