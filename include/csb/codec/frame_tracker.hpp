#pragma once

/// @file frame_tracker.hpp
/// @brief Frame-contract bookkeeping shared by the bundled backends.
///
/// A backend opens one Scope per sequence/map frame and reports every
/// element, key and value visit. The tracker rejects visits that break the
/// protocol (wrong frame kind, skipped or repeated index, value without a
/// key, too many or too few visits) and limits nesting depth. The Scope
/// pops its frame on every exit path, including early failure.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "csb/foundation/codec_logger.hpp"
#include "csb/foundation/codec_options.hpp"
#include "csb/foundation/codec_result.hpp"

namespace csb::codec {

enum class FrameKind : uint8_t {
    Sequence,
    Map
};

class FrameTracker {
public:
    /// RAII frame guard returned by open().
    class Scope {
    public:
        ~Scope();

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;
        Scope(Scope&&) = delete;
        Scope& operator=(Scope&&) = delete;

    private:
        friend class FrameTracker;
        explicit Scope(FrameTracker& tracker) : tracker_(&tracker) {}

        FrameTracker* tracker_;
    };

    /// @param backend  Name reported in log context ("binary", "json").
    /// @param category Log category for failures raised by this tracker.
    FrameTracker(std::string backend, foundation::LogCategory category,
                 foundation::CodecOptions options);

    /// Fail with DepthLimitExceeded when another frame would exceed max_depth.
    [[nodiscard]] foundation::CodecResult<void> checkDepth() const;

    /// Push a frame of @p length entries. Call checkDepth() first.
    [[nodiscard]] Scope open(FrameKind kind, std::size_t length);

    /// Record sequence element @p index of the innermost frame.
    [[nodiscard]] foundation::CodecResult<void> element(std::size_t index);

    /// Record map key @p index of the innermost frame.
    [[nodiscard]] foundation::CodecResult<void> key(std::size_t index);

    /// Record map value @p index; must follow key(index).
    [[nodiscard]] foundation::CodecResult<void> value(std::size_t index);

    /// Verify the innermost frame saw all announced entries
    /// (only when strict arity is enabled).
    [[nodiscard]] foundation::CodecResult<void> close() const;

    /// Number of open frames.
    [[nodiscard]] std::size_t depth() const noexcept { return frames_.size(); }

    [[nodiscard]] const foundation::CodecOptions& options() const noexcept {
        return options_;
    }

    /// Build an error and log it with the current frame position.
    [[nodiscard]] foundation::CodecError fail(foundation::ErrorCode code,
                                              std::string message) const;

private:
    struct Frame {
        FrameKind kind;
        std::size_t length;
        std::size_t next = 0;
        bool awaitingValue = false;
    };

    [[nodiscard]] foundation::CodecResult<void> expectFrame(FrameKind kind,
                                                            std::string_view what) const;

    std::string backend_;
    foundation::LogCategory category_;
    foundation::CodecOptions options_;
    std::vector<Frame> frames_;
};

}  // namespace csb::codec
