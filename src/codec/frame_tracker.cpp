/// @file frame_tracker.cpp
/// @brief Frame-contract checks shared by the binary and JSON backends.

#include "csb/codec/frame_tracker.hpp"

#include <utility>

namespace csb::codec {

using foundation::CodecError;
using foundation::CodecResult;
using foundation::ErrorCode;

FrameTracker::Scope::~Scope() {
    tracker_->frames_.pop_back();
}

FrameTracker::FrameTracker(std::string backend, foundation::LogCategory category,
                           foundation::CodecOptions options)
    : backend_(std::move(backend)), category_(category), options_(options) {}

CodecResult<void> FrameTracker::checkDepth() const {
    if (frames_.size() >= options_.maxDepth) {
        return CodecResult<void>::err(
            fail(ErrorCode::DepthLimitExceeded,
                 "frame nesting exceeds max_depth " + std::to_string(options_.maxDepth)));
    }
    return CodecResult<void>::ok();
}

FrameTracker::Scope FrameTracker::open(FrameKind kind, std::size_t length) {
    frames_.push_back(Frame{kind, length});
    return Scope(*this);
}

CodecResult<void> FrameTracker::expectFrame(FrameKind kind, std::string_view what) const {
    if (frames_.empty() || frames_.back().kind != kind) {
        return CodecResult<void>::err(
            fail(ErrorCode::FrameOrderViolation,
                 std::string(what) + " visited outside a " +
                     (kind == FrameKind::Sequence ? "sequence" : "map") + " frame"));
    }
    return CodecResult<void>::ok();
}

CodecResult<void> FrameTracker::element(std::size_t index) {
    auto r = expectFrame(FrameKind::Sequence, "element");
    if (!r) {
        return r;
    }
    auto& frame = frames_.back();
    if (index != frame.next) {
        return CodecResult<void>::err(
            fail(ErrorCode::FrameOrderViolation,
                 "element index " + std::to_string(index) + ", expected " +
                     std::to_string(frame.next)));
    }
    if (index >= frame.length) {
        return CodecResult<void>::err(
            fail(ErrorCode::FrameArityMismatch,
                 "element index " + std::to_string(index) + " beyond frame length " +
                     std::to_string(frame.length)));
    }
    ++frame.next;
    return CodecResult<void>::ok();
}

CodecResult<void> FrameTracker::key(std::size_t index) {
    auto r = expectFrame(FrameKind::Map, "key");
    if (!r) {
        return r;
    }
    auto& frame = frames_.back();
    if (frame.awaitingValue || index != frame.next) {
        return CodecResult<void>::err(
            fail(ErrorCode::FrameOrderViolation,
                 "key index " + std::to_string(index) + ", expected " +
                     (frame.awaitingValue ? "value " : "key ") + std::to_string(frame.next)));
    }
    if (index >= frame.length) {
        return CodecResult<void>::err(
            fail(ErrorCode::FrameArityMismatch,
                 "key index " + std::to_string(index) + " beyond frame length " +
                     std::to_string(frame.length)));
    }
    frame.awaitingValue = true;
    return CodecResult<void>::ok();
}

CodecResult<void> FrameTracker::value(std::size_t index) {
    auto r = expectFrame(FrameKind::Map, "value");
    if (!r) {
        return r;
    }
    auto& frame = frames_.back();
    if (!frame.awaitingValue || index != frame.next) {
        return CodecResult<void>::err(
            fail(ErrorCode::FrameOrderViolation,
                 "value index " + std::to_string(index) + " without a preceding key"));
    }
    frame.awaitingValue = false;
    ++frame.next;
    return CodecResult<void>::ok();
}

CodecResult<void> FrameTracker::close() const {
    if (!options_.strictArity || frames_.empty()) {
        return CodecResult<void>::ok();
    }
    const auto& frame = frames_.back();
    if (frame.next != frame.length || frame.awaitingValue) {
        return CodecResult<void>::err(
            fail(ErrorCode::FrameArityMismatch,
                 "frame announced " + std::to_string(frame.length) + " entries, body visited " +
                     std::to_string(frame.next)));
    }
    return CodecResult<void>::ok();
}

CodecError FrameTracker::fail(ErrorCode code, std::string message) const {
    auto& logger = foundation::CodecLogger::instance();
    if (logger.isEnabled(foundation::LogLevel::Debug, category_)) {
        foundation::LogContext ctx;
        ctx.backend = backend_;
        ctx.depth = frames_.size();
        if (!frames_.empty()) {
            // Entry being visited: the open key, else the last announced element.
            const auto& frame = frames_.back();
            if (frame.awaitingValue) {
                ctx.index = frame.next;
            } else if (frame.next > 0) {
                ctx.index = frame.next - 1;
            }
        }
        ctx.extra["subsystem"] = std::string(foundation::errorSubsystem(code));
        logger.logWithContext(foundation::LogLevel::Debug, category_, message, ctx);
    }
    return CodecError(code, std::move(message));
}

}  // namespace csb::codec
