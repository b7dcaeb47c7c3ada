// Repository: VidCat-media
// Component: Decode Types
// Purpose: Frame, output geometry and error codes shared by the decoder and
//          both decode actors.
// Copyright (c) 2025 VidCat contributors

#ifndef VIDCAT_DECODE_DECODE_TYPES_HPP_
#define VIDCAT_DECODE_DECODE_TYPES_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace vidcat::decode {

// Bytes per output pixel (interleaved 8-bit RGBA).
inline constexpr int kBytesPerPixel = 4;

// =============================================================================
// Frame
// =============================================================================

// Frame is one decoded picture, rescaled to the handle's output size.
// rgba holds exactly width * height * 4 bytes with no row padding.
// Produced by a decode step, handed to the foreground once, then discarded.
struct Frame {
  std::vector<uint8_t> rgba;
  int width = 0;
  int height = 0;
  double timestamp_s = 0.0;  // Presentation time relative to stream start

  // True when the seek that led to this frame could not reach its target and
  // recovered by seeking to the start of the stream instead.
  bool approximate = false;

  size_t ExpectedSize() const {
    return static_cast<size_t>(width) * static_cast<size_t>(height) *
           static_cast<size_t>(kBytesPerPixel);
  }

  bool IsWellFormed() const {
    return width > 0 && height > 0 && rgba.size() == ExpectedSize();
  }
};

// OutputSize is the fixed rescale target of an open handle.
struct OutputSize {
  int width = 0;
  int height = 0;

  bool operator==(const OutputSize& other) const {
    return width == other.width && height == other.height;
  }
  bool operator!=(const OutputSize& other) const { return !(*this == other); }
};

// Width is bounded by max_width (0 = unbounded); height follows the source
// aspect ratio and is never below 1. Returns {0, 0} for a degenerate source.
OutputSize ComputeOutputSize(int source_width, int source_height, int max_width);

// Clamps a normalized position into [0, 1]. NaN maps to 0.
double ClampNormalizedPosition(double position);

// =============================================================================
// Errors and outcomes
// =============================================================================

enum class OpenError {
  kNone = 0,

  // Container could not be opened (missing, unreadable, not a media file).
  kUnreadableFile,

  // Container opened but stream probing failed.
  kNoStreamInfo,

  // Container has no video stream.
  kNoVideoStream,

  // No decoder available for the video codec.
  kUnsupportedCodec,

  // Decoder context could not be configured or opened.
  kCodecInitFailed,

  // Rescaler could not be created for the source pixel format.
  kScalerInitFailed,

  // FFmpeg allocation failure.
  kOutOfMemory,
};

const char* OpenErrorToString(OpenError error);

enum class SeekMode {
  kKeyframe,  // Land on the keyframe at or before the target (fast)
  kPrecise,   // Keyframe seek, then discard frames until target is reached
};

enum class SeekOutcome {
  kOnTarget,         // Seek to the requested time succeeded
  kFellBackToStart,  // Requested seek failed; recovered at stream start
  kFailed,           // Neither seek succeeded; position unchanged
};

const char* SeekOutcomeToString(SeekOutcome outcome);

// DecoderStats tracks per-handle decode activity.
struct DecoderStats {
  uint64_t frames_decoded = 0;
  uint64_t decode_errors = 0;
  uint64_t seeks = 0;
  uint64_t seek_fallbacks = 0;
  uint64_t preroll_frames_discarded = 0;
};

}  // namespace vidcat::decode

#endif  // VIDCAT_DECODE_DECODE_TYPES_HPP_
