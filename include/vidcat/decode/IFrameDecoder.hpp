// Repository: VidCat-media
// Component: IFrameDecoder
// Purpose: Minimal decoder surface used by the hover-scrub and playback
//          actors so tests can inject a fake decoder.
//          Production uses MediaDecoder; tests use FakeFrameDecoder.
// Copyright (c) 2025 VidCat contributors

#ifndef VIDCAT_DECODE_IFRAME_DECODER_HPP_
#define VIDCAT_DECODE_IFRAME_DECODER_HPP_

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "vidcat/decode/DecodeTypes.hpp"

namespace vidcat::decode {

// One open media handle: container + selected video stream + decoder +
// rescaler. Not thread-safe: the owning actor's thread is the only caller
// for the handle's whole lifetime.
class IFrameDecoder {
 public:
  virtual ~IFrameDecoder() = default;

  // Container duration in seconds (>= 0). Fixed after open.
  virtual double DurationSeconds() const = 0;

  // Rescale target of every produced frame. Fixed after open.
  virtual OutputSize GetOutputSize() const = 0;

  // Coded dimensions of the selected video stream.
  virtual int SourceWidth() const = 0;
  virtual int SourceHeight() const = 0;

  // Repositions the stream at an absolute time and flushes decoder state.
  virtual SeekOutcome SeekToSeconds(double seconds) = 0;

  // Clamps position to [0, 1], seeks to duration * position, then decodes.
  // nullopt means the stream was exhausted (or the seek failed outright).
  virtual std::optional<Frame> SeekAndDecode(double normalized_position) = 0;

  // Decodes the next frame from the current read position.
  // nullopt signals end-of-stream; it is not an error.
  virtual std::optional<Frame> DecodeNextFrame() = 0;
};

// Result of opening a handle. Mirrors the Success()/Failure() result idiom
// used across the project.
struct OpenResult {
  bool ok = false;
  OpenError error = OpenError::kNone;
  std::string detail;
  std::unique_ptr<IFrameDecoder> decoder;

  static OpenResult Success(std::unique_ptr<IFrameDecoder> decoder) {
    OpenResult result;
    result.ok = true;
    result.decoder = std::move(decoder);
    return result;
  }

  static OpenResult Failure(OpenError error, const std::string& detail = "") {
    OpenResult result;
    result.error = error;
    result.detail = detail;
    return result;
  }
};

// Opens a handle for a file path. Invoked on the actor thread that will own
// the handle (hover) or on the caller thread before ownership is handed to
// the decode thread (playback).
using DecoderFactory = std::function<OpenResult(const std::string& path)>;

}  // namespace vidcat::decode

#endif  // VIDCAT_DECODE_IFRAME_DECODER_HPP_
