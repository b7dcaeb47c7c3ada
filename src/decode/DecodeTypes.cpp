// Repository: VidCat-media
// Component: Decode Types Implementation
// Copyright (c) 2025 VidCat contributors

#include "vidcat/decode/DecodeTypes.hpp"

#include <algorithm>
#include <cmath>

namespace vidcat::decode {

OutputSize ComputeOutputSize(int source_width, int source_height, int max_width) {
  if (source_width <= 0 || source_height <= 0) {
    return OutputSize{0, 0};
  }
  int width = source_width;
  if (max_width > 0) {
    width = std::min(source_width, max_width);
  }
  const double scale = static_cast<double>(width) / source_width;
  int height = static_cast<int>(std::lround(source_height * scale));
  return OutputSize{width, std::max(height, 1)};
}

double ClampNormalizedPosition(double position) {
  if (std::isnan(position)) return 0.0;
  return std::clamp(position, 0.0, 1.0);
}

const char* OpenErrorToString(OpenError error) {
  switch (error) {
    case OpenError::kNone:
      return "NONE";
    case OpenError::kUnreadableFile:
      return "UNREADABLE_FILE";
    case OpenError::kNoStreamInfo:
      return "NO_STREAM_INFO";
    case OpenError::kNoVideoStream:
      return "NO_VIDEO_STREAM";
    case OpenError::kUnsupportedCodec:
      return "UNSUPPORTED_CODEC";
    case OpenError::kCodecInitFailed:
      return "CODEC_INIT_FAILED";
    case OpenError::kScalerInitFailed:
      return "SCALER_INIT_FAILED";
    case OpenError::kOutOfMemory:
      return "OUT_OF_MEMORY";
  }
  return "UNKNOWN_ERROR";
}

const char* SeekOutcomeToString(SeekOutcome outcome) {
  switch (outcome) {
    case SeekOutcome::kOnTarget:
      return "ON_TARGET";
    case SeekOutcome::kFellBackToStart:
      return "FELL_BACK_TO_START";
    case SeekOutcome::kFailed:
      return "FAILED";
  }
  return "UNKNOWN";
}

}  // namespace vidcat::decode
