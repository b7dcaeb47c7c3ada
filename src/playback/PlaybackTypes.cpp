// Repository: VidCat-media
// Component: Playback Types
// Purpose: String conversions and derived transport values.
// Copyright (c) 2025 VidCat contributors

#include "vidcat/playback/PlaybackTypes.hpp"

namespace vidcat::playback {

double TransportState::Position() const {
  if (duration_s <= 0.0) {
    return 0.0;
  }
  const double t = pending_seek_s ? *pending_seek_s : current_time_s;
  return decode::ClampNormalizedPosition(t / duration_s);
}

const char* PlaybackCommandTypeToString(PlaybackCommandType type) {
  switch (type) {
    case PlaybackCommandType::kPlay:
      return "PLAY";
    case PlaybackCommandType::kPause:
      return "PAUSE";
    case PlaybackCommandType::kSeekTo:
      return "SEEK_TO";
    case PlaybackCommandType::kStop:
      return "STOP";
  }
  return "UNKNOWN";
}

const char* PlaybackPhaseToString(PlaybackPhase phase) {
  switch (phase) {
    case PlaybackPhase::kStopped:
      return "STOPPED";
    case PlaybackPhase::kPaused:
      return "PAUSED";
    case PlaybackPhase::kPlaying:
      return "PLAYING";
  }
  return "UNKNOWN";
}

}  // namespace vidcat::playback
