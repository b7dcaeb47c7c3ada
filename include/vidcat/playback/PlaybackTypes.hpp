// Repository: VidCat-media
// Component: Playback Types
// Purpose: Transport state, command and config types for playback sessions.
// Copyright (c) 2025 VidCat contributors

#ifndef VIDCAT_PLAYBACK_PLAYBACK_TYPES_HPP_
#define VIDCAT_PLAYBACK_PLAYBACK_TYPES_HPP_

#include <chrono>
#include <cstddef>
#include <optional>

#include "vidcat/decode/DecodeTypes.hpp"
#include "vidcat/decode/DecoderConfig.hpp"

namespace vidcat::playback {

// =============================================================================
// TransportState
// =============================================================================

// TransportState is shared between the caller and the decode thread.
// Guarded by the owning actor's state lock; never held across a decode.
struct TransportState {
  bool playing = false;
  double current_time_s = 0.0;
  double duration_s = 0.0;  // Fixed after open

  // Target of a seek the decode thread has not completed yet.
  std::optional<double> pending_seek_s;

  // current_time / duration in [0, 1]; 0 when the duration is unknown.
  // A pending seek is reported as the position so the UI shows the target.
  double Position() const;
};

// =============================================================================
// Commands
// =============================================================================

enum class PlaybackCommandType {
  kPlay,
  kPause,
  kSeekTo,
  kStop,
};

const char* PlaybackCommandTypeToString(PlaybackCommandType type);

struct PlaybackCommand {
  PlaybackCommandType type = PlaybackCommandType::kPause;
  double seek_seconds = 0.0;  // kSeekTo only

  static PlaybackCommand Play() { return PlaybackCommand{PlaybackCommandType::kPlay, 0.0}; }
  static PlaybackCommand Pause() { return PlaybackCommand{PlaybackCommandType::kPause, 0.0}; }
  static PlaybackCommand SeekTo(double seconds) {
    return PlaybackCommand{PlaybackCommandType::kSeekTo, seconds};
  }
  static PlaybackCommand Stop() { return PlaybackCommand{PlaybackCommandType::kStop, 0.0}; }
};

// =============================================================================
// Phase
// =============================================================================

// Stopped -> Paused -> Playing <-> Paused. Seeking overlays Paused/Playing
// and is reported separately (PlaybackActor::IsSeeking).
enum class PlaybackPhase {
  kStopped,
  kPaused,
  kPlaying,
};

const char* PlaybackPhaseToString(PlaybackPhase phase);

// =============================================================================
// Config
// =============================================================================

// Full-size frames, seeks land on the requested frame.
inline decode::DecoderConfig DefaultPlaybackDecoderConfig() {
  decode::DecoderConfig config;
  config.max_output_width = 1280;
  config.max_decode_threads = 0;
  config.seek_mode = decode::SeekMode::kPrecise;
  return config;
}

struct PlaybackConfig {
  decode::DecoderConfig decoder = DefaultPlaybackDecoderConfig();

  // Target pacing of the decode loop while playing (~30 fps).
  std::chrono::microseconds frame_interval{33333};

  // How long the paused loop waits for a command before re-checking.
  std::chrono::milliseconds paused_poll_interval{16};

  // Undelivered frames kept for the consumer; the oldest is dropped beyond
  // this bound. 0 = unbounded.
  size_t max_buffered_frames = 120;
};

}  // namespace vidcat::playback

#endif  // VIDCAT_PLAYBACK_PLAYBACK_TYPES_HPP_
