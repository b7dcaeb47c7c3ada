// Repository: VidCat-media
// Component: PlaybackActor
// Purpose: One playback session: a decode thread that owns its decoder,
//          paces decoding to a fixed frame interval and exposes transport
//          state plus a frame channel to the render loop.
// Copyright (c) 2025 VidCat contributors

#ifndef VIDCAT_PLAYBACK_PLAYBACK_ACTOR_HPP_
#define VIDCAT_PLAYBACK_PLAYBACK_ACTOR_HPP_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "vidcat/decode/DecodeTypes.hpp"
#include "vidcat/decode/IFrameDecoder.hpp"
#include "vidcat/playback/PlaybackTypes.hpp"

namespace vidcat::playback {

class PlaybackActor;

struct PlaybackOpenResult {
  bool ok = false;
  decode::OpenError error = decode::OpenError::kNone;
  std::string detail;
  std::unique_ptr<PlaybackActor> actor;
};

// PlaybackActor runs one open video on its own decode thread.
//
// Lifecycle:
// 1. Open() opens the decoder on the caller thread and starts the decode
//    thread paused (Paused). The decoder then belongs to that thread.
// 2. Play()/Pause()/TogglePlayback()/Seek() update the shared transport
//    state immediately and forward a command to the decode thread.
// 3. GetFrame() is polled once per render tick.
// 4. Stop() (or destruction) ends the loop and joins the thread (Stopped).
//
// Decode loop, per iteration:
// - Drain every queued command without blocking. A burst collapses to the
//   last play/pause intent and the last seek target; kStop ends the loop.
// - Perform the seek, if any. Frames still queued from before it are dropped.
// - Paused: wait up to paused_poll_interval for a command, then loop.
// - Playing: sleep off the rest of frame_interval, decode one frame, publish
//   its timestamp as current time and queue it. No frame = end of stream,
//   which pauses playback.
//
// Thread safety: all public methods may be called from any thread. The
// state lock is never held across a decode step.
class PlaybackActor {
 public:
  struct Stats {
    uint64_t frames_produced = 0;
    uint64_t frames_dropped = 0;  // Oldest undelivered frame evicted
    uint64_t frames_discarded_by_seek = 0;
    uint64_t seeks_completed = 0;
    uint64_t seek_fallbacks = 0;
    uint64_t end_of_stream_pauses = 0;
  };

  // Opens path with MediaDecoder and config.decoder.
  static PlaybackOpenResult Open(const std::string& path,
                                 const PlaybackConfig& config = PlaybackConfig());

  static PlaybackOpenResult Open(const std::string& path, const PlaybackConfig& config,
                                 const decode::DecoderFactory& factory);

  ~PlaybackActor();

  PlaybackActor(const PlaybackActor&) = delete;
  PlaybackActor& operator=(const PlaybackActor&) = delete;

  void Play();
  void Pause();
  void TogglePlayback();

  // position is clamped to [0, 1]; the target is position * duration.
  void Seek(double normalized_position);

  // current_time / duration in [0, 1] (the pending seek target while one
  // is outstanding).
  double CurrentPosition() const;
  double CurrentTime() const;
  double Duration() const;
  bool IsPlaying() const;

  // Non-blocking. Oldest undelivered frame, or nullopt.
  std::optional<decode::Frame> GetFrame();

  // Ends the decode loop and joins the thread. Idempotent.
  void Stop();

  TransportState Snapshot() const;
  PlaybackPhase Phase() const;
  bool IsSeeking() const;
  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  const std::string& Path() const { return path_; }
  decode::OutputSize OutputSize() const { return output_size_; }
  int SourceWidth() const { return source_width_; }
  int SourceHeight() const { return source_height_; }
  Stats GetStats() const;

 private:
  // Only Open() constructs, so it allocates with new rather than make_unique.
  PlaybackActor(const std::string& path, const PlaybackConfig& config,
                std::unique_ptr<decode::IFrameDecoder> decoder);

  void SendCommand(const PlaybackCommand& command);

  void DecodeLoop(std::unique_ptr<decode::IFrameDecoder> decoder);
  void PerformSeek(decode::IFrameDecoder& decoder, double target_s);
  void PublishFrame(decode::Frame frame);
  void HandleEndOfStream();

  std::string path_;
  PlaybackConfig config_;
  decode::OutputSize output_size_;
  int source_width_ = 0;
  int source_height_ = 0;

  // Shared transport state.
  mutable std::mutex state_mutex_;
  TransportState state_;
  Stats stats_;

  // Caller -> decode thread.
  std::mutex command_mutex_;
  std::condition_variable command_cv_;
  std::deque<PlaybackCommand> commands_;

  // Decode thread -> caller.
  std::mutex frame_mutex_;
  std::deque<decode::Frame> frames_;

  std::atomic<bool> running_{false};
  std::mutex join_mutex_;
  std::thread decode_thread_;
};

}  // namespace vidcat::playback

#endif  // VIDCAT_PLAYBACK_PLAYBACK_ACTOR_HPP_
