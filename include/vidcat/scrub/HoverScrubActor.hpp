// Repository: VidCat-media
// Component: HoverScrubActor
// Purpose: Moves hover-scrub decoding off the render loop. One persistent
//          worker thread owns at most one open decoder, coalesces scrub
//          requests (latest wins) and hands back the newest decoded frame.
// Copyright (c) 2025 VidCat contributors

#ifndef VIDCAT_SCRUB_HOVER_SCRUB_ACTOR_HPP_
#define VIDCAT_SCRUB_HOVER_SCRUB_ACTOR_HPP_

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include "vidcat/decode/DecodeTypes.hpp"
#include "vidcat/decode/DecoderConfig.hpp"
#include "vidcat/decode/IFrameDecoder.hpp"

namespace vidcat::scrub {

// Small previews, fast keyframe seeks, one decode thread per handle.
inline decode::DecoderConfig DefaultHoverDecoderConfig() {
  decode::DecoderConfig config;
  config.max_output_width = 320;
  config.max_decode_threads = 1;
  config.seek_mode = decode::SeekMode::kKeyframe;
  return config;
}

struct HoverScrubConfig {
  decode::DecoderConfig decoder = DefaultHoverDecoderConfig();

  // Positions are compared on a grid of this many steps (100 = 1%) when
  // deduplicating requests.
  int position_grid_steps = 100;

  // Reported by GetPreviewSize() until the first frame is delivered.
  decode::OutputSize default_preview_size{320, 180};
};

// HoverFrame is a decoded preview tagged with the video it came from.
struct HoverFrame {
  std::string video_path;
  double position = 0.0;
  decode::Frame frame;
};

// HoverScrubActor decodes hover-scrub previews on a dedicated worker thread.
//
// Render loop (caller): RequestFrame() on pointer motion, PollFrame() once per
// tick, ClearPending() when the hover target disappears. None of these block
// on decode work; they only take the actor's short internal lock.
//
// Worker thread: waits on the request queue, opens a decoder only when the
// requested video differs from the open one, seeks and decodes, and publishes
// the result into a single latest-wins slot. Decode failures publish nothing.
//
// State machine: kIdle -> kDecoderOpen(video) -> kDecoderOpen(other video);
// kDecoderOpen -> kIdle only on ReleaseDecoder() (or a failed open).
//
// Stale results are rejected twice: by generation (bumped by ClearPending)
// when the worker publishes, and by video identity when the caller polls.
//
// Thread safety: public methods may be called from any thread, but the
// intended caller is a single render loop.
class HoverScrubActor {
 public:
  enum class State { kIdle, kDecoderOpen };

  struct Stats {
    uint64_t requests_sent = 0;
    uint64_t requests_deduplicated = 0;
    uint64_t requests_superseded = 0;
    uint64_t decode_attempts = 0;
    uint64_t decoder_opens = 0;
    uint64_t open_failures = 0;
    uint64_t decode_misses = 0;
    uint64_t frames_published = 0;
    uint64_t stale_frames_dropped = 0;
  };

  // Uses MediaDecoder with config.decoder.
  explicit HoverScrubActor(const HoverScrubConfig& config = HoverScrubConfig());
  HoverScrubActor(const HoverScrubConfig& config, decode::DecoderFactory factory);

  // Stops the worker after its current unit of work and joins it.
  ~HoverScrubActor();

  HoverScrubActor(const HoverScrubActor&) = delete;
  HoverScrubActor& operator=(const HoverScrubActor&) = delete;

  // Non-blocking. Drops the request if (path, position on grid) equals the
  // previous one; otherwise replaces any not-yet-started request.
  void RequestFrame(const std::string& path, double position);

  // Non-blocking. Returns the newest completed decode for the most recently
  // requested video, or nullopt.
  std::optional<HoverFrame> PollFrame();

  // Drops the outstanding request and discards any decoded-but-unpolled frame,
  // including one still being decoded.
  void ClearPending();

  // Asks the worker to close its decoder (kDecoderOpen -> kIdle).
  void ReleaseDecoder();

  // Size of the last delivered frame, or config.default_preview_size.
  decode::OutputSize GetPreviewSize() const;

  State GetState() const;
  std::string OpenVideoPath() const;
  Stats GetStats() const;

 private:
  enum class RequestType { kDecode, kReleaseDecoder, kStop };

  struct Request {
    RequestType type = RequestType::kDecode;
    std::string path;
    double position = 0.0;
    uint64_t generation = 0;
  };

  void Start();
  void WorkerLoop();
  void HandleDecode(const Request& request);
  void HandleRelease();

  // Caller holds mutex_.
  void EnqueueLocked(Request request);

  int GridKey(double position) const;

  HoverScrubConfig config_;
  decode::DecoderFactory factory_;

  mutable std::mutex mutex_;
  std::condition_variable request_cv_;
  std::deque<Request> requests_;

  // Dedup key of the last request sent, cleared by ClearPending().
  std::optional<std::pair<std::string, int>> last_requested_;
  // Video identity the caller currently wants frames for.
  std::string wanted_path_;
  uint64_t generation_ = 0;

  std::optional<HoverFrame> completed_;
  decode::OutputSize preview_size_;

  State state_ = State::kIdle;
  std::string open_path_;
  Stats stats_;

  // Worker-thread only.
  std::unique_ptr<decode::IFrameDecoder> decoder_;

  std::thread worker_;
};

const char* HoverStateToString(HoverScrubActor::State state);

}  // namespace vidcat::scrub

#endif  // VIDCAT_SCRUB_HOVER_SCRUB_ACTOR_HPP_
