// Repository: VidCat-media
// Component: HoverScrubActor
// Purpose: Background hover-scrub decoding with latest-wins request
//          coalescing and stale-result rejection.
// Copyright (c) 2025 VidCat contributors

#include "vidcat/scrub/HoverScrubActor.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

#include "vidcat/decode/FrameFingerprint.hpp"
#include "vidcat/decode/MediaDecoder.hpp"
#include "vidcat/util/Logger.hpp"

namespace vidcat::scrub {

using vidcat::util::Logger;

const char* HoverStateToString(HoverScrubActor::State state) {
  switch (state) {
    case HoverScrubActor::State::kIdle:
      return "IDLE";
    case HoverScrubActor::State::kDecoderOpen:
      return "DECODER_OPEN";
  }
  return "UNKNOWN";
}

HoverScrubActor::HoverScrubActor(const HoverScrubConfig& config)
    : HoverScrubActor(config, decode::MediaDecoder::MakeFactory(config.decoder)) {}

HoverScrubActor::HoverScrubActor(const HoverScrubConfig& config,
                                 decode::DecoderFactory factory)
    : config_(config),
      factory_(std::move(factory)),
      preview_size_(config.default_preview_size) {
  Start();
}

HoverScrubActor::~HoverScrubActor() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // No new decode work after the stop signal; an in-flight decode finishes.
    requests_.clear();
    Request stop;
    stop.type = RequestType::kStop;
    requests_.push_back(std::move(stop));
    completed_.reset();
  }
  request_cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void HoverScrubActor::Start() {
  worker_ = std::thread(&HoverScrubActor::WorkerLoop, this);
}

// =============================================================================
// Caller side (render loop)
// =============================================================================

void HoverScrubActor::RequestFrame(const std::string& path, double position) {
  position = decode::ClampNormalizedPosition(position);
  const int key = GridKey(position);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    wanted_path_ = path;

    if (last_requested_ && last_requested_->first == path &&
        last_requested_->second == key) {
      stats_.requests_deduplicated++;
      return;
    }
    last_requested_ = std::make_pair(path, key);

    // A finished preview of another video is already stale.
    if (completed_ && completed_->video_path != path) {
      completed_.reset();
      stats_.stale_frames_dropped++;
    }

    Request request;
    request.type = RequestType::kDecode;
    request.path = path;
    request.position = position;
    request.generation = generation_;
    EnqueueLocked(std::move(request));
    stats_.requests_sent++;
  }
  request_cv_.notify_one();
}

std::optional<HoverFrame> HoverScrubActor::PollFrame() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!completed_) {
    return std::nullopt;
  }
  HoverFrame result = std::move(*completed_);
  completed_.reset();

  if (result.video_path != wanted_path_) {
    stats_.stale_frames_dropped++;
    return std::nullopt;
  }
  preview_size_ = decode::OutputSize{result.frame.width, result.frame.height};
  return result;
}

void HoverScrubActor::ClearPending() {
  std::lock_guard<std::mutex> lock(mutex_);
  generation_++;
  last_requested_.reset();
  wanted_path_.clear();
  completed_.reset();
  requests_.erase(
      std::remove_if(requests_.begin(), requests_.end(),
                     [](const Request& r) { return r.type == RequestType::kDecode; }),
      requests_.end());
}

void HoverScrubActor::ReleaseDecoder() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Request release;
    release.type = RequestType::kReleaseDecoder;
    EnqueueLocked(std::move(release));
  }
  request_cv_.notify_one();
}

decode::OutputSize HoverScrubActor::GetPreviewSize() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return preview_size_;
}

HoverScrubActor::State HoverScrubActor::GetState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::string HoverScrubActor::OpenVideoPath() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_path_;
}

HoverScrubActor::Stats HoverScrubActor::GetStats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void HoverScrubActor::EnqueueLocked(Request request) {
  // Latest wins: a decode request that has not started yet is replaced, as
  // long as nothing else was queued behind it.
  if (request.type == RequestType::kDecode && !requests_.empty() &&
      requests_.back().type == RequestType::kDecode) {
    requests_.back() = std::move(request);
    stats_.requests_superseded++;
    return;
  }
  requests_.push_back(std::move(request));
}

int HoverScrubActor::GridKey(double position) const {
  const int steps = config_.position_grid_steps > 0 ? config_.position_grid_steps : 100;
  return static_cast<int>(std::lround(position * steps));
}

// =============================================================================
// Worker thread
// =============================================================================

void HoverScrubActor::WorkerLoop() {
  while (true) {
    Request request;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      request_cv_.wait(lock, [this] { return !requests_.empty(); });
      request = std::move(requests_.front());
      requests_.pop_front();
    }

    switch (request.type) {
      case RequestType::kDecode:
        HandleDecode(request);
        break;
      case RequestType::kReleaseDecoder:
        HandleRelease();
        break;
      case RequestType::kStop:
        HandleRelease();
        return;
    }
  }
}

void HoverScrubActor::HandleDecode(const Request& request) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (request.generation != generation_) {
      return;  // Cleared before the worker picked it up.
    }
    stats_.decode_attempts++;
  }

  // Reuse the open decoder for the same video; otherwise swap handles.
  if (!decoder_ || open_path_ != request.path) {
    HandleRelease();

    decode::OpenResult opened = factory_(request.path);
    if (!opened.ok || !opened.decoder) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.open_failures++;
      }
      std::ostringstream oss;
      oss << "[HoverScrub] open failed, no preview uri=" << request.path
          << " error=" << decode::OpenErrorToString(opened.error);
      Logger::Debug(oss.str());
      return;
    }

    decoder_ = std::move(opened.decoder);
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = State::kDecoderOpen;
    open_path_ = request.path;
    stats_.decoder_opens++;
  }

  std::optional<decode::Frame> frame = decoder_->SeekAndDecode(request.position);
  if (!frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.decode_misses++;
    return;
  }

  // Fingerprint and log outside mutex_.
  if (Logger::DebugEnabled()) {
    std::ostringstream oss;
    oss << "[HoverScrub] decoded uri=" << request.path
        << " position=" << request.position
        << " frame=" << decode::FormatFingerprint(decode::FingerprintFrame(*frame));
    Logger::Debug(oss.str());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (request.generation != generation_) {
    stats_.stale_frames_dropped++;
    return;
  }

  HoverFrame result;
  result.video_path = request.path;
  result.position = request.position;
  result.frame = std::move(*frame);
  completed_ = std::move(result);
  stats_.frames_published++;
}

void HoverScrubActor::HandleRelease() {
  // Destroy the handle on this thread; it never leaves the worker.
  decoder_.reset();
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = State::kIdle;
  open_path_.clear();
}

}  // namespace vidcat::scrub
