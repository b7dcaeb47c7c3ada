// Repository: VidCat-media
// Component: PlaybackActor
// Purpose: Paced decode loop, command handling and transport state for one
//          playback session.
// Copyright (c) 2025 VidCat contributors

#include "vidcat/playback/PlaybackActor.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <utility>

#include "vidcat/decode/MediaDecoder.hpp"
#include "vidcat/util/Logger.hpp"

namespace vidcat::playback {

using vidcat::util::Logger;

PlaybackOpenResult PlaybackActor::Open(const std::string& path, const PlaybackConfig& config) {
  return Open(path, config, decode::MediaDecoder::MakeFactory(config.decoder));
}

PlaybackOpenResult PlaybackActor::Open(const std::string& path, const PlaybackConfig& config,
                                       const decode::DecoderFactory& factory) {
  PlaybackOpenResult result;

  decode::OpenResult opened = factory(path);
  if (!opened.ok || !opened.decoder) {
    result.error = opened.error;
    result.detail = opened.detail;
    std::ostringstream oss;
    oss << "[PlaybackActor] open failed uri=" << path
        << " error=" << decode::OpenErrorToString(opened.error);
    if (!opened.detail.empty()) {
      oss << " detail=" << opened.detail;
    }
    Logger::Error(oss.str());
    return result;
  }

  result.ok = true;
  result.actor.reset(new PlaybackActor(path, config, std::move(opened.decoder)));

  std::ostringstream oss;
  oss << "[PlaybackActor] opened uri=" << path
      << " duration=" << result.actor->Duration() << "s"
      << " output=" << result.actor->OutputSize().width << "x"
      << result.actor->OutputSize().height;
  Logger::Info(oss.str());
  return result;
}

PlaybackActor::PlaybackActor(const std::string& path, const PlaybackConfig& config,
                             std::unique_ptr<decode::IFrameDecoder> decoder)
    : path_(path),
      config_(config),
      output_size_(decoder->GetOutputSize()),
      source_width_(decoder->SourceWidth()),
      source_height_(decoder->SourceHeight()) {
  state_.duration_s = std::max(0.0, decoder->DurationSeconds());
  running_.store(true, std::memory_order_release);
  decode_thread_ = std::thread(&PlaybackActor::DecodeLoop, this, std::move(decoder));
}

PlaybackActor::~PlaybackActor() {
  Stop();
}

// =============================================================================
// Caller side
// =============================================================================

void PlaybackActor::Play() {
  if (!IsRunning()) return;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.playing = true;
  }
  SendCommand(PlaybackCommand::Play());
}

void PlaybackActor::Pause() {
  if (!IsRunning()) return;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.playing = false;
  }
  SendCommand(PlaybackCommand::Pause());
}

void PlaybackActor::TogglePlayback() {
  if (!IsRunning()) return;
  bool now_playing = false;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.playing = !state_.playing;
    now_playing = state_.playing;
  }
  SendCommand(now_playing ? PlaybackCommand::Play() : PlaybackCommand::Pause());
}

void PlaybackActor::Seek(double normalized_position) {
  if (!IsRunning()) return;
  const double position = decode::ClampNormalizedPosition(normalized_position);
  double target_s = 0.0;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    target_s = position * state_.duration_s;
    state_.pending_seek_s = target_s;
  }
  SendCommand(PlaybackCommand::SeekTo(target_s));
}

double PlaybackActor::CurrentPosition() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_.Position();
}

double PlaybackActor::CurrentTime() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_.current_time_s;
}

double PlaybackActor::Duration() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_.duration_s;
}

bool PlaybackActor::IsPlaying() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_.playing;
}

std::optional<decode::Frame> PlaybackActor::GetFrame() {
  std::lock_guard<std::mutex> lock(frame_mutex_);
  if (frames_.empty()) {
    return std::nullopt;
  }
  decode::Frame frame = std::move(frames_.front());
  frames_.pop_front();
  return frame;
}

void PlaybackActor::Stop() {
  std::lock_guard<std::mutex> join_lock(join_mutex_);
  if (!decode_thread_.joinable()) {
    return;
  }
  SendCommand(PlaybackCommand::Stop());
  decode_thread_.join();

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.playing = false;
    state_.pending_seek_s.reset();
  }
  {
    std::lock_guard<std::mutex> lock(frame_mutex_);
    frames_.clear();
  }

  std::ostringstream oss;
  oss << "[PlaybackActor] stopped uri=" << path_;
  Logger::Info(oss.str());
}

TransportState PlaybackActor::Snapshot() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

PlaybackPhase PlaybackActor::Phase() const {
  if (!IsRunning()) {
    return PlaybackPhase::kStopped;
  }
  return IsPlaying() ? PlaybackPhase::kPlaying : PlaybackPhase::kPaused;
}

bool PlaybackActor::IsSeeking() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_.pending_seek_s.has_value();
}

PlaybackActor::Stats PlaybackActor::GetStats() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return stats_;
}

void PlaybackActor::SendCommand(const PlaybackCommand& command) {
  {
    std::lock_guard<std::mutex> lock(command_mutex_);
    commands_.push_back(command);
  }
  command_cv_.notify_one();
}

// =============================================================================
// Decode thread
// =============================================================================

void PlaybackActor::DecodeLoop(std::unique_ptr<decode::IFrameDecoder> decoder) {
  using Clock = std::chrono::steady_clock;

  bool playing = false;
  Clock::time_point next_frame_at = Clock::now();

  while (true) {
    std::deque<PlaybackCommand> batch;
    {
      std::lock_guard<std::mutex> lock(command_mutex_);
      batch.swap(commands_);
    }

    // Collapse the burst to its effective outcome.
    bool stop = false;
    std::optional<bool> play_intent;
    std::optional<double> seek_target;
    for (const PlaybackCommand& command : batch) {
      switch (command.type) {
        case PlaybackCommandType::kPlay:
          play_intent = true;
          break;
        case PlaybackCommandType::kPause:
          play_intent = false;
          break;
        case PlaybackCommandType::kSeekTo:
          seek_target = command.seek_seconds;
          break;
        case PlaybackCommandType::kStop:
          stop = true;
          break;
      }
      if (stop) break;
    }
    if (stop) break;

    if (seek_target) {
      PerformSeek(*decoder, *seek_target);
    }

    if (play_intent) {
      if (*play_intent && !playing) {
        next_frame_at = Clock::now();
      }
      playing = *play_intent;
      // Re-assert the drained intent; an end-of-stream pause may have
      // overwritten the caller's newer request.
      std::lock_guard<std::mutex> lock(state_mutex_);
      state_.playing = playing;
    }

    if (!playing) {
      std::unique_lock<std::mutex> lock(command_mutex_);
      command_cv_.wait_for(lock, config_.paused_poll_interval,
                           [this] { return !commands_.empty(); });
      continue;
    }

    // Sleep off the rest of the frame interval, waking early for commands.
    {
      std::unique_lock<std::mutex> lock(command_mutex_);
      if (command_cv_.wait_until(lock, next_frame_at,
                                 [this] { return !commands_.empty(); })) {
        continue;
      }
    }

    next_frame_at = Clock::now() + config_.frame_interval;
    std::optional<decode::Frame> frame = decoder->DecodeNextFrame();
    if (!frame) {
      playing = false;
      HandleEndOfStream();
      continue;
    }
    PublishFrame(std::move(*frame));
  }

  // The decoder is closed on the thread that used it.
  decoder.reset();
  running_.store(false, std::memory_order_release);
}

void PlaybackActor::PerformSeek(decode::IFrameDecoder& decoder, double target_s) {
  const decode::SeekOutcome outcome = decoder.SeekToSeconds(target_s);

  size_t discarded = 0;
  {
    std::lock_guard<std::mutex> lock(frame_mutex_);
    discarded = frames_.size();
    frames_.clear();
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    switch (outcome) {
      case decode::SeekOutcome::kOnTarget:
        state_.current_time_s = target_s;
        break;
      case decode::SeekOutcome::kFellBackToStart:
        state_.current_time_s = 0.0;
        stats_.seek_fallbacks++;
        break;
      case decode::SeekOutcome::kFailed:
        break;
    }
    // A newer Seek() keeps its own pending target.
    if (state_.pending_seek_s && *state_.pending_seek_s == target_s) {
      state_.pending_seek_s.reset();
    }
    stats_.seeks_completed++;
    stats_.frames_discarded_by_seek += discarded;
  }

  if (outcome != decode::SeekOutcome::kOnTarget) {
    std::ostringstream oss;
    oss << "[PlaybackActor] seek did not reach target uri=" << path_
        << " target=" << target_s << "s"
        << " outcome=" << decode::SeekOutcomeToString(outcome);
    Logger::Warn(oss.str());
  } else if (Logger::DebugEnabled()) {
    std::ostringstream oss;
    oss << "[PlaybackActor] seek uri=" << path_ << " target=" << target_s << "s"
        << " discarded_frames=" << discarded;
    Logger::Debug(oss.str());
  }
}

void PlaybackActor::PublishFrame(decode::Frame frame) {
  const double timestamp_s = frame.timestamp_s;

  bool dropped = false;
  {
    std::lock_guard<std::mutex> lock(frame_mutex_);
    if (config_.max_buffered_frames > 0 && frames_.size() >= config_.max_buffered_frames) {
      frames_.pop_front();
      dropped = true;
    }
    frames_.push_back(std::move(frame));
  }

  std::lock_guard<std::mutex> lock(state_mutex_);
  state_.current_time_s = timestamp_s;
  stats_.frames_produced++;
  if (dropped) {
    stats_.frames_dropped++;
  }
}

void PlaybackActor::HandleEndOfStream() {
  double at_s = 0.0;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.playing = false;
    stats_.end_of_stream_pauses++;
    at_s = state_.current_time_s;
  }

  std::ostringstream oss;
  oss << "[PlaybackActor] end of stream, paused uri=" << path_ << " time=" << at_s << "s";
  Logger::Info(oss.str());
}

}  // namespace vidcat::playback
