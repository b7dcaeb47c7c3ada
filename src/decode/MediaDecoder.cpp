// Repository: VidCat-media
// Component: Media Decoder
// Purpose: Opens one media file with libavformat/libavcodec and produces
//          RGBA frames rescaled to a bounded output size.
// Copyright (c) 2025 VidCat contributors

#include "vidcat/decode/MediaDecoder.hpp"

#include <cmath>
#include <cstring>
#include <limits>
#include <sstream>
#include <utility>

#include "vidcat/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/imgutils.h>
#include <libavutil/log.h>
#include <libavutil/mem.h>  // av_freep (for av_image_alloc buffer)
#include <libavutil/pixdesc.h>
#include <libswscale/swscale.h>
}

namespace vidcat::decode {

using vidcat::util::Logger;

namespace {

// Consecutive send/receive failures tolerated within one decode step before
// it gives up and reports "no frame".
constexpr int kMaxConsecutiveDecodeErrors = 32;

// Timestamps within this distance of a precise-seek target count as on target.
constexpr double kPrerollEpsilonS = 0.001;

std::string AvErrorString(int errnum) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(errnum, errbuf, sizeof(errbuf));
  return std::string(errbuf);
}

}  // namespace

MediaDecoder::MediaDecoder(const std::string& path, const DecoderConfig& config)
    : path_(path), config_(config) {}

MediaDecoder::~MediaDecoder() {
  Close();
}

OpenResult MediaDecoder::Open(const std::string& path, const DecoderConfig& config) {
  // Suppress FFmpeg warnings but keep errors visible
  av_log_set_level(AV_LOG_ERROR);

  std::unique_ptr<MediaDecoder> decoder(new MediaDecoder(path, config));

  std::string detail;
  OpenError error = decoder->OpenInput(detail);
  if (error == OpenError::kNone) error = decoder->FindVideoStream(detail);
  if (error == OpenError::kNone) error = decoder->InitializeCodec(detail);
  if (error == OpenError::kNone) error = decoder->InitializeScaler(detail);

  if (error != OpenError::kNone) {
    std::ostringstream oss;
    oss << "[MediaDecoder] open FAILED uri=" << path
        << " error=" << OpenErrorToString(error)
        << " detail=" << detail;
    Logger::Error(oss.str());
    return OpenResult::Failure(error, detail);
  }

  { std::ostringstream oss;
    oss << "[MediaDecoder] open OK uri=" << path
        << " source=" << decoder->source_width_ << "x" << decoder->source_height_
        << " output=" << decoder->output_size_.width << "x" << decoder->output_size_.height
        << " duration_s=" << decoder->duration_s_
        << " seek_mode=" << (config.seek_mode == SeekMode::kPrecise ? "precise" : "keyframe");
    Logger::Info(oss.str()); }

  return OpenResult::Success(std::move(decoder));
}

DecoderFactory MediaDecoder::MakeFactory(const DecoderConfig& config) {
  return [config](const std::string& path) { return MediaDecoder::Open(path, config); };
}

// =============================================================================
// Open steps
// =============================================================================

OpenError MediaDecoder::OpenInput(std::string& detail) {
  int ret = avformat_open_input(&format_ctx_, path_.c_str(), nullptr, nullptr);
  if (ret < 0) {
    // avformat_open_input frees the context on failure.
    format_ctx_ = nullptr;
    detail = "open_input: " + AvErrorString(ret);
    return OpenError::kUnreadableFile;
  }

  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    detail = "find_stream_info: " + AvErrorString(ret);
    return OpenError::kNoStreamInfo;
  }
  return OpenError::kNone;
}

OpenError MediaDecoder::FindVideoStream(std::string& detail) {
  int index = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (index < 0) {
    detail = "find_best_stream: " + AvErrorString(index);
    return OpenError::kNoVideoStream;
  }
  video_stream_index_ = index;

  AVStream* stream = format_ctx_->streams[video_stream_index_];
  time_base_ = av_q2d(stream->time_base);
  start_pts_ = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;

  AVRational rate = av_guess_frame_rate(format_ctx_, stream, nullptr);
  if (rate.num > 0 && rate.den > 0) {
    frame_interval_s_ = 1.0 / av_q2d(rate);
  }

  // Container duration first; stream-level duration when the container has none.
  if (format_ctx_->duration != AV_NOPTS_VALUE && format_ctx_->duration > 0) {
    duration_s_ = static_cast<double>(format_ctx_->duration) / AV_TIME_BASE;
  } else if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
    duration_s_ = static_cast<double>(stream->duration) * time_base_;
  } else {
    duration_s_ = 0.0;
  }
  return OpenError::kNone;
}

OpenError MediaDecoder::InitializeCodec(std::string& detail) {
  AVCodecParameters* codecpar = format_ctx_->streams[video_stream_index_]->codecpar;

  const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
  if (!codec) {
    detail = std::string("no decoder for codec ") + avcodec_get_name(codecpar->codec_id);
    return OpenError::kUnsupportedCodec;
  }

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    detail = "avcodec_alloc_context3";
    return OpenError::kOutOfMemory;
  }

  int ret = avcodec_parameters_to_context(codec_ctx_, codecpar);
  if (ret < 0) {
    detail = "parameters_to_context: " + AvErrorString(ret);
    return OpenError::kCodecInitFailed;
  }

  // 0 lets FFmpeg pick the thread count.
  codec_ctx_->thread_count = config_.max_decode_threads;
  codec_ctx_->thread_type = FF_THREAD_FRAME;

  ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    detail = "avcodec_open2: " + AvErrorString(ret);
    return OpenError::kCodecInitFailed;
  }

  source_width_ = codec_ctx_->width;
  source_height_ = codec_ctx_->height;
  output_size_ = ComputeOutputSize(source_width_, source_height_, config_.max_output_width);
  if (output_size_.width <= 0) {
    detail = "unknown frame size";
    return OpenError::kCodecInitFailed;
  }
  return OpenError::kNone;
}

OpenError MediaDecoder::InitializeScaler(std::string& detail) {
  frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!frame_ || !packet_) {
    detail = "frame/packet alloc";
    return OpenError::kOutOfMemory;
  }

  if (av_image_alloc(scaled_data_, scaled_linesize_, output_size_.width,
                     output_size_.height, AV_PIX_FMT_RGBA, 32) < 0) {
    detail = "av_image_alloc";
    return OpenError::kOutOfMemory;
  }

  // Some demuxers only learn the pixel format from the first decoded frame;
  // ConvertFrame() builds the context lazily in that case.
  if (codec_ctx_->pix_fmt != AV_PIX_FMT_NONE) {
    sws_ctx_ = sws_getContext(
        source_width_, source_height_, codec_ctx_->pix_fmt,
        output_size_.width, output_size_.height, AV_PIX_FMT_RGBA,
        SWS_BILINEAR, nullptr, nullptr, nullptr);
    if (!sws_ctx_) {
      detail = std::string("sws_getContext from ") +
               (av_get_pix_fmt_name(codec_ctx_->pix_fmt) ? av_get_pix_fmt_name(codec_ctx_->pix_fmt) : "?");
      return OpenError::kScalerInitFailed;
    }
  }
  return OpenError::kNone;
}

void MediaDecoder::Close() {
  if (format_ctx_ || codec_ctx_) {
    std::ostringstream oss;
    oss << "[MediaDecoder] close uri=" << path_
        << " frames_decoded=" << stats_.frames_decoded
        << " decode_errors=" << stats_.decode_errors
        << " seeks=" << stats_.seeks
        << " seek_fallbacks=" << stats_.seek_fallbacks;
    Logger::Debug(oss.str());
  }

  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }

  // scaled_data_ was allocated with av_image_alloc(); one buffer backs all planes.
  if (scaled_data_[0]) {
    av_freep(&scaled_data_[0]);
  }

  if (frame_) {
    av_frame_free(&frame_);
  }

  if (packet_) {
    av_packet_free(&packet_);
  }

  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }

  if (format_ctx_) {
    avformat_close_input(&format_ctx_);
  }

  video_stream_index_ = -1;
}

// =============================================================================
// Seeking
// =============================================================================

std::optional<Frame> MediaDecoder::SeekAndDecode(double normalized_position) {
  const double position = ClampNormalizedPosition(normalized_position);
  const SeekOutcome outcome = SeekToSeconds(duration_s_ * position);

  // A failed seek still flushed the decoder; decode from wherever the
  // container is (the frame is flagged approximate).
  std::optional<Frame> frame = DecodeNextFrame();

  if (Logger::DebugEnabled()) {
    std::ostringstream oss;
    oss << "[MediaDecoder] seek_and_decode uri=" << path_
        << " position=" << position
        << " seek=" << SeekOutcomeToString(outcome);
    if (frame) {
      oss << " frame_ts=" << frame->timestamp_s;
    } else {
      oss << " frame=none";
    }
    Logger::Debug(oss.str());
  }
  return frame;
}

SeekOutcome MediaDecoder::SeekToSeconds(double seconds) {
  if (!format_ctx_ || !codec_ctx_) {
    return SeekOutcome::kFailed;
  }
  if (std::isnan(seconds) || seconds < 0.0) {
    seconds = 0.0;
  }

  stats_.seeks++;
  SeekOutcome outcome = SeekContainer(seconds);

  // Flush decoder buffers so no pre-seek frame leaks out.
  avcodec_flush_buffers(codec_ctx_);
  draining_ = false;
  exhausted_ = false;
  has_held_frame_ = false;
  has_last_timestamp_ = false;
  last_seek_fell_back_ = (outcome != SeekOutcome::kOnTarget);

  if (outcome == SeekOutcome::kOnTarget && config_.seek_mode == SeekMode::kPrecise) {
    PrerollTo(seconds);
  }
  return outcome;
}

SeekOutcome MediaDecoder::SeekContainer(double seconds) {
  int64_t target_us = static_cast<int64_t>(std::llround(seconds * AV_TIME_BASE));
  if (format_ctx_->start_time != AV_NOPTS_VALUE) {
    target_us += format_ctx_->start_time;
  }

  // Land on the keyframe at or before the target.
  int ret = avformat_seek_file(format_ctx_, -1, std::numeric_limits<int64_t>::min(),
                               target_us, target_us, 0);
  if (ret >= 0) {
    return SeekOutcome::kOnTarget;
  }

  { std::ostringstream oss;
    oss << "[MediaDecoder] seek FAILED uri=" << path_
        << " target_s=" << seconds
        << " err=" << AvErrorString(ret)
        << " (retrying at stream start)";
    Logger::Warn(oss.str()); }

  ret = av_seek_frame(format_ctx_, video_stream_index_, start_pts_, AVSEEK_FLAG_BACKWARD);
  if (ret >= 0) {
    stats_.seek_fallbacks++;
    return SeekOutcome::kFellBackToStart;
  }

  { std::ostringstream oss;
    oss << "[MediaDecoder] fallback seek FAILED uri=" << path_
        << " err=" << AvErrorString(ret);
    Logger::Warn(oss.str()); }
  return SeekOutcome::kFailed;
}

void MediaDecoder::PrerollTo(double target_s) {
  int discarded = 0;
  while (ReceiveFrame()) {
    const double ts = FrameTimestamp(frame_);
    if (ts + kPrerollEpsilonS >= target_s || discarded >= config_.max_preroll_frames) {
      has_held_frame_ = true;
      break;
    }
    last_timestamp_s_ = ts;
    has_last_timestamp_ = true;
    ++discarded;
  }
  stats_.preroll_frames_discarded += static_cast<uint64_t>(discarded);

  std::ostringstream oss;
  oss << "[MediaDecoder] preroll uri=" << path_
      << " target_s=" << target_s
      << " discarded=" << discarded
      << " on_target=" << (has_held_frame_ ? "yes" : "no");
  Logger::Debug(oss.str());
}

// =============================================================================
// Decoding
// =============================================================================

std::optional<Frame> MediaDecoder::DecodeNextFrame() {
  if (!format_ctx_ || !codec_ctx_) {
    return std::nullopt;
  }
  if (has_held_frame_) {
    has_held_frame_ = false;
    return ConvertFrame();
  }
  if (!ReceiveFrame()) {
    return std::nullopt;
  }
  return ConvertFrame();
}

bool MediaDecoder::ReceiveFrame() {
  if (exhausted_) {
    return false;
  }

  int consecutive_errors = 0;
  while (true) {
    int ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret >= 0) {
      return true;
    }
    if (ret == AVERROR_EOF) {
      exhausted_ = true;
      return false;
    }
    if (ret != AVERROR(EAGAIN)) {
      stats_.decode_errors++;
      if (++consecutive_errors >= kMaxConsecutiveDecodeErrors) {
        Logger::Warn("[MediaDecoder] receive_frame failing repeatedly uri=" + path_ +
                     " err=" + AvErrorString(ret));
        return false;
      }
      continue;
    }
    if (draining_) {
      exhausted_ = true;
      return false;
    }

    ret = av_read_frame(format_ctx_, packet_);
    if (ret < 0) {
      if (ret != AVERROR_EOF) {
        stats_.decode_errors++;
        Logger::Warn("[MediaDecoder] read_frame FAILED uri=" + path_ +
                     " err=" + AvErrorString(ret) + " (treating as end of stream)");
      }
      // End of container: drain frames still buffered inside the decoder.
      int flush_ret = avcodec_send_packet(codec_ctx_, nullptr);
      if (flush_ret < 0 && flush_ret != AVERROR_EOF) {
        exhausted_ = true;
        return false;
      }
      draining_ = true;
      continue;
    }

    if (packet_->stream_index != video_stream_index_) {
      av_packet_unref(packet_);
      continue;
    }

    ret = avcodec_send_packet(codec_ctx_, packet_);
    av_packet_unref(packet_);
    if (ret < 0 && ret != AVERROR(EAGAIN)) {
      // Corrupt packet: skip it and keep reading.
      stats_.decode_errors++;
      if (++consecutive_errors >= kMaxConsecutiveDecodeErrors) {
        Logger::Warn("[MediaDecoder] send_packet failing repeatedly uri=" + path_ +
                     " err=" + AvErrorString(ret));
        return false;
      }
    }
  }
}

double MediaDecoder::FrameTimestamp(const AVFrame* frame) {
  int64_t pts = frame->best_effort_timestamp;
  if (pts == AV_NOPTS_VALUE) {
    pts = frame->pts;
  }
  if (pts == AV_NOPTS_VALUE) {
    return has_last_timestamp_ ? last_timestamp_s_ + frame_interval_s_ : 0.0;
  }
  return static_cast<double>(pts - start_pts_) * time_base_;
}

std::optional<Frame> MediaDecoder::ConvertFrame() {
  const AVPixelFormat src_format = static_cast<AVPixelFormat>(frame_->format);
  sws_ctx_ = sws_getCachedContext(
      sws_ctx_, frame_->width, frame_->height, src_format,
      output_size_.width, output_size_.height, AV_PIX_FMT_RGBA,
      SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    stats_.decode_errors++;
    Logger::Warn("[MediaDecoder] scaler unavailable for frame uri=" + path_);
    av_frame_unref(frame_);
    return std::nullopt;
  }

  sws_scale(sws_ctx_,
            frame_->data, frame_->linesize, 0, frame_->height,
            scaled_data_, scaled_linesize_);

  Frame out;
  out.width = output_size_.width;
  out.height = output_size_.height;
  out.timestamp_s = FrameTimestamp(frame_);
  out.approximate = last_seek_fell_back_;

  // The scaler's line stride may exceed the row width; copy row by row.
  const size_t row_bytes = static_cast<size_t>(out.width) * kBytesPerPixel;
  out.rgba.resize(out.ExpectedSize());
  uint8_t* dst = out.rgba.data();
  for (int y = 0; y < out.height; y++) {
    std::memcpy(dst + static_cast<size_t>(y) * row_bytes,
                scaled_data_[0] + static_cast<size_t>(y) * scaled_linesize_[0],
                row_bytes);
  }

  last_timestamp_s_ = out.timestamp_s;
  has_last_timestamp_ = true;
  stats_.frames_decoded++;
  av_frame_unref(frame_);
  return out;
}

}  // namespace vidcat::decode
