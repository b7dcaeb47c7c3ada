// Repository: VidCat-media
// Component: Media Decoder
// Purpose: Opens one media file with libavformat/libavcodec and produces
//          RGBA frames rescaled to a bounded output size.
// Copyright (c) 2025 VidCat contributors

#ifndef VIDCAT_DECODE_MEDIA_DECODER_HPP_
#define VIDCAT_DECODE_MEDIA_DECODER_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "vidcat/decode/DecodeTypes.hpp"
#include "vidcat/decode/DecoderConfig.hpp"
#include "vidcat/decode/IFrameDecoder.hpp"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;

namespace vidcat::decode {

// MediaDecoder decodes the best video stream of a container using libavformat
// and libavcodec, and rescales every frame to RGBA with libswscale.
//
// Features:
// - Any container/codec the linked FFmpeg build supports
// - Output width bounded by DecoderConfig::max_output_width, aspect preserved
// - Keyframe or precise (preroll) seeking, always followed by a decoder flush
// - Backward seek to stream start when a seek fails (frame flagged approximate)
// - Decoder drained at end of container so buffered frames are not lost
//
// Thread Safety:
// - Not thread-safe: use from a single decode thread for its whole lifetime
//
// Lifecycle:
// 1. MediaDecoder::Open() (returns OpenResult with the handle or an error)
// 2. SeekAndDecode() / SeekToSeconds() / DecodeNextFrame() repeatedly
// 3. Destroy (releases every FFmpeg context)
class MediaDecoder : public IFrameDecoder {
 public:
  static OpenResult Open(const std::string& path, const DecoderConfig& config);

  // Returns a factory that opens MediaDecoders with a fixed config.
  static DecoderFactory MakeFactory(const DecoderConfig& config);

  ~MediaDecoder() override;

  MediaDecoder(const MediaDecoder&) = delete;
  MediaDecoder& operator=(const MediaDecoder&) = delete;

  double DurationSeconds() const override { return duration_s_; }
  OutputSize GetOutputSize() const override { return output_size_; }

  SeekOutcome SeekToSeconds(double seconds) override;
  std::optional<Frame> SeekAndDecode(double normalized_position) override;
  std::optional<Frame> DecodeNextFrame() override;

  int SourceWidth() const override { return source_width_; }
  int SourceHeight() const override { return source_height_; }
  const std::string& Path() const { return path_; }
  const DecoderStats& GetStats() const { return stats_; }

  // True once the container and decoder are both drained.
  bool IsExhausted() const { return exhausted_; }

 private:
  // Only Open() constructs, so it allocates with new rather than make_unique.
  MediaDecoder(const std::string& path, const DecoderConfig& config);

  // Open steps. Each returns kNone on success and fills detail on failure.
  OpenError OpenInput(std::string& detail);
  OpenError FindVideoStream(std::string& detail);
  OpenError InitializeCodec(std::string& detail);
  OpenError InitializeScaler(std::string& detail);

  void Close();

  // Seeks the container to an absolute presentation time (seconds from
  // stream start), falling back to a backward seek to the stream start.
  SeekOutcome SeekContainer(double seconds);

  // Decodes and discards frames until one reaches target_s. The on-target
  // frame stays in frame_ and is returned by the next DecodeNextFrame().
  void PrerollTo(double target_s);

  // Pulls packets of the selected stream until the decoder yields a frame
  // into frame_. Returns false once the stream is exhausted.
  bool ReceiveFrame();

  // Rescales frame_ to RGBA and copies it out row by row (stride-aware).
  std::optional<Frame> ConvertFrame();

  double FrameTimestamp(const AVFrame* frame);

  std::string path_;
  DecoderConfig config_;
  DecoderStats stats_;

  // FFmpeg contexts (opaque pointers)
  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwsContext* sws_ctx_ = nullptr;

  // RGBA rescale target (av_image_alloc; linesize may exceed width * 4)
  uint8_t* scaled_data_[4] = {nullptr, nullptr, nullptr, nullptr};
  int scaled_linesize_[4] = {0, 0, 0, 0};

  int video_stream_index_ = -1;
  int source_width_ = 0;
  int source_height_ = 0;
  OutputSize output_size_;
  double duration_s_ = 0.0;

  // Timing
  int64_t start_pts_ = 0;
  double time_base_ = 0.0;
  double frame_interval_s_ = 1.0 / 30.0;
  bool has_last_timestamp_ = false;
  double last_timestamp_s_ = 0.0;

  // Read/drain state, reset by every seek
  bool draining_ = false;
  bool exhausted_ = false;
  bool has_held_frame_ = false;
  bool last_seek_fell_back_ = false;
};

}  // namespace vidcat::decode

#endif  // VIDCAT_DECODE_MEDIA_DECODER_HPP_
