// Repository: VidCat-media
// Component: Decoder Configuration
// Purpose: Configuration structure for MediaDecoder.
// Copyright (c) 2025 VidCat contributors

#ifndef VIDCAT_DECODE_DECODER_CONFIG_HPP_
#define VIDCAT_DECODE_DECODER_CONFIG_HPP_

#include "vidcat/decode/DecodeTypes.hpp"

namespace vidcat::decode {

// POD struct - immutable after the decoder is opened
struct DecoderConfig {
  int max_output_width = 320;       // Output width bound (0 = keep source width)
  int max_decode_threads = 0;       // Decoder threads (0 = FFmpeg auto)
  SeekMode seek_mode = SeekMode::kKeyframe;
  int max_preroll_frames = 600;     // kPrecise: frames discarded before giving up on the target
};

}  // namespace vidcat::decode

#endif  // VIDCAT_DECODE_DECODER_CONFIG_HPP_
