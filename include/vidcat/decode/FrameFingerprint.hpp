// Repository: VidCat-media
// Component: Frame Fingerprint
// Purpose: Header-only CRC32 fingerprinting of decoded RGBA frames for
//          debug logs and frame-identity checks in tests.
// Copyright (c) 2025 VidCat contributors

#ifndef VIDCAT_DECODE_FRAME_FINGERPRINT_HPP_
#define VIDCAT_DECODE_FRAME_FINGERPRINT_HPP_

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

#include <zlib.h>

#include "vidcat/decode/DecodeTypes.hpp"

namespace vidcat::decode {

// CRC32 of the whole pixel buffer. Returns 0 for an empty buffer.
inline uint32_t CRC32Pixels(const uint8_t* data, size_t size) {
  if (!data || size == 0) return 0;
  uLong crc = crc32(0L, Z_NULL, 0);
  // crc32() takes uInt lengths; feed large buffers in chunks.
  constexpr size_t kChunk = 1u << 30;
  while (size > 0) {
    const size_t len = size < kChunk ? size : kChunk;
    crc = crc32(crc, data, static_cast<uInt>(len));
    data += len;
    size -= len;
  }
  return static_cast<uint32_t>(crc);
}

struct FrameFingerprint {
  int width = 0;
  int height = 0;
  double timestamp_s = 0.0;
  uint32_t rgba_crc32 = 0;
};

inline FrameFingerprint FingerprintFrame(const Frame& frame) {
  FrameFingerprint fp;
  fp.width = frame.width;
  fp.height = frame.height;
  fp.timestamp_s = frame.timestamp_s;
  fp.rgba_crc32 = CRC32Pixels(frame.rgba.data(), frame.rgba.size());
  return fp;
}

// e.g. "320x180@4.967s crc=0x1a2b3c4d"
inline std::string FormatFingerprint(const FrameFingerprint& fp) {
  std::ostringstream oss;
  oss << fp.width << "x" << fp.height
      << "@" << std::fixed << std::setprecision(3) << fp.timestamp_s << "s"
      << " crc=0x" << std::hex << std::setw(8) << std::setfill('0') << fp.rgba_crc32;
  return oss.str();
}

}  // namespace vidcat::decode

#endif  // VIDCAT_DECODE_FRAME_FINGERPRINT_HPP_
