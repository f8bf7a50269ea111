#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "broadcast_ipc.pb.h"

namespace broadcast {

namespace v1 = ::broadcast_ipc::v1;

class CodecError : public std::runtime_error {
public:
  enum class Code { EncodingFailed, DecodingFailed };

  CodecError(Code code, const std::string &message)
      : std::runtime_error(message), code_(code) {}

  Code code() const noexcept { return code_; }

private:
  Code code_;
};

// Uncompressed 32-bit BGRA image, rows tightly packed.
struct ImageFrame {
  uint32_t width = 0;
  uint32_t height = 0;
  std::vector<uint8_t> pixels;
};

// Interleaved linear PCM.
struct AudioFrame {
  v1::AudioFormat format;
  int32_t sample_count = 0;
  std::vector<uint8_t> samples;
};

struct EncodedImage {
  v1::ImageMetadata metadata;
  std::vector<uint8_t> bytes;
};

struct EncodedAudio {
  v1::AudioMetadata metadata;
  std::vector<uint8_t> bytes;
};

// Image compression is pluggable; the transport only moves opaque bytes.
class ImageCodec {
public:
  virtual ~ImageCodec() = default;
  virtual EncodedImage encode(const ImageFrame &frame) = 0;
  virtual ImageFrame decode(const std::vector<uint8_t> &bytes,
                            const v1::ImageMetadata &metadata) = 0;
};

class AudioCodec {
public:
  virtual ~AudioCodec() = default;
  virtual EncodedAudio encode(const AudioFrame &frame) = 0;
  virtual AudioFrame decode(const std::vector<uint8_t> &bytes,
                            const v1::AudioMetadata &metadata) = 0;
};

constexpr uint32_t kBytesPerPixel = 4;

// Passes BGRA pixels through unchanged after checking their size.
class RawImageCodec final : public ImageCodec {
public:
  EncodedImage encode(const ImageFrame &frame) override;
  ImageFrame decode(const std::vector<uint8_t> &bytes,
                    const v1::ImageMetadata &metadata) override;
};

// Linear PCM format identifier ('lpcm') and flags.
constexpr uint32_t kAudioFormatLinearPcm = 0x6C70636D;
constexpr uint32_t kAudioFormatFlagIsFloat = 1u << 0;
constexpr uint32_t kAudioFormatFlagIsSignedInteger = 1u << 2;
constexpr uint32_t kAudioFormatFlagIsPacked = 1u << 3;
constexpr uint32_t kAudioFormatFlagIsNonInterleaved = 1u << 5;

// Packed signed-integer interleaved PCM description.
v1::AudioFormat make_pcm_format(double sample_rate, uint32_t channels,
                                uint32_t bits_per_channel);

// Passes interleaved PCM through unchanged. Planar layouts are rejected.
class PcmAudioCodec final : public AudioCodec {
public:
  EncodedAudio encode(const AudioFrame &frame) override;
  AudioFrame decode(const std::vector<uint8_t> &bytes,
                    const v1::AudioMetadata &metadata) override;
};

} // namespace broadcast
