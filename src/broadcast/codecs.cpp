#include "broadcast/codecs.hpp"

namespace broadcast {

namespace {

uint64_t image_size(uint32_t width, uint32_t height) {
  return static_cast<uint64_t>(width) * height * kBytesPerPixel;
}

// Returns an empty string when the format can be carried, otherwise the reason.
std::string check_pcm_format(const v1::AudioFormat &format) {
  if (format.format_id() != kAudioFormatLinearPcm) {
    return "unsupported audio format id " + std::to_string(format.format_id());
  }
  if (format.format_flags() & kAudioFormatFlagIsNonInterleaved) {
    return "non-interleaved audio is not supported";
  }
  if (format.bytes_per_frame() == 0 || format.channels_per_frame() == 0) {
    return "audio format has no frame layout";
  }
  return {};
}

std::string check_pcm_size(int32_t sample_count, const v1::AudioFormat &format,
                           size_t size) {
  if (sample_count <= 0) {
    return "audio buffer is empty";
  }
  uint64_t expected =
      static_cast<uint64_t>(sample_count) * format.bytes_per_frame();
  if (size != expected) {
    return "audio buffer has " + std::to_string(size) + " bytes, expected " +
           std::to_string(expected);
  }
  return {};
}

} // namespace

// -----------------------------
// RawImageCodec
// -----------------------------

EncodedImage RawImageCodec::encode(const ImageFrame &frame) {
  if (frame.width == 0 || frame.height == 0) {
    throw CodecError(CodecError::Code::EncodingFailed, "image has no pixels");
  }
  if (frame.pixels.size() != image_size(frame.width, frame.height)) {
    throw CodecError(CodecError::Code::EncodingFailed,
                     "image buffer size does not match " +
                         std::to_string(frame.width) + "x" +
                         std::to_string(frame.height));
  }

  EncodedImage out;
  out.metadata.set_width(frame.width);
  out.metadata.set_height(frame.height);
  out.bytes = frame.pixels;
  return out;
}

ImageFrame RawImageCodec::decode(const std::vector<uint8_t> &bytes,
                                 const v1::ImageMetadata &metadata) {
  if (metadata.width() == 0 || metadata.height() == 0 ||
      bytes.size() != image_size(metadata.width(), metadata.height())) {
    throw CodecError(CodecError::Code::DecodingFailed,
                     "image payload does not match metadata " +
                         std::to_string(metadata.width()) + "x" +
                         std::to_string(metadata.height()));
  }

  ImageFrame frame;
  frame.width = metadata.width();
  frame.height = metadata.height();
  frame.pixels = bytes;
  return frame;
}

// -----------------------------
// PcmAudioCodec
// -----------------------------

v1::AudioFormat make_pcm_format(double sample_rate, uint32_t channels,
                                uint32_t bits_per_channel) {
  v1::AudioFormat format;
  const uint32_t bytes_per_frame = channels * (bits_per_channel / 8);
  format.set_sample_rate(sample_rate);
  format.set_format_id(kAudioFormatLinearPcm);
  format.set_format_flags(kAudioFormatFlagIsSignedInteger |
                          kAudioFormatFlagIsPacked);
  format.set_bytes_per_packet(bytes_per_frame);
  format.set_frames_per_packet(1);
  format.set_bytes_per_frame(bytes_per_frame);
  format.set_channels_per_frame(channels);
  format.set_bits_per_channel(bits_per_channel);
  return format;
}

EncodedAudio PcmAudioCodec::encode(const AudioFrame &frame) {
  std::string err = check_pcm_format(frame.format);
  if (err.empty()) {
    err = check_pcm_size(frame.sample_count, frame.format, frame.samples.size());
  }
  if (!err.empty()) {
    throw CodecError(CodecError::Code::EncodingFailed, err);
  }

  EncodedAudio out;
  out.metadata.set_sample_count(frame.sample_count);
  *out.metadata.mutable_format() = frame.format;
  out.bytes = frame.samples;
  return out;
}

AudioFrame PcmAudioCodec::decode(const std::vector<uint8_t> &bytes,
                                 const v1::AudioMetadata &metadata) {
  std::string err = check_pcm_format(metadata.format());
  if (err.empty()) {
    err = check_pcm_size(metadata.sample_count(), metadata.format(),
                         bytes.size());
  }
  if (!err.empty()) {
    throw CodecError(CodecError::Code::DecodingFailed, err);
  }

  AudioFrame frame;
  frame.format = metadata.format();
  frame.sample_count = metadata.sample_count();
  frame.samples = bytes;
  return frame;
}

} // namespace broadcast
