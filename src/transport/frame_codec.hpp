// src/transport/frame_codec.hpp
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace transport
{

    // Wire layout of one frame:
    //   [u32 total_length][u32 payload_length][encoded header][payload]
    // total_length counts the encoded header plus the payload.
    constexpr size_t kFrameHeaderBytes = 8;

    // Upper bound on total_length accepted from a peer.
    constexpr uint32_t kMaxMessageBytes = 64u * 1024u * 1024u;

    struct FrameHeader
    {
        uint32_t total_length = 0;
        uint32_t payload_length = 0;
    };

    // One complete frame split into its two sections.
    struct Frame
    {
        std::string header_bytes;
        std::vector<uint8_t> payload;
    };

    std::array<uint8_t, kFrameHeaderBytes> encode_frame_header(uint32_t total_length,
                                                              uint32_t payload_length);

    // Decodes the 8-byte frame header.
    // Returns false and sets err if fewer than 8 bytes are given or if
    // payload_length > total_length.
    bool decode_frame_header(const uint8_t *data, size_t len, FrameHeader &out, std::string &err);

    // Builds the complete wire representation of one message.
    // Returns false and sets err if the message would exceed max_len.
    bool encode_frame(const std::string &encoded_header, const std::vector<uint8_t> *payload,
                      std::vector<uint8_t> &out, std::string &err,
                      uint32_t max_len = kMaxMessageBytes);

    // Incremental frame parser. Bytes may be appended in arbitrary slices;
    // partial headers and partial bodies stay buffered until complete.
    // Not thread-safe.
    class FrameAssembler
    {
      public:
        explicit FrameAssembler(uint32_t max_len = kMaxMessageBytes);

        void append(const uint8_t *data, size_t len);

        // Extracts the next complete frame.
        // Returns:
        //  - true  => frame extracted into out
        //  - false => more bytes needed (err empty) or corrupt input (err non-empty)
        bool next(Frame &out, std::string &err);

        // Bytes received but not yet returned as part of a frame.
        size_t buffered() const { return buffer_.size() - offset_; }

        void reset();

      private:
        void compact();

        uint32_t max_len_;
        std::vector<uint8_t> buffer_;
        size_t offset_ = 0;
    };

} // namespace transport
