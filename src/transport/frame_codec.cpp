// src/transport/frame_codec.cpp
#include "transport/frame_codec.hpp"


namespace transport
{

    static inline uint32_t decode_u32_le(const uint8_t b[4])
    {
        return (static_cast<uint32_t>(b[0])) |
               (static_cast<uint32_t>(b[1]) << 8) |
               (static_cast<uint32_t>(b[2]) << 16) |
               (static_cast<uint32_t>(b[3]) << 24);
    }

    static inline void encode_u32_le(uint32_t v, uint8_t b[4])
    {
        b[0] = static_cast<uint8_t>(v & 0xFF);
        b[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
        b[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
        b[3] = static_cast<uint8_t>((v >> 24) & 0xFF);
    }

    std::array<uint8_t, kFrameHeaderBytes> encode_frame_header(uint32_t total_length,
                                                              uint32_t payload_length)
    {
        std::array<uint8_t, kFrameHeaderBytes> out{};
        encode_u32_le(total_length, out.data());
        encode_u32_le(payload_length, out.data() + 4);
        return out;
    }

    bool decode_frame_header(const uint8_t *data, size_t len, FrameHeader &out, std::string &err)
    {
        err.clear();

        if (data == nullptr || len < kFrameHeaderBytes)
        {
            err = "insufficient bytes for frame header";
            return false;
        }

        FrameHeader hdr;
        hdr.total_length = decode_u32_le(data);
        hdr.payload_length = decode_u32_le(data + 4);

        if (hdr.payload_length > hdr.total_length)
        {
            err = "payload length exceeds total length";
            return false;
        }

        out = hdr;
        return true;
    }

    bool encode_frame(const std::string &encoded_header, const std::vector<uint8_t> *payload,
                      std::vector<uint8_t> &out, std::string &err, uint32_t max_len)
    {
        err.clear();

        const size_t payload_len = payload ? payload->size() : 0;
        const size_t total = encoded_header.size() + payload_len;
        if (total < encoded_header.size() || total > max_len)
        {
            err = "message length exceeds max";
            return false;
        }

        const auto hdr = encode_frame_header(static_cast<uint32_t>(total),
                                             static_cast<uint32_t>(payload_len));

        out.clear();
        out.reserve(kFrameHeaderBytes + total);
        out.insert(out.end(), hdr.begin(), hdr.end());
        out.insert(out.end(), encoded_header.begin(), encoded_header.end());
        if (payload_len > 0)
        {
            out.insert(out.end(), payload->begin(), payload->end());
        }
        return true;
    }

    FrameAssembler::FrameAssembler(uint32_t max_len) : max_len_(max_len) {}

    void FrameAssembler::append(const uint8_t *data, size_t len)
    {
        if (len == 0)
        {
            return;
        }
        compact();
        buffer_.insert(buffer_.end(), data, data + len);
    }

    bool FrameAssembler::next(Frame &out, std::string &err)
    {
        err.clear();

        // Wait for the fixed-size header first.
        if (buffered() < kFrameHeaderBytes)
        {
            return false;
        }

        const uint8_t *base = buffer_.data() + offset_;

        FrameHeader hdr;
        if (!decode_frame_header(base, kFrameHeaderBytes, hdr, err))
        {
            return false;
        }
        if (hdr.total_length > max_len_)
        {
            err = "message length exceeds max";
            return false;
        }

        const size_t frame_len = kFrameHeaderBytes + static_cast<size_t>(hdr.total_length);
        if (buffered() < frame_len)
        {
            return false;
        }

        const uint8_t *body = base + kFrameHeaderBytes;
        const size_t header_len = hdr.total_length - hdr.payload_length;

        out.header_bytes.assign(reinterpret_cast<const char *>(body), header_len);
        out.payload.assign(body + header_len, body + hdr.total_length);

        offset_ += frame_len;
        if (offset_ == buffer_.size())
        {
            buffer_.clear();
            offset_ = 0;
        }
        return true;
    }

    void FrameAssembler::reset()
    {
        buffer_.clear();
        offset_ = 0;
    }

    void FrameAssembler::compact()
    {
        // Drop consumed bytes once they dominate the buffer.
        if (offset_ > 0 && offset_ >= buffer_.size() / 2)
        {
            buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
            offset_ = 0;
        }
    }

} // namespace transport
