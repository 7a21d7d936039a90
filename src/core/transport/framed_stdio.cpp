// src/core/transport/framed_stdio.cpp
#include "core/transport/framed_stdio.hpp"

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

    bool read_exact(std::istream &in, uint8_t *buf, size_t n)
    {
        size_t got = 0;
        while (got < n)
        {
            in.read(reinterpret_cast<char *>(buf + got), static_cast<std::streamsize>(n - got));
            const std::streamsize r = in.gcount();
            if (r <= 0)
            {
                return false;
            }
            got += static_cast<size_t>(r);
        }
        return true;
    }

    ReadStatus read_frame(std::istream &in, std::vector<uint8_t> &out, std::string &err, uint32_t max_len)
    {
        err.clear();
        out.clear();

        uint8_t hdr[kFrameHeaderBytes] = {0, 0, 0, 0};

        // First byte alone: zero bytes here is a clean end of input,
        // anything short of a full header after that is truncation.
        in.read(reinterpret_cast<char *>(hdr), 1);
        if (in.gcount() == 0)
        {
            if (in.bad())
            {
                err = "stream failure while reading frame header";
                return ReadStatus::Error;
            }
            return ReadStatus::EndOfInput;
        }
        if (!read_exact(in, hdr + 1, kFrameHeaderBytes - 1))
        {
            err = "unexpected EOF while reading frame header";
            return ReadStatus::Error;
        }

        const uint32_t len = decode_u32_le(hdr);
        if (len == 0)
        {
            err = "invalid frame length: 0";
            return ReadStatus::Error;
        }
        if (len > max_len)
        {
            err = "frame length " + std::to_string(len) + " exceeds max " + std::to_string(max_len);
            return ReadStatus::Error;
        }

        out.resize(len);
        if (!read_exact(in, out.data(), len))
        {
            err = "unexpected EOF while reading frame payload";
            return ReadStatus::Error;
        }

        return ReadStatus::Frame;
    }

    bool write_frame(std::ostream &out, const uint8_t *data, size_t len, std::string &err, uint32_t max_len)
    {
        err.clear();

        if (len == 0)
        {
            err = "invalid frame length: 0";
            return false;
        }
        if (len > max_len)
        {
            err = "frame length exceeds max";
            return false;
        }

        uint8_t hdr[kFrameHeaderBytes];
        encode_u32_le(static_cast<uint32_t>(len), hdr);

        out.write(reinterpret_cast<const char *>(hdr), kFrameHeaderBytes);
        if (!out.good())
        {
            err = "failed writing frame header";
            return false;
        }

        out.write(reinterpret_cast<const char *>(data), static_cast<std::streamsize>(len));
        if (!out.good())
        {
            err = "failed writing frame payload";
            return false;
        }

        out.flush();
        if (!out.good())
        {
            err = "failed flushing output";
            return false;
        }

        return true;
    }

    bool write_frame(std::ostream &out, const std::string &payload, std::string &err, uint32_t max_len)
    {
        return write_frame(out, reinterpret_cast<const uint8_t *>(payload.data()), payload.size(), err,
                           max_len);
    }

} // namespace transport
