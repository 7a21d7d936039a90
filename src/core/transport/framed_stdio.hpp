// src/core/transport/framed_stdio.hpp
#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace transport
{

    // 1 MiB frames; an encoded DetectEdgesRequest/ServerFrame never needs more
    // than chunk_size plus a few bytes of protobuf overhead.
    constexpr uint32_t kMaxFrameBytes = 1024u * 1024u;
    constexpr size_t kFrameHeaderBytes = 4;

    enum class ReadStatus
    {
        Frame,      // one frame stored in out
        EndOfInput, // clean EOF on a frame boundary
        Error       // truncated frame, bad length or stream failure; err set
    };

    // Reads exactly n bytes into buf. Returns false on EOF or stream failure before n bytes.
    bool read_exact(std::istream &in, uint8_t *buf, size_t n);

    // Reads one length-prefixed frame (uint32_le + payload bytes).
    ReadStatus read_frame(std::istream &in, std::vector<uint8_t> &out, std::string &err,
                          uint32_t max_len = kMaxFrameBytes);

    // Writes one length-prefixed frame (uint32_le + payload bytes) and flushes,
    // so a blocked reader on the other end applies backpressure here.
    // Returns false on error and sets err.
    bool write_frame(std::ostream &out, const uint8_t *data, size_t len, std::string &err,
                     uint32_t max_len = kMaxFrameBytes);

    bool write_frame(std::ostream &out, const std::string &payload, std::string &err,
                     uint32_t max_len = kMaxFrameBytes);

} // namespace transport
