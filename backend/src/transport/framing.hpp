#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// Each frame on the wire: 4-byte big-endian payload length, then the payload.
constexpr std::size_t kFrameHeaderBytes = 4;
constexpr std::size_t kDefaultMaxFrameBytes = 1u << 20;

inline void append_frame(std::string& out, std::string_view payload)
{
    const auto n = static_cast<std::uint32_t>(payload.size());
    out.push_back(static_cast<char>((n >> 24) & 0xFF));
    out.push_back(static_cast<char>((n >> 16) & 0xFF));
    out.push_back(static_cast<char>((n >> 8) & 0xFF));
    out.push_back(static_cast<char>(n & 0xFF));
    out.append(payload.data(), payload.size());
}

inline std::uint32_t read_frame_length(const unsigned char* header)
{
    return (static_cast<std::uint32_t>(header[0]) << 24) |
           (static_cast<std::uint32_t>(header[1]) << 16) |
           (static_cast<std::uint32_t>(header[2]) << 8)  |
            static_cast<std::uint32_t>(header[3]);
}
