#include <algorithm>
#include <cstdint>

#include "proto/framer.hpp"
#include "util/log.hpp"

namespace framer
{

std::size_t frame_count(std::size_t payload_len, std::size_t chunk_size)
{
    if (chunk_size == 0)
        return 0;
    if (payload_len == 0)
        return 1;
    return (payload_len + chunk_size - 1) / chunk_size;
}

std::vector<Frame> split(const Payload &payload, std::size_t chunk_size)
{
    if (chunk_size == 0)
    {
        LOG_ERROR("split: invalid chunk_size (0)");
        return {};
    }

    const std::size_t num_frames = frame_count(payload.size(), chunk_size);
    if (num_frames > UINT32_MAX)
    {
        LOG_ERROR("split: payload too large (%zu bytes, needs %zu frames)", payload.size(),
                  num_frames);
        return {};
    }

    std::vector<Frame> out;
    out.reserve(num_frames);
    if (payload.empty())
    {
        Frame f;
        f.seq   = 1;
        f.total = 1;
        out.push_back(std::move(f));
        return out;
    }

    for (std::size_t i = 0; i < num_frames; i++)
    {
        const std::size_t start = i * chunk_size;
        const std::size_t take  = std::min(chunk_size, payload.size() - start);
        Frame             f;
        f.seq   = static_cast<std::uint32_t>(i + 1);
        f.total = static_cast<std::uint32_t>(num_frames);
        f.bytes.assign(payload.begin() + start, payload.begin() + start + take);
        out.push_back(std::move(f));
    }
    return out;
}

}  // namespace framer
