#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

/*
TX:
service.send_schedule(file bytes)
  -> envelope::wrap(bytes)            // "#START#" + bytes + "#END#"
     -> framer::split(payload, chunk) // N frames, last one may be short
        -> for each Frame:
             channel.write(frame.bytes)   // one BLE write, no per-frame ack
RX:
channel inbound notify
  -> contains completion marker ("A") ? session done : ignored
*/

namespace framer
{

using Payload = std::vector<std::uint8_t>;

struct Frame
{
    std::uint32_t             seq{0};    // 1-based
    std::uint32_t             total{0};  // same for every frame of one payload
    std::vector<std::uint8_t> bytes;
};

// Split payload into ceil(len / chunk_size) frames in sequence order.
// An empty payload yields one zero-length frame (total = 1) so an empty
// schedule still makes a session that can finish.
// chunk_size == 0 is rejected: returns an empty vector (never a valid split).
std::vector<Frame> split(const Payload &payload, std::size_t chunk_size);

// Number of frames split() produces, 0 for chunk_size == 0.
std::size_t frame_count(std::size_t payload_len, std::size_t chunk_size);

}  // namespace framer
