#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "util/constants.hpp"

namespace transfer
{

// Synchronous start errors (nothing was sent)
enum class Status
{
    Ok,
    InvalidArgument,  // chunk_size == 0 or empty marker
    NotConnected,     // channel not ready at session start
};

enum class Outcome
{
    Completed,
    TimedOut,
    Cancelled,
    Disconnected,
    LinkError,
    Superseded,
};

enum class State
{
    Idle,
    Sending,      // frames still being dispatched
    AwaitingAck,  // all frames out, waiting for the marker
};

struct Options
{
    std::size_t               chunk_size        = constants::CHUNK_SIZE;
    std::chrono::milliseconds inter_frame_delay = constants::FRAME_DELAY;
    std::chrono::milliseconds timeout           = constants::ACK_TIMEOUT;
    std::string               ack_marker        = std::string(constants::ACK_MARKER);
};

struct ProgressEvent
{
    std::uint32_t seq{0};
    std::uint32_t total{0};
};

struct TransferResult
{
    bool                       success{false};
    std::optional<std::string> detail;
    Outcome                    outcome{Outcome::Cancelled};
};

// detail strings reported to the caller
inline constexpr const char *DETAIL_TIMED_OUT    = "timed out waiting for completion acknowledgment";
inline constexpr const char *DETAIL_CANCELLED    = "cancelled";
inline constexpr const char *DETAIL_DISCONNECTED = "device disconnected during transfer";
inline constexpr const char *DETAIL_SUPERSEDED   = "superseded by a new transfer";

const char *to_string(Status s);
const char *to_string(Outcome o);
const char *to_string(State s);

}  // namespace transfer
