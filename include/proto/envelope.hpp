#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "util/constants.hpp"

// Whole-message framing for the dispenser firmware, independent of chunking:
//   "#START#" <schedule bytes> "#END#"
namespace envelope
{

using Bytes = std::vector<std::uint8_t>;

Bytes wrap(const Bytes     &body,
           std::string_view start = constants::START_SENTINEL,
           std::string_view end   = constants::END_SENTINEL);

// Find one complete message in an accumulated receive buffer. On success the
// body is returned and everything up to and including the end sentinel is
// erased from `buf`. Bytes before the start sentinel are discarded.
std::optional<Bytes> take_message(Bytes           &buf,
                                  std::string_view start = constants::START_SENTINEL,
                                  std::string_view end   = constants::END_SENTINEL);

}  // namespace envelope
