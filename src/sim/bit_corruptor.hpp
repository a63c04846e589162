#pragma once

#include "orbiter/types.hpp"
#include <random>

namespace orbiter {
namespace sim {

// Controlled bit-level corruption for exercising CRC and FEC without
// running the waveform channel.

// Flips `count` distinct positions (clamped to bits.size())
Bits flipRandomBits(BitSpan bits, size_t count, std::mt19937& rng);

// Flips `num_bursts` runs of `burst_length` consecutive bits at random
// offsets. Runs may overlap, in which case overlapping bits flip twice.
Bits addBurstErrors(BitSpan bits, size_t burst_length, size_t num_bursts, std::mt19937& rng);

} // namespace sim
} // namespace orbiter
