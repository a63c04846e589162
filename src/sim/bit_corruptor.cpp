#include "bit_corruptor.hpp"
#include "orbiter/logging.hpp"

#include <algorithm>
#include <numeric>

namespace orbiter {
namespace sim {

Bits flipRandomBits(BitSpan bits, size_t count, std::mt19937& rng) {
    Bits out(bits.begin(), bits.end());
    count = std::min(count, out.size());
    if (count == 0) return out;

    // Partial Fisher-Yates over positions
    std::vector<size_t> positions(out.size());
    std::iota(positions.begin(), positions.end(), 0);
    for (size_t i = 0; i < count; i++) {
        std::uniform_int_distribution<size_t> pick(i, positions.size() - 1);
        std::swap(positions[i], positions[pick(rng)]);
        out[positions[i]] ^= 1;
    }

    LOG_CHAN(TRACE, "Flipped %zu of %zu bits", count, out.size());
    return out;
}

Bits addBurstErrors(BitSpan bits, size_t burst_length, size_t num_bursts, std::mt19937& rng) {
    Bits out(bits.begin(), bits.end());
    if (out.empty() || burst_length == 0) return out;

    burst_length = std::min(burst_length, out.size());
    std::uniform_int_distribution<size_t> start_dist(0, out.size() - burst_length);

    for (size_t b = 0; b < num_bursts; b++) {
        size_t start = start_dist(rng);
        for (size_t i = start; i < start + burst_length; i++) {
            out[i] ^= 1;
        }
    }
    return out;
}

} // namespace sim
} // namespace orbiter
