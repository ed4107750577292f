#include "core/sampler.hpp"
#include "spdlog/spdlog.h"
#include <bit>   // Pour std::bit_width (C++20)

namespace mat_shuffle {

int bits_needed(std::uint32_t max_inclusive) {
    return static_cast<int>(std::bit_width(max_inclusive));
}

std::uint32_t low_bits_mask(int bits) {
    if (bits <= 0) return 0u;
    if (bits >= 32) return 0xFFFFFFFFu;
    return (std::uint32_t{1} << bits) - 1u;
}

UnbiasedSampler::UnbiasedSampler(EntropySource& source)
    : source_(source) {}

std::uint32_t UnbiasedSampler::sample(std::uint32_t max_inclusive) {
    if (max_inclusive == 0) {
        return 0;
    }
    const std::uint32_t mask = low_bits_mask(bits_needed(max_inclusive));

    // Au pire moins de 2 tirages en moyenne: le masque couvre moins du double de la plage
    while (true) {
        const std::uint32_t masked = source_.next_u32() & mask;
        ++draws_;
        if (masked <= max_inclusive) {
            return masked;
        }
        ++rejections_;
        spdlog::trace("Sampler: rejet de {} (max {})", masked, max_inclusive);
    }
}

} // namespace mat_shuffle
