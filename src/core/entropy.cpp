#include "core/entropy.hpp"
#include "mat_shuffle/errors.h"
#include "spdlog/spdlog.h"
#include <exception>
#include <limits>

namespace mat_shuffle {

SecureEntropySource::SecureEntropySource()
    : SecureEntropySource("default") {}

SecureEntropySource::SecureEntropySource(const std::string& token)
    : token_(token)
{
    try {
        device_ = std::make_unique<std::random_device>(token_);
    } catch (const std::exception& e) {
        spdlog::error("Impossible d'ouvrir la source d'entropie '{}': {}", token_, e.what());
        throw EntropyUnavailable("cannot open random_device '" + token_ + "': " + e.what());
    }
}

std::uint32_t SecureEntropySource::next_u32() {
    static_assert(std::numeric_limits<std::random_device::result_type>::digits >= 32,
                  "random_device must deliver at least 32 bits per call");
    try {
        return static_cast<std::uint32_t>((*device_)());
    } catch (const std::exception& e) {
        spdlog::error("Lecture de la source d'entropie '{}' en échec: {}", token_, e.what());
        throw EntropyUnavailable("read from random_device '" + token_ + "' failed: " + e.what());
    }
}

InsecureEntropySource::InsecureEntropySource(std::uint32_t seed)
    : seed_(seed), rng_(seed)
{
    spdlog::warn("Source d'entropie NON sécurisée (mt19937, graine {}) : réservée aux tests.", seed);
}

} // namespace mat_shuffle
