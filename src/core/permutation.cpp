#include "core/permutation.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/fmt/ranges.h"
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace mat_shuffle {

Deck generate_permutation(std::size_t num_cards, UnbiasedSampler& sampler) {
    if (num_cards == 0) {
        throw std::invalid_argument("Cannot generate a permutation of 0 cards.");
    }
    if (num_cards - 1 > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument("Too many cards for a 32-bit sampler: " + std::to_string(num_cards));
    }

    std::vector<Card> cards(num_cards);
    std::iota(cards.begin(), cards.end(), Card{0});

    // i descend strictement jusqu'à 1, borne exacte i à chaque tirage
    for (std::size_t i = num_cards - 1; i > 0; --i) {
        const std::size_t j = sampler.sample(static_cast<std::uint32_t>(i));
        std::swap(cards[i], cards[j]);
    }

    spdlog::trace("Permutation générée ({} cartes): {}", num_cards, fmt::join(cards, ","));
    return Deck(std::move(cards));
}

} // namespace mat_shuffle
