#include "core/deck.hpp"
#include <stdexcept>
#include <numeric>   // Pour std::iota
#include <sstream>
#include <utility>

namespace mat_shuffle {

Deck Deck::identity(std::size_t size) {
    std::vector<Card> cards(size);
    std::iota(cards.begin(), cards.end(), Card{0});
    return Deck(std::move(cards));
}

Deck::Deck(std::vector<Card> cards)
    : cards_(std::move(cards))
{
    if (!is_permutation()) {
        throw std::invalid_argument("Deck must be a permutation of 0.." + std::to_string(cards_.size()) + "-1.");
    }
}

Deck::Deck(std::size_t size, const std::vector<Card>& source, std::size_t offset)
{
    if (offset > source.size() || size > source.size() - offset) {
        throw std::out_of_range("Deck slice [" + std::to_string(offset) + ", " + std::to_string(offset + size)
                                + ") outside source of size " + std::to_string(source.size()) + ".");
    }
    cards_.assign(source.begin() + offset, source.begin() + offset + size);
    if (!is_permutation()) {
        throw std::invalid_argument("Deck slice must be a permutation of 0.." + std::to_string(size) + "-1.");
    }
}

Card Deck::at(std::size_t i) const {
    if (i >= cards_.size()) {
        throw std::out_of_range("Deck index " + std::to_string(i) + " out of range (size " + std::to_string(cards_.size()) + ").");
    }
    return cards_[i];
}

bool Deck::is_permutation() const {
    std::vector<bool> seen(cards_.size(), false);
    for (Card c : cards_) {
        if (c >= cards_.size() || seen[c]) return false;
        seen[c] = true;
    }
    return true;
}

bool Deck::is_identity() const {
    for (std::size_t i = 0; i < cards_.size(); ++i) {
        if (cards_[i] != i) return false;
    }
    return true;
}

std::string Deck::toString() const {
    std::stringstream ss;
    ss << "Deck(" << cards_.size() << ") bottom->top [";
    for (std::size_t i = 0; i < cards_.size(); ++i) {
        ss << cards_[i];
        if (i + 1 < cards_.size()) ss << " ";
    }
    ss << "]";
    return ss.str();
}

} // namespace mat_shuffle
