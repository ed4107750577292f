#include "mat_shuffle/pile_engine.h"
#include "spdlog/spdlog.h"
#include "spdlog/fmt/ranges.h"
#include <sstream>
#include <stdexcept>
#include <utility>

namespace mat_shuffle {

// -----------------------------------------------------------------------------
//  PileInstructions
// -----------------------------------------------------------------------------
PileInstructions::PileInstructions(std::vector<std::uint32_t> deck_ordered_piles, std::uint32_t num_piles, bool gather_forward)
    : deck_ordered_(std::move(deck_ordered_piles)),
      deal_ordered_(deck_ordered_.rbegin(), deck_ordered_.rend()),
      num_piles_(num_piles),
      gather_forward_(gather_forward)
{
    if (num_piles_ == 0) {
        throw std::invalid_argument("PileInstructions: num_piles must be > 0");
    }
    for (std::uint32_t pile : deck_ordered_) {
        if (pile >= num_piles_) {
            throw std::out_of_range("PileInstructions: pile " + std::to_string(pile) + " >= num_piles "
                                    + std::to_string(num_piles_));
        }
    }
}

std::string PileInstructions::toString() const {
    std::stringstream ss;
    ss << "PileInstructions(" << deck_ordered_.size() << " cartes, " << num_piles_ << " tas, gather_forward="
       << (gather_forward_ ? "true" : "false") << ") deal order [";
    for (std::size_t i = 0; i < deal_ordered_.size(); ++i) {
        ss << deal_ordered_[i];
        if (i + 1 < deal_ordered_.size()) ss << " ";
    }
    ss << "]";
    return ss.str();
}

// -----------------------------------------------------------------------------
//  Simulation d'une passe
// -----------------------------------------------------------------------------
PileInstructions compute_instructions(const Deck& deck, const PassPlan& plan, int pass_index) {
    std::vector<std::uint32_t> piles(deck.size());
    for (std::size_t i = 0; i < deck.size(); ++i) {
        piles[i] = plan.pile_for(deck.cards()[i], pass_index);
    }
    return PileInstructions(std::move(piles), plan.get_num_piles(), plan.gather_forward(pass_index));
}

std::vector<std::vector<Card>> deal_to_piles(const Deck& deck, const PileInstructions& instructions) {
    if (deck.size() != instructions.get_num_instructions()) {
        throw std::invalid_argument("deal_to_piles: deck size " + std::to_string(deck.size())
                                    + " != instruction count " + std::to_string(instructions.get_num_instructions()));
    }
    std::vector<std::vector<Card>> piles(instructions.get_num_piles());
    const auto& cards  = deck.cards();
    const auto& target = instructions.deck_ordered();

    // On donne depuis le dessus (N-1) vers le dessous (0); chaque tas se construit de bas en haut
    for (std::size_t i = cards.size(); i-- > 0; ) {
        piles[target[i]].push_back(cards[i]);
    }
    return piles;
}

Deck gather_piles(const std::vector<std::vector<Card>>& piles, bool gather_forward) {
    std::vector<Card> gathered;
    std::size_t total = 0;
    for (const auto& pile : piles) total += pile.size();
    gathered.reserve(total);

    // Le contenu d'un tas n'est jamais réordonné, seul l'ordre des tas change
    if (gather_forward) {
        for (const auto& pile : piles) {
            gathered.insert(gathered.end(), pile.begin(), pile.end());
        }
    } else {
        for (auto it = piles.rbegin(); it != piles.rend(); ++it) {
            gathered.insert(gathered.end(), it->begin(), it->end());
        }
    }
    return Deck(std::move(gathered));
}

Deck apply_instructions(const Deck& deck, const PileInstructions& instructions) {
    const auto piles = deal_to_piles(deck, instructions);
    if (spdlog::should_log(spdlog::level::debug)) {
        std::vector<std::size_t> sizes;
        sizes.reserve(piles.size());
        for (const auto& pile : piles) sizes.push_back(pile.size());
        spdlog::debug("Donne: {} cartes sur {} tas (tailles: {}), ramassage {}",
                      deck.size(), piles.size(), fmt::join(sizes, ","),
                      instructions.gather_forward() ? "en avant" : "en arrière");
    }
    return gather_piles(piles, instructions.gather_forward());
}

std::vector<PassResult> run_passes(const Deck& permutation, const PassPlan& plan) {
    if (permutation.size() != plan.get_num_cards()) {
        throw std::invalid_argument("run_passes: permutation size " + std::to_string(permutation.size())
                                    + " != plan card count " + std::to_string(plan.get_num_cards()));
    }

    std::vector<PassResult> results;
    results.reserve(plan.get_num_passes());

    Deck current = permutation;
    for (int k = 0; k < plan.get_num_passes(); ++k) {
        PileInstructions instructions = compute_instructions(current, plan, k);
        Deck next = apply_instructions(current, instructions);
        if (spdlog::should_log(spdlog::level::trace)) {
            spdlog::trace("Passe {}: {}", k, instructions.toString());
            spdlog::trace("Passe {} -> {}", k, next.toString());
        }
        results.push_back(PassResult{k, std::move(instructions), next});
        current = std::move(next);
    }

    if (!current.is_identity()) {
        spdlog::critical("Le paquet final n'est pas trié après {} passes: {}", plan.get_num_passes(), current.toString());
        throw std::logic_error("Pile decomposition did not restore the identity deck.");
    }
    spdlog::debug("{} passe(s) simulée(s), paquet final trié.", plan.get_num_passes());
    return results;
}

} // namespace mat_shuffle
