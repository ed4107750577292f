#ifndef MAT_SHUFFLE_PILE_ENGINE_H
#define MAT_SHUFFLE_PILE_ENGINE_H

#include "mat_shuffle/pass_plan.h"
#include "core/deck.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mat_shuffle {

// Instructions d'une passe.
// deck_ordered[i] est le tas de la carte en position i (0 = dessous, comme le Deck).
// deal_ordered est l'inverse: [0] est la première carte donnée physiquement (le dessus du paquet).
class PileInstructions {
public:
    PileInstructions(std::vector<std::uint32_t> deck_ordered_piles, std::uint32_t num_piles, bool gather_forward);

    std::size_t                       get_num_instructions() const { return deck_ordered_.size(); }
    std::uint32_t                     get_num_piles()        const { return num_piles_; }
    const std::vector<std::uint32_t>& deck_ordered()         const { return deck_ordered_; }
    const std::vector<std::uint32_t>& deal_ordered()         const { return deal_ordered_; }
    // true: tas 0 en dessous, tas P-1 au dessus. false: l'inverse.
    bool                              gather_forward()       const { return gather_forward_; }

    std::string toString() const;

private:
    std::vector<std::uint32_t> deck_ordered_;
    std::vector<std::uint32_t> deal_ordered_;
    std::uint32_t              num_piles_;
    bool                       gather_forward_;
};

// Résultat d'une passe: les instructions et le paquet obtenu après ramassage
struct PassResult {
    int              pass_index;
    PileInstructions instructions;
    Deck             deck;
};

// Tas de chaque carte du paquet pour la passe `pass_index` (chiffre de la position cible)
PileInstructions compute_instructions(const Deck& deck, const PassPlan& plan, int pass_index);

// Donne depuis le dessus du paquet vers les tas; l'ordre dans un tas est conservé (0 = dessous du tas)
std::vector<std::vector<Card>> deal_to_piles(const Deck& deck, const PileInstructions& instructions);

// Ramasse les tas en un seul paquet selon le sens de ramassage
Deck gather_piles(const std::vector<std::vector<Card>>& piles, bool gather_forward);

// Donne puis ramasse: le paquet que laisse la passe
Deck apply_instructions(const Deck& deck, const PileInstructions& instructions);

// Exécute les K passes sur la permutation et vérifie que le paquet final est l'identité.
// Lance std::logic_error si l'invariant est violé (ne doit jamais arriver).
std::vector<PassResult> run_passes(const Deck& permutation, const PassPlan& plan);

} // namespace mat_shuffle

#endif // MAT_SHUFFLE_PILE_ENGINE_H
