#ifndef MAT_SHUFFLE_PASS_PLAN_H
#define MAT_SHUFFLE_PASS_PLAN_H

#include "mat_shuffle/common_types.h"
#include <cstdint>
#include <optional>

namespace mat_shuffle {

// Plus petit K tel que num_piles^K >= num_cards, ou std::nullopt si K > max_passes.
// Multiplications entières uniquement: pas de racine flottante (sqrt(100) mal arrondi, etc.)
std::optional<int> compute_passes(std::uint64_t num_cards, std::uint64_t num_piles,
                                  int max_passes = DEFAULT_MAX_PASSES);

// Plus petit P tel que P^num_passes >= num_cards (ceil(sqrt(N)) pour 2 passes, ceil(cbrt(N)) pour 3)
std::uint64_t min_piles_for_passes(std::uint64_t num_cards, int num_passes);

// k-ième chiffre de `value` en base `base`: floor(value / base^k) mod base
std::uint32_t digit_for_pass(std::uint32_t value, std::uint32_t base, int digit_index);

// Sens du ramassage de la passe `pass_index` sur `num_passes`.
// La dernière passe ramasse toujours "en avant" (tas 0 en dessous), puis on alterne en remontant.
bool gather_forward_for_pass(int num_passes, int pass_index);

// Plan de passes: K et la fonction d'extraction de chiffre paramétrée.
// Construit une fois à partir de N et P au début d'une exécution.
class PassPlan {
public:
    PassPlan(std::uint32_t num_cards, std::uint32_t num_piles, int num_passes);

    std::uint32_t get_num_cards()  const { return num_cards_; }
    std::uint32_t get_num_piles()  const { return num_piles_; }
    int           get_num_passes() const { return num_passes_; }

    // Tas où doit aller une carte de position cible `target` pendant la passe `pass_index`
    std::uint32_t pile_for(std::uint32_t target, int pass_index) const;
    bool          gather_forward(int pass_index) const;

private:
    void check_pass_index(int pass_index) const;

    std::uint32_t num_cards_;
    std::uint32_t num_piles_;
    int           num_passes_;
};

// Lance PassesInfeasible si aucun K <= max_passes ne convient
PassPlan make_pass_plan(std::uint32_t num_cards, std::uint32_t num_piles,
                        int max_passes = DEFAULT_MAX_PASSES);

} // namespace mat_shuffle

#endif // MAT_SHUFFLE_PASS_PLAN_H
