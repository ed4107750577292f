#include "mat_shuffle/pass_plan.h"
#include "mat_shuffle/errors.h"
#include "spdlog/spdlog.h"
#include <stdexcept>
#include <string>

namespace mat_shuffle {

std::optional<int> compute_passes(std::uint64_t num_cards, std::uint64_t num_piles, int max_passes) {
    if (num_cards <= 1) {
        // Une seule carte (ou aucune) est déjà à sa place: une passe suffit dès qu'il y a un tas
        if (num_piles >= 1 && max_passes >= 1) return 1;
        return std::nullopt;
    }
    // p <= 1 ne fait jamais croître l'accumulateur
    if (num_piles <= 1) {
        return std::nullopt;
    }

    std::uint64_t accumulator = num_piles;
    for (int k = 1; k <= max_passes; ++k) {
        if (accumulator >= num_cards) {
            return k;
        }
        // accumulator < num_cards ici, donc accumulator * num_piles ne déborde pas pour des tailles raisonnables
        accumulator *= num_piles;
    }
    return std::nullopt;
}

std::uint64_t min_piles_for_passes(std::uint64_t num_cards, int num_passes) {
    if (num_passes <= 0) {
        throw std::invalid_argument("num_passes must be > 0");
    }
    if (num_cards <= 1) return 1;

    // Recherche entière: pas d'erreur d'arrondi sur les carrés/cubes parfaits
    for (std::uint64_t piles = 2; ; ++piles) {
        std::uint64_t power = 1;
        int k = 0;
        while (k < num_passes && power < num_cards) {
            power *= piles;
            ++k;
        }
        if (power >= num_cards) return piles;
    }
}

std::uint32_t digit_for_pass(std::uint32_t value, std::uint32_t base, int digit_index) {
    if (base == 0) {
        throw std::invalid_argument("digit_for_pass: base must be > 0");
    }
    if (digit_index < 0) {
        throw std::invalid_argument("digit_for_pass: digit_index must be >= 0");
    }
    if (base == 1) return 0;

    std::uint32_t quotient = value;
    for (int i = 0; i < digit_index && quotient > 0; ++i) {
        quotient /= base;
    }
    return quotient % base;
}

bool gather_forward_for_pass(int num_passes, int pass_index) {
    return (num_passes - 1 - pass_index) % 2 == 0;
}

// -----------------------------------------------------------------------------
//  PassPlan
// -----------------------------------------------------------------------------
PassPlan::PassPlan(std::uint32_t num_cards, std::uint32_t num_piles, int num_passes)
    : num_cards_(num_cards), num_piles_(num_piles), num_passes_(num_passes)
{
    if (num_piles_ == 0) throw std::invalid_argument("PassPlan: num_piles must be > 0");
    if (num_passes_ <= 0) throw std::invalid_argument("PassPlan: num_passes must be > 0");

    std::optional<int> minimal = compute_passes(num_cards_, num_piles_, num_passes_);
    if (!minimal || *minimal != num_passes_) {
        throw std::invalid_argument("PassPlan: " + std::to_string(num_passes_) + " is not the minimal pass count for "
                                    + std::to_string(num_cards_) + " cards on " + std::to_string(num_piles_) + " piles");
    }
}

void PassPlan::check_pass_index(int pass_index) const {
    if (pass_index < 0 || pass_index >= num_passes_) {
        throw std::out_of_range("Pass index " + std::to_string(pass_index) + " outside [0, "
                                + std::to_string(num_passes_) + ")");
    }
}

std::uint32_t PassPlan::pile_for(std::uint32_t target, int pass_index) const {
    check_pass_index(pass_index);
    return digit_for_pass(target, num_piles_, pass_index);
}

bool PassPlan::gather_forward(int pass_index) const {
    check_pass_index(pass_index);
    return gather_forward_for_pass(num_passes_, pass_index);
}

PassPlan make_pass_plan(std::uint32_t num_cards, std::uint32_t num_piles, int max_passes) {
    std::optional<int> passes = compute_passes(num_cards, num_piles, max_passes);
    if (!passes) {
        spdlog::warn("Plan de passes impossible: {} cartes, {} tas, max {} passes", num_cards, num_piles, max_passes);
        throw PassesInfeasible(num_cards, num_piles, max_passes);
    }
    spdlog::debug("Plan de passes: {} cartes, {} tas -> {} passe(s)", num_cards, num_piles, *passes);
    return PassPlan(num_cards, num_piles, *passes);
}

} // namespace mat_shuffle
