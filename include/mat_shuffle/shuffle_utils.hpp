#ifndef MAT_SHUFFLE_SHUFFLE_UTILS_HPP
#define MAT_SHUFFLE_SHUFFLE_UTILS_HPP

#include "mat_shuffle/shuffle_session.h"
#include <string>
#include <vector>
#include "core/deck.hpp" // Pour Card

namespace mat_shuffle {

// "forward" / "backward"
std::string gather_direction_to_string(bool gather_forward);

std::string vec_to_string(const std::vector<Card>& cards);

// En-tête d'une page, ex. "Pass 1/2 - deal 3/6" ou "Pass 1/2 - gather"
std::string page_title(const InstructionPage& page, int num_passes, std::size_t pages_in_pass);

// Toutes les pages du résultat, numérotées, prêtes à imprimer
std::string pages_to_string(const ShuffleResult& result);

} // namespace mat_shuffle

#endif // MAT_SHUFFLE_SHUFFLE_UTILS_HPP
