#ifndef MAT_SHUFFLE_CORE_PERMUTATION_HPP
#define MAT_SHUFFLE_CORE_PERMUTATION_HPP

#include "core/deck.hpp"
#include "core/sampler.hpp"
#include <cstddef>

namespace mat_shuffle {

// Fisher-Yates sur l'identité: la valeur en position i est la position finale de la carte i.
// Toute la randomisation a lieu ici; le reste n'est que de la donne.
Deck generate_permutation(std::size_t num_cards, UnbiasedSampler& sampler);

} // namespace mat_shuffle

#endif // MAT_SHUFFLE_CORE_PERMUTATION_HPP
