#ifndef MAT_SHUFFLE_CORE_SAMPLER_HPP
#define MAT_SHUFFLE_CORE_SAMPLER_HPP

#include "core/entropy.hpp"
#include <cstdint>

namespace mat_shuffle {

// Nombre de bits nécessaires pour encoder max_inclusive (= ceil(log2(max_inclusive + 1)))
//
//   x            0  1  2  3  4  5  6  7  8  9  10
//   bits(x)      0  1  2  2  3  3  3  3  4  4  4
int bits_needed(std::uint32_t max_inclusive);

// Masque des `bits` bits de poids faible
std::uint32_t low_bits_mask(int bits);

// Échantillonnage par rejet: tirage 32 bits, masque, rejet si > max.
// Pas de réduction modulo (biais vers les petites valeurs).
class UnbiasedSampler {
public:
    explicit UnbiasedSampler(EntropySource& source);

    // Entier uniforme dans [0, max_inclusive]. sample(0) ne consomme pas d'entropie.
    std::uint32_t sample(std::uint32_t max_inclusive);

    // Instrumentation
    std::uint64_t draws()      const { return draws_; }
    std::uint64_t rejections() const { return rejections_; }
    void reset_counters() { draws_ = 0; rejections_ = 0; }


private:
    EntropySource& source_;
    std::uint64_t  draws_      = 0;
    std::uint64_t  rejections_ = 0;
};

} // namespace mat_shuffle

#endif // MAT_SHUFFLE_CORE_SAMPLER_HPP
