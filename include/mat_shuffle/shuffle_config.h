#ifndef MAT_SHUFFLE_SHUFFLE_CONFIG_H
#define MAT_SHUFFLE_SHUFFLE_CONFIG_H

#include "mat_shuffle/common_types.h"
#include <cstddef>
#include <cstdint>
#include <string>

namespace mat_shuffle {

// Bornes acceptées pour chaque réglage (fixées par l'hôte)
struct ConfigLimits {
    int num_cards_min        = 1;
    int num_cards_max        = 10000;
    int rows_min             = 1;
    int rows_max             = 10;
    int columns_min          = 1;
    int columns_max          = 10;
    int instruction_rows_min = 1;
    int instruction_rows_max = 10;
    int max_passes_min       = 1;
    int max_passes_max       = 20;
};

// Seuils de l'appréciation GOOD / OK / POOR (choix produit, sans effet sur l'algorithme)
struct RatingThresholds {
    int good_max_passes = 2;
    int ok_max_passes   = 3;
};

struct ShuffleConfig {
    int num_cards        = 52;
    int rows             = 2;   // Hauteur du tapis (lignes A, B, ...)
    int columns          = 5;   // Largeur du tapis (colonnes 1, 2, ...)
    int instruction_rows = 2;   // Lignes de 5 instructions par page
    int max_passes       = DEFAULT_MAX_PASSES;
    int instructions_per_row = INSTRUCTIONS_PER_ROW;

    // Le mode non sécurisé doit être demandé explicitement
    bool allow_insecure_entropy = false;

    ConfigLimits     limits;
    RatingThresholds thresholds;

    std::uint32_t num_piles()      const { return static_cast<std::uint32_t>(rows) * static_cast<std::uint32_t>(columns); }
    std::size_t   cards_per_deal() const { return static_cast<std::size_t>(instruction_rows) * instructions_per_row; }
};

// Rapport de configuration: purement informatif, il ne bloque rien
struct ConfigReport {
    ConfigVerdict verdict       = ConfigVerdict::OUT_OF_RANGE;
    int           num_cards     = 0;
    int           rows          = 0;
    int           columns       = 0;
    std::uint32_t num_piles     = 0;
    int           num_passes    = 0;     // 0 si non faisable
    PassRating    rating        = PassRating::POOR;
    std::uint64_t piles_for_two_passes   = 0; // ceil(sqrt(N))
    std::uint64_t piles_for_three_passes = 0; // ceil(cbrt(N))
    std::string   message;

    bool feasible() const { return verdict == ConfigVerdict::OK; }
};

PassRating rate_passes(int num_passes, const RatingThresholds& thresholds = {});

// Lance ConfigurationOutOfRange sur la première valeur hors bornes
void validate_configuration(const ShuffleConfig& config);

// Contrôle complet ("Check settings"): ne lance jamais, le verdict et le message disent tout
ConfigReport assess_configuration(const ShuffleConfig& config);

} // namespace mat_shuffle

#endif // MAT_SHUFFLE_SHUFFLE_CONFIG_H
