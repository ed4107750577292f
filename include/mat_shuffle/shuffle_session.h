#ifndef MAT_SHUFFLE_SHUFFLE_SESSION_H
#define MAT_SHUFFLE_SHUFFLE_SESSION_H

#include "mat_shuffle/common_types.h"
#include "mat_shuffle/shuffle_config.h"
#include "mat_shuffle/pile_engine.h"
#include "mat_shuffle/mat_mapper.h"
#include "core/deck.hpp"
#include "core/entropy.hpp"
#include <string>
#include <vector>

namespace mat_shuffle {

// Une page affichable. pass_index / page_index valent -1 pour les marqueurs BEGIN / DONE.
struct InstructionPage {
    PageKind                 kind;
    int                      pass_index;
    int                      page_index;
    std::vector<std::string> labels;  // Vide sauf pour DEAL
    std::string              text;
};

// Résultat complet et vérifié d'une randomisation
struct ShuffleResult {
    ConfigReport                 report;
    Deck                         permutation;
    std::vector<PassResult>      passes;
    std::vector<MappedPass>      mapped_passes;
    std::vector<InstructionPage> pages;
};

extern const char* const BEGIN_TEXT;
extern const char* const DONE_TEXT;

// BEGIN, puis pour chaque passe ses pages DEAL et sa page GATHER, puis DONE
std::vector<InstructionPage> frame_pages(const std::vector<MappedPass>& mapped_passes);

// Pipeline complet: validation, permutation, plan, passes, projection sur le tapis.
// Tout ou rien: lance ConfigurationOutOfRange, PassesInfeasible ou EntropyUnavailable
// avant de produire la moindre instruction.
ShuffleResult run_shuffle(const ShuffleConfig& config, EntropySource& entropy);

// Idem avec la source d'entropie sécurisée du système
ShuffleResult run_shuffle(const ShuffleConfig& config);

} // namespace mat_shuffle

#endif // MAT_SHUFFLE_SHUFFLE_SESSION_H
