#ifndef MAT_SHUFFLE_COMMON_TYPES_H
#define MAT_SHUFFLE_COMMON_TYPES_H

namespace mat_shuffle {

// Nombre d'instructions par ligne affichée (fixe)
constexpr int INSTRUCTIONS_PER_ROW = 5;

// Plafond "généreux" du nombre de passes (4 suffit en pratique)
constexpr int DEFAULT_MAX_PASSES = 10;

// Appréciation qualitative d'un réglage
enum class PassRating {
    GOOD,   // 1 ou 2 passes
    OK,     // 3 passes
    POOR    // 4 passes et plus
};

// Verdict du contrôle de configuration
enum class ConfigVerdict {
    OK,
    OUT_OF_RANGE,
    INFEASIBLE
};

// Types de pages d'instructions
enum class PageKind {
    BEGIN,   // Marqueur de début
    DEAL,    // Tranche d'instructions de donne
    GATHER,  // Comment ramasser les tas
    DONE     // Marqueur de fin
};

inline const char* rating_to_string(PassRating rating) {
    switch (rating) {
        case PassRating::GOOD: return "GOOD";
        case PassRating::OK:   return "OK";
        case PassRating::POOR: return "POOR";
        default:               return "UNKNOWN";
    }
}

inline const char* verdict_to_string(ConfigVerdict verdict) {
    switch (verdict) {
        case ConfigVerdict::OK:           return "OK";
        case ConfigVerdict::OUT_OF_RANGE: return "OUT_OF_RANGE";
        case ConfigVerdict::INFEASIBLE:   return "INFEASIBLE";
        default:                          return "UNKNOWN";
    }
}

inline const char* page_kind_to_string(PageKind kind) {
    switch (kind) {
        case PageKind::BEGIN:  return "BEGIN";
        case PageKind::DEAL:   return "DEAL";
        case PageKind::GATHER: return "GATHER";
        case PageKind::DONE:   return "DONE";
        default:               return "UNKNOWN";
    }
}

} // namespace mat_shuffle

#endif // MAT_SHUFFLE_COMMON_TYPES_H
