#ifndef MAT_SHUFFLE_MAT_MAPPER_H
#define MAT_SHUFFLE_MAT_MAPPER_H

#include "mat_shuffle/common_types.h"
#include "mat_shuffle/pile_engine.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mat_shuffle {

// Une page de donne: les étiquettes à suivre dans l'ordre et leur rendu texte
struct DealPage {
    std::vector<std::string> labels;
    std::string              text;
};

// Instructions d'une passe projetées sur le tapis
struct MappedPass {
    int                   pass_index;
    std::vector<DealPage> pages;
    std::string           gather_text;
};

// Tapis: grille rows x columns d'étiquettes, numérotée de gauche à droite et de haut en bas.
// Dans un tapis 2x2, [0] = A1, [1] = A2, [2] = B1, [3] = B2.
class Mat {
public:
    static constexpr int MAX_ROWS = 26; // Une seule lettre par ligne

    Mat(int rows, int columns);

    int get_rows()      const { return rows_; }
    int get_columns()   const { return columns_; }
    std::uint32_t get_num_piles() const { return static_cast<std::uint32_t>(labels_.size()); }

    const std::vector<std::string>& labels() const { return labels_; }
    const std::string&              label(std::uint32_t pile) const;

    // Étiquettes dans l'ordre physique de donne
    std::vector<std::string> deal_labels(const PileInstructions& instructions) const;

    // Texte expliquant dans quel ordre ramasser les tas
    std::string gather_instruction(bool gather_forward) const;

    MappedPass map_instructions(const PileInstructions& instructions, int pass_index,
                                std::size_t cards_per_deal,
                                int instructions_per_row = INSTRUCTIONS_PER_ROW) const;

    std::string toString() const;

private:
    int rows_;
    int columns_;
    std::vector<std::string> labels_;
};

// Découpe une suite d'étiquettes en pages de cards_per_deal entrées (la dernière peut être plus courte).
// Un saut de ligne toutes les instructions_per_row entrées.
std::vector<DealPage> split_by_num_per_deal(const std::vector<std::string>& deal_labels,
                                            std::size_t cards_per_deal,
                                            int instructions_per_row = INSTRUCTIONS_PER_ROW);

} // namespace mat_shuffle

#endif // MAT_SHUFFLE_MAT_MAPPER_H
