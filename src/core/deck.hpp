#ifndef MAT_SHUFFLE_CORE_DECK_HPP
#define MAT_SHUFFLE_CORE_DECK_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mat_shuffle {

// Une carte est identifiée par sa valeur 0..N-1.
// Dans une permutation, la valeur est la position finale visée par la carte.
using Card = std::uint32_t;

// Paquet ordonné, index 0 = dessous du paquet, index N-1 = dessus.
// Immuable: chaque passe produit un nouveau Deck au lieu de modifier l'ancien.
class Deck {
public:
    // Paquet identité 0..size-1 (seul cas où l'on crée un paquet "de rien")
    static Deck identity(std::size_t size);

    explicit Deck(std::vector<Card> cards);
    // Copie de `size` cartes de `source` à partir de `offset`
    Deck(std::size_t size, const std::vector<Card>& source, std::size_t offset);
    ~Deck() = default;

    std::size_t              size()        const { return cards_.size(); }
    bool                     empty()       const { return cards_.empty(); }
    const std::vector<Card>& cards()       const { return cards_; }
    Card                     at(std::size_t i) const;
    Card                     bottom()      const { return at(0); }
    Card                     top()         const { return at(cards_.size() - 1); }

    // Vrai si chaque valeur 0..N-1 apparaît exactement une fois
    bool is_permutation() const;
    bool is_identity()    const;

    std::string toString() const;

    bool operator==(const Deck& other) const { return cards_ == other.cards_; }
    bool operator!=(const Deck& other) const { return !(*this == other); }

private:
    std::vector<Card> cards_;
};

} // namespace mat_shuffle

#endif // MAT_SHUFFLE_CORE_DECK_HPP
