#ifndef MAT_SHUFFLE_ERRORS_H
#define MAT_SHUFFLE_ERRORS_H

#include <stdexcept>
#include <string>

namespace mat_shuffle {

// Toutes ces erreurs sont terminales pour le calcul en cours: rien n'est réessayé.

// Une entrée est hors des bornes configurées (nombre de cartes, tapis, lignes d'instructions...)
class ConfigurationOutOfRange : public std::invalid_argument {
public:
    ConfigurationOutOfRange(const std::string& field, long value, long min_value, long max_value)
        : std::invalid_argument(field + " = " + std::to_string(value) + " is outside the allowed range ["
                                + std::to_string(min_value) + ", " + std::to_string(max_value) + "]."),
          field_(field), value_(value), min_(min_value), max_(max_value) {}

    const std::string& field() const { return field_; }
    long value()     const { return value_; }
    long min_value() const { return min_; }
    long max_value() const { return max_; }

private:
    std::string field_;
    long value_;
    long min_;
    long max_;
};

// Aucun nombre de passes K <= max_passes ne vérifie P^K >= N
class PassesInfeasible : public std::runtime_error {
public:
    PassesInfeasible(long num_cards, long num_piles, int max_passes)
        : std::runtime_error("Too many passes needed to randomise " + std::to_string(num_cards) + " cards on "
                             + std::to_string(num_piles) + " piles (more than " + std::to_string(max_passes) + ")."),
          max_passes_(max_passes) {}

    int max_passes() const { return max_passes_; }

private:
    int max_passes_;
};

// La source d'entropie sécurisée ne peut pas fournir de bits
class EntropyUnavailable : public std::runtime_error {
public:
    explicit EntropyUnavailable(const std::string& what)
        : std::runtime_error("Secure entropy unavailable: " + what) {}
};

} // namespace mat_shuffle

#endif // MAT_SHUFFLE_ERRORS_H
