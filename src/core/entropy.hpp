#ifndef MAT_SHUFFLE_CORE_ENTROPY_HPP
#define MAT_SHUFFLE_CORE_ENTROPY_HPP

#include <cstdint>
#include <memory>
#include <random>   // Pour std::random_device et std::mt19937
#include <string>

namespace mat_shuffle {

// Source de mots aléatoires de largeur fixe (32 bits).
// Le mode non sécurisé est une classe distincte: on ne bascule jamais dessus silencieusement.
class EntropySource {
public:
    virtual ~EntropySource() = default;

    // Lance EntropyUnavailable si la source ne peut plus fournir de bits
    virtual std::uint32_t next_u32() = 0;
    virtual bool is_secure() const = 0;
    virtual std::string name() const = 0;
};

// Source du système (std::random_device), utilisée en production
class SecureEntropySource : public EntropySource {
public:
    SecureEntropySource();
    explicit SecureEntropySource(const std::string& token);

    std::uint32_t next_u32() override;
    bool is_secure() const override { return true; }
    std::string name() const override { return "random_device(" + token_ + ")"; }

private:
    std::string token_;
    std::unique_ptr<std::random_device> device_;
};

// Mersenne Twister graine fixe: compatibilité et tests uniquement
class InsecureEntropySource : public EntropySource {
public:
    explicit InsecureEntropySource(std::uint32_t seed);

    std::uint32_t next_u32() override { return rng_(); }
    bool is_secure() const override { return false; }
    std::string name() const override { return "mt19937(seed=" + std::to_string(seed_) + ")"; }

private:
    std::uint32_t seed_;
    std::mt19937  rng_;
};

} // namespace mat_shuffle

#endif // MAT_SHUFFLE_CORE_ENTROPY_HPP
