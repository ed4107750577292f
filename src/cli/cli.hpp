// cli.hpp : Lecture de la ligne de commande (cxxopts)
#ifndef MAT_SHUFFLE_CLI_HPP
#define MAT_SHUFFLE_CLI_HPP

#include "mat_shuffle/shuffle_config.h"
#include <cstdint>
#include <optional>
#include <string>

namespace mat_shuffle::cli {

struct Options {
    ShuffleConfig config;

    // Seulement le rapport de configuration ("Check settings")
    bool check_only = false;
    bool verbose    = false;
    bool parse_error = false;

    // Graine du mode non sécurisé; nullopt => source sécurisée du système
    std::optional<std::uint32_t> insecure_seed;
};

// Remplit Options depuis argv. want_help passe à true pour --help ou une erreur de syntaxe,
// help_text contient alors l'aide (précédée du message d'erreur le cas échéant).
Options parse_args(int argc, char** argv, bool& want_help, std::string& help_text);

} // namespace mat_shuffle::cli

#endif // MAT_SHUFFLE_CLI_HPP
