#include "mat_shuffle/shuffle_session.h"
#include "mat_shuffle/shuffle_config.h"
#include "mat_shuffle/shuffle_utils.hpp"
#include "mat_shuffle/errors.h"
#include "core/entropy.hpp"
#include "cli/cli.hpp"
#include "spdlog/spdlog.h"

#include <iostream>   // std::cout, std::cerr
#include <memory>     // std::unique_ptr
#include <string>     // std::string
#include <exception>  // std::exception

int main(int argc, char* argv[])
{
    // ─────────────────────────────────────────────────────────────
    // Paramètres
    // ─────────────────────────────────────────────────────────────
    bool        want_help = false;
    std::string help_text;
    mat_shuffle::cli::Options options = mat_shuffle::cli::parse_args(argc, argv, want_help, help_text);
    if (want_help)
    {
        (options.parse_error ? std::cerr : std::cout) << help_text << '\n';
        return options.parse_error ? 2 : 0;
    }

    // ─────────────────────────────────────────────────────────────
    // Logging
    // ─────────────────────────────────────────────────────────────
    spdlog::set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::info("Démarrage de mat_shuffle…");

    // 1. Rapport de configuration (ne lance jamais)
    const mat_shuffle::ConfigReport report = mat_shuffle::assess_configuration(options.config);
    std::cout << report.message << "\n\n";
    if (!report.feasible())
    {
        spdlog::error("Configuration refusée ({}).", mat_shuffle::verdict_to_string(report.verdict));
        return 1;
    }
    if (options.check_only)
    {
        spdlog::info("Contrôle seul demandé, pas de randomisation.");
        return 0;
    }

    try
    {
        // 2. Source d'entropie: sécurisée sauf demande explicite
        std::unique_ptr<mat_shuffle::EntropySource> entropy;
        if (options.insecure_seed)
            entropy = std::make_unique<mat_shuffle::InsecureEntropySource>(*options.insecure_seed);
        else
            entropy = std::make_unique<mat_shuffle::SecureEntropySource>();

        // 3. Randomisation complète et instructions
        const mat_shuffle::ShuffleResult result = mat_shuffle::run_shuffle(options.config, *entropy);
        std::cout << mat_shuffle::pages_to_string(result);
    }
    catch (const mat_shuffle::EntropyUnavailable& e)
    {
        spdlog::critical("Entropie indisponible : {}", e.what());
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Erreur critique : {}", e.what());
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    spdlog::info("Exécution terminée.");
    return 0;
}
