#include "mat_shuffle/shuffle_session.h"
#include "mat_shuffle/errors.h"
#include "mat_shuffle/pass_plan.h"
#include "core/permutation.hpp"
#include "core/sampler.hpp"
#include "spdlog/spdlog.h"
#include <utility>

namespace mat_shuffle {

const char* const BEGIN_TEXT = "Virtual randomisation complete.\n\nProceed to the first deal instruction.";
const char* const DONE_TEXT  = "Done!\n\nDeck randomised and ready for use.";

std::vector<InstructionPage> frame_pages(const std::vector<MappedPass>& mapped_passes) {
    std::vector<InstructionPage> pages;
    pages.push_back(InstructionPage{PageKind::BEGIN, -1, -1, {}, BEGIN_TEXT});

    for (const MappedPass& mapped : mapped_passes) {
        for (std::size_t p = 0; p < mapped.pages.size(); ++p) {
            pages.push_back(InstructionPage{PageKind::DEAL, mapped.pass_index, static_cast<int>(p),
                                            mapped.pages[p].labels, mapped.pages[p].text});
        }
        pages.push_back(InstructionPage{PageKind::GATHER, mapped.pass_index, -1, {}, mapped.gather_text});
    }

    pages.push_back(InstructionPage{PageKind::DONE, -1, -1, {}, DONE_TEXT});
    return pages;
}

ShuffleResult run_shuffle(const ShuffleConfig& config, EntropySource& entropy) {
    // 1. Toute la validation avant la moindre randomisation
    validate_configuration(config);
    ConfigReport report = assess_configuration(config);
    if (report.verdict == ConfigVerdict::INFEASIBLE) {
        throw PassesInfeasible(config.num_cards, config.num_piles(), config.max_passes);
    }
    if (!entropy.is_secure() && !config.allow_insecure_entropy) {
        spdlog::error("Source d'entropie non sécurisée '{}' refusée (allow_insecure_entropy = false).", entropy.name());
        throw EntropyUnavailable("source '" + entropy.name() + "' is not secure and insecure mode was not requested");
    }

    spdlog::info("Randomisation de {} cartes sur un tapis {}x{} ({} tas), {} passe(s) [{}], entropie {}",
                 config.num_cards, config.columns, config.rows, report.num_piles, report.num_passes,
                 rating_to_string(report.rating), entropy.name());

    // 2. Le tapis (les étiquettes ne dépendent que de la géométrie)
    const Mat mat(config.rows, config.columns);
    spdlog::debug("{}", mat.toString());

    // 3. La seule étape aléatoire
    UnbiasedSampler sampler(entropy);
    Deck permutation = generate_permutation(static_cast<std::size_t>(config.num_cards), sampler);
    spdlog::debug("Permutation tirée: {} tirages, {} rejets", sampler.draws(), sampler.rejections());

    // 4. Plan de passes et simulation de la donne
    const PassPlan plan = make_pass_plan(static_cast<std::uint32_t>(config.num_cards), config.num_piles(), config.max_passes);
    std::vector<PassResult> passes = run_passes(permutation, plan);

    // 5. Projection sur le tapis et pagination
    std::vector<MappedPass> mapped;
    mapped.reserve(passes.size());
    for (const PassResult& pass : passes) {
        mapped.push_back(mat.map_instructions(pass.instructions, pass.pass_index,
                                              config.cards_per_deal(), config.instructions_per_row));
    }
    std::vector<InstructionPage> pages = frame_pages(mapped);

    spdlog::info("Randomisation terminée: {} page(s) d'instructions.", pages.size());
    return ShuffleResult{std::move(report), std::move(permutation), std::move(passes), std::move(mapped), std::move(pages)};
}

ShuffleResult run_shuffle(const ShuffleConfig& config) {
    validate_configuration(config);
    SecureEntropySource entropy;
    return run_shuffle(config, entropy);
}

} // namespace mat_shuffle
