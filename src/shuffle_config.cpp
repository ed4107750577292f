#include "mat_shuffle/shuffle_config.h"
#include "mat_shuffle/errors.h"
#include "mat_shuffle/mat_mapper.h"
#include "mat_shuffle/pass_plan.h"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <optional>
#include <sstream>

namespace mat_shuffle {

namespace {
    void check_range(const char* field, int value, int min_value, int max_value) {
        if (value < min_value || value > max_value) {
            throw ConfigurationOutOfRange(field, value, min_value, max_value);
        }
    }

    std::string info_lines(const ShuffleConfig& config, const ConfigReport& report) {
        std::stringstream ss;
        ss << "- Info:\n"
           << "* [" << config.columns << " * " << config.rows << "] mat spaces gives a total of "
           << report.num_piles << " piles.\n"
           << "* " << report.piles_for_two_passes << "+ piles needed for 2 pass for " << config.num_cards << " cards.\n"
           << "* " << report.piles_for_three_passes << "+ piles needed for 3 pass for " << config.num_cards << " cards.";
        return ss.str();
    }
}

PassRating rate_passes(int num_passes, const RatingThresholds& thresholds) {
    if (num_passes <= thresholds.good_max_passes) return PassRating::GOOD;
    if (num_passes <= thresholds.ok_max_passes)   return PassRating::OK;
    return PassRating::POOR;
}

void validate_configuration(const ShuffleConfig& config) {
    const ConfigLimits& l = config.limits;
    check_range("num_cards",        config.num_cards,        l.num_cards_min,        l.num_cards_max);
    check_range("rows",             config.rows,             l.rows_min,             std::min(l.rows_max, Mat::MAX_ROWS));
    check_range("columns",          config.columns,          l.columns_min,          l.columns_max);
    check_range("instruction_rows", config.instruction_rows, l.instruction_rows_min, l.instruction_rows_max);
    check_range("max_passes",       config.max_passes,       l.max_passes_min,       l.max_passes_max);
    check_range("instructions_per_row", config.instructions_per_row, 1, INSTRUCTIONS_PER_ROW * 4);
    if (config.thresholds.good_max_passes > config.thresholds.ok_max_passes) {
        throw ConfigurationOutOfRange("thresholds.good_max_passes", config.thresholds.good_max_passes,
                                      0, config.thresholds.ok_max_passes);
    }
}

ConfigReport assess_configuration(const ShuffleConfig& config) {
    ConfigReport report;
    report.num_cards = config.num_cards;
    report.rows      = config.rows;
    report.columns   = config.columns;

    try {
        validate_configuration(config);
    } catch (const ConfigurationOutOfRange& e) {
        spdlog::warn("Configuration hors bornes: {}", e.what());
        report.verdict = ConfigVerdict::OUT_OF_RANGE;
        report.message = std::string("Current settings are outside allowed values.\n\n") + e.what()
                       + "\n\nAdjust the settings, then check them again.";
        return report;
    }

    report.num_piles              = config.num_piles();
    report.piles_for_two_passes   = min_piles_for_passes(static_cast<std::uint64_t>(config.num_cards), 2);
    report.piles_for_three_passes = min_piles_for_passes(static_cast<std::uint64_t>(config.num_cards), 3);

    std::optional<int> passes = compute_passes(static_cast<std::uint64_t>(config.num_cards), report.num_piles, config.max_passes);
    if (!passes) {
        spdlog::warn("Configuration infaisable: {} cartes sur {} tas, plus de {} passes", config.num_cards, report.num_piles, config.max_passes);
        report.verdict = ConfigVerdict::INFEASIBLE;
        report.message = "Too many passes needed (more than " + std::to_string(config.max_passes) + ").\n\n"
                       + "Adjust the settings, then check them again.\n\n" + info_lines(config, report);
        return report;
    }

    report.verdict    = ConfigVerdict::OK;
    report.num_passes = *passes;
    report.rating     = rate_passes(*passes, config.thresholds);

    std::stringstream ss;
    ss << "- Current settings: " << rating_to_string(report.rating) << "\n"
       << "(" << config.num_cards << " cards randomised in " << report.num_passes << " deals.)\n"
       << "(Mat spaces used (W*H): [" << config.columns << "*" << config.rows << "].)\n\n"
       << info_lines(config, report);
    report.message = ss.str();

    spdlog::debug("Configuration OK: {} cartes, {} tas, {} passe(s), {}", config.num_cards, report.num_piles,
                  report.num_passes, rating_to_string(report.rating));
    return report;
}

} // namespace mat_shuffle
