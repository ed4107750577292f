#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "mat_shuffle/shuffle_session.h"
#include "mat_shuffle/shuffle_utils.hpp"
#include "mat_shuffle/errors.h"
#include "support/scripted_entropy.hpp"
#include <string>
#include <vector>

using namespace mat_shuffle;
using mat_shuffle::testing::ScriptedEntropySource;
using mat_shuffle::testing::SeededSecureTestSource;
using Catch::Matchers::ContainsSubstring;

namespace {
    ShuffleConfig config_for(int cards, int rows, int columns, int instruction_rows = 2) {
        ShuffleConfig config;
        config.num_cards = cards;
        config.rows = rows;
        config.columns = columns;
        config.instruction_rows = instruction_rows;
        return config;
    }

    std::size_t count_kind(const std::vector<InstructionPage>& pages, PageKind kind) {
        std::size_t n = 0;
        for (const auto& page : pages) if (page.kind == kind) ++n;
        return n;
    }
} // namespace anonyme

TEST_CASE("Full run: 100 cards on a 5x2 mat", "[session]") {
    SeededSecureTestSource entropy(12345);
    ShuffleResult result = run_shuffle(config_for(100, 2, 5), entropy);

    REQUIRE(result.report.num_passes == 2);
    REQUIRE(result.permutation.is_permutation());
    REQUIRE(result.passes.size() == 2);
    REQUIRE_FALSE(result.passes[0].instructions.gather_forward());
    REQUIRE(result.passes[1].instructions.gather_forward());
    REQUIRE(result.passes.back().deck.is_identity());

    SECTION("Page framing") {
        const auto& pages = result.pages;
        // BEGIN + 2 x (10 pages de donne + ramassage) + DONE
        REQUIRE(pages.size() == 24);
        REQUIRE(pages.front().kind == PageKind::BEGIN);
        REQUIRE(pages.front().text == BEGIN_TEXT);
        REQUIRE(pages.back().kind == PageKind::DONE);
        REQUIRE(pages.back().text == DONE_TEXT);
        REQUIRE(count_kind(pages, PageKind::DEAL) == 20);
        REQUIRE(count_kind(pages, PageKind::GATHER) == 2);
        REQUIRE(pages[11].kind == PageKind::GATHER);
        REQUIRE(pages[11].pass_index == 0);
        REQUIRE(pages[12].kind == PageKind::DEAL);
        REQUIRE(pages[12].pass_index == 1);
        REQUIRE(pages[12].page_index == 0);
    }

    SECTION("Deal pages spell out the deal order of each pass") {
        Mat mat(2, 5);
        for (const PassResult& pass : result.passes) {
            std::vector<std::string> from_pages;
            for (const auto& page : result.pages) {
                if (page.kind == PageKind::DEAL && page.pass_index == pass.pass_index) {
                    from_pages.insert(from_pages.end(), page.labels.begin(), page.labels.end());
                }
            }
            REQUIRE(from_pages == mat.deal_labels(pass.instructions));
        }
    }

    SECTION("Printable output") {
        std::string text = pages_to_string(result);
        REQUIRE_THAT(text, ContainsSubstring("Pass 1/2 - deal 1/10"));
        REQUIRE_THAT(text, ContainsSubstring("Pass 2/2 - gather"));
        REQUIRE_THAT(text, ContainsSubstring("Deck randomised and ready for use."));
    }
}

TEST_CASE("Short last page: 23 cards, 10 per page", "[session][pagination]") {
    SeededSecureTestSource entropy(3);
    ShuffleResult result = run_shuffle(config_for(23, 1, 5), entropy);

    REQUIRE(result.report.num_passes == 2);
    REQUIRE(result.mapped_passes.size() == 2);
    for (const MappedPass& mapped : result.mapped_passes) {
        REQUIRE(mapped.pages.size() == 3);
        REQUIRE(mapped.pages[0].labels.size() == 10);
        REQUIRE(mapped.pages[1].labels.size() == 10);
        REQUIRE(mapped.pages[2].labels.size() == 3);
    }
    REQUIRE(result.passes.back().deck.is_identity());
}

TEST_CASE("Same entropy stream, same instructions", "[session]") {
    SeededSecureTestSource a(77);
    SeededSecureTestSource b(77);
    ShuffleResult ra = run_shuffle(config_for(52, 2, 4), a);
    ShuffleResult rb = run_shuffle(config_for(52, 2, 4), b);
    REQUIRE(ra.permutation == rb.permutation);
    REQUIRE(pages_to_string(ra) == pages_to_string(rb));
}

TEST_CASE("Errors are raised before any instruction is produced", "[session][errors]") {
    SECTION("Out of range configuration consumes no entropy") {
        ScriptedEntropySource entropy({1u, 2u, 3u});
        REQUIRE_THROWS_AS(run_shuffle(config_for(0, 2, 5), entropy), ConfigurationOutOfRange);
        REQUIRE(entropy.consumed() == 0);
    }

    SECTION("Infeasible pass count consumes no entropy") {
        ScriptedEntropySource entropy({1u, 2u, 3u});
        ShuffleConfig config = config_for(5000, 1, 2);
        REQUIRE_THROWS_AS(run_shuffle(config, entropy), PassesInfeasible);
        REQUIRE(entropy.consumed() == 0);
    }

    SECTION("Exhausted entropy aborts the whole run") {
        ScriptedEntropySource entropy({0u, 0u});
        REQUIRE_THROWS_AS(run_shuffle(config_for(52, 2, 5), entropy), EntropyUnavailable);
    }

    SECTION("An insecure source must be requested explicitly") {
        InsecureEntropySource insecure(1);
        ShuffleConfig config = config_for(52, 2, 5);
        REQUIRE_THROWS_AS(run_shuffle(config, insecure), EntropyUnavailable);

        config.allow_insecure_entropy = true;
        ShuffleResult result = run_shuffle(config, insecure);
        REQUIRE(result.passes.back().deck.is_identity());
    }
}

TEST_CASE("Single pass and single card runs", "[session]") {
    SECTION("Enough piles for one pass") {
        SeededSecureTestSource entropy(5);
        ShuffleResult result = run_shuffle(config_for(8, 2, 5, 1), entropy);
        REQUIRE(result.report.num_passes == 1);
        REQUIRE(result.passes.size() == 1);
        REQUIRE(result.passes[0].instructions.gather_forward());
        // Une passe: chaque carte va directement dans le tas de sa position finale
        for (std::size_t i = 0; i < result.permutation.size(); ++i) {
            REQUIRE(result.passes[0].instructions.deck_ordered()[i] == result.permutation.cards()[i]);
        }
        REQUIRE(result.pages.size() == 1 + 2 + 1 + 1);
    }

    SECTION("One card") {
        ScriptedEntropySource entropy(std::vector<std::uint32_t>{});
        ShuffleResult result = run_shuffle(config_for(1, 1, 1), entropy);
        REQUIRE(result.permutation.cards() == std::vector<Card>{0});
        REQUIRE(result.passes.size() == 1);
        REQUIRE(result.pages.size() == 4);
        REQUIRE(result.pages[1].labels == std::vector<std::string>{"A1"});
        REQUIRE(result.pages[2].text == "Pick up the single pile A1.");
    }
}

TEST_CASE("Secure run with the system entropy source", "[session][entropy]") {
    ShuffleResult result = run_shuffle(ShuffleConfig{});
    REQUIRE(result.report.num_passes == 2);
    REQUIRE(result.passes.back().deck.is_identity());
}

TEST_CASE("Display helpers", "[session][utils]") {
    REQUIRE(gather_direction_to_string(true) == "forward");
    REQUIRE(gather_direction_to_string(false) == "backward");
    REQUIRE(vec_to_string({2, 0, 1}) == "[2 0 1]");
    REQUIRE(vec_to_string({}) == "[]");

    InstructionPage gather{PageKind::GATHER, 1, -1, {}, ""};
    REQUIRE(page_title(gather, 3, 0) == "Pass 2/3 - gather");
    InstructionPage deal{PageKind::DEAL, 0, 2, {"A1"}, "A1"};
    REQUIRE(page_title(deal, 2, 6) == "Pass 1/2 - deal 3/6");
}
