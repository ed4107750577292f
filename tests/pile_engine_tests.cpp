#include <catch2/catch_test_macros.hpp>
#include "mat_shuffle/pile_engine.h"
#include "mat_shuffle/pass_plan.h"
#include "core/permutation.hpp"
#include "core/entropy.hpp"
#include <stdexcept>
#include <vector>

using namespace mat_shuffle;

namespace {
    Deck random_permutation(std::size_t n, std::uint32_t seed) {
        InsecureEntropySource source(seed);
        UnbiasedSampler sampler(source);
        return generate_permutation(n, sampler);
    }
} // namespace anonyme

TEST_CASE("PileInstructions", "[pile_engine]") {
    PileInstructions instr({0, 1, 2, 2, 0}, 3, true);
    REQUIRE(instr.get_num_instructions() == 5);
    REQUIRE(instr.deck_ordered() == std::vector<std::uint32_t>{0, 1, 2, 2, 0});
    // Le dessus du paquet est donné en premier
    REQUIRE(instr.deal_ordered() == std::vector<std::uint32_t>{0, 2, 2, 1, 0});
    REQUIRE(instr.gather_forward());

    REQUIRE_THROWS_AS(PileInstructions({0, 3}, 3, true), std::out_of_range);
    REQUIRE_THROWS_AS(PileInstructions({0}, 0, true), std::invalid_argument);
}

TEST_CASE("Deal and gather simulation", "[pile_engine]") {
    Deck deck = Deck::identity(4);

    SECTION("Dealing starts from the top of the deck") {
        PileInstructions instr({0, 1, 0, 1}, 2, true);
        auto piles = deal_to_piles(deck, instr);
        REQUIRE(piles.size() == 2);
        // carte 3 (dessus) -> tas 1, carte 2 -> tas 0, carte 1 -> tas 1, carte 0 -> tas 0
        REQUIRE(piles[0] == std::vector<Card>{2, 0});
        REQUIRE(piles[1] == std::vector<Card>{3, 1});
    }

    SECTION("Forward gather puts pile 0 at the bottom") {
        PileInstructions instr({0, 1, 0, 1}, 2, true);
        REQUIRE(apply_instructions(deck, instr).cards() == std::vector<Card>{2, 0, 3, 1});
    }

    SECTION("Backward gather puts the last pile at the bottom") {
        PileInstructions instr({0, 1, 0, 1}, 2, false);
        REQUIRE(apply_instructions(deck, instr).cards() == std::vector<Card>{3, 1, 2, 0});
    }

    SECTION("Empty piles are allowed") {
        PileInstructions instr({2, 2, 2, 2}, 3, true);
        auto piles = deal_to_piles(deck, instr);
        REQUIRE(piles[0].empty());
        REQUIRE(piles[1].empty());
        REQUIRE(piles[2] == std::vector<Card>{3, 2, 1, 0});
    }

    SECTION("Size mismatch is rejected") {
        PileInstructions instr({0, 1}, 2, true);
        REQUIRE_THROWS_AS(deal_to_piles(deck, instr), std::invalid_argument);
    }
}

TEST_CASE("compute_instructions uses the digit of the target position", "[pile_engine]") {
    PassPlan plan = make_pass_plan(100, 10);
    std::vector<Card> cards(100);
    for (Card i = 0; i < 100; ++i) cards[i] = 99 - i;
    Deck deck(cards);

    PileInstructions pass0 = compute_instructions(deck, plan, 0);
    PileInstructions pass1 = compute_instructions(deck, plan, 1);
    REQUIRE(pass0.deck_ordered()[0] == 9);   // carte 99 -> unité 9
    REQUIRE(pass1.deck_ordered()[0] == 9);   // carte 99 -> dizaine 9
    REQUIRE(pass0.deck_ordered()[24] == 5);  // carte 75 -> unité 5
    REQUIRE(pass1.deck_ordered()[24] == 7);  // carte 75 -> dizaine 7
    REQUIRE_FALSE(pass0.gather_forward());
    REQUIRE(pass1.gather_forward());
}

TEST_CASE("100 cards on 10 piles sort in two passes", "[pile_engine]") {
    Deck permutation = random_permutation(100, 7);
    PassPlan plan = make_pass_plan(100, 10);
    std::vector<PassResult> passes = run_passes(permutation, plan);

    REQUIRE(passes.size() == 2);
    REQUIRE(passes[0].pass_index == 0);
    REQUIRE_FALSE(passes[0].instructions.gather_forward());
    REQUIRE(passes[1].instructions.gather_forward());

    // Après la passe 0, le paquet est groupé par unité, 9 en dessous et 0 au dessus
    const Deck& intermediate = passes[0].deck;
    for (std::size_t i = 0; i < 100; ++i) {
        REQUIRE(intermediate.cards()[i] % 10 == 9 - i / 10);
    }

    REQUIRE(passes[1].deck.is_identity());
    REQUIRE(passes[1].deck == Deck::identity(100));
}

TEST_CASE("Every legal (N, P) ends on the identity deck", "[pile_engine]") {
    std::uint32_t seed = 1;
    for (std::size_t n : {1u, 2u, 3u, 5u, 9u, 10u, 11u, 27u, 52u, 64u, 99u, 130u, 500u}) {
        for (std::uint32_t p : {2u, 3u, 4u, 5u, 7u, 10u, 12u}) {
            Deck permutation = random_permutation(n, seed++);
            PassPlan plan = make_pass_plan(static_cast<std::uint32_t>(n), p);
            std::vector<PassResult> passes = run_passes(permutation, plan);
            INFO("n = " << n << ", p = " << p << ", K = " << plan.get_num_passes());
            REQUIRE(static_cast<int>(passes.size()) == plan.get_num_passes());
            REQUIRE(passes.back().deck.is_identity());
            for (const PassResult& pass : passes) {
                REQUIRE(pass.deck.is_permutation());
            }
        }
    }
}

TEST_CASE("Reversing the gather alternation breaks the sort", "[pile_engine]") {
    Deck permutation = random_permutation(100, 99);
    PassPlan plan = make_pass_plan(100, 10);

    Deck current = permutation;
    for (int k = 0; k < plan.get_num_passes(); ++k) {
        PileInstructions good = compute_instructions(current, plan, k);
        PileInstructions flipped(good.deck_ordered(), good.get_num_piles(), !good.gather_forward());
        current = apply_instructions(current, flipped);
    }
    REQUIRE_FALSE(current.is_identity());
    // La dernière passe en arrière met les dizaines 9 en dessous
    REQUIRE(current.bottom() / 10 == 9);
}

TEST_CASE("run_passes checks the permutation size", "[pile_engine]") {
    PassPlan plan = make_pass_plan(10, 4);
    REQUIRE_THROWS_AS(run_passes(Deck::identity(9), plan), std::invalid_argument);
}
