#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <stdexcept>
#include <vector>
#include "core/cards.hpp"
#include "holdem/monte_carlo.h"

using namespace holdem;
using Catch::Matchers::WithinAbs;

TEST_CASE("Pocket aces heads-up converge to about 0.85", "[montecarlo]") {
    MonteCarloSimulator sim(2024);
    const double equity = sim.estimate_equity(cards_from_string("As Ah"), {}, 1, 20000);
    REQUIRE_THAT(equity, WithinAbs(0.85, 0.03));
}

TEST_CASE("Equity decreases as opponents are added", "[montecarlo]") {
    MonteCarloSimulator sim(7);
    const auto aces = cards_from_string("As Ah");
    double previous = 1.0;
    for (int opponents = 1; opponents <= 7; ++opponents) {
        const double equity = sim.estimate_equity(aces, {}, opponents, 4000);
        INFO("opponents = " << opponents << ", equity = " << equity);
        REQUIRE(equity < previous);
        previous = equity;
    }
}

TEST_CASE("Pocket aces are the strongest preflop hand", "[montecarlo]") {
    const char* others[] = {"Ks Kh", "As Ks", "7s 2h"};
    for (int opponents : {1, 3}) {
        MonteCarloSimulator sim(opponents * 101);
        const double aces = sim.estimate_equity(cards_from_string("Ad Ac"), {}, opponents, 10000);
        for (const char* hand : others) {
            const double other = sim.estimate_equity(cards_from_string(hand), {}, opponents, 10000);
            INFO(hand << " vs " << opponents << " opponents: " << other << " < " << aces);
            REQUIRE(other < aces);
        }
    }
}

TEST_CASE("Known boards give exact equities", "[montecarlo]") {
    MonteCarloSimulator sim(3);

    SECTION("Unbeatable quads") {
        const double equity = sim.estimate_equity(cards_from_string("As Ad"),
                                                  cards_from_string("Ac Ah Kd 7s 2c"), 3, 500);
        REQUIRE(equity == 1.0);
    }

    SECTION("Royal flush on the board is always split") {
        const double equity = sim.estimate_equity(cards_from_string("2c 3d"),
                                                  cards_from_string("Ts Js Qs Ks As"), 1, 500);
        REQUIRE_THAT(equity, WithinAbs(0.5, 1e-12));
    }

    SECTION("A made flush on the turn is a big favourite") {
        const double equity = sim.estimate_equity(cards_from_string("Ah 9h"),
                                                  cards_from_string("Kh 7h 2h 3c"), 1, 3000);
        REQUIRE(equity > 0.8);
    }
}

TEST_CASE("Degenerate requests", "[montecarlo]") {
    MonteCarloSimulator sim(1);
    const auto hole = cards_from_string("Qs Qd");

    REQUIRE(sim.estimate_equity(hole, {}, 0, 1000) == 1.0);
    REQUIRE(sim.estimate_equity(hole, {}, 1, 0) == 0.0);
    // 5 cartes de board + 2 x 24 adversaires > 50 cartes restantes
    REQUIRE(sim.estimate_equity(hole, {}, 24, 100) == 0.0);

    REQUIRE_THROWS_AS(sim.estimate_equity(cards_from_string("Qs"), {}, 1, 100), std::invalid_argument);
    REQUIRE_THROWS_AS(sim.estimate_equity(hole, cards_from_string("Qs 2c 3c"), 1, 100), std::invalid_argument);
    REQUIRE_THROWS_AS(sim.estimate_equity(hole, cards_from_string("2c 3c 4c 5c 6c 7c"), 1, 100),
                      std::invalid_argument);
}

TEST_CASE("Async estimate matches a synchronous one with the same seed", "[montecarlo]") {
    EquityRequest request;
    request.hole_cards = cards_from_string("Jc Tc");
    request.board = cards_from_string("9c 8d 2s");
    request.num_opponents = 2;
    request.iterations = 2000;
    request.seed = 99;

    auto future = MonteCarloSimulator::estimate_equity_async(request);
    MonteCarloSimulator sim(99);
    const double sync = sim.estimate_equity(request.hole_cards, request.board, 2, 2000);
    REQUIRE(future.get() == sync);
}
