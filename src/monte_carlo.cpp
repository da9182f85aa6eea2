#include "holdem/monte_carlo.h"
#include "core/bitboard.hpp"
#include "eval/hand_evaluator.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <array>
#include <chrono>
#include <stdexcept>

namespace holdem {

MonteCarloSimulator::MonteCarloSimulator()
    : rng_(static_cast<uint32_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count())) {}

MonteCarloSimulator::MonteCarloSimulator(uint32_t seed) : rng_(seed) {}

double MonteCarloSimulator::estimate_equity(const std::vector<Card>& hole_cards,
                                            const std::vector<Card>& board,
                                            int num_opponents,
                                            int iterations) {
    if (hole_cards.size() != 2) {
        throw std::invalid_argument("Monte Carlo requires exactly 2 hole cards, got " + std::to_string(hole_cards.size()));
    }
    if (board.size() > 5) {
        throw std::invalid_argument("Board cannot have more than 5 cards");
    }
    std::vector<Card> known = hole_cards;
    known.insert(known.end(), board.begin(), board.end());
    const Bitboard dead = unique_cards_to_board(known);

    if (num_opponents < 1) return 1.0;
    if (iterations <= 0) {
        spdlog::warn("Monte Carlo: iterations={} , équité non calculée", iterations);
        return 0.0;
    }

    std::vector<Card> deck = remaining_cards(dead);
    const size_t board_missing = 5 - board.size();
    const size_t needed = board_missing + 2 * static_cast<size_t>(num_opponents);
    if (needed > deck.size()) {
        spdlog::error("Monte Carlo: pas assez de cartes ({} requises, {} restantes)", needed, deck.size());
        return 0.0;
    }

    std::array<Card, 7> hero{};
    hero[0] = hole_cards[0];
    hero[1] = hole_cards[1];
    std::array<Card, 5> full_board{};
    std::copy(board.begin(), board.end(), full_board.begin());

    double wins = 0.0;
    for (int it = 0; it < iterations; ++it) {
        // Fisher-Yates partiel : les `needed` premières cartes forment un tirage uniforme sans remise
        for (size_t i = 0; i < needed; ++i) {
            std::uniform_int_distribution<size_t> pick(i, deck.size() - 1);
            std::swap(deck[i], deck[pick(rng_)]);
        }
        size_t next = 0;
        for (size_t b = board.size(); b < 5; ++b) full_board[b] = deck[next++];

        std::copy(full_board.begin(), full_board.end(), hero.begin() + 2);
        const PackedScore hero_score = evaluate_packed(hero.data(), hero.size());

        PackedScore best = hero_score;
        int winners = 1;
        bool hero_wins = true;
        std::array<Card, 7> villain{};
        std::copy(full_board.begin(), full_board.end(), villain.begin() + 2);
        for (int o = 0; o < num_opponents; ++o) {
            villain[0] = deck[next++];
            villain[1] = deck[next++];
            const PackedScore s = evaluate_packed(villain.data(), villain.size());
            if (s > best) {
                best = s;
                winners = 1;
                hero_wins = false;
            } else if (s == best) {
                ++winners;
            }
        }
        if (hero_wins) wins += 1.0 / winners;
    }

    const double equity = wins / iterations;
    spdlog::trace("Monte Carlo: {} vs {} adversaire(s), {} essais -> {:.4f}",
                  to_string(hole_cards[0]) + to_string(hole_cards[1]), num_opponents, iterations, equity);
    return equity;
}

std::future<double> MonteCarloSimulator::estimate_equity_async(EquityRequest request) {
    return std::async(std::launch::async, [req = std::move(request)]() {
        MonteCarloSimulator simulator(req.seed);
        return simulator.estimate_equity(req.hole_cards, req.board, req.num_opponents, req.iterations);
    });
}

} // namespace holdem
