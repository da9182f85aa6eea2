#ifndef HOLDEM_MONTE_CARLO_H
#define HOLDEM_MONTE_CARLO_H

#include <cstdint>
#include <future>
#include <random>
#include <vector>

#include "core/cards.hpp"

namespace holdem {

// Instantané immuable pour un calcul hors du fil du moteur
struct EquityRequest {
    std::vector<Card> hole_cards;
    std::vector<Card> board;
    int num_opponents = 1;
    int iterations = 1000;
    uint32_t seed = 0;
};

class MonteCarloSimulator {
public:
    MonteCarloSimulator();
    explicit MonteCarloSimulator(uint32_t seed);

    /**
     * @brief Estime la probabilité de gain contre num_opponents mains aléatoires.
     * Chaque essai complète le board et distribue les adversaires sans remise ;
     * une égalité à k gagnants compte 1/k.
     * @return Fraction de gain dans [0,1] ; 1.0 sans adversaire.
     * @throws std::invalid_argument si hole_cards n'a pas 2 cartes, si le board
     *         dépasse 5 cartes, ou si une carte est invalide ou dupliquée.
     */
    double estimate_equity(const std::vector<Card>& hole_cards,
                           const std::vector<Card>& board,
                           int num_opponents,
                           int iterations);

    // Lance le calcul sur un simulateur dédié (aucun état partagé)
    static std::future<double> estimate_equity_async(EquityRequest request);

private:
    std::mt19937 rng_;
};

} // namespace holdem

#endif // HOLDEM_MONTE_CARLO_H
