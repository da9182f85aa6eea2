#ifndef HOLDEM_DECISION_ENGINE_H
#define HOLDEM_DECISION_ENGINE_H

#include <cstdint>
#include <random>
#include <vector>

#include "core/cards.hpp"
#include "holdem/ai_profile.h"
#include "holdem/common_types.h"
#include "holdem/game_config.h"
#include "holdem/monte_carlo.h"

namespace holdem {

// Instantané de ce que voit un bot au moment de décider
struct DecisionContext {
    int seat = -1;
    std::vector<Card> hole_cards;
    std::vector<Card> board;
    Street street = Street::PREFLOP;

    int amount_to_call = 0;
    int pot_size = 0;        // pot avant le call
    int current_bet = 0;
    int player_bet = 0;      // mise du joueur sur la street
    int stack = 0;
    int min_raise_to = 0;
    int max_raise_to = 0;    // player_bet + stack
    int big_blind = 0;

    int num_opponents = 1;
    Position position = Position::INVALID;
    bool can_raise = true;
    bool facing_reraise = false;
    bool is_preflop_aggressor = false;

    AIProfile profile;
};

struct ActionDistribution {
    double fold = 0.0;
    double check_call = 0.0;
    double raise = 0.0;
    double all_in = 0.0;

    double aggression() const { return raise + all_in; }
    double total() const { return fold + check_call + raise + all_in; }
};

struct Decision {
    Action action;
    double equity = 0.0;
    double pot_odds = 0.0;
    double strength = 0.0;
    ActionDistribution distribution;
};

/**
 * @brief Équité + pot odds + traits (tilt, position) -> distribution -> action tirée.
 *
 * La distribution est monotone : plus d'équité ou une meilleure position donnent
 * plus d'agressivité ; plus de tilt rend plus large et plus agressif ; un
 * fold_to_3bet au-dessus du seuil augmente le fold face à une relance.
 */
class DecisionEngine {
public:
    explicit DecisionEngine(DecisionConfig config = {});
    DecisionEngine(DecisionConfig config, uint32_t seed);

    Decision decide(const DecisionContext& ctx);

    // Partie pure du pipeline
    ActionDistribution compute_distribution(const DecisionContext& ctx, double equity) const;
    Action sample_action(const DecisionContext& ctx, const ActionDistribution& distribution, double strength);

    int raise_target(const DecisionContext& ctx, double strength) const;
    double hand_strength(const DecisionContext& ctx, double equity) const;

    static double pot_odds(int amount_to_call, int pot_size);

    const DecisionConfig& config() const { return config_; }

private:
    DecisionConfig      config_;
    MonteCarloSimulator simulator_;
    std::mt19937        rng_;
};

} // namespace holdem

#endif // HOLDEM_DECISION_ENGINE_H
