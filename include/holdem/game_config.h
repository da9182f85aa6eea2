#ifndef HOLDEM_GAME_CONFIG_H
#define HOLDEM_GAME_CONFIG_H

#include <cstdint>
#include <optional>

namespace holdem {

struct TiltConfig {
    double pot_reference = 800.0; // pot perdu qui fait +sensibilité de tilt
    double decay_base    = 0.03;  // décroissance par main sans perte
};

struct EngineConfig {
    int small_blind = 10;
    int big_blind   = 20;
    int ante        = 0;

    int bot_think_delay_ms = 600;
    int run_out_delay_ms   = 800; // pause entre deux streets d'un run-out

    TiltConfig tilt;
    std::optional<uint32_t> deck_seed;

    // Lève std::invalid_argument si la configuration est incohérente
    void validate() const;
};

/**
 * @brief Seuils réglables du moteur de décision.
 * Seul le sens des effets est contractuel ; les valeurs sont du tuning.
 */
struct DecisionConfig {
    int monte_carlo_iterations = 600;

    double fold_steepness       = 12.0; // pente de la sigmoïde de fold
    double tightness_margin     = 0.20; // équité exigée en plus des pot odds (x tightness)
    double call_down_weight     = 0.10; // réduction de l'équité exigée (x call_down)
    double value_raise_weight   = 1.0;
    double bluff_weight         = 0.35;
    double max_raise_share      = 0.95;
    double position_weight      = 0.5;  // bonus positionnel ajouté à la force
    double fold_to_3bet_threshold = 0.35;
    double fold_to_3bet_weight    = 1.2;
    double all_in_strength      = 0.65; // force à partir de laquelle le tapis devient envisageable
    double all_in_weight        = 1.5;
    double short_stack_spr      = 1.5;  // SPR sous lequel on préfère le tapis
    double cbet_weight          = 0.8;
    double preflop_open_bb      = 3.0;
    double postflop_pot_fraction_min = 0.5;
    double postflop_pot_fraction_max = 1.0;

    // Ramène les valeurs hors bornes dans leur plage (avec un warn)
    void sanitize();
};

} // namespace holdem

#endif // HOLDEM_GAME_CONFIG_H
