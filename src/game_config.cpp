#include "holdem/game_config.h"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace holdem {

void EngineConfig::validate() const {
    if (small_blind <= 0 || big_blind <= 0) {
        throw std::invalid_argument("Blinds must be > 0 (sb=" + std::to_string(small_blind) +
                                    ", bb=" + std::to_string(big_blind) + ")");
    }
    if (small_blind > big_blind) throw std::invalid_argument("Small blind must be <= big blind");
    if (ante < 0) throw std::invalid_argument("Ante must be >= 0");
    if (bot_think_delay_ms < 0 || run_out_delay_ms < 0) throw std::invalid_argument("Delays must be >= 0");
    if (tilt.pot_reference <= 0.0) throw std::invalid_argument("Tilt pot reference must be > 0");
}

namespace {
void clamp_field(double& value, double lo, double hi, const char* field) {
    const double clamped = std::clamp(value, lo, hi);
    if (clamped != value) {
        spdlog::warn("DecisionConfig: {}={} hors de [{}, {}], ramené à {}", field, value, lo, hi, clamped);
        value = clamped;
    }
}
} // namespace

void DecisionConfig::sanitize() {
    if (monte_carlo_iterations < 1) {
        spdlog::warn("DecisionConfig: monte_carlo_iterations={} invalide, ramené à 1", monte_carlo_iterations);
        monte_carlo_iterations = 1;
    }
    clamp_field(fold_steepness, 0.1, 100.0, "fold_steepness");
    clamp_field(tightness_margin, 0.0, 1.0, "tightness_margin");
    clamp_field(call_down_weight, 0.0, 1.0, "call_down_weight");
    clamp_field(value_raise_weight, 0.0, 2.0, "value_raise_weight");
    clamp_field(bluff_weight, 0.0, 1.0, "bluff_weight");
    clamp_field(max_raise_share, 0.0, 1.0, "max_raise_share");
    clamp_field(position_weight, 0.0, 2.0, "position_weight");
    clamp_field(fold_to_3bet_threshold, 0.0, 1.0, "fold_to_3bet_threshold");
    clamp_field(fold_to_3bet_weight, 0.0, 5.0, "fold_to_3bet_weight");
    clamp_field(all_in_strength, 0.0, 1.0, "all_in_strength");
    clamp_field(all_in_weight, 0.0, 10.0, "all_in_weight");
    clamp_field(short_stack_spr, 0.0, 20.0, "short_stack_spr");
    clamp_field(cbet_weight, 0.0, 1.0, "cbet_weight");
    clamp_field(preflop_open_bb, 2.0, 10.0, "preflop_open_bb");
    clamp_field(postflop_pot_fraction_min, 0.1, 3.0, "postflop_pot_fraction_min");
    clamp_field(postflop_pot_fraction_max, postflop_pot_fraction_min, 3.0, "postflop_pot_fraction_max");
}

} // namespace holdem
