#include "holdem/decision_engine.h"
#include "holdem/game_utils.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <cmath>

namespace holdem {

DecisionEngine::DecisionEngine(DecisionConfig config)
    : DecisionEngine(std::move(config), std::random_device{}()) {}

DecisionEngine::DecisionEngine(DecisionConfig config, uint32_t seed)
    : config_(std::move(config)),
      simulator_(seed ^ 0x9e3779b9u),
      rng_(seed)
{
    config_.sanitize();
}

double DecisionEngine::pot_odds(int amount_to_call, int pot_size) {
    if (amount_to_call <= 0) return 0.0;
    return static_cast<double>(amount_to_call) / static_cast<double>(pot_size + amount_to_call);
}

double DecisionEngine::hand_strength(const DecisionContext& ctx, double equity) const {
    const double bonus = ctx.profile.position_bonus(ctx.position) * config_.position_weight;
    return std::clamp(equity + bonus, 0.0, 1.0);
}

ActionDistribution DecisionEngine::compute_distribution(const DecisionContext& ctx, double equity) const {
    const AIProfile& profile = ctx.profile;
    const double strength   = hand_strength(ctx, equity);
    const double tightness  = profile.effective_tightness();
    const double aggression = profile.effective_aggression();
    const double bluff      = profile.effective_bluff_freq();
    const double call_down  = profile.effective_call_down();

    // 1) Fold : sigmoïde de l'écart entre équité exigée et force
    double p_fold = 0.0;
    if (ctx.amount_to_call > 0) {
        const double required = pot_odds(ctx.amount_to_call, ctx.pot_size)
                              + config_.tightness_margin * tightness
                              - config_.call_down_weight * call_down;
        p_fold = 1.0 / (1.0 + std::exp(-config_.fold_steepness * (required - strength)));
    }

    // 2) Part agressive des mains qui continuent
    double raise_share = aggression * strength * config_.value_raise_weight + bluff * config_.bluff_weight;
    if (ctx.street == Street::FLOP && ctx.amount_to_call == 0 && ctx.is_preflop_aggressor) {
        raise_share = std::max(raise_share, profile.cbet_freq * config_.cbet_weight);
    }
    raise_share = std::clamp(raise_share, 0.0, config_.max_raise_share);

    // 3) Part du tapis dans l'agressivité (main forte ou tapis court)
    double all_in_frac = 0.0;
    if (strength > config_.all_in_strength) {
        all_in_frac = (strength - config_.all_in_strength) * config_.all_in_weight * aggression;
    }
    const double spr = static_cast<double>(ctx.stack) / std::max(1, ctx.pot_size);
    if (spr < config_.short_stack_spr && config_.short_stack_spr > 0.0) {
        all_in_frac += (1.0 - spr / config_.short_stack_spr) * strength;
    }
    all_in_frac = std::clamp(all_in_frac, 0.0, 1.0);

    ActionDistribution d;
    const double p_continue = 1.0 - p_fold;
    d.fold       = p_fold;
    d.check_call = p_continue * (1.0 - raise_share);
    d.raise      = p_continue * raise_share * (1.0 - all_in_frac);
    d.all_in     = p_continue * raise_share * all_in_frac;

    // 4) Face à une relance, un fold_to_3bet élevé pousse au fold
    if (ctx.facing_reraise && ctx.amount_to_call > 0 && profile.fold_to_3bet > config_.fold_to_3bet_threshold) {
        const double extra = std::clamp((profile.fold_to_3bet - config_.fold_to_3bet_threshold)
                                        * config_.fold_to_3bet_weight * (1.0 - strength), 0.0, 1.0);
        const double new_fold = d.fold + extra * (1.0 - d.fold);
        const double scale = d.fold < 1.0 ? (1.0 - new_fold) / (1.0 - d.fold) : 0.0;
        d.fold = new_fold;
        d.check_call *= scale;
        d.raise *= scale;
        d.all_in *= scale;
    }

    // 5) Légalité : pas de relance possible -> tout va au call
    const bool can_bet_more = ctx.can_raise && ctx.max_raise_to > ctx.current_bet;
    if (!can_bet_more) {
        d.check_call += d.raise + d.all_in;
        d.raise = 0.0;
        d.all_in = 0.0;
    } else if (ctx.max_raise_to <= ctx.min_raise_to) {
        // Le tapis ne couvre pas une relance complète : seul le tapis reste
        d.all_in += d.raise;
        d.raise = 0.0;
    }
    return d;
}

int DecisionEngine::raise_target(const DecisionContext& ctx, double strength) const {
    int target;
    if (ctx.street == Street::PREFLOP) {
        if (ctx.current_bet <= ctx.big_blind) {
            target = static_cast<int>(std::lround(config_.preflop_open_bb * ctx.big_blind));
        } else {
            target = ctx.current_bet * 3;
        }
    } else {
        const double fraction = config_.postflop_pot_fraction_min
                              + (config_.postflop_pot_fraction_max - config_.postflop_pot_fraction_min) * strength;
        target = ctx.current_bet + static_cast<int>(std::lround(fraction * (ctx.pot_size + ctx.amount_to_call)));
    }
    target = std::max(target, ctx.min_raise_to);
    return std::min(target, ctx.max_raise_to);
}

Action DecisionEngine::sample_action(const DecisionContext& ctx, const ActionDistribution& distribution, double strength) {
    Action action;
    action.player_index = ctx.seat;

    const double weights[4] = {distribution.fold, distribution.check_call, distribution.raise, distribution.all_in};
    int choice = 1;
    if (distribution.total() > 0.0) {
        std::discrete_distribution<int> pick(std::begin(weights), std::end(weights));
        choice = pick(rng_);
    }

    switch (choice) {
        case 0:
            action.type = ctx.amount_to_call > 0 ? ActionType::FOLD : ActionType::CHECK;
            break;
        case 2: {
            const int target = raise_target(ctx, strength);
            if (target >= ctx.max_raise_to) {
                action.type = ActionType::ALL_IN;
                action.amount = ctx.max_raise_to;
            } else {
                action.type = ActionType::RAISE;
                action.amount = target;
            }
            break;
        }
        case 3:
            action.type = ActionType::ALL_IN;
            action.amount = ctx.max_raise_to;
            break;
        default:
            if (ctx.amount_to_call > 0) {
                action.type = ActionType::CALL;
                action.amount = std::min(ctx.amount_to_call, ctx.stack);
            } else {
                action.type = ActionType::CHECK;
            }
            break;
    }
    return action;
}

Decision DecisionEngine::decide(const DecisionContext& ctx) {
    Decision decision;
    decision.equity = simulator_.estimate_equity(ctx.hole_cards, ctx.board,
                                                 std::max(1, ctx.num_opponents),
                                                 config_.monte_carlo_iterations);
    decision.pot_odds = pot_odds(ctx.amount_to_call, ctx.pot_size);
    decision.strength = hand_strength(ctx, decision.equity);
    decision.distribution = compute_distribution(ctx, decision.equity);
    decision.action = sample_action(ctx, decision.distribution, decision.strength);

    spdlog::debug("Décision {} [{}] {}: eq={:.3f} po={:.3f} tilt={:.2f} dist(f={:.2f} c={:.2f} r={:.2f} a={:.2f}) -> {}",
                  ctx.profile.name, position_to_string(ctx.position), street_to_string(ctx.street),
                  decision.equity, decision.pot_odds, ctx.profile.current_tilt,
                  decision.distribution.fold, decision.distribution.check_call,
                  decision.distribution.raise, decision.distribution.all_in,
                  action_to_string(decision.action));
    return decision;
}

} // namespace holdem
