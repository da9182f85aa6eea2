#include "holdem/ai_profile.h"
#include <algorithm>
#include <utility>

namespace holdem {

namespace {

// Effet du tilt sur chaque trait
constexpr double TILT_ON_TIGHTNESS  = 0.4;
constexpr double TILT_ON_AGGRESSION = 0.3;
constexpr double TILT_ON_BLUFF      = 0.25;
constexpr double TILT_ON_CALL_DOWN  = 0.2;

constexpr double MIN_EFFECTIVE_TIGHTNESS = 0.05;
constexpr double MAX_EFFECTIVE_BLUFF     = 0.8;

AIProfile make_profile(std::string id, std::string name,
                       double tightness, double aggression, double bluff,
                       double fold_to_3bet, double cbet, double position_awareness,
                       double tilt_sensitivity, double call_down) {
    AIProfile p;
    p.id = std::move(id);
    p.name = std::move(name);
    p.tightness = tightness;
    p.aggression = aggression;
    p.bluff_freq = bluff;
    p.fold_to_3bet = fold_to_3bet;
    p.cbet_freq = cbet;
    p.position_awareness = position_awareness;
    p.tilt_sensitivity = tilt_sensitivity;
    p.call_down = call_down;
    return p;
}

} // namespace

double raw_position_bonus(Position pos) {
    switch (pos) {
        case Position::BTN: return 0.20;
        case Position::CO:  return 0.14;
        case Position::HJ:  return 0.06;
        case Position::BB:  return 0.05;
        case Position::SB:  return -0.05;
        case Position::MP:  return -0.08;
        case Position::UTG: return -0.18;
        default:            return 0.0;
    }
}

double AIProfile::effective_tightness() const {
    return std::max(MIN_EFFECTIVE_TIGHTNESS, tightness - current_tilt * TILT_ON_TIGHTNESS);
}

double AIProfile::effective_aggression() const {
    return std::min(1.0, aggression + current_tilt * TILT_ON_AGGRESSION);
}

double AIProfile::effective_bluff_freq() const {
    return std::min(MAX_EFFECTIVE_BLUFF, bluff_freq + current_tilt * TILT_ON_BLUFF);
}

double AIProfile::effective_call_down() const {
    return std::min(1.0, call_down + current_tilt * TILT_ON_CALL_DOWN);
}

double AIProfile::position_bonus(Position pos) const {
    return raw_position_bonus(pos) * position_awareness;
}

// ─────────────────────────────────────────────────────────────
// Presets
//                 id  nom  tight aggr bluff f3b  cbet  pos  tilt  callDown
// ─────────────────────────────────────────────────────────────
AIProfile AIProfile::rock() {
    return make_profile("rock", "Rock", 0.90, 0.80, 0.01, 0.08, 0.80, 0.10, 0.05, 0.05);
}

AIProfile AIProfile::maniac() {
    return make_profile("maniac", "Mad Mike", 0.25, 0.95, 0.60, 0.20, 0.90, 0.40, 0.30, 0.15);
}

AIProfile AIProfile::calling_station() {
    return make_profile("calling_station", "Anna", 0.35, 0.15, 0.05, 0.08, 0.25, 0.20, 0.20, 0.95);
}

AIProfile AIProfile::fox() {
    return make_profile("fox", "Old Fox", 0.55, 0.68, 0.22, 0.52, 0.65, 0.80, 0.15, 0.30);
}

AIProfile AIProfile::shark() {
    return make_profile("shark", "Tom the Shark", 0.48, 0.78, 0.28, 0.50, 0.75, 0.95, 0.10, 0.25);
}

AIProfile AIProfile::academic() {
    return make_profile("academic", "Amy", 0.52, 0.62, 0.25, 0.48, 0.60, 0.85, 0.02, 0.35);
}

AIProfile AIProfile::tilt_david() {
    return make_profile("tilt_david", "David", 0.55, 0.55, 0.18, 0.50, 0.58, 0.50, 0.85, 0.30);
}

std::vector<AIProfile> AIProfile::presets() {
    return {rock(), maniac(), calling_station(), fox(), shark(), academic(), tilt_david()};
}

std::optional<AIProfile> AIProfile::preset(std::string_view id) {
    for (auto& p : presets()) {
        if (p.id == id) return p;
    }
    return std::nullopt;
}

} // namespace holdem
