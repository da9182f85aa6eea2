#include "holdem/tilt_manager.h"
#include "spdlog/spdlog.h"
#include <algorithm>

namespace holdem {

void TiltManager::update_tilt(std::vector<Player>& players,
                              const std::set<PlayerId>& last_hand_losers,
                              int last_pot_size,
                              const TiltConfig& config) {
    for (auto& player : players) {
        if (!player.ai_profile) continue;
        AIProfile& profile = *player.ai_profile;

        if (last_hand_losers.count(player.id)) {
            const double increase = profile.tilt_sensitivity * (static_cast<double>(last_pot_size) / config.pot_reference);
            profile.current_tilt = std::min(1.0, profile.current_tilt + increase);
            if (increase > 0.0) {
                spdlog::debug("Tilt: {} +{:.3f} -> {:.3f}", player.name, increase, profile.current_tilt);
            }
        } else {
            const double decay = config.decay_base * (1.0 - profile.tilt_sensitivity * 0.5);
            profile.current_tilt = std::max(0.0, profile.current_tilt - decay);
        }
    }
}

void TiltManager::reset_all(std::vector<Player>& players) {
    for (auto& player : players) {
        if (player.ai_profile) player.ai_profile->current_tilt = 0.0;
    }
}

} // namespace holdem
