#ifndef HOLDEM_TILT_MANAGER_H
#define HOLDEM_TILT_MANAGER_H

#include <set>
#include <vector>

#include "holdem/game_config.h"
#include "holdem/player.h"

namespace holdem {

// Fait évoluer current_tilt des bots d'une main à l'autre
class TiltManager {
public:
    /**
     * @brief Les perdants de la main précédente prennent du tilt
     * (sensibilité * pot / pot_reference, plafonné à 1) ; les autres bots se calment.
     */
    static void update_tilt(std::vector<Player>& players,
                            const std::set<PlayerId>& last_hand_losers,
                            int last_pot_size,
                            const TiltConfig& config);

    static void reset_all(std::vector<Player>& players);
};

} // namespace holdem

#endif // HOLDEM_TILT_MANAGER_H
