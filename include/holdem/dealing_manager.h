#ifndef HOLDEM_DEALING_MANAGER_H
#define HOLDEM_DEALING_MANAGER_H

#include <vector>

#include "core/deck.hpp"
#include "holdem/common_types.h"
#include "holdem/player.h"

namespace holdem {

class DealingManager {
public:
    // Deux tours d'une carte, en partant du siège à gauche du bouton (joueurs en lice)
    static void deal_hole_cards(Deck& deck, std::vector<Player>& players, int dealer_index);

    /**
     * @brief Brûle une carte puis distribue la street suivante (3, 1 ou 1 carte).
     * @return La nouvelle street ; à la river, rien n'est distribué et RIVER est rendu.
     */
    static Street deal_next_street(Deck& deck, std::vector<Card>& community, Street current);

    // Streets encore à distribuer : preflop 3, flop 2, turn 1, river 0
    static int streets_remaining(Street street);

    static Street next_street(Street street);
};

} // namespace holdem

#endif // HOLDEM_DEALING_MANAGER_H
