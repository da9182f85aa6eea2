#ifndef HOLDEM_SHOWDOWN_MANAGER_H
#define HOLDEM_SHOWDOWN_MANAGER_H

#include <map>
#include <set>
#include <string>
#include <vector>

#include "core/cards.hpp"
#include "holdem/player.h"
#include "holdem/pot.h"

namespace holdem {

struct HandResult {
    std::vector<PlayerId> winner_ids;   // dédupliqués, dans l'ordre d'attribution
    std::string message;                // texte de règlement lisible
    std::set<PlayerId> loser_ids;       // alimente le tilt
    int total_pot = 0;
    std::map<PlayerId, int> payouts;    // jetons reçus par joueur
};

class ShowdownManager {
public:
    // Tout le monde s'est couché sauf un joueur : il prend le pot sans évaluation
    static HandResult distribute_single_winner(std::vector<Player>& players, int winner_index, int pot_total);

    /**
     * @brief Règle chaque tranche indépendamment.
     * Un seul éligible : il prend la tranche. Sinon, meilleure main ; partage à
     * égalité, les jetons restants vont un par un aux gagnants en partant du
     * premier siège à gauche du bouton.
     */
    static HandResult distribute_pot(std::vector<Player>& players, const Pot& pot,
                                     const std::vector<Card>& community, int dealer_index);

    // Joueurs ayant misé cette main et absents des gagnants
    static std::set<PlayerId> find_losers(const std::vector<Player>& players,
                                          const std::vector<PlayerId>& winner_ids);
};

} // namespace holdem

#endif // HOLDEM_SHOWDOWN_MANAGER_H
