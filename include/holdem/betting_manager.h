#ifndef HOLDEM_BETTING_MANAGER_H
#define HOLDEM_BETTING_MANAGER_H

#include <vector>

#include "holdem/common_types.h"
#include "holdem/player.h"

namespace holdem {

// Résultat de l'application d'une action sur (joueur, mise courante, relance min)
struct BetActionResult {
    Player player;
    int  pot_addition    = 0;
    int  new_current_bet = 0;
    int  new_min_raise   = 0;
    bool new_last_raiser = false; // relance complète : ce joueur devient le dernier relanceur
    bool reopen_action   = false; // les joueurs ayant déjà parlé doivent reparler
    bool is_valid        = false;
};

class BettingManager {
public:
    /**
     * @brief Applique une action.
     *
     * RAISE : amount = montant total visé ("raise to"), relevé au minimum légal
     * puis plafonné au tapis. Un all-in inférieur à une relance complète augmente
     * la mise courante sans rouvrir l'action. Un CHECK face à une mise est invalide.
     */
    static BetActionResult process_action(const Player& player, ActionType action, int amount,
                                          int current_bet, int min_raise);

    /**
     * @brief Tour terminé : chaque joueur actif a parlé depuis la dernière relance
     * complète et a égalisé, ou au plus un joueur peut encore agir et il a égalisé.
     */
    static bool is_round_complete(const std::vector<Player>& players,
                                  const std::vector<bool>& has_acted,
                                  int current_bet);

    // Début de street : mises à zéro, relance min = BB, all-in marqués comme ayant parlé
    static void reset_street(std::vector<Player>& players, std::vector<bool>& has_acted,
                             int& current_bet, int& min_raise, int big_blind);

    // Blind forcée, plafonnée au tapis ; retourne le montant posté
    static int post_blind(Player& player, int amount);

    // Ante : compte dans total_bet_this_hand mais pas dans la mise de la street
    static int post_ante(Player& player, int amount);

    static int amount_to_call(const Player& player, int current_bet);
};

} // namespace holdem

#endif // HOLDEM_BETTING_MANAGER_H
