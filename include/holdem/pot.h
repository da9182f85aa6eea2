#ifndef HOLDEM_POT_H
#define HOLDEM_POT_H

#include <set>
#include <string>
#include <vector>

#include "holdem/player.h"

namespace holdem {

// Tranche de pot : montant, niveau de contribution plafond, joueurs éligibles
struct PotTranche {
    int amount = 0;
    int level = 0;
    std::set<PlayerId> eligible_ids;
};

class Pot {
public:
    void reset();
    void add(int amount);

    int total() const { return total_; }
    const std::vector<PotTranche>& tranches() const { return tranches_; }

    // Pot principal : première tranche (ou total si non calculé)
    int main_pot() const;
    bool has_side_pots() const { return tranches_.size() > 1; }

    /**
     * @brief Découpe le pot en tranches à partir de total_bet_this_hand.
     * Les mises des joueurs couchés comptent mais ne donnent pas d'éligibilité.
     */
    void calculate_tranches(const std::vector<Player>& players);

    static std::vector<PotTranche> build_tranches(const std::vector<Player>& players);

    /**
     * @brief Rend au plus gros contributeur (s'il est seul) l'excédent sur la deuxième contribution.
     * @return Montant rendu (0 si rien à rendre).
     */
    int return_uncalled_bet(std::vector<Player>& players);

    // "main pot", "side pot 1", ...
    static std::string tranche_label(size_t index);

private:
    int total_ = 0;
    std::vector<PotTranche> tranches_;
};

} // namespace holdem

#endif // HOLDEM_POT_H
