#include "holdem/pot.h"
#include "spdlog/spdlog.h"
#include <algorithm>

namespace holdem {

void Pot::reset() {
    total_ = 0;
    tranches_.clear();
}

void Pot::add(int amount) {
    if (amount <= 0) return;
    total_ += amount;
}

int Pot::main_pot() const {
    return tranches_.empty() ? total_ : tranches_.front().amount;
}

std::string Pot::tranche_label(size_t index) {
    if (index == 0) return "main pot";
    return "side pot " + std::to_string(index);
}

std::vector<PotTranche> Pot::build_tranches(const std::vector<Player>& players) {
    // Niveaux distincts de contribution (joueurs couchés compris)
    std::vector<int> levels;
    for (const auto& p : players) {
        if (p.total_bet_this_hand > 0) levels.push_back(p.total_bet_this_hand);
    }
    std::sort(levels.begin(), levels.end());
    levels.erase(std::unique(levels.begin(), levels.end()), levels.end());

    std::vector<PotTranche> tranches;
    int previous_level = 0;
    int orphan_chips = 0; // niveau sans éligible avant toute tranche

    for (int level : levels) {
        int amount = 0;
        std::set<PlayerId> eligible;
        for (const auto& p : players) {
            const int bet = p.total_bet_this_hand;
            amount += std::min(bet, level) - std::min(bet, previous_level);
            if (bet >= level && p.status != PlayerStatus::FOLDED) {
                eligible.insert(p.id);
            }
        }
        previous_level = level;
        if (amount <= 0) continue;

        if (eligible.empty()) {
            // Excédent d'un joueur couché : rattaché à la tranche précédente
            if (!tranches.empty()) {
                tranches.back().amount += amount;
            } else {
                orphan_chips += amount;
            }
            continue;
        }

        if (!tranches.empty() && tranches.back().eligible_ids == eligible) {
            tranches.back().amount += amount;
            tranches.back().level = level;
        } else {
            tranches.push_back(PotTranche{amount + orphan_chips, level, std::move(eligible)});
            orphan_chips = 0;
        }
    }

    if (orphan_chips > 0) {
        spdlog::error("Pot: {} jetons sans aucun joueur éligible", orphan_chips);
    }
    return tranches;
}

void Pot::calculate_tranches(const std::vector<Player>& players) {
    tranches_ = build_tranches(players);

    int tranche_sum = 0;
    for (const auto& t : tranches_) tranche_sum += t.amount;
    if (tranche_sum != total_) {
        spdlog::error("Pot: somme des tranches {} != total {}", tranche_sum, total_);
    }
    for (size_t i = 0; i < tranches_.size(); ++i) {
        spdlog::debug("Pot: {} = {} (niveau {}, {} éligibles)",
                      tranche_label(i), tranches_[i].amount, tranches_[i].level, tranches_[i].eligible_ids.size());
    }
}

int Pot::return_uncalled_bet(std::vector<Player>& players) {
    int highest = 0;
    int second = 0;
    int top_index = -1;
    int top_count = 0;
    for (size_t i = 0; i < players.size(); ++i) {
        const int bet = players[i].total_bet_this_hand;
        if (bet > highest) {
            second = highest;
            highest = bet;
            top_index = static_cast<int>(i);
            top_count = 1;
        } else if (bet == highest && bet > 0) {
            ++top_count;
        } else if (bet > second) {
            second = bet;
        }
    }
    if (top_index < 0 || top_count > 1 || highest <= second) return 0;

    Player& top = players[top_index];
    const int refund = highest - second;
    top.chips += refund;
    top.total_bet_this_hand -= refund;
    top.current_bet -= std::min(top.current_bet, refund);
    if (top.status == PlayerStatus::ALL_IN && top.chips > 0) {
        top.status = PlayerStatus::ACTIVE;
    }
    total_ -= refund;
    spdlog::debug("Pot: mise non suivie de {} rendue à {}", refund, top.name);
    return refund;
}

} // namespace holdem
