#include "holdem/betting_manager.h"
#include "spdlog/spdlog.h"
#include <algorithm>

namespace holdem {

namespace {

// Paie jusqu'à `amount` (plafonné au tapis) ; all-in si le tapis est vide
int pay(Player& p, int amount, bool counts_on_street) {
    const int paid = std::clamp(amount, 0, p.chips);
    p.chips -= paid;
    p.total_bet_this_hand += paid;
    if (counts_on_street) p.current_bet += paid;
    if (p.chips == 0 && p.status == PlayerStatus::ACTIVE) {
        p.status = PlayerStatus::ALL_IN;
    }
    return paid;
}

void apply_call(BetActionResult& r, int current_bet) {
    const int to_call = std::max(0, current_bet - r.player.current_bet);
    r.pot_addition = pay(r.player, to_call, true);
}

void apply_raise_to(BetActionResult& r, int target, int current_bet, int min_raise) {
    r.pot_addition = pay(r.player, target - r.player.current_bet, true);
    const int raise_size = r.player.current_bet - current_bet;
    r.new_current_bet = r.player.current_bet;
    if (raise_size >= min_raise) {
        r.new_min_raise = raise_size;
        r.new_last_raiser = true;
        r.reopen_action = true;
    } else {
        // All-in court : la mise monte mais l'action n'est pas rouverte
        spdlog::debug("{} all-in de {} (relance incomplète {} < {})",
                      r.player.name, r.player.current_bet, raise_size, min_raise);
    }
}

} // namespace

int BettingManager::amount_to_call(const Player& player, int current_bet) {
    return std::min(std::max(0, current_bet - player.current_bet), player.chips);
}

BetActionResult BettingManager::process_action(const Player& player, ActionType action, int amount,
                                               int current_bet, int min_raise) {
    BetActionResult r;
    r.player = player;
    r.new_current_bet = current_bet;
    r.new_min_raise = min_raise;

    if (player.status != PlayerStatus::ACTIVE) {
        return r; // is_valid = false
    }
    r.is_valid = true;

    switch (action) {
        case ActionType::FOLD:
            r.player.status = PlayerStatus::FOLDED;
            break;

        case ActionType::CHECK:
            if (player.current_bet < current_bet) {
                r.is_valid = false;
            }
            break;

        case ActionType::CALL:
            apply_call(r, current_bet);
            break;

        case ActionType::RAISE: {
            const int max_target = player.current_bet + player.chips;
            const int target = std::min(std::max(amount, current_bet + min_raise), max_target);
            if (target <= current_bet) {
                apply_call(r, current_bet); // pas de quoi relancer : simple suivi
            } else {
                apply_raise_to(r, target, current_bet, min_raise);
            }
            break;
        }

        case ActionType::ALL_IN: {
            const int target = player.current_bet + player.chips;
            if (target <= current_bet) {
                apply_call(r, current_bet);
            } else {
                apply_raise_to(r, target, current_bet, min_raise);
            }
            break;
        }
    }
    return r;
}

bool BettingManager::is_round_complete(const std::vector<Player>& players,
                                       const std::vector<bool>& has_acted,
                                       int current_bet) {
    int can_act = 0;
    for (const auto& p : players) {
        if (p.can_act()) ++can_act;
    }
    for (size_t i = 0; i < players.size(); ++i) {
        const Player& p = players[i];
        if (!p.can_act()) continue;
        if (p.current_bet != current_bet) return false;
        const bool acted = i < has_acted.size() && has_acted[i];
        if (!acted && can_act > 1) return false;
    }
    return true;
}

void BettingManager::reset_street(std::vector<Player>& players, std::vector<bool>& has_acted,
                                  int& current_bet, int& min_raise, int big_blind) {
    has_acted.assign(players.size(), false);
    for (size_t i = 0; i < players.size(); ++i) {
        players[i].current_bet = 0;
        if (players[i].status == PlayerStatus::ALL_IN) has_acted[i] = true;
    }
    current_bet = 0;
    min_raise = big_blind;
}

int BettingManager::post_blind(Player& player, int amount) {
    return pay(player, amount, true);
}

int BettingManager::post_ante(Player& player, int amount) {
    return pay(player, amount, false);
}

} // namespace holdem
