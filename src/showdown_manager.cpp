#include "holdem/showdown_manager.h"
#include "eval/hand_evaluator.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <optional>

namespace holdem {

namespace {

void credit(std::vector<Player>& players, int seat, int amount, HandResult& result) {
    Player& p = players[seat];
    p.chips += amount;
    result.payouts[p.id] += amount;
    if (std::find(result.winner_ids.begin(), result.winner_ids.end(), p.id) == result.winner_ids.end()) {
        result.winner_ids.push_back(p.id);
    }
    // Un gagnant éliminé revient en jeu s'il a de nouveau des jetons
    if (p.status == PlayerStatus::ELIMINATED && p.chips > 0) {
        p.status = PlayerStatus::ACTIVE;
    }
}

std::string join_names(const std::vector<Player>& players, const std::vector<int>& seats) {
    std::string out;
    for (size_t i = 0; i < seats.size(); ++i) {
        if (i > 0) out += (i + 1 == seats.size()) ? " and " : ", ";
        out += players[seats[i]].name;
    }
    return out;
}

} // namespace

HandResult ShowdownManager::distribute_single_winner(std::vector<Player>& players, int winner_index, int pot_total) {
    HandResult result;
    result.total_pot = pot_total;
    if (winner_index < 0 || winner_index >= static_cast<int>(players.size())) {
        spdlog::error("Showdown: index de gagnant invalide {}", winner_index);
        return result;
    }
    credit(players, winner_index, pot_total, result);
    result.message = players[winner_index].name + " wins " + std::to_string(pot_total);
    result.loser_ids = find_losers(players, result.winner_ids);
    spdlog::info("{}", result.message);
    return result;
}

HandResult ShowdownManager::distribute_pot(std::vector<Player>& players, const Pot& pot,
                                           const std::vector<Card>& community, int dealer_index) {
    HandResult result;
    result.total_pot = pot.total();
    const int n = static_cast<int>(players.size());

    // Scores évalués une seule fois par siège
    std::vector<std::optional<HandScore>> scores(players.size());
    auto score_of = [&](int seat) -> const HandScore& {
        if (!scores[seat]) scores[seat] = evaluate_hand(players[seat].hole_cards, community);
        return *scores[seat];
    };

    std::vector<std::string> parts;
    const auto& tranches = pot.tranches();
    for (size_t t = 0; t < tranches.size(); ++t) {
        const PotTranche& tranche = tranches[t];
        if (tranche.amount <= 0) continue;

        // Éligibles dans l'ordre des sièges depuis la gauche du bouton
        std::vector<int> eligible;
        for (int offset = 1; offset <= n; ++offset) {
            const int seat = (dealer_index + offset) % n;
            if (players[seat].status != PlayerStatus::FOLDED && tranche.eligible_ids.count(players[seat].id)) {
                eligible.push_back(seat);
            }
        }
        if (eligible.empty()) {
            spdlog::error("Showdown: {} sans joueur éligible, attribué aux joueurs en lice", Pot::tranche_label(t));
            for (int offset = 1; offset <= n; ++offset) {
                const int seat = (dealer_index + offset) % n;
                if (players[seat].is_live()) eligible.push_back(seat);
            }
            if (eligible.empty()) continue;
        }

        const std::string label = Pot::tranche_label(t);
        if (eligible.size() == 1) {
            credit(players, eligible.front(), tranche.amount, result);
            parts.push_back(players[eligible.front()].name + " wins " + label + " " + std::to_string(tranche.amount));
            continue;
        }

        std::vector<int> winners;
        const HandScore* best = nullptr;
        for (int seat : eligible) {
            const HandScore& s = score_of(seat);
            if (!best || *best < s) {
                best = &s;
                winners.assign(1, seat);
            } else if (s == *best) {
                winners.push_back(seat);
            }
        }

        const int k = static_cast<int>(winners.size());
        const int share = tranche.amount / k;
        const int remainder = tranche.amount % k;
        for (int i = 0; i < k; ++i) {
            credit(players, winners[i], share + (i < remainder ? 1 : 0), result);
        }

        const std::string hand_desc = describe_hand(*best);
        if (k == 1) {
            parts.push_back(players[winners.front()].name + " wins " + label + " " +
                            std::to_string(tranche.amount) + " with " + hand_desc);
        } else {
            parts.push_back(join_names(players, winners) + " split " + label + " " +
                            std::to_string(tranche.amount) + " with " + hand_desc);
        }
    }

    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result.message += "; ";
        result.message += parts[i];
    }
    result.loser_ids = find_losers(players, result.winner_ids);
    spdlog::info("Showdown: {}", result.message);
    return result;
}

std::set<PlayerId> ShowdownManager::find_losers(const std::vector<Player>& players,
                                                const std::vector<PlayerId>& winner_ids) {
    std::set<PlayerId> losers;
    for (const auto& p : players) {
        if (p.total_bet_this_hand <= 0) continue;
        if (std::find(winner_ids.begin(), winner_ids.end(), p.id) != winner_ids.end()) continue;
        losers.insert(p.id);
    }
    return losers;
}

} // namespace holdem
