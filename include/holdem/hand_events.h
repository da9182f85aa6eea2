#ifndef HOLDEM_HAND_EVENTS_H
#define HOLDEM_HAND_EVENTS_H

#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "core/cards.hpp"
#include "holdem/common_types.h"

namespace holdem {

struct ActionLogEntry {
    PlayerId player_id = INVALID_PLAYER_ID;
    std::string player_name;
    ActionType action = ActionType::FOLD;
    int amount = 0;          // jetons engagés (RAISE / ALL_IN : montant total visé)
    Street street = Street::PREFLOP;
    bool voluntary = false;  // compte pour le VPIP
};

// Émis en fin de main pour les consommateurs (logs, stats, animation)
struct HandEndEvent {
    uint64_t hand_number = 0;
    std::vector<PlayerId> winner_ids;
    std::string message;
    int total_pot = 0;
    std::map<PlayerId, int> payouts;
    std::set<PlayerId> loser_ids;
    std::vector<Card> community_cards;
    std::vector<ActionLogEntry> action_log;
};

// Ce que peut faire le joueur dont c'est le tour
struct LegalActions {
    bool can_check = false;
    bool can_call = false;
    bool can_raise = false;
    int amount_to_call = 0;
    int min_raise_to = 0;
    int max_raise_to = 0;
};

// "En attente de l'action du joueur X"
struct ActionRequest {
    uint64_t hand_number = 0;
    int seat = -1;
    PlayerId player_id = INVALID_PLAYER_ID;
    Street street = Street::PREFLOP;
    LegalActions legal;
};

using HandEndListener       = std::function<void(const HandEndEvent&)>;
using ActionRequestListener = std::function<void(const ActionRequest&)>;

} // namespace holdem

#endif // HOLDEM_HAND_EVENTS_H
