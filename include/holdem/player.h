#ifndef HOLDEM_PLAYER_H
#define HOLDEM_PLAYER_H

#include <optional>
#include <utility>
#include <string>
#include <vector>

#include "core/cards.hpp"
#include "holdem/ai_profile.h"
#include "holdem/common_types.h"

namespace holdem {

struct Player {
    PlayerId id = INVALID_PLAYER_ID;
    std::string name;
    int chips = 0;

    // --- État de la main en cours ---
    std::vector<Card> hole_cards;
    PlayerStatus status = PlayerStatus::ACTIVE;
    int current_bet = 0;          // mise sur la street courante
    int total_bet_this_hand = 0;  // blinds + antes + mises de toutes les streets
    int starting_chips = 0;       // tapis au début de la main

    bool is_human = false;
    std::optional<AIProfile> ai_profile;
    int rebuys = 0;

    Player() = default;
    Player(PlayerId player_id, std::string player_name, int stack, bool human = false)
        : id(player_id), name(std::move(player_name)), chips(stack), starting_chips(stack), is_human(human) {}

    // Encore en lice pour le pot (actif ou all-in)
    bool is_live() const { return status == PlayerStatus::ACTIVE || status == PlayerStatus::ALL_IN; }
    bool can_act() const { return status == PlayerStatus::ACTIVE; }
    bool is_bot() const { return !is_human && ai_profile.has_value(); }

    void reset_for_new_hand() {
        hole_cards.clear();
        current_bet = 0;
        total_bet_this_hand = 0;
        starting_chips = chips;
        status = chips > 0 ? PlayerStatus::ACTIVE : PlayerStatus::ELIMINATED;
    }
};

} // namespace holdem

#endif // HOLDEM_PLAYER_H
