#ifndef HOLDEM_COMMON_TYPES_H
#define HOLDEM_COMMON_TYPES_H

namespace holdem {

// Identifiant stable d'un joueur (indépendant du siège)
using PlayerId = int;
constexpr PlayerId INVALID_PLAYER_ID = -1;

// Positions (étiquettes relatives au bouton)
enum class Position {
    BTN,    // Button
    SB,     // Small Blind
    BB,     // Big Blind
    UTG,    // Under the Gun
    MP,     // Middle Position
    HJ,     // Hijack
    CO,     // Cutoff
    INVALID
};

enum class Street {
    PREFLOP,
    FLOP,
    TURN,
    RIVER,
    SHOWDOWN
};

enum class ActionType {
    FOLD,
    CHECK,
    CALL,
    RAISE,  // amount = montant total visé sur la street ("raise to")
    ALL_IN
};

// Action concrète d'un siège
struct Action {
    int player_index = -1;
    ActionType type = ActionType::FOLD;
    int amount = 0;

    bool operator==(const Action& other) const {
        return player_index == other.player_index &&
               type == other.type &&
               amount == other.amount;
    }
};

enum class PlayerStatus {
    ACTIVE,
    FOLDED,
    ALL_IN,
    ELIMINATED
};

// Phases de la machine à états d'une main
enum class HandPhase {
    IDLE,
    DEALING,
    BETTING,
    RUNNING_OUT, // plus personne ne peut miser : le board est distribué sans action
    SHOWDOWN
};

inline const char* position_to_string(Position pos) {
    switch (pos) {
        case Position::BTN: return "BTN";
        case Position::SB:  return "SB";
        case Position::BB:  return "BB";
        case Position::UTG: return "UTG";
        case Position::MP:  return "MP";
        case Position::HJ:  return "HJ";
        case Position::CO:  return "CO";
        default:            return "INVALID";
    }
}

} // namespace holdem

#endif // HOLDEM_COMMON_TYPES_H
