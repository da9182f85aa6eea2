#include "holdem/game_utils.hpp"
#include <sstream>

namespace holdem {

std::string street_to_string(Street s) {
    switch (s) {
        case Street::PREFLOP:  return "Preflop";
        case Street::FLOP:     return "Flop";
        case Street::TURN:     return "Turn";
        case Street::RIVER:    return "River";
        case Street::SHOWDOWN: return "Showdown";
        default:               return "UnknownStreet";
    }
}

std::string action_type_to_string(ActionType type) {
    switch (type) {
        case ActionType::FOLD:   return "FOLD";
        case ActionType::CHECK:  return "CHECK";
        case ActionType::CALL:   return "CALL";
        case ActionType::RAISE:  return "RAISE";
        case ActionType::ALL_IN: return "ALL_IN";
        default:                 return "UNKNOWN_ACTION_TYPE";
    }
}

std::string action_to_string(const Action& action) {
    const std::string type_str = action_type_to_string(action.type);
    // Le montant n'a de sens que pour les mises
    if (action.type == ActionType::CALL || action.type == ActionType::RAISE || action.type == ActionType::ALL_IN) {
        return type_str + " " + std::to_string(action.amount);
    }
    return type_str;
}

std::string status_to_string(PlayerStatus status) {
    switch (status) {
        case PlayerStatus::ACTIVE:     return "active";
        case PlayerStatus::FOLDED:     return "folded";
        case PlayerStatus::ALL_IN:     return "all-in";
        case PlayerStatus::ELIMINATED: return "eliminated";
        default:                       return "unknown";
    }
}

std::string hand_phase_to_string(HandPhase phase) {
    switch (phase) {
        case HandPhase::IDLE:        return "idle";
        case HandPhase::DEALING:     return "dealing";
        case HandPhase::BETTING:     return "betting";
        case HandPhase::RUNNING_OUT: return "running-out";
        case HandPhase::SHOWDOWN:    return "showdown";
        default:                     return "unknown";
    }
}

std::string vec_to_string(const std::vector<Card>& cards) {
    std::stringstream ss;
    ss << "[";
    for (size_t i = 0; i < cards.size(); ++i) {
        ss << (cards[i] == INVALID_CARD ? "--" : holdem::to_string(cards[i]));
        if (i < cards.size() - 1) ss << " ";
    }
    ss << "]";
    return ss.str();
}

Position position_from_offset(int offset, int num_players) {
    if (num_players < 2 || offset < 0 || offset >= num_players) return Position::INVALID;
    if (num_players == 2) {
        // Heads-up : le bouton poste la small blind
        return offset == 0 ? Position::BTN : Position::BB;
    }
    if (offset == 0) return Position::BTN;
    if (offset == 1) return Position::SB;
    if (offset == 2) return Position::BB;
    if (offset == num_players - 1) return Position::CO;
    if (offset == num_players - 2 && num_players >= 7) return Position::HJ;
    if (offset == 3) return Position::UTG;
    return Position::MP;
}

} // namespace holdem
