#ifndef HOLDEM_GAME_UTILS_HPP
#define HOLDEM_GAME_UTILS_HPP

#include <string>
#include <vector>
#include "core/cards.hpp"
#include "holdem/common_types.h"

namespace holdem {

std::string street_to_string(Street s);
std::string action_type_to_string(ActionType type);
std::string action_to_string(const Action& action);
std::string status_to_string(PlayerStatus status);
std::string hand_phase_to_string(HandPhase phase);

// "[As Kd --]"
std::string vec_to_string(const std::vector<Card>& cards);

/**
 * @brief Étiquette de position d'après le décalage depuis le bouton.
 * @param offset 0 = bouton, 1 = siège suivant parmi les joueurs de la main, ...
 * @param num_players nombre de joueurs dans la main.
 */
Position position_from_offset(int offset, int num_players);

} // namespace holdem

#endif // HOLDEM_GAME_UTILS_HPP
