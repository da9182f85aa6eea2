#ifndef HOLDEM_HAND_EVALUATOR_HPP
#define HOLDEM_HAND_EVALUATOR_HPP

#include <vector>
#include <cstdint>
#include <string>
#include <array>

#include "core/cards.hpp"

namespace holdem {

// Catégories, de la plus faible à la plus forte
enum class HandCategory : uint8_t {
    HIGH_CARD = 0,
    PAIR,
    TWO_PAIR,
    TRIPS,
    STRAIGHT,
    FLUSH,
    FULL_HOUSE,
    QUADS,
    STRAIGHT_FLUSH
};

/**
 * @brief Score comparable d'une main de 5 cartes.
 * Les kickers sont des valeurs de rang (2..14) décroissantes propres à la catégorie :
 * quads -> [carré, kicker], two pair -> [haute paire, basse paire, kicker],
 * quinte -> [hauteur] (la roue A-2-3-4-5 vaut 5).
 */
struct HandScore {
    HandCategory category = HandCategory::HIGH_CARD;
    std::vector<int> kickers;

    bool operator==(const HandScore& other) const {
        return category == other.category && kickers == other.kickers;
    }
    bool operator!=(const HandScore& other) const { return !(*this == other); }
    bool operator<(const HandScore& other) const;
    bool operator>(const HandScore& other) const { return other < *this; }
};

// Score compact : catégorie sur 4 bits puis 5 kickers de 4 bits.
// L'ordre des entiers est l'ordre des mains.
using PackedScore = uint32_t;

/**
 * @brief Meilleure main de 5 cartes parmi 5 à 7 cartes (énumère tous les sous-ensembles).
 * @throws std::invalid_argument si count n'est pas dans [5, 7].
 */
PackedScore evaluate_packed(const Card* cards, size_t count);

HandScore unpack_score(PackedScore packed);

HandScore evaluate_five(const std::array<Card, 5>& cards);

/**
 * @brief Évalue 2 cartes privées + 3 à 5 cartes communes.
 * Fonction pure : indépendante de l'ordre des cartes dans chaque liste.
 * @throws std::invalid_argument si le total n'est pas dans [5, 7].
 */
HandScore evaluate_hand(const std::vector<Card>& hole, const std::vector<Card>& community);

HandScore evaluate_cards(const std::vector<Card>& cards);

// -1 si a < b, 0 si égalité, 1 si a > b
int compare_hands(const HandScore& a, const HandScore& b);

std::string hand_category_to_string(HandCategory category);
// "Full House, Kings full of Fives"
std::string describe_hand(const HandScore& score);

} // namespace holdem

#endif // HOLDEM_HAND_EVALUATOR_HPP
