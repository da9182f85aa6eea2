#ifndef HOLDEM_CARDS_HPP
#define HOLDEM_CARDS_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <stdexcept> // Pour std::invalid_argument

namespace holdem {

// Une carte = index 0-51 (suit * 13 + rank)
using Card = uint8_t;

// Constante pour une carte invalide/inconnue
constexpr Card INVALID_CARD = 52;

enum class Suit : uint8_t { CLUBS = 0, DIAMONDS = 1, HEARTS = 2, SPADES = 3 };
enum class Rank : uint8_t {
    TWO = 0, THREE = 1, FOUR = 2, FIVE = 3, SIX = 4, SEVEN = 5, EIGHT = 6,
    NINE = 7, TEN = 8, JACK = 9, QUEEN = 10, KING = 11, ACE = 12
};

constexpr Card make_card(Rank r, Suit s) {
    return static_cast<uint8_t>(s) * 13 + static_cast<uint8_t>(r);
}

constexpr Rank get_rank(Card c) {
    return static_cast<Rank>(c % 13);
}

constexpr Suit get_suit(Card c) {
    return static_cast<Suit>(c / 13);
}

// Valeur "poker" du rang : 2..14 (as haut)
constexpr int rank_value(Card c) {
    return static_cast<int>(c % 13) + 2;
}

constexpr bool is_valid_card(Card c) {
    return c < INVALID_CARD;
}

// Conversions string <-> Card/Rank/Suit
std::string to_string(Suit s);
std::string to_string(Rank r);
std::string to_string(Card c);

Card card_from_string(const std::string& s);
Rank rank_from_char(char r);
Suit suit_from_char(char s);

// "As Kd 7h" ou "AsKd7h" -> {As, Kd, 7h}
std::vector<Card> cards_from_string(const std::string& s);

} // namespace holdem

#endif // HOLDEM_CARDS_HPP
