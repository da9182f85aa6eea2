#ifndef HOLDEM_BITBOARD_HPP
#define HOLDEM_BITBOARD_HPP

#include <bit>
#include <cstdint>
#include <string>
#include <vector>

#include "core/cards.hpp"

namespace holdem {

// Masque de bits : bit i = carte d'index i (0-51)
using Bitboard = uint64_t;

constexpr Bitboard EMPTY_BOARD = 0ULL;
constexpr int NUM_CARDS = 52;
constexpr Bitboard FULL_DECK = (1ULL << NUM_CARDS) - 1;

inline void set_card(Bitboard& board, Card c) {
    if (is_valid_card(c)) board |= (1ULL << c);
}

inline void clear_card(Bitboard& board, Card c) {
    if (is_valid_card(c)) board &= ~(1ULL << c);
}

inline bool test_card(Bitboard board, Card c) {
    if (!is_valid_card(c)) return false;
    return (board & (1ULL << c)) != 0;
}

inline int count_set_bits(Bitboard board) {
    return std::popcount(board);
}

// Retire et retourne la carte du bit de poids faible (INVALID_CARD si vide)
inline Card pop_lsb(Bitboard& board) {
    if (board == 0) return INVALID_CARD;
    const int idx = std::countr_zero(board);
    board &= (board - 1);
    return static_cast<Card>(idx);
}

std::string board_to_string(Bitboard board);
std::vector<Card> board_to_cards(Bitboard board);
Bitboard cards_to_board(const std::vector<Card>& cards);

/**
 * @brief Construit un masque à partir d'une liste en vérifiant l'unicité.
 * @throws std::invalid_argument si une carte est invalide ou dupliquée.
 */
Bitboard unique_cards_to_board(const std::vector<Card>& cards);

// Cartes restantes du paquet (ordre croissant d'index)
std::vector<Card> remaining_cards(Bitboard dead);

} // namespace holdem

#endif // HOLDEM_BITBOARD_HPP
