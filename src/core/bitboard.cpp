#include "core/bitboard.hpp"
#include <stdexcept>

namespace holdem {

std::string board_to_string(Bitboard board) {
    std::string out;
    // pop_lsb rend les cartes par index croissant
    while (board != 0) {
        out += to_string(pop_lsb(board));
    }
    return out;
}

std::vector<Card> board_to_cards(Bitboard board) {
    std::vector<Card> cards;
    cards.reserve(count_set_bits(board));
    while (board != 0) {
        cards.push_back(pop_lsb(board));
    }
    return cards;
}

Bitboard cards_to_board(const std::vector<Card>& cards) {
    Bitboard board = EMPTY_BOARD;
    for (Card c : cards) {
        set_card(board, c);
    }
    return board;
}

Bitboard unique_cards_to_board(const std::vector<Card>& cards) {
    Bitboard board = EMPTY_BOARD;
    for (Card c : cards) {
        if (!is_valid_card(c)) {
            throw std::invalid_argument("Invalid card index " + std::to_string(static_cast<int>(c)));
        }
        if (test_card(board, c)) {
            throw std::invalid_argument("Duplicate card " + to_string(c));
        }
        set_card(board, c);
    }
    return board;
}

std::vector<Card> remaining_cards(Bitboard dead) {
    return board_to_cards(FULL_DECK & ~dead);
}

} // namespace holdem
