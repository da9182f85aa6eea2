#include "core/deck.hpp"
#include "core/bitboard.hpp"
#include <stdexcept>
#include <algorithm>
#include <numeric>

namespace holdem {

Deck::Deck() : Deck(std::random_device{}()) {}

Deck::Deck(uint32_t seed) : rng_(seed) {
    initialize();
    shuffle();
}

void Deck::initialize() {
    cards_.resize(NUM_CARDS);
    std::iota(cards_.begin(), cards_.end(), Card{0});
    next_card_index_ = 0;
}

void Deck::reset() {
    next_card_index_ = 0;
    if (!stacked_) shuffle();
}

Card Deck::deal_card() {
    if (next_card_index_ >= cards_.size()) {
        throw std::runtime_error("Deck is empty, cannot deal card.");
    }
    return cards_[next_card_index_++];
}

void Deck::burn_card() {
    // Brûler dans un paquet vide : sans effet
    if (next_card_index_ < cards_.size()) next_card_index_++;
}

void Deck::shuffle() {
    std::shuffle(cards_.begin(), cards_.end(), rng_);
    next_card_index_ = 0;
}

void Deck::set_cards_for_testing(const std::vector<Card>& top_cards) {
    const Bitboard used = unique_cards_to_board(top_cards);
    cards_ = top_cards;
    for (Card c : remaining_cards(used)) {
        cards_.push_back(c);
    }
    next_card_index_ = 0;
    stacked_ = true;
}

void Deck::unstack() {
    stacked_ = false;
    initialize();
    shuffle();
}

} // namespace holdem
