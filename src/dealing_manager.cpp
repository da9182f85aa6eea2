#include "holdem/dealing_manager.h"
#include "holdem/game_utils.hpp"
#include "spdlog/spdlog.h"

namespace holdem {

void DealingManager::deal_hole_cards(Deck& deck, std::vector<Player>& players, int dealer_index) {
    const int n = static_cast<int>(players.size());
    if (n == 0) return;
    for (auto& p : players) p.hole_cards.clear();

    for (int round = 0; round < 2; ++round) {
        for (int offset = 1; offset <= n; ++offset) {
            Player& p = players[(dealer_index + offset) % n];
            if (!p.is_live()) continue;
            p.hole_cards.push_back(deck.deal_card());
        }
    }
    for (const auto& p : players) {
        if (!p.hole_cards.empty()) {
            spdlog::trace("Cartes de {}: {}", p.name, vec_to_string(p.hole_cards));
        }
    }
}

Street DealingManager::next_street(Street street) {
    switch (street) {
        case Street::PREFLOP: return Street::FLOP;
        case Street::FLOP:    return Street::TURN;
        case Street::TURN:    return Street::RIVER;
        default:              return Street::SHOWDOWN;
    }
}

Street DealingManager::deal_next_street(Deck& deck, std::vector<Card>& community, Street current) {
    if (current == Street::RIVER || current == Street::SHOWDOWN) return current;

    const Street next = next_street(current);
    const int count = (next == Street::FLOP) ? 3 : 1;
    deck.burn_card();
    for (int i = 0; i < count; ++i) {
        community.push_back(deck.deal_card());
    }
    spdlog::debug("{}: {}", street_to_string(next), vec_to_string(community));
    return next;
}

int DealingManager::streets_remaining(Street street) {
    switch (street) {
        case Street::PREFLOP: return 3;
        case Street::FLOP:    return 2;
        case Street::TURN:    return 1;
        default:              return 0;
    }
}

} // namespace holdem
