#ifndef HOLDEM_CORE_DECK_HPP
#define HOLDEM_CORE_DECK_HPP

#include "core/cards.hpp"
#include <vector>
#include <random>
#include <cstdint>

namespace holdem {

class Deck {
public:
    Deck();
    explicit Deck(uint32_t seed);
    ~Deck() = default;

    // Lève std::runtime_error si le paquet est vide
    Card deal_card();
    void burn_card();
    void shuffle();
    // Remet toutes les cartes ; un paquet "truqué" garde son ordre
    void reset();

    size_t remaining() const { return cards_.size() - next_card_index_; }

    /**
     * @brief Fixe l'ordre du paquet pour les tests.
     * Les cartes données sortent en premier, le reste suit dans l'ordre canonique.
     * L'ordre est conservé à travers reset() jusqu'à unstack().
     * @throws std::invalid_argument si une carte est invalide ou dupliquée.
     */
    void set_cards_for_testing(const std::vector<Card>& top_cards);
    void unstack();
    bool is_stacked() const { return stacked_; }

private:
    void initialize();

    std::vector<Card> cards_;
    size_t            next_card_index_ = 0;
    bool              stacked_ = false;
    std::mt19937      rng_;
};

} // namespace holdem

#endif // HOLDEM_CORE_DECK_HPP
