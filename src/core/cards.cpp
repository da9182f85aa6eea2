#include "core/cards.hpp"
#include <cctype>
#include <string_view>

namespace holdem {

namespace {
constexpr std::string_view RANK_CHARS = "23456789TJQKA";
constexpr std::string_view SUIT_CHARS = "cdhs";
}

// --- Conversions char <-> Rank/Suit ---

Rank rank_from_char(char r) {
    const auto pos = RANK_CHARS.find(static_cast<char>(std::toupper(static_cast<unsigned char>(r))));
    if (pos == std::string_view::npos) {
        throw std::invalid_argument("Invalid rank character: " + std::string(1, r));
    }
    return static_cast<Rank>(pos);
}

Suit suit_from_char(char s) {
    const auto pos = SUIT_CHARS.find(static_cast<char>(std::tolower(static_cast<unsigned char>(s))));
    if (pos == std::string_view::npos) {
        throw std::invalid_argument("Invalid suit character: " + std::string(1, s));
    }
    return static_cast<Suit>(pos);
}

std::string to_string(Rank r) {
    const auto idx = static_cast<size_t>(r);
    if (idx >= RANK_CHARS.size()) return "?";
    return std::string(1, RANK_CHARS[idx]);
}

std::string to_string(Suit s) {
    const auto idx = static_cast<size_t>(s);
    if (idx >= SUIT_CHARS.size()) return "?";
    return std::string(1, SUIT_CHARS[idx]);
}

std::string to_string(Card c) {
    if (!is_valid_card(c)) return "??";
    return to_string(get_rank(c)) + to_string(get_suit(c));
}

Card card_from_string(const std::string& s) {
    if (s.length() != 2) {
        throw std::invalid_argument("Invalid card string format: '" + s + "'. Expected 'Rs'.");
    }
    try {
        return make_card(rank_from_char(s[0]), suit_from_char(s[1]));
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument("Invalid card string '" + s + "': " + e.what());
    }
}

std::vector<Card> cards_from_string(const std::string& s) {
    std::string compact;
    compact.reserve(s.size());
    for (char ch : s) {
        if (!std::isspace(static_cast<unsigned char>(ch))) compact.push_back(ch);
    }
    if (compact.size() % 2 != 0) {
        throw std::invalid_argument("Invalid card list: '" + s + "'");
    }
    std::vector<Card> cards;
    cards.reserve(compact.size() / 2);
    for (size_t i = 0; i < compact.size(); i += 2) {
        cards.push_back(card_from_string(compact.substr(i, 2)));
    }
    return cards;
}

} // namespace holdem
