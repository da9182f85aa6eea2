// ─────────────────────────────────────────────────────────────────────────────
//  src/eval/hand_evaluator.cpp
//  Évaluateur par énumération : les C(n,5) sous-ensembles (21 pour 7 cartes)
//  sont scorés et le maximum est retenu.
// ─────────────────────────────────────────────────────────────────────────────
#include "eval/hand_evaluator.hpp"
#include <stdexcept>
#include <algorithm>
#include <bit>

namespace holdem {

namespace {

constexpr int KICKER_COUNT[9] = {
    5, // HIGH_CARD
    4, // PAIR
    3, // TWO_PAIR
    3, // TRIPS
    1, // STRAIGHT
    5, // FLUSH
    2, // FULL_HOUSE
    2, // QUADS
    1  // STRAIGHT_FLUSH
};

constexpr uint16_t WHEEL_MASK = (1u << 14) | (1u << 5) | (1u << 4) | (1u << 3) | (1u << 2);

PackedScore pack(HandCategory category, const int* kickers, int n) {
    PackedScore packed = static_cast<PackedScore>(category) << 20;
    for (int i = 0; i < n; ++i) {
        packed |= static_cast<PackedScore>(kickers[i]) << (16 - 4 * i);
    }
    return packed;
}

PackedScore score_five(Card c0, Card c1, Card c2, Card c3, Card c4) {
    const Card cards[5] = {c0, c1, c2, c3, c4};

    int counts[15] = {0};
    uint16_t rank_mask = 0;
    bool flush = true;
    const Suit first_suit = get_suit(c0);
    for (Card c : cards) {
        const int v = rank_value(c);
        counts[v]++;
        rank_mask |= static_cast<uint16_t>(1u << v);
        if (get_suit(c) != first_suit) flush = false;
    }

    int straight_high = 0;
    if (std::popcount(rank_mask) == 5) {
        const int low = std::countr_zero(rank_mask);
        if (rank_mask == (0x1Fu << low)) {
            straight_high = low + 4;
        } else if (rank_mask == WHEEL_MASK) {
            straight_high = 5; // A-2-3-4-5 : l'as compte pour 1
        }
    }

    if (flush && straight_high) {
        return pack(HandCategory::STRAIGHT_FLUSH, &straight_high, 1);
    }

    // Groupes (nombre, rang) triés par nombre puis rang décroissants
    int group_count[5];
    int group_rank[5];
    int groups = 0;
    for (int v = 14; v >= 2; --v) {
        if (counts[v] == 0) continue;
        int pos = groups++;
        while (pos > 0 && group_count[pos - 1] < counts[v]) {
            group_count[pos] = group_count[pos - 1];
            group_rank[pos] = group_rank[pos - 1];
            --pos;
        }
        group_count[pos] = counts[v];
        group_rank[pos] = v;
    }

    HandCategory category;
    if (group_count[0] == 4) {
        category = HandCategory::QUADS;
    } else if (group_count[0] == 3 && group_count[1] == 2) {
        category = HandCategory::FULL_HOUSE;
    } else if (flush) {
        category = HandCategory::FLUSH;
    } else if (straight_high) {
        return pack(HandCategory::STRAIGHT, &straight_high, 1);
    } else if (group_count[0] == 3) {
        category = HandCategory::TRIPS;
    } else if (group_count[0] == 2 && group_count[1] == 2) {
        category = HandCategory::TWO_PAIR;
    } else if (group_count[0] == 2) {
        category = HandCategory::PAIR;
    } else {
        category = HandCategory::HIGH_CARD;
    }
    return pack(category, group_rank, groups);
}

std::string rank_name(int value, bool plural) {
    static const char* singular_names[] = {
        "Two", "Three", "Four", "Five", "Six", "Seven", "Eight",
        "Nine", "Ten", "Jack", "Queen", "King", "Ace"
    };
    static const char* plural_names[] = {
        "Twos", "Threes", "Fours", "Fives", "Sixes", "Sevens", "Eights",
        "Nines", "Tens", "Jacks", "Queens", "Kings", "Aces"
    };
    if (value < 2 || value > 14) return "?";
    return plural ? plural_names[value - 2] : singular_names[value - 2];
}

} // namespace

bool HandScore::operator<(const HandScore& other) const {
    if (category != other.category) return category < other.category;
    return std::lexicographical_compare(kickers.begin(), kickers.end(),
                                        other.kickers.begin(), other.kickers.end());
}

PackedScore evaluate_packed(const Card* cards, size_t count) {
    if (count < 5 || count > 7) {
        throw std::invalid_argument("Hand evaluation requires 5 to 7 cards, got " + std::to_string(count));
    }
    PackedScore best = 0;
    for (size_t a = 0; a < count; ++a)
        for (size_t b = a + 1; b < count; ++b)
            for (size_t c = b + 1; c < count; ++c)
                for (size_t d = c + 1; d < count; ++d)
                    for (size_t e = d + 1; e < count; ++e)
                        best = std::max(best, score_five(cards[a], cards[b], cards[c], cards[d], cards[e]));
    return best;
}

HandScore unpack_score(PackedScore packed) {
    HandScore score;
    const int cat = static_cast<int>(packed >> 20) & 0xF;
    score.category = static_cast<HandCategory>(cat);
    const int n = KICKER_COUNT[std::min(cat, 8)];
    score.kickers.reserve(n);
    for (int i = 0; i < n; ++i) {
        score.kickers.push_back(static_cast<int>(packed >> (16 - 4 * i)) & 0xF);
    }
    return score;
}

HandScore evaluate_five(const std::array<Card, 5>& cards) {
    return unpack_score(evaluate_packed(cards.data(), cards.size()));
}

HandScore evaluate_hand(const std::vector<Card>& hole, const std::vector<Card>& community) {
    std::array<Card, 7> all{};
    const size_t total = hole.size() + community.size();
    if (total < 5 || total > 7) {
        throw std::invalid_argument("Hand evaluation requires 5 to 7 cards, got " + std::to_string(total));
    }
    std::copy(hole.begin(), hole.end(), all.begin());
    std::copy(community.begin(), community.end(), all.begin() + hole.size());
    return unpack_score(evaluate_packed(all.data(), total));
}

HandScore evaluate_cards(const std::vector<Card>& cards) {
    return unpack_score(evaluate_packed(cards.data(), cards.size()));
}

int compare_hands(const HandScore& a, const HandScore& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

std::string hand_category_to_string(HandCategory category) {
    switch (category) {
        case HandCategory::HIGH_CARD:      return "High Card";
        case HandCategory::PAIR:           return "Pair";
        case HandCategory::TWO_PAIR:       return "Two Pair";
        case HandCategory::TRIPS:          return "Three of a Kind";
        case HandCategory::STRAIGHT:       return "Straight";
        case HandCategory::FLUSH:          return "Flush";
        case HandCategory::FULL_HOUSE:     return "Full House";
        case HandCategory::QUADS:          return "Four of a Kind";
        case HandCategory::STRAIGHT_FLUSH: return "Straight Flush";
        default:                           return "Unknown";
    }
}

std::string describe_hand(const HandScore& score) {
    const auto& k = score.kickers;
    if (k.empty()) return hand_category_to_string(score.category);
    switch (score.category) {
        case HandCategory::HIGH_CARD:
            return "High Card, " + rank_name(k[0], false);
        case HandCategory::PAIR:
            return "Pair of " + rank_name(k[0], true);
        case HandCategory::TWO_PAIR:
            return "Two Pair, " + rank_name(k[0], true) + " and " + rank_name(k[1], true);
        case HandCategory::TRIPS:
            return "Three of a Kind, " + rank_name(k[0], true);
        case HandCategory::STRAIGHT:
            return "Straight, " + rank_name(k[0], false) + " high";
        case HandCategory::FLUSH:
            return "Flush, " + rank_name(k[0], false) + " high";
        case HandCategory::FULL_HOUSE:
            return "Full House, " + rank_name(k[0], true) + " full of " + rank_name(k[1], true);
        case HandCategory::QUADS:
            return "Four of a Kind, " + rank_name(k[0], true);
        case HandCategory::STRAIGHT_FLUSH:
            if (k[0] == 14) return "Royal Flush";
            return "Straight Flush, " + rank_name(k[0], false) + " high";
        default:
            return hand_category_to_string(score.category);
    }
}

} // namespace holdem
