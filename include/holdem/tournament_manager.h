#ifndef HOLDEM_TOURNAMENT_MANAGER_H
#define HOLDEM_TOURNAMENT_MANAGER_H

#include <cstdint>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "holdem/ai_profile.h"
#include "holdem/common_types.h"
#include "holdem/player.h"

namespace holdem {

class PokerEngine;

struct BlindLevel {
    int level = 1;
    int small_blind = 10;
    int big_blind = 20;
    int ante = 0;

    // "Level 3: 25/50 (ante 5)"
    std::string description() const;
};

struct TournamentConfig {
    std::string name = "Standard";
    int starting_chips = 1000;
    std::vector<BlindLevel> blind_schedule;
    int hands_per_level = 10;
    std::vector<double> payout_structure = {0.5, 0.3, 0.2};

    int max_players = 8;
    int max_rebuys = 1;
    int entry_interval_hands = 10; // une tentative d'entrée toutes les N mains

    // Lève std::invalid_argument si le calendrier ou les paiements sont incohérents
    void validate() const;

    static TournamentConfig turbo();
    static TournamentConfig standard();
    static TournamentConfig deep_stack();
};

struct EliminationRecord {
    PlayerId player_id = INVALID_PLAYER_ID;
    std::string name;
    uint64_t hand_number = 0;
};

struct TournamentResult {
    int rank = 0;
    PlayerId player_id = INVALID_PLAYER_ID;
    std::string name;
    int chips = 0;
    double payout_fraction = 0.0;
};

/**
 * @brief Collaborateur externe du moteur : niveaux de blinds, recaves, entrées
 *        dynamiques et classement final.
 *
 * N'agit sur le PokerEngine qu'entre deux mains, via son API publique.
 */
class TournamentManager {
public:
    explicit TournamentManager(TournamentConfig config);
    TournamentManager(TournamentConfig config, uint32_t seed);

    // Applique le premier niveau de blinds
    bool apply_starting_level(PokerEngine& engine) const;

    Player make_player(PlayerId id, std::string name, std::optional<AIProfile> profile, bool human = false) const;

    /**
     * @brief À appeler après chaque fin de main.
     * Compte la main, monte de niveau si besoin, enregistre les éliminations
     * et tente une entrée dynamique.
     * @return false si une main est encore en cours (rien n'est fait).
     */
    bool on_hand_complete(PokerEngine& engine);

    // true si le niveau a changé
    bool check_blind_level_up();

    bool rebuy(PokerEngine& engine, PlayerId id);

    // Id du nouveau joueur s'il y a eu une entrée
    std::optional<PlayerId> try_dynamic_entry(PokerEngine& engine);

    static double entry_probability(uint64_t hands_played);

    std::vector<TournamentResult> final_results(const PokerEngine& engine) const;

    const TournamentConfig& config() const { return config_; }
    const BlindLevel& current_level() const { return config_.blind_schedule[level_index_]; }
    int level_index() const { return level_index_; }
    int hands_at_level() const { return hands_at_level_; }
    const std::vector<EliminationRecord>& eliminations() const { return eliminations_; }

private:
    void record_eliminations(const PokerEngine& engine);
    std::string unique_name(const PokerEngine& engine, const std::string& base) const;

    TournamentConfig config_;
    int level_index_ = 0;
    int hands_at_level_ = 0;
    std::vector<EliminationRecord> eliminations_;
    std::set<PlayerId> eliminated_ids_;
    std::mt19937 rng_;
};

} // namespace holdem

#endif // HOLDEM_TOURNAMENT_MANAGER_H
