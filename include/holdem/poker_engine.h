#ifndef HOLDEM_POKER_ENGINE_H
#define HOLDEM_POKER_ENGINE_H

#include <cstdint>
#include <future>
#include <set>
#include <vector>

#include "core/cards.hpp"
#include "core/deck.hpp"
#include "holdem/common_types.h"
#include "holdem/decision_engine.h"
#include "holdem/game_config.h"
#include "holdem/hand_events.h"
#include "holdem/player.h"
#include "holdem/pot.h"
#include "holdem/showdown_manager.h"
#include "holdem/task_scheduler.h"

namespace holdem {

// Valeurs d'aide à la décision pour l'affichage du joueur humain
struct AssistInfo {
    double equity = 0.0;
    double pot_odds = 0.0;
    int amount_to_call = 0;
};

/**
 * @brief Machine à états d'une main de Hold'em.
 *
 * idle -> dealing -> betting (preflop) -> dealing -> betting (flop) -> ...
 * -> showdown -> idle. Mono-thread : une action à la fois. Les décisions des
 * bots et le run-out passent par le TaskScheduler, chaque tâche étant
 * rattachée au numéro de main et revérifiée au déclenchement.
 */
class PokerEngine {
public:
    static constexpr int MAX_PLAYERS = 10;

    /**
     * @throws std::invalid_argument si la config est invalide, si la table est
     *         vide ou dépasse MAX_PLAYERS, ou si deux joueurs ont le même id.
     */
    PokerEngine(std::vector<Player> players, EngineConfig config, TaskScheduler& scheduler,
                DecisionEngine* bot_brain = nullptr);

    void set_hand_end_listener(HandEndListener listener) { hand_end_listener_ = std::move(listener); }
    void set_action_request_listener(ActionRequestListener listener) { action_request_listener_ = std::move(listener); }

    // Lance une nouvelle main (sans effet si une main est en cours)
    void start_hand();

    /**
     * @brief Applique l'action du joueur dont c'est le tour.
     * @return false si l'action est ignorée (hors tour, illégale, main terminée).
     */
    bool process_action(const Action& action);

    LegalActions legal_actions(int seat) const;
    bool is_legal(const Action& action) const;

    // --- Opérations entre deux mains (refusées pendant une main) ---
    bool set_blinds(int small_blind, int big_blind, int ante);
    bool add_player(Player player);
    bool add_chips(PlayerId id, int amount);
    // add_chips + compteur de recaves du joueur
    bool rebuy_player(PlayerId id, int amount);

    DecisionContext make_decision_context(int seat) const;
    std::future<AssistInfo> assist_info_async(int seat, int iterations) const;

    void stack_deck_for_testing(const std::vector<Card>& top_cards) { deck_.set_cards_for_testing(top_cards); }

    // --- Accesseurs ---
    const std::vector<Player>& players() const { return players_; }
    const Player* find_player(PlayerId id) const;
    int seat_of(PlayerId id) const;
    const std::vector<Card>& community_cards() const { return community_; }
    const Pot& pot() const { return pot_; }
    Street current_street() const { return street_; }
    HandPhase phase() const { return phase_; }
    uint64_t hand_number() const { return hand_number_; }
    int dealer_index() const { return dealer_index_; }
    int small_blind_index() const { return sb_index_; }
    int big_blind_index() const { return bb_index_; }
    int active_player_index() const { return active_index_; }
    int current_bet() const { return current_bet_; }
    int min_raise() const { return min_raise_; }
    bool is_hand_over() const { return hand_over_; }
    bool has_acted(int seat) const;
    const std::vector<ActionLogEntry>& action_log() const { return action_log_; }
    const HandResult& last_result() const { return last_result_; }
    const EngineConfig& config() const { return config_; }

    // Tapis + pot en cours : constant pendant une main
    int total_chips() const;
    int count_players(PlayerStatus status) const;
    int count_live_players() const;
    Position position_of(int seat) const;

private:
    int next_seat(int from, bool (*predicate)(const Player&)) const;
    LegalActions compute_legal(int seat) const;

    void set_phase(HandPhase phase);
    void post_forced_bets(int active_count);
    void after_action();
    void advance_street();
    void start_run_out();
    void run_out_step(HandId hand_id);
    void end_hand();
    void request_action();
    void fire_bot_decision(int seat, HandId hand_id);
    void emit_hand_end();

    std::vector<Player> players_;
    EngineConfig        config_;
    TaskScheduler&      scheduler_;
    DecisionEngine*     bot_brain_;

    Deck              deck_;
    Pot               pot_;
    std::vector<Card> community_;
    Street            street_ = Street::PREFLOP;
    HandPhase         phase_ = HandPhase::IDLE;

    uint64_t hand_number_ = 0;
    bool     hand_over_ = true;
    int dealer_index_ = -1;
    int sb_index_ = -1;
    int bb_index_ = -1;
    int active_index_ = -1;

    int current_bet_ = 0;
    int min_raise_ = 0;
    std::vector<bool> has_acted_;
    int last_raiser_ = -1;
    int raises_this_street_ = 0;
    int preflop_aggressor_ = -1;
    int chips_at_hand_start_ = 0;

    std::vector<ActionLogEntry> action_log_;
    HandResult last_result_;
    std::set<PlayerId> last_hand_losers_;
    int last_pot_size_ = 0;

    HandEndListener       hand_end_listener_;
    ActionRequestListener action_request_listener_;
};

} // namespace holdem

#endif // HOLDEM_POKER_ENGINE_H
