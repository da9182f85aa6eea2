#include "holdem/poker_engine.h"
#include "holdem/betting_manager.h"
#include "holdem/dealing_manager.h"
#include "holdem/game_utils.hpp"
#include "holdem/monte_carlo.h"
#include "holdem/tilt_manager.h"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <stdexcept>

namespace holdem {

namespace {
bool is_active(const Player& p) { return p.status == PlayerStatus::ACTIVE; }
bool is_seated(const Player& p) { return p.status != PlayerStatus::ELIMINATED; }
} // namespace

// -----------------------------------------------------------------------------
//  Constructeur
// -----------------------------------------------------------------------------
PokerEngine::PokerEngine(std::vector<Player> players, EngineConfig config, TaskScheduler& scheduler,
                         DecisionEngine* bot_brain)
    : players_(std::move(players)),
      config_(std::move(config)),
      scheduler_(scheduler),
      bot_brain_(bot_brain),
      deck_(config_.deck_seed ? Deck(*config_.deck_seed) : Deck())
{
    config_.validate();
    if (players_.empty()) throw std::invalid_argument("PokerEngine requires at least one player");
    if (static_cast<int>(players_.size()) > MAX_PLAYERS) {
        throw std::invalid_argument("Too many players: " + std::to_string(players_.size()));
    }
    std::set<PlayerId> ids;
    for (auto& p : players_) {
        if (!ids.insert(p.id).second) throw std::invalid_argument("Duplicate player id " + std::to_string(p.id));
        if (p.chips < 0) throw std::invalid_argument("Negative stack for " + p.name);
        p.status = p.chips > 0 ? PlayerStatus::ACTIVE : PlayerStatus::ELIMINATED;
    }
    has_acted_.assign(players_.size(), false);
    min_raise_ = config_.big_blind;
    spdlog::debug("PokerEngine initialisé: {} joueurs, blinds {}/{} ante {}",
                  players_.size(), config_.small_blind, config_.big_blind, config_.ante);
}

// -----------------------------------------------------------------------------
//  Accesseurs
// -----------------------------------------------------------------------------
const Player* PokerEngine::find_player(PlayerId id) const {
    const int seat = seat_of(id);
    return seat >= 0 ? &players_[seat] : nullptr;
}

int PokerEngine::seat_of(PlayerId id) const {
    for (size_t i = 0; i < players_.size(); ++i) {
        if (players_[i].id == id) return static_cast<int>(i);
    }
    return -1;
}

bool PokerEngine::has_acted(int seat) const {
    return seat >= 0 && seat < static_cast<int>(has_acted_.size()) && has_acted_[seat];
}

int PokerEngine::total_chips() const {
    // Une fois la main réglée, le pot est déjà redistribué
    int total = hand_over_ ? 0 : pot_.total();
    for (const auto& p : players_) total += p.chips;
    return total;
}

int PokerEngine::count_players(PlayerStatus status) const {
    return static_cast<int>(std::count_if(players_.begin(), players_.end(),
                                          [status](const Player& p) { return p.status == status; }));
}

int PokerEngine::count_live_players() const {
    return static_cast<int>(std::count_if(players_.begin(), players_.end(),
                                          [](const Player& p) { return p.is_live(); }));
}

Position PokerEngine::position_of(int seat) const {
    if (dealer_index_ < 0 || seat < 0 || seat >= static_cast<int>(players_.size())) return Position::INVALID;
    if (!is_seated(players_[seat])) return Position::INVALID;
    const int n = static_cast<int>(players_.size());
    int offset = 0;
    int in_hand = 0;
    for (int k = 0; k < n; ++k) {
        const int s = (dealer_index_ + k) % n;
        if (!is_seated(players_[s])) continue;
        if (s == seat) offset = in_hand;
        ++in_hand;
    }
    return position_from_offset(offset, in_hand);
}

int PokerEngine::next_seat(int from, bool (*predicate)(const Player&)) const {
    const int n = static_cast<int>(players_.size());
    for (int k = 1; k <= n; ++k) {
        const int s = ((from + k) % n + n) % n;
        if (predicate(players_[s])) return s;
    }
    return -1;
}

void PokerEngine::set_phase(HandPhase phase) {
    if (phase_ == phase) return;
    spdlog::debug("Main #{}: {} -> {} ({})", hand_number_, hand_phase_to_string(phase_),
                  hand_phase_to_string(phase), street_to_string(street_));
    phase_ = phase;
}

// -----------------------------------------------------------------------------
//  Début de main
// -----------------------------------------------------------------------------
void PokerEngine::start_hand() {
    if (!hand_over_) {
        spdlog::warn("start_hand ignoré: la main #{} est en cours", hand_number_);
        return;
    }
    ++hand_number_;
    TiltManager::update_tilt(players_, last_hand_losers_, last_pot_size_, config_.tilt);

    deck_.reset();
    community_.clear();
    pot_.reset();
    street_ = Street::PREFLOP;
    action_log_.clear();
    last_result_ = HandResult{};
    current_bet_ = 0;
    min_raise_ = config_.big_blind;
    last_raiser_ = -1;
    raises_this_street_ = 0;
    preflop_aggressor_ = -1;
    active_index_ = -1;

    for (auto& p : players_) p.reset_for_new_hand();
    has_acted_.assign(players_.size(), false);
    chips_at_hand_start_ = total_chips();

    const int active_count = count_players(PlayerStatus::ACTIVE);
    if (active_count < 2) {
        last_result_.message = "Not enough players!";
        spdlog::warn("Main #{}: {} ({} joueur actif)", hand_number_, last_result_.message, active_count);
        set_phase(HandPhase::IDLE);
        emit_hand_end();
        return;
    }

    hand_over_ = false;
    set_phase(HandPhase::DEALING);
    dealer_index_ = next_seat(dealer_index_, is_active);
    post_forced_bets(active_count);
    DealingManager::deal_hole_cards(deck_, players_, dealer_index_);

    current_bet_ = config_.big_blind;
    min_raise_ = config_.big_blind;
    for (size_t i = 0; i < players_.size(); ++i) {
        has_acted_[i] = players_[i].status == PlayerStatus::ALL_IN;
    }

    spdlog::info("Main #{}: bouton {} | SB {} ({}) | BB {} ({}) | pot {}",
                 hand_number_, players_[dealer_index_].name,
                 players_[sb_index_].name, config_.small_blind,
                 players_[bb_index_].name, config_.big_blind, pot_.total());

    set_phase(HandPhase::BETTING);
    // Blinds à tapis : il peut n'y avoir personne pour parler
    if (BettingManager::is_round_complete(players_, has_acted_, current_bet_)) {
        advance_street();
        return;
    }
    active_index_ = next_seat(bb_index_, is_active);
    request_action();
}

void PokerEngine::post_forced_bets(int active_count) {
    if (active_count == 2) {
        // Heads-up : le bouton poste la small blind
        sb_index_ = dealer_index_;
        bb_index_ = next_seat(dealer_index_, is_active);
    } else {
        sb_index_ = next_seat(dealer_index_, is_active);
        bb_index_ = next_seat(sb_index_, is_active);
    }

    if (config_.ante > 0) {
        for (auto& p : players_) {
            if (p.status == PlayerStatus::ACTIVE) pot_.add(BettingManager::post_ante(p, config_.ante));
        }
    }
    const int sb_posted = BettingManager::post_blind(players_[sb_index_], config_.small_blind);
    const int bb_posted = BettingManager::post_blind(players_[bb_index_], config_.big_blind);
    pot_.add(sb_posted);
    pot_.add(bb_posted);
    spdlog::debug("Blinds: {} poste {}, {} poste {}", players_[sb_index_].name, sb_posted,
                  players_[bb_index_].name, bb_posted);
}

// -----------------------------------------------------------------------------
//  Actions
// -----------------------------------------------------------------------------
LegalActions PokerEngine::compute_legal(int seat) const {
    LegalActions legal;
    if (seat < 0 || seat >= static_cast<int>(players_.size())) return legal;
    const Player& p = players_[seat];
    if (!p.can_act()) return legal;

    const int to_call = std::max(0, current_bet_ - p.current_bet);
    legal.amount_to_call = std::min(to_call, p.chips);
    legal.can_check = to_call == 0;
    legal.can_call = to_call > 0;
    // Déjà parlé depuis la dernière relance complète : pas de relance (all-in court)
    legal.can_raise = !has_acted(seat) && p.chips > to_call;
    legal.max_raise_to = p.current_bet + p.chips;
    legal.min_raise_to = std::min(current_bet_ + min_raise_, legal.max_raise_to);
    return legal;
}

LegalActions PokerEngine::legal_actions(int seat) const {
    if (hand_over_ || phase_ != HandPhase::BETTING || seat != active_index_) return LegalActions{};
    return compute_legal(seat);
}

bool PokerEngine::is_legal(const Action& action) const {
    if (hand_over_ || phase_ != HandPhase::BETTING || action.player_index != active_index_) return false;
    const LegalActions legal = compute_legal(action.player_index);
    const Player& p = players_[action.player_index];
    switch (action.type) {
        case ActionType::FOLD:   return p.can_act();
        case ActionType::CHECK:  return legal.can_check;
        case ActionType::CALL:   return legal.can_call || legal.can_check;
        case ActionType::RAISE:  return legal.can_raise;
        case ActionType::ALL_IN: return legal.can_raise || (p.can_act() && p.chips <= current_bet_ - p.current_bet);
    }
    return false;
}

bool PokerEngine::process_action(const Action& action) {
    if (hand_over_ || phase_ != HandPhase::BETTING) {
        spdlog::warn("Action {} ignorée: pas de tour d'enchères en cours", action_to_string(action));
        return false;
    }
    if (action.player_index != active_index_) {
        spdlog::warn("Action {} du siège {} ignorée: c'est au siège {}",
                     action_to_string(action), action.player_index, active_index_);
        return false;
    }
    if (!is_legal(action)) {
        spdlog::warn("Action illégale ignorée: siège {} {}", action.player_index, action_to_string(action));
        return false;
    }

    const int seat = action.player_index;
    Player& player = players_[seat];
    const BetActionResult result = BettingManager::process_action(player, action.type, action.amount,
                                                                  current_bet_, min_raise_);
    if (!result.is_valid) {
        spdlog::warn("Action invalide ignorée: {} {}", player.name, action_to_string(action));
        return false;
    }

    player = result.player;
    pot_.add(result.pot_addition);
    current_bet_ = result.new_current_bet;
    min_raise_ = result.new_min_raise;

    if (result.reopen_action) {
        for (size_t i = 0; i < players_.size(); ++i) {
            if (static_cast<int>(i) != seat && players_[i].can_act()) has_acted_[i] = false;
        }
    }
    if (result.new_last_raiser) {
        last_raiser_ = seat;
        ++raises_this_street_;
        if (street_ == Street::PREFLOP) preflop_aggressor_ = seat;
    }
    has_acted_[seat] = true;

    ActionLogEntry entry;
    entry.player_id = player.id;
    entry.player_name = player.name;
    entry.action = action.type;
    entry.street = street_;
    const bool is_bet = action.type == ActionType::RAISE || action.type == ActionType::ALL_IN;
    entry.amount = is_bet ? player.current_bet : result.pot_addition;
    // Volontaire : des jetons mis par choix (un check d'option de BB n'en met aucun)
    entry.voluntary = result.pot_addition > 0 && action.type != ActionType::FOLD;
    action_log_.push_back(entry);

    spdlog::info("[{}] {} {} (pot {})", street_to_string(street_), player.name,
                 action_to_string(Action{seat, action.type, entry.amount}), pot_.total());

    after_action();
    return true;
}

void PokerEngine::after_action() {
    if (count_live_players() <= 1) {
        end_hand();
        return;
    }
    if (BettingManager::is_round_complete(players_, has_acted_, current_bet_)) {
        advance_street();
        return;
    }
    const int next = next_seat(active_index_, is_active);
    if (next < 0) {
        advance_street();
        return;
    }
    active_index_ = next;
    request_action();
}

// -----------------------------------------------------------------------------
//  Streets / run-out
// -----------------------------------------------------------------------------
void PokerEngine::advance_street() {
    active_index_ = -1;
    if (street_ == Street::RIVER) {
        end_hand();
        return;
    }
    if (count_players(PlayerStatus::ACTIVE) <= 1) {
        start_run_out();
        return;
    }

    set_phase(HandPhase::DEALING);
    street_ = DealingManager::deal_next_street(deck_, community_, street_);
    BettingManager::reset_street(players_, has_acted_, current_bet_, min_raise_, config_.big_blind);
    last_raiser_ = -1;
    raises_this_street_ = 0;

    set_phase(HandPhase::BETTING);
    active_index_ = next_seat(dealer_index_, is_active);
    request_action();
}

void PokerEngine::start_run_out() {
    set_phase(HandPhase::RUNNING_OUT);
    if (DealingManager::streets_remaining(street_) == 0) {
        end_hand();
        return;
    }
    spdlog::debug("Main #{}: plus d'enchères possibles, run-out du board", hand_number_);
    const HandId id = hand_number_;
    scheduler_.schedule_after(config_.run_out_delay_ms, id, [this, id]() { run_out_step(id); });
}

void PokerEngine::run_out_step(HandId hand_id) {
    if (hand_over_ || hand_id != hand_number_ || phase_ != HandPhase::RUNNING_OUT) {
        spdlog::trace("Run-out périmé ignoré (main {})", hand_id);
        return;
    }
    street_ = DealingManager::deal_next_street(deck_, community_, street_);
    BettingManager::reset_street(players_, has_acted_, current_bet_, min_raise_, config_.big_blind);
    if (DealingManager::streets_remaining(street_) == 0) {
        end_hand();
        return;
    }
    scheduler_.schedule_after(config_.run_out_delay_ms, hand_id, [this, hand_id]() { run_out_step(hand_id); });
}

// -----------------------------------------------------------------------------
//  Fin de main
// -----------------------------------------------------------------------------
void PokerEngine::end_hand() {
    if (hand_over_) return;
    set_phase(HandPhase::SHOWDOWN);
    active_index_ = -1;

    std::vector<int> live;
    for (size_t i = 0; i < players_.size(); ++i) {
        if (players_[i].is_live()) live.push_back(static_cast<int>(i));
    }

    HandResult result;
    if (live.size() == 1) {
        result = ShowdownManager::distribute_single_winner(players_, live.front(), pot_.total());
    } else {
        // Le board doit être complet pour évaluer
        while (community_.size() < 5) {
            street_ = DealingManager::deal_next_street(deck_, community_, street_);
        }
        street_ = Street::SHOWDOWN;
        pot_.return_uncalled_bet(players_);
        pot_.calculate_tranches(players_);
        result = ShowdownManager::distribute_pot(players_, pot_, community_, dealer_index_);
    }

    for (auto& p : players_) {
        if (p.chips == 0 && p.status != PlayerStatus::ELIMINATED) {
            p.status = PlayerStatus::ELIMINATED;
            spdlog::info("{} est éliminé (main #{})", p.name, hand_number_);
        }
    }

    int stacks_after = 0;
    for (const auto& p : players_) stacks_after += p.chips;
    if (stacks_after != chips_at_hand_start_) {
        spdlog::error("Main #{}: jetons non conservés ({} -> {})", hand_number_, chips_at_hand_start_, stacks_after);
    }

    last_hand_losers_ = result.loser_ids;
    last_pot_size_ = result.total_pot;
    last_result_ = std::move(result);
    hand_over_ = true;
    scheduler_.cancel_hand(hand_number_);
    set_phase(HandPhase::IDLE);
    emit_hand_end();
}

void PokerEngine::emit_hand_end() {
    if (!hand_end_listener_) return;
    HandEndEvent event;
    event.hand_number = hand_number_;
    event.winner_ids = last_result_.winner_ids;
    event.message = last_result_.message;
    event.total_pot = last_result_.total_pot;
    event.payouts = last_result_.payouts;
    event.loser_ids = last_result_.loser_ids;
    event.community_cards = community_;
    event.action_log = action_log_;
    hand_end_listener_(event);
}

// -----------------------------------------------------------------------------
//  Tour de parole / bots
// -----------------------------------------------------------------------------
void PokerEngine::request_action() {
    if (active_index_ < 0) return;
    const int seat = active_index_;
    const HandId id = hand_number_;
    // Le listener peut rappeler le moteur (action synchrone, fin de main,
    // add_player) : rien de players_ n'est lu après son retour
    const bool bot = players_[seat].is_bot();
    const size_t actions_before = action_log_.size();

    if (action_request_listener_) {
        ActionRequest request;
        request.hand_number = id;
        request.seat = seat;
        request.player_id = players_[seat].id;
        request.street = street_;
        request.legal = legal_actions(seat);
        action_request_listener_(request);
        if (hand_over_ || hand_number_ != id || action_log_.size() != actions_before) return;
    }

    if (bot) {
        scheduler_.schedule_after(config_.bot_think_delay_ms, id, [this, seat, id]() { fire_bot_decision(seat, id); });
    }
}

void PokerEngine::fire_bot_decision(int seat, HandId hand_id) {
    // La main a pu se terminer par un autre chemin depuis la programmation
    if (hand_over_ || hand_id != hand_number_ || phase_ != HandPhase::BETTING || seat != active_index_) {
        spdlog::trace("Décision périmée ignorée: siège {} main {}", seat, hand_id);
        return;
    }

    const LegalActions legal = legal_actions(seat);
    Action fallback{seat, legal.can_check ? ActionType::CHECK : ActionType::FOLD, 0};
    Action action = fallback;
    if (bot_brain_) {
        try {
            action = bot_brain_->decide(make_decision_context(seat)).action;
        } catch (const std::exception& e) {
            spdlog::error("Décision du bot {} en échec: {}", players_[seat].name, e.what());
        }
    }
    if (!process_action(action)) {
        spdlog::warn("Bot {}: action {} refusée, repli sur {}", players_[seat].name,
                     action_to_string(action), action_to_string(fallback));
        process_action(fallback);
    }
}

DecisionContext PokerEngine::make_decision_context(int seat) const {
    DecisionContext ctx;
    if (seat < 0 || seat >= static_cast<int>(players_.size())) return ctx;
    const Player& p = players_[seat];
    const LegalActions legal = compute_legal(seat);

    ctx.seat = seat;
    ctx.hole_cards = p.hole_cards;
    ctx.board = community_;
    ctx.street = street_;
    ctx.amount_to_call = legal.amount_to_call;
    ctx.pot_size = pot_.total();
    ctx.current_bet = current_bet_;
    ctx.player_bet = p.current_bet;
    ctx.stack = p.chips;
    ctx.min_raise_to = legal.min_raise_to;
    ctx.max_raise_to = legal.max_raise_to;
    ctx.big_blind = config_.big_blind;
    ctx.num_opponents = std::max(1, count_live_players() - 1);
    ctx.position = position_of(seat);
    ctx.can_raise = legal.can_raise;
    ctx.facing_reraise = raises_this_street_ >= 2 && last_raiser_ != seat;
    ctx.is_preflop_aggressor = preflop_aggressor_ == seat;
    ctx.profile = p.ai_profile.value_or(AIProfile{});
    return ctx;
}

std::future<AssistInfo> PokerEngine::assist_info_async(int seat, int iterations) const {
    AssistInfo base;
    if (seat < 0 || seat >= static_cast<int>(players_.size()) || players_[seat].hole_cards.size() != 2) {
        std::promise<AssistInfo> ready;
        ready.set_value(base);
        return ready.get_future();
    }
    const Player& p = players_[seat];
    base.amount_to_call = std::min(std::max(0, current_bet_ - p.current_bet), p.chips);
    base.pot_odds = DecisionEngine::pot_odds(base.amount_to_call, pot_.total());

    // Instantané immuable : aucune référence vers l'état du moteur
    EquityRequest request;
    request.hole_cards = p.hole_cards;
    request.board = community_;
    request.num_opponents = std::max(1, count_live_players() - 1);
    request.iterations = iterations;
    request.seed = static_cast<uint32_t>(hand_number_ * 31 + static_cast<uint64_t>(seat));

    return std::async(std::launch::async, [request, base]() {
        AssistInfo info = base;
        MonteCarloSimulator simulator(request.seed);
        info.equity = simulator.estimate_equity(request.hole_cards, request.board,
                                                request.num_opponents, request.iterations);
        return info;
    });
}

// -----------------------------------------------------------------------------
//  Entre deux mains
// -----------------------------------------------------------------------------
bool PokerEngine::set_blinds(int small_blind, int big_blind, int ante) {
    if (!hand_over_) {
        spdlog::warn("set_blinds refusé pendant la main #{}", hand_number_);
        return false;
    }
    if (small_blind <= 0 || big_blind < small_blind || ante < 0) {
        spdlog::warn("set_blinds refusé: valeurs invalides {}/{} ante {}", small_blind, big_blind, ante);
        return false;
    }
    config_.small_blind = small_blind;
    config_.big_blind = big_blind;
    config_.ante = ante;
    spdlog::info("Blinds: {}/{} ante {}", small_blind, big_blind, ante);
    return true;
}

bool PokerEngine::add_player(Player player) {
    if (!hand_over_) {
        spdlog::warn("add_player refusé pendant la main #{}", hand_number_);
        return false;
    }
    if (static_cast<int>(players_.size()) >= MAX_PLAYERS) {
        spdlog::warn("add_player refusé: table pleine ({} joueurs)", players_.size());
        return false;
    }
    if (seat_of(player.id) >= 0 || player.chips < 0) {
        spdlog::warn("add_player refusé: id {} déjà présent ou tapis invalide", player.id);
        return false;
    }
    player.status = player.chips > 0 ? PlayerStatus::ACTIVE : PlayerStatus::ELIMINATED;
    spdlog::info("{} rejoint la table avec {} jetons", player.name, player.chips);
    players_.push_back(std::move(player));
    has_acted_.push_back(false);
    return true;
}

bool PokerEngine::add_chips(PlayerId id, int amount) {
    if (!hand_over_) {
        spdlog::warn("add_chips refusé pendant la main #{}", hand_number_);
        return false;
    }
    const int seat = seat_of(id);
    if (seat < 0 || amount <= 0) return false;
    Player& p = players_[seat];
    p.chips += amount;
    if (p.status == PlayerStatus::ELIMINATED) p.status = PlayerStatus::ACTIVE;
    return true;
}

bool PokerEngine::rebuy_player(PlayerId id, int amount) {
    if (!add_chips(id, amount)) return false;
    ++players_[seat_of(id)].rebuys;
    return true;
}

} // namespace holdem
