#include "holdem/tournament_manager.h"
#include "holdem/poker_engine.h"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <array>
#include <stdexcept>
#include <unordered_set>

namespace holdem {

namespace {

std::vector<BlindLevel> make_schedule(const std::vector<std::array<int, 3>>& levels) {
    std::vector<BlindLevel> schedule;
    schedule.reserve(levels.size());
    int n = 1;
    for (const auto& l : levels) schedule.push_back(BlindLevel{n++, l[0], l[1], l[2]});
    return schedule;
}

} // namespace

std::string BlindLevel::description() const {
    std::string s = "Level " + std::to_string(level) + ": "
                  + std::to_string(small_blind) + "/" + std::to_string(big_blind);
    if (ante > 0) s += " (ante " + std::to_string(ante) + ")";
    return s;
}

// -----------------------------------------------------------------------------
//  Configurations prédéfinies
// -----------------------------------------------------------------------------
void TournamentConfig::validate() const {
    if (starting_chips <= 0) throw std::invalid_argument("starting_chips must be positive");
    if (blind_schedule.empty()) throw std::invalid_argument("blind schedule is empty");
    if (hands_per_level <= 0) throw std::invalid_argument("hands_per_level must be positive");
    if (max_players < 2 || max_players > PokerEngine::MAX_PLAYERS) {
        throw std::invalid_argument("max_players out of range: " + std::to_string(max_players));
    }
    if (max_rebuys < 0 || entry_interval_hands <= 0) throw std::invalid_argument("invalid rebuy/entry settings");
    for (const auto& l : blind_schedule) {
        if (l.small_blind <= 0 || l.big_blind < l.small_blind || l.ante < 0) {
            throw std::invalid_argument("invalid blind level: " + l.description());
        }
    }
    double sum = 0.0;
    for (double f : payout_structure) {
        if (f < 0.0) throw std::invalid_argument("negative payout fraction");
        sum += f;
    }
    if (sum > 1.0 + 1e-9) throw std::invalid_argument("payout fractions exceed 1");
}

TournamentConfig TournamentConfig::turbo() {
    TournamentConfig c;
    c.name = "Turbo";
    c.starting_chips = 1000;
    c.hands_per_level = 5;
    c.blind_schedule = make_schedule({
        {10, 20, 0}, {15, 30, 0}, {25, 50, 5}, {50, 100, 10}, {75, 150, 15},
        {100, 200, 25}, {150, 300, 50}, {200, 400, 75}, {300, 600, 100}, {500, 1000, 150}});
    return c;
}

TournamentConfig TournamentConfig::standard() {
    TournamentConfig c;
    c.name = "Standard";
    c.starting_chips = 1000;
    c.hands_per_level = 10;
    c.blind_schedule = make_schedule({
        {10, 20, 0}, {15, 30, 0}, {20, 40, 0}, {25, 50, 5}, {50, 100, 10},
        {75, 150, 15}, {100, 200, 25}, {150, 300, 50}, {200, 400, 75}, {300, 600, 100}});
    return c;
}

TournamentConfig TournamentConfig::deep_stack() {
    TournamentConfig c;
    c.name = "Deep Stack";
    c.starting_chips = 2000;
    c.hands_per_level = 15;
    c.blind_schedule = make_schedule({
        {10, 20, 0}, {15, 30, 0}, {20, 40, 0}, {25, 50, 0}, {30, 60, 5},
        {50, 100, 10}, {75, 150, 15}, {100, 200, 25}, {150, 300, 50}, {200, 400, 75}});
    return c;
}

// -----------------------------------------------------------------------------
//  TournamentManager
// -----------------------------------------------------------------------------
TournamentManager::TournamentManager(TournamentConfig config)
    : TournamentManager(std::move(config), std::random_device{}()) {}

TournamentManager::TournamentManager(TournamentConfig config, uint32_t seed)
    : config_(std::move(config)), rng_(seed)
{
    config_.validate();
}

bool TournamentManager::apply_starting_level(PokerEngine& engine) const {
    const BlindLevel& level = config_.blind_schedule.front();
    spdlog::info("Tournoi {}: {}", config_.name, level.description());
    return engine.set_blinds(level.small_blind, level.big_blind, level.ante);
}

Player TournamentManager::make_player(PlayerId id, std::string name, std::optional<AIProfile> profile,
                                      bool human) const {
    Player p(id, std::move(name), config_.starting_chips, human);
    p.ai_profile = std::move(profile);
    return p;
}

bool TournamentManager::on_hand_complete(PokerEngine& engine) {
    if (!engine.is_hand_over()) {
        spdlog::warn("on_hand_complete ignoré: la main #{} est en cours", engine.hand_number());
        return false;
    }
    if (check_blind_level_up()) {
        const BlindLevel& level = current_level();
        spdlog::info("Montée des blinds -> {}", level.description());
        engine.set_blinds(level.small_blind, level.big_blind, level.ante);
    }
    record_eliminations(engine);
    try_dynamic_entry(engine);
    return true;
}

bool TournamentManager::check_blind_level_up() {
    ++hands_at_level_;
    if (hands_at_level_ < config_.hands_per_level) return false;
    if (level_index_ + 1 >= static_cast<int>(config_.blind_schedule.size())) {
        return false; // dernier niveau atteint
    }
    ++level_index_;
    hands_at_level_ = 0;
    return true;
}

void TournamentManager::record_eliminations(const PokerEngine& engine) {
    for (const auto& p : engine.players()) {
        if (p.status != PlayerStatus::ELIMINATED || eliminated_ids_.count(p.id)) continue;
        eliminated_ids_.insert(p.id);
        eliminations_.push_back(EliminationRecord{p.id, p.name, engine.hand_number()});
        spdlog::info("{} sort du tournoi (main #{}, {} joueurs restants)", p.name, engine.hand_number(),
                     engine.players().size() - eliminated_ids_.size());
    }
}

bool TournamentManager::rebuy(PokerEngine& engine, PlayerId id) {
    if (!engine.is_hand_over()) {
        spdlog::warn("Recave refusée pendant la main #{}", engine.hand_number());
        return false;
    }
    const Player* p = engine.find_player(id);
    if (!p) {
        spdlog::warn("Recave refusée: joueur {} inconnu", id);
        return false;
    }
    if (p->status != PlayerStatus::ELIMINATED || p->chips > 0) {
        spdlog::warn("Recave refusée: {} n'est pas éliminé", p->name);
        return false;
    }
    if (p->rebuys >= config_.max_rebuys) {
        spdlog::warn("Recave refusée: {} a déjà utilisé ses {} recaves", p->name, config_.max_rebuys);
        return false;
    }
    const std::string name = p->name;
    if (!engine.rebuy_player(id, config_.starting_chips)) return false;

    eliminated_ids_.erase(id);
    eliminations_.erase(std::remove_if(eliminations_.begin(), eliminations_.end(),
                                       [id](const EliminationRecord& r) { return r.player_id == id; }),
                        eliminations_.end());
    spdlog::info("{} se recave pour {} jetons", name, config_.starting_chips);
    return true;
}

double TournamentManager::entry_probability(uint64_t hands_played) {
    if (hands_played < 30) return 0.6;
    if (hands_played < 60) return 0.4;
    if (hands_played < 100) return 0.2;
    return 0.0; // table finale : plus d'entrées
}

std::string TournamentManager::unique_name(const PokerEngine& engine, const std::string& base) const {
    std::unordered_set<std::string> names;
    for (const auto& p : engine.players()) names.insert(p.name);
    std::string name = base;
    for (int counter = 2; names.count(name); ++counter) name = base + std::to_string(counter);
    return name;
}

std::optional<PlayerId> TournamentManager::try_dynamic_entry(PokerEngine& engine) {
    const uint64_t hands = engine.hand_number();
    if (hands == 0 || hands % static_cast<uint64_t>(config_.entry_interval_hands) != 0) return std::nullopt;

    const int seated = static_cast<int>(engine.players().size()) - engine.count_players(PlayerStatus::ELIMINATED);
    if (seated >= config_.max_players) return std::nullopt;

    std::uniform_real_distribution<double> roll(0.0, 1.0);
    if (roll(rng_) >= entry_probability(hands)) return std::nullopt;

    const std::vector<AIProfile> profiles = AIProfile::presets();
    std::uniform_int_distribution<size_t> pick(0, profiles.size() - 1);
    AIProfile profile = profiles[pick(rng_)];

    PlayerId id = 0;
    for (const auto& p : engine.players()) id = std::max(id, p.id + 1);

    Player entrant = make_player(id, unique_name(engine, profile.name), profile);
    const std::string name = entrant.name;
    if (!engine.add_player(std::move(entrant))) return std::nullopt;
    spdlog::info("Nouvelle entrée: {} ({}) avec {} jetons", name, profile.id, config_.starting_chips);
    return id;
}

std::vector<TournamentResult> TournamentManager::final_results(const PokerEngine& engine) const {
    std::vector<const Player*> remaining;
    std::vector<const Player*> unrecorded;
    for (const auto& p : engine.players()) {
        if (p.status != PlayerStatus::ELIMINATED) {
            remaining.push_back(&p);
        } else if (!eliminated_ids_.count(p.id)) {
            unrecorded.push_back(&p);
        }
    }
    std::stable_sort(remaining.begin(), remaining.end(),
                     [](const Player* a, const Player* b) { return a->chips > b->chips; });

    std::vector<TournamentResult> results;
    auto push = [&](PlayerId id, const std::string& name, int chips) {
        TournamentResult r;
        r.rank = static_cast<int>(results.size()) + 1;
        r.player_id = id;
        r.name = name;
        r.chips = chips;
        const size_t idx = static_cast<size_t>(r.rank - 1);
        r.payout_fraction = idx < config_.payout_structure.size() ? config_.payout_structure[idx] : 0.0;
        results.push_back(std::move(r));
    };

    for (const Player* p : remaining) push(p->id, p->name, p->chips);
    // Le dernier éliminé finit le mieux classé
    for (auto it = eliminations_.rbegin(); it != eliminations_.rend(); ++it) push(it->player_id, it->name, 0);
    for (const Player* p : unrecorded) push(p->id, p->name, 0);
    return results;
}

} // namespace holdem
