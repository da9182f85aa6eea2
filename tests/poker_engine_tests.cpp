#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/cards.hpp"
#include "holdem/poker_engine.h"

using namespace holdem;
using Catch::Matchers::WithinAbs;

namespace {

const char* NAMES[] = {"Alice", "Bob", "Carol", "Dan", "Eve", "Frank"};

EngineConfig test_config() {
    EngineConfig config;
    config.small_blind = 10;
    config.big_blind = 20;
    config.deck_seed = 1;
    return config;
}

std::vector<Player> make_players(const std::vector<int>& stacks) {
    std::vector<Player> players;
    for (size_t i = 0; i < stacks.size(); ++i) {
        players.emplace_back(static_cast<PlayerId>(i), NAMES[i], stacks[i]);
    }
    return players;
}

// Table de test : aucun bot, les actions passent par process_action
struct Table {
    ManualScheduler scheduler;
    PokerEngine engine;
    std::vector<HandEndEvent> events;
    std::vector<ActionRequest> requests;

    explicit Table(const std::vector<int>& stacks, EngineConfig config = test_config())
        : engine(make_players(stacks), config, scheduler)
    {
        engine.set_hand_end_listener([this](const HandEndEvent& e) { events.push_back(e); });
        engine.set_action_request_listener([this](const ActionRequest& r) { requests.push_back(r); });
    }

    bool act(ActionType type, int amount = 0) {
        return engine.process_action(Action{engine.active_player_index(), type, amount});
    }
};

} // namespace

TEST_CASE("Construction contracts", "[engine]") {
    ManualScheduler scheduler;
    REQUIRE_THROWS_AS(PokerEngine({}, test_config(), scheduler), std::invalid_argument);

    std::vector<Player> dup = make_players({1000, 1000});
    dup[1].id = 0;
    REQUIRE_THROWS_AS(PokerEngine(dup, test_config(), scheduler), std::invalid_argument);

    EngineConfig bad = test_config();
    bad.small_blind = 30;
    REQUIRE_THROWS_AS(PokerEngine(make_players({1000, 1000}), bad, scheduler), std::invalid_argument);

    std::vector<Player> crowd;
    for (int i = 0; i <= PokerEngine::MAX_PLAYERS; ++i) crowd.emplace_back(i, "P" + std::to_string(i), 100);
    REQUIRE_THROWS_AS(PokerEngine(crowd, test_config(), scheduler), std::invalid_argument);
}

TEST_CASE("Blinds and first action three-handed", "[engine]") {
    Table t({1000, 1000, 1000});
    t.engine.start_hand();

    REQUIRE(t.engine.hand_number() == 1);
    REQUIRE(t.engine.phase() == HandPhase::BETTING);
    REQUIRE(t.engine.current_street() == Street::PREFLOP);
    REQUIRE(t.engine.dealer_index() == 0);
    REQUIRE(t.engine.small_blind_index() == 1);
    REQUIRE(t.engine.big_blind_index() == 2);
    REQUIRE(t.engine.active_player_index() == 0);
    REQUIRE(t.engine.pot().total() == 30);
    REQUIRE(t.engine.current_bet() == 20);
    REQUIRE(t.engine.players()[1].chips == 990);
    REQUIRE(t.engine.players()[2].chips == 980);
    for (const auto& p : t.engine.players()) REQUIRE(p.hole_cards.size() == 2);

    const LegalActions legal = t.engine.legal_actions(0);
    REQUIRE(legal.can_call);
    REQUIRE_FALSE(legal.can_check);
    REQUIRE(legal.can_raise);
    REQUIRE(legal.amount_to_call == 20);
    REQUIRE(legal.min_raise_to == 40);
    REQUIRE(legal.max_raise_to == 1000);

    REQUIRE(t.requests.size() == 1);
    REQUIRE(t.requests.back().seat == 0);
    REQUIRE(t.requests.back().player_id == 0);
    REQUIRE(t.requests.back().legal.amount_to_call == 20);

    REQUIRE(t.engine.position_of(0) == Position::BTN);
    REQUIRE(t.engine.position_of(1) == Position::SB);
    REQUIRE(t.engine.position_of(2) == Position::BB);

    SECTION("Not the player's turn: legal_actions is empty") {
        REQUIRE_FALSE(t.engine.legal_actions(1).can_call);
        REQUIRE_FALSE(t.engine.legal_actions(1).can_raise);
    }

    SECTION("The button moves on the next hand") {
        REQUIRE(t.act(ActionType::FOLD));
        REQUIRE(t.act(ActionType::FOLD));
        REQUIRE(t.engine.is_hand_over());
        t.engine.start_hand();
        REQUIRE(t.engine.dealer_index() == 1);
        REQUIRE(t.engine.small_blind_index() == 2);
        REQUIRE(t.engine.big_blind_index() == 0);
        REQUIRE(t.engine.active_player_index() == 1);
    }
}

TEST_CASE("A full raise requires the others to act again", "[engine]") {
    Table t({1000, 1000, 1000});
    t.engine.start_hand();

    REQUIRE(t.act(ActionType::CALL));           // bouton
    REQUIRE(t.act(ActionType::CALL));           // SB complète
    REQUIRE(t.engine.active_player_index() == 2);
    REQUIRE(t.act(ActionType::RAISE, 60));      // BB relance à 60

    REQUIRE(t.engine.current_street() == Street::PREFLOP);
    REQUIRE(t.engine.current_bet() == 60);
    REQUIRE(t.engine.min_raise() == 40);
    REQUIRE_FALSE(t.engine.has_acted(0));
    REQUIRE_FALSE(t.engine.has_acted(1));
    REQUIRE(t.engine.has_acted(2));
    REQUIRE(t.engine.active_player_index() == 0);

    REQUIRE(t.act(ActionType::CALL));
    REQUIRE(t.engine.current_street() == Street::PREFLOP);
    REQUIRE(t.engine.active_player_index() == 1);

    REQUIRE(t.act(ActionType::CALL));
    REQUIRE(t.engine.current_street() == Street::FLOP);
    REQUIRE(t.engine.community_cards().size() == 3);
    REQUIRE(t.engine.pot().total() == 180);
    REQUIRE(t.engine.current_bet() == 0);
    // Après le flop, parole au premier joueur à gauche du bouton
    REQUIRE(t.engine.active_player_index() == 1);
}

TEST_CASE("An under-raise all-in does not reopen the betting", "[engine]") {
    // La BB n'a que 90 jetons
    Table t({1000, 1000, 90});
    t.engine.start_hand();

    REQUIRE(t.act(ActionType::RAISE, 60));      // bouton : relance complète à 60
    REQUIRE(t.act(ActionType::CALL));           // SB suit
    REQUIRE(t.engine.legal_actions(2).can_raise);
    REQUIRE(t.act(ActionType::ALL_IN));         // BB à tapis pour 90 : relance de 30 < 40

    REQUIRE(t.engine.players()[2].status == PlayerStatus::ALL_IN);
    REQUIRE(t.engine.current_bet() == 90);
    REQUIRE(t.engine.min_raise() == 40);
    REQUIRE(t.engine.has_acted(0));
    REQUIRE(t.engine.has_acted(1));
    REQUIRE(t.engine.active_player_index() == 0);

    SECTION("Players who already acted may only call or fold") {
        const LegalActions legal = t.engine.legal_actions(0);
        REQUIRE(legal.can_call);
        REQUIRE(legal.amount_to_call == 30);
        REQUIRE_FALSE(legal.can_raise);
        REQUIRE_FALSE(t.act(ActionType::RAISE, 200));
        REQUIRE_FALSE(t.act(ActionType::ALL_IN));
        REQUIRE(t.engine.active_player_index() == 0);

        REQUIRE(t.act(ActionType::CALL));
        REQUIRE(t.engine.active_player_index() == 1);
        REQUIRE_FALSE(t.engine.legal_actions(1).can_raise);
        REQUIRE(t.act(ActionType::CALL));

        REQUIRE(t.engine.current_street() == Street::FLOP);
        REQUIRE(t.engine.pot().total() == 270);
        REQUIRE(t.engine.active_player_index() == 1);
    }
}

TEST_CASE("Heads-up blinds and action order", "[engine]") {
    Table t({1000, 1000});
    // Distribution : siège 1 puis siège 0, deux tours ; puis brûle / flop / brûle / turn / brûle / river
    t.engine.stack_deck_for_testing(cards_from_string("7c As 2d Ad 3h Kc 9d 5h 4h 3s 6h Jc"));
    t.engine.start_hand();

    REQUIRE(t.engine.dealer_index() == 0);
    REQUIRE(t.engine.small_blind_index() == 0);
    REQUIRE(t.engine.big_blind_index() == 1);
    REQUIRE(t.engine.active_player_index() == 0);
    REQUIRE(t.engine.players()[0].hole_cards == cards_from_string("As Ad"));
    REQUIRE(t.engine.players()[1].hole_cards == cards_from_string("7c 2d"));

    REQUIRE(t.act(ActionType::CALL));
    // La BB garde son option
    REQUIRE(t.engine.active_player_index() == 1);
    REQUIRE(t.engine.legal_actions(1).can_check);
    REQUIRE(t.act(ActionType::CHECK));

    REQUIRE(t.engine.current_street() == Street::FLOP);
    REQUIRE(t.engine.community_cards() == cards_from_string("Kc 9d 5h"));
    // Après le flop, le bouton parle en dernier
    REQUIRE(t.engine.active_player_index() == 1);

    for (int street = 0; street < 3; ++street) {
        REQUIRE(t.act(ActionType::CHECK));
        REQUIRE(t.act(ActionType::CHECK));
    }

    REQUIRE(t.engine.is_hand_over());
    REQUIRE(t.engine.phase() == HandPhase::IDLE);
    REQUIRE(t.engine.players()[0].chips == 1020);
    REQUIRE(t.engine.players()[1].chips == 980);
    REQUIRE(t.events.size() == 1);

    const HandEndEvent& e = t.events.back();
    REQUIRE(e.hand_number == 1);
    REQUIRE(e.winner_ids == std::vector<PlayerId>{0});
    REQUIRE(e.total_pot == 40);
    REQUIRE(e.payouts.at(0) == 40);
    REQUIRE(e.loser_ids == std::set<PlayerId>{1});
    REQUIRE(e.community_cards == cards_from_string("Kc 9d 5h 3s Jc"));
    REQUIRE(e.message == "Alice wins main pot 40 with Pair of Aces");

    SECTION("Action log and voluntary flags") {
        REQUIRE(e.action_log.size() == 8);
        REQUIRE(e.action_log[0].player_name == "Alice");
        REQUIRE(e.action_log[0].action == ActionType::CALL);
        REQUIRE(e.action_log[0].amount == 10);
        REQUIRE(e.action_log[0].voluntary);
        // La BB qui checke son option n'entre pas volontairement
        REQUIRE(e.action_log[1].action == ActionType::CHECK);
        REQUIRE_FALSE(e.action_log[1].voluntary);
        REQUIRE(e.action_log[2].street == Street::FLOP);
        REQUIRE(e.action_log[7].street == Street::RIVER);
    }
}

TEST_CASE("Everybody folds to the big blind", "[engine]") {
    Table t({1000, 1000, 1000});
    t.engine.start_hand();
    REQUIRE(t.act(ActionType::FOLD));
    REQUIRE(t.act(ActionType::FOLD));

    REQUIRE(t.engine.is_hand_over());
    REQUIRE(t.engine.community_cards().empty());
    REQUIRE(t.engine.players()[2].chips == 1010);
    REQUIRE(t.engine.players()[1].chips == 990);
    REQUIRE(t.engine.last_result().message == "Carol wins 30");
    REQUIRE(t.events.size() == 1);
    REQUIRE(t.events.back().winner_ids == std::vector<PlayerId>{2});
    REQUIRE(t.events.back().loser_ids == std::set<PlayerId>{1});
    REQUIRE(t.events.back().action_log.size() == 2);
    REQUIRE(t.engine.total_chips() == 3000);
    REQUIRE(t.scheduler.pending() == 0);
}

TEST_CASE("All-in players get the board run out with pacing", "[engine]") {
    SECTION("Equal stacks: the loser is eliminated") {
        Table t({1000, 1000});
        t.engine.stack_deck_for_testing(cards_from_string("7c As 2d Ad 3h Kc 9d 5h 4h 3s 6h Jc"));
        t.engine.start_hand();
        REQUIRE(t.act(ActionType::ALL_IN));
        REQUIRE(t.act(ActionType::CALL));

        REQUIRE(t.engine.phase() == HandPhase::RUNNING_OUT);
        REQUIRE_FALSE(t.engine.is_hand_over());
        REQUIRE(t.engine.community_cards().empty());
        REQUIRE(t.engine.total_chips() == 2000);
        // Plus personne ne peut agir
        REQUIRE_FALSE(t.act(ActionType::CHECK));

        t.scheduler.advance(799);
        REQUIRE(t.engine.community_cards().empty());
        t.scheduler.advance(1);
        REQUIRE(t.engine.community_cards().size() == 3);
        REQUIRE(t.engine.current_street() == Street::FLOP);

        t.scheduler.run_until_idle();
        REQUIRE(t.engine.is_hand_over());
        REQUIRE(t.engine.community_cards().size() == 5);
        REQUIRE(t.engine.players()[0].chips == 2000);
        REQUIRE(t.engine.players()[1].chips == 0);
        REQUIRE(t.engine.players()[1].status == PlayerStatus::ELIMINATED);
        REQUIRE(t.engine.total_chips() == 2000);

        SECTION("Only one player left: the next hand does not start") {
            t.engine.start_hand();
            REQUIRE(t.engine.is_hand_over());
            REQUIRE(t.engine.hand_number() == 2);
            REQUIRE(t.engine.last_result().message == "Not enough players!");
            REQUIRE(t.events.size() == 2);
            REQUIRE(t.engine.players()[0].chips == 2000);
        }
    }

    SECTION("Shorter stack: the uncalled excess goes back") {
        Table t({1000, 500});
        t.engine.stack_deck_for_testing(cards_from_string("As 7c Ad 2d 3h Kc 9d 5h 4h 3s 6h Jc"));
        t.engine.start_hand();
        REQUIRE(t.act(ActionType::ALL_IN));
        REQUIRE(t.act(ActionType::CALL));
        REQUIRE(t.engine.players()[1].status == PlayerStatus::ALL_IN);

        t.scheduler.run_until_idle();
        REQUIRE(t.engine.is_hand_over());
        REQUIRE(t.engine.players()[1].chips == 1000);
        REQUIRE(t.engine.players()[0].chips == 500);
        REQUIRE(t.engine.players()[0].status != PlayerStatus::ELIMINATED);
        REQUIRE(t.events.back().total_pot == 1000);
        REQUIRE(t.engine.total_chips() == 1500);
    }
}

TEST_CASE("Illegal and out-of-turn actions are ignored", "[engine]") {
    Table t({1000, 1000, 1000});

    // Avant toute main
    REQUIRE_FALSE(t.engine.process_action(Action{0, ActionType::CALL, 0}));

    t.engine.start_hand();
    const int pot_before = t.engine.pot().total();

    REQUIRE_FALSE(t.engine.process_action(Action{1, ActionType::CALL, 0}));   // pas son tour
    REQUIRE_FALSE(t.engine.process_action(Action{0, ActionType::CHECK, 0}));  // check face à la BB
    REQUIRE_FALSE(t.engine.process_action(Action{7, ActionType::FOLD, 0}));   // siège inconnu
    REQUIRE(t.engine.pot().total() == pot_before);
    REQUIRE(t.engine.active_player_index() == 0);
    REQUIRE(t.engine.action_log().empty());

    REQUIRE(t.engine.is_legal(Action{0, ActionType::CALL, 0}));
    REQUIRE_FALSE(t.engine.is_legal(Action{0, ActionType::CHECK, 0}));
}

TEST_CASE("Between-hands operations are refused mid-hand", "[engine]") {
    Table t({1000, 1000, 1000});
    t.engine.start_hand();

    REQUIRE_FALSE(t.engine.set_blinds(20, 40, 0));
    REQUIRE_FALSE(t.engine.add_player(Player(9, "Late", 1000)));
    REQUIRE_FALSE(t.engine.add_chips(0, 500));
    t.engine.start_hand(); // sans effet
    REQUIRE(t.engine.hand_number() == 1);
    REQUIRE(t.engine.config().big_blind == 20);

    REQUIRE(t.act(ActionType::FOLD));
    REQUIRE(t.act(ActionType::FOLD));
    REQUIRE(t.engine.is_hand_over());

    REQUIRE(t.engine.set_blinds(20, 40, 5));
    REQUIRE_FALSE(t.engine.set_blinds(50, 40, 0));
    REQUIRE(t.engine.add_player(Player(9, "Late", 1000)));
    REQUIRE_FALSE(t.engine.add_player(Player(9, "Twin", 1000)));
    REQUIRE(t.engine.add_chips(0, 500));
    REQUIRE(t.engine.players().size() == 4);
    REQUIRE(t.engine.players()[0].chips == 1500);

    t.engine.start_hand();
    // Antes de 5 x 4 + blinds 20 / 40
    REQUIRE(t.engine.pot().total() == 80);
    REQUIRE(t.engine.current_bet() == 40);
}

TEST_CASE("Antes count toward the pot but not the street bet", "[engine]") {
    EngineConfig config = test_config();
    config.ante = 5;
    Table t({1000, 1000, 1000}, config);
    t.engine.start_hand();

    REQUIRE(t.engine.pot().total() == 45);
    REQUIRE(t.engine.current_bet() == 20);
    REQUIRE(t.engine.players()[0].current_bet == 0);
    REQUIRE(t.engine.players()[0].total_bet_this_hand == 5);
    REQUIRE(t.engine.legal_actions(0).amount_to_call == 20);
}

TEST_CASE("Blinds that put players all-in", "[engine]") {
    // SB à 5 jetons, BB à 15 : seul le bouton peut encore parler
    Table t({1000, 5, 15});
    t.engine.start_hand();
    REQUIRE(t.engine.players()[1].status == PlayerStatus::ALL_IN);
    REQUIRE(t.engine.players()[2].status == PlayerStatus::ALL_IN);
    REQUIRE(t.engine.active_player_index() == 0);
    REQUIRE(t.engine.legal_actions(0).amount_to_call == 20);

    REQUIRE(t.act(ActionType::CALL));
    REQUIRE(t.engine.phase() == HandPhase::RUNNING_OUT);
    t.scheduler.run_until_idle();
    REQUIRE(t.engine.is_hand_over());
    REQUIRE(t.engine.total_chips() == 1020);
}

TEST_CASE("Assist info is computed from a snapshot", "[engine][montecarlo]") {
    Table t({1000, 1000, 1000});
    t.engine.start_hand();

    auto future = t.engine.assist_info_async(0, 400);
    // Le moteur continue pendant le calcul
    REQUIRE(t.act(ActionType::CALL));
    const AssistInfo info = future.get();
    REQUIRE(info.amount_to_call == 20);
    REQUIRE_THAT(info.pot_odds, WithinAbs(0.4, 1e-9));
    REQUIRE(info.equity >= 0.0);
    REQUIRE(info.equity <= 1.0);

    SECTION("No hole cards: neutral values") {
        Table idle({1000, 1000});
        const AssistInfo empty = idle.engine.assist_info_async(0, 400).get();
        REQUIRE(empty.equity == 0.0);
        REQUIRE(empty.amount_to_call == 0);
    }
}

TEST_CASE("Bots play complete hands and chips are conserved", "[engine][bots]") {
    DecisionConfig brain_config;
    brain_config.monte_carlo_iterations = 80;
    DecisionEngine brain(brain_config, 77);

    std::vector<Player> players;
    const auto profiles = AIProfile::presets();
    for (int i = 0; i < 5; ++i) {
        Player p(i, profiles[i].name, 500);
        p.ai_profile = profiles[i];
        players.push_back(p);
    }
    ManualScheduler scheduler;
    PokerEngine engine(players, test_config(), scheduler, &brain);

    int events = 0;
    bool payouts_match = true;
    engine.set_hand_end_listener([&](const HandEndEvent& e) {
        ++events;
        int paid = 0;
        for (const auto& [id, amount] : e.payouts) paid += amount;
        if (!e.winner_ids.empty() && paid != e.total_pot) payouts_match = false;
    });

    for (int hand = 0; hand < 25; ++hand) {
        engine.start_hand();
        scheduler.run_until_idle();
        REQUIRE(engine.is_hand_over());
        REQUIRE(engine.total_chips() == 2500);
        for (const auto& p : engine.players()) {
            REQUIRE(p.chips >= 0);
            REQUIRE((p.chips > 0 || p.status == PlayerStatus::ELIMINATED));
        }
    }
    REQUIRE(events == 25);
    REQUIRE(payouts_match);
}

namespace {

// Garde toutes les tâches : cancel_hand ne retire rien, les tâches périmées partent quand même
struct RecordingScheduler : TaskScheduler {
    struct Pending {
        HandId hand_id;
        Task   task;
    };
    std::vector<Pending> tasks;

    TaskId schedule_after(int /*delay_ms*/, HandId hand_id, Task task) override {
        tasks.push_back(Pending{hand_id, std::move(task)});
        return tasks.size();
    }
    void cancel_hand(HandId /*hand_id*/) override {}

    // Copie avant l'appel : la tâche peut en programmer d'autres
    void fire(size_t index) {
        Task task = tasks.at(index).task;
        task();
    }
};

std::vector<int> stacks_of(const PokerEngine& engine) {
    std::vector<int> stacks;
    for (const auto& p : engine.players()) stacks.push_back(p.chips);
    return stacks;
}

} // namespace

TEST_CASE("A synchronous answer to an action request can end the hand", "[engine]") {
    ManualScheduler scheduler;
    std::vector<Player> players = make_players({1000, 1000, 1000});
    players[0].ai_profile = AIProfile::rock();
    players.shrink_to_fit();
    PokerEngine engine(std::move(players), test_config(), scheduler);

    int requests = 0;
    engine.set_action_request_listener([&](const ActionRequest& r) {
        ++requests;
        const ActionType type = r.legal.can_check ? ActionType::CHECK : ActionType::FOLD;
        engine.process_action(Action{r.seat, type, 0});
    });
    int hands_ended = 0;
    engine.set_hand_end_listener([&](const HandEndEvent&) {
        ++hands_ended;
        // La table grandit entre deux mains : players_ est réalloué
        REQUIRE(engine.add_player(Player(10, "Frank", 1000)));
    });

    engine.start_hand();

    REQUIRE(engine.is_hand_over());
    REQUIRE(requests == 2);
    REQUIRE(hands_ended == 1);
    REQUIRE(engine.players().size() == 4);
    REQUIRE(engine.players()[2].chips == 1010);
    // Le bot a déjà répondu : aucune décision ne reste programmée
    REQUIRE(scheduler.pending() == 0);
    REQUIRE(engine.total_chips() == 4000);
}

TEST_CASE("Stale bot decisions do not touch the engine", "[engine][bots]") {
    RecordingScheduler scheduler;
    std::vector<Player> players = make_players({1000, 1000});
    players[1].ai_profile = AIProfile::rock();
    PokerEngine engine(std::move(players), test_config(), scheduler);

    // Heads-up : Alice (bouton, SB) relance, la décision du bot est programmée
    engine.start_hand();
    REQUIRE(engine.process_action(Action{0, ActionType::RAISE, 60}));
    REQUIRE(scheduler.tasks.size() == 1);
    REQUIRE(scheduler.tasks[0].hand_id == 1);

    // La main se termine par un autre chemin avant l'échéance
    REQUIRE(engine.process_action(Action{1, ActionType::FOLD, 0}));
    REQUIRE(engine.is_hand_over());

    const std::vector<int> stacks = stacks_of(engine);
    const size_t log_size = engine.action_log().size();

    SECTION("Hand already over") {
        scheduler.fire(0);
        REQUIRE(stacks_of(engine) == stacks);
        REQUIRE(engine.action_log().size() == log_size);
        REQUIRE(engine.hand_number() == 1);
        REQUIRE(engine.is_hand_over());
        REQUIRE(engine.phase() == HandPhase::IDLE);
    }

    SECTION("A later hand is running") {
        // Main 2 : le bot est au bouton et parle en premier
        engine.start_hand();
        REQUIRE(engine.hand_number() == 2);
        REQUIRE(engine.active_player_index() == 1);
        REQUIRE(scheduler.tasks.size() == 2);
        const std::vector<int> running = stacks_of(engine);
        const size_t running_log = engine.action_log().size();

        scheduler.fire(0);
        REQUIRE(stacks_of(engine) == running);
        REQUIRE(engine.action_log().size() == running_log);
        REQUIRE(engine.active_player_index() == 1);
        REQUIRE_FALSE(engine.is_hand_over());

        // La décision de la main 2 s'applique normalement
        scheduler.fire(1);
        REQUIRE(engine.action_log().size() == running_log + 1);
        REQUIRE(engine.action_log().back().player_id == 1);
    }
}

TEST_CASE("Stale run-out steps do not touch the engine", "[engine]") {
    RecordingScheduler scheduler;
    PokerEngine engine(make_players({1000, 500}), test_config(), scheduler);
    engine.stack_deck_for_testing(cards_from_string("As 7c Ad 2d 3h Kc 9d 5h 4h 3s 6h Jc"));
    engine.start_hand();
    REQUIRE(engine.process_action(Action{0, ActionType::ALL_IN, 0}));
    REQUIRE(engine.process_action(Action{1, ActionType::CALL, 0}));
    REQUIRE(engine.phase() == HandPhase::RUNNING_OUT);

    for (size_t i = 0; i < scheduler.tasks.size(); ++i) scheduler.fire(i);
    REQUIRE(scheduler.tasks.size() == 3);
    REQUIRE(engine.is_hand_over());
    REQUIRE(engine.community_cards().size() == 5);
    const std::vector<int> stacks = stacks_of(engine);
    REQUIRE(stacks == std::vector<int>{500, 1000});

    SECTION("Hand already over") {
        scheduler.fire(0);
        scheduler.fire(2);
        REQUIRE(stacks_of(engine) == stacks);
        REQUIRE(engine.community_cards().size() == 5);
        REQUIRE(scheduler.tasks.size() == 3);
    }

    SECTION("A later hand is running") {
        engine.start_hand();
        REQUIRE(engine.phase() == HandPhase::BETTING);
        const std::vector<int> running = stacks_of(engine);

        scheduler.fire(0);
        REQUIRE(engine.community_cards().empty());
        REQUIRE(engine.current_street() == Street::PREFLOP);
        REQUIRE(stacks_of(engine) == running);
        REQUIRE(scheduler.tasks.size() == 3);
    }
}

TEST_CASE("Tilt follows the previous hand's losers and pot", "[engine][tilt]") {
    ManualScheduler scheduler;
    std::vector<Player> players = make_players({1000, 1000, 1000});
    players[0].ai_profile = AIProfile::fox();
    players[0].ai_profile->current_tilt = 0.5;
    players[1].ai_profile = AIProfile::tilt_david();
    PokerEngine engine(std::move(players), test_config(), scheduler);

    // Bouton Alice (fox), SB Bob (David), BB Carol ; Alice parle en premier
    engine.start_hand();
    const double fox_before = engine.players()[0].ai_profile->current_tilt;
    REQUIRE(engine.players()[1].ai_profile->current_tilt == 0.0);
    REQUIRE(engine.process_action(Action{0, ActionType::FOLD, 0}));
    REQUIRE(engine.process_action(Action{1, ActionType::FOLD, 0}));
    REQUIRE(engine.is_hand_over());
    REQUIRE(engine.last_result().loser_ids == std::set<PlayerId>{1});
    REQUIRE(engine.last_result().total_pot == 30);

    engine.start_hand();
    const AIProfile& fox = *engine.players()[0].ai_profile;
    const AIProfile& david = *engine.players()[1].ai_profile;
    // Perdant : + sensibilité x pot / 800
    REQUIRE_THAT(david.current_tilt, WithinAbs(david.tilt_sensitivity * 30.0 / 800.0, 1e-12));
    // Sans perte (couché sans jetons investis) : décroissance
    REQUIRE_THAT(fox.current_tilt, WithinAbs(fox_before - 0.03 * (1.0 - 0.5 * fox.tilt_sensitivity), 1e-12));
}
