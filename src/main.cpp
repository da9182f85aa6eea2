#include "holdem/decision_engine.h"
#include "holdem/game_utils.hpp"
#include "holdem/poker_engine.h"
#include "holdem/task_scheduler.h"
#include "holdem/tournament_manager.h"
#include "spdlog/spdlog.h"

#include <cstdint>    // uint32_t
#include <exception>  // std::exception
#include <iostream>   // std::cerr
#include <optional>   // std::nullopt
#include <string>     // std::string, std::stoi
#include <vector>     // std::vector

int main(int argc, char* argv[])
{
    // ─────────────────────────────────────────────────────────────
    // Arguments : holdem_sim [hands] [seed] [--verbose]
    // ─────────────────────────────────────────────────────────────
    int      num_hands = 50;
    uint32_t seed      = 42;
    bool     verbose   = false;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") verbose = true;
        else positional.push_back(arg);
    }

    // ─────────────────────────────────────────────────────────────
    // Logging
    // ─────────────────────────────────────────────────────────────
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);

    try
    {
        if (positional.size() > 0) num_hands = std::stoi(positional[0]);
        if (positional.size() > 1) seed = static_cast<uint32_t>(std::stoul(positional[1]));
        if (num_hands <= 0) {
            std::cerr << "Usage: holdem_sim [hands > 0] [seed] [--verbose]\n";
            return 1;
        }
        spdlog::info("Démarrage de la simulation: {} mains, seed {}", num_hands, seed);

        // 1. Tournoi turbo : un Hero passif contre sept bots
        holdem::TournamentManager tournament(holdem::TournamentConfig::turbo(), seed);

        std::vector<holdem::Player> roster;
        roster.push_back(tournament.make_player(0, "Hero", std::nullopt, /*human*/ true));
        holdem::PlayerId next_id = 1;
        for (const auto& profile : holdem::AIProfile::presets()) {
            roster.push_back(tournament.make_player(next_id++, profile.name, profile));
        }

        // 2. Moteur, ordonnanceur virtuel et cerveau des bots
        holdem::ManualScheduler scheduler;
        holdem::DecisionEngine  brain(holdem::DecisionConfig{}, seed);

        holdem::EngineConfig engine_config;
        engine_config.deck_seed = seed;
        holdem::PokerEngine engine(std::move(roster), engine_config, scheduler, &brain);
        tournament.apply_starting_level(engine);

        // 3. Hero : check / call via l'API publique, comme le ferait une UI
        const holdem::PlayerId hero_id = 0;
        engine.set_action_request_listener([&](const holdem::ActionRequest& request) {
            if (request.player_id != hero_id) return;
            const holdem::ActionType type = request.legal.can_check ? holdem::ActionType::CHECK
                                                                    : holdem::ActionType::CALL;
            const holdem::Action action{request.seat, type, request.legal.amount_to_call};
            scheduler.schedule_after(engine_config.bot_think_delay_ms, request.hand_number,
                                     [&engine, action]() { engine.process_action(action); });
        });

        engine.set_hand_end_listener([](const holdem::HandEndEvent& event) {
            spdlog::info("Main #{} terminée: {} | board {} | {} actions",
                         event.hand_number, event.message,
                         holdem::vec_to_string(event.community_cards), event.action_log.size());
        });

        // 4. Boucle de mains
        int played = 0;
        for (; played < num_hands; ++played)
        {
            const int seated = static_cast<int>(engine.players().size())
                             - engine.count_players(holdem::PlayerStatus::ELIMINATED);
            if (seated < 2) {
                spdlog::info("Plus qu'un joueur à la table, fin du tournoi.");
                break;
            }

            engine.start_hand();
            scheduler.run_until_idle();
            if (!engine.is_hand_over()) {
                spdlog::error("Main #{} bloquée: aucune tâche en attente", engine.hand_number());
                return 1;
            }
            tournament.on_hand_complete(engine);

            const holdem::Player* hero = engine.find_player(hero_id);
            if (hero && hero->status == holdem::PlayerStatus::ELIMINATED) {
                tournament.rebuy(engine, hero_id);
            }
        }

        // 5. Classement final
        spdlog::info("{} mains jouées, {}", played, tournament.current_level().description());
        for (const auto& r : tournament.final_results(engine)) {
            spdlog::info("  #{} {:<16} {:>6} jetons  payout {:.0f}%",
                         r.rank, r.name, r.chips, r.payout_fraction * 100.0);
        }
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Erreur critique : {}", e.what());
        std::cerr << "Erreur critique : " << e.what() << '\n';
        return 1;
    }

    spdlog::info("Exécution terminée.");
    return 0;
}
