#ifndef HOLDEM_AI_PROFILE_H
#define HOLDEM_AI_PROFILE_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "holdem/common_types.h"

namespace holdem {

/**
 * @brief Personnalité d'un bot : un vecteur de traits dans [0,1] plus un tilt courant.
 *
 * Les presets ("rock", "maniac", ...) sont de simples configurations de ce vecteur.
 */
struct AIProfile {
    std::string id;
    std::string name;

    double tightness          = 0.5;
    double aggression         = 0.5;
    double bluff_freq         = 0.1;
    double position_awareness = 0.5;
    double tilt_sensitivity   = 0.3;
    double fold_to_3bet       = 0.5;
    double cbet_freq          = 0.5;
    double call_down          = 0.3;

    // Évolue main après main (TiltManager)
    double current_tilt = 0.0;

    // Traits corrigés du tilt
    double effective_tightness() const;
    double effective_aggression() const;
    double effective_bluff_freq() const;
    double effective_call_down() const;

    // Bonus positionnel déjà pondéré par position_awareness
    double position_bonus(Position pos) const;

    // --- Presets ---
    static AIProfile rock();
    static AIProfile maniac();
    static AIProfile calling_station();
    static AIProfile fox();
    static AIProfile shark();
    static AIProfile academic();
    static AIProfile tilt_david();

    static std::vector<AIProfile> presets();
    static std::optional<AIProfile> preset(std::string_view id);
};

// Bonus brut par position (avant pondération)
double raw_position_bonus(Position pos);

} // namespace holdem

#endif // HOLDEM_AI_PROFILE_H
