#pragma once

#include <cstddef>
#include <string>

namespace gpi {

enum class BetKind { Single, Combo };

enum class Market { Win, Place };

enum class ComboType { CoupleWinner, CouplePlace, Trio, Quartet };

enum class Discipline { Flat, Trot, Obstacle };

const char* toString(BetKind kind);
const char* toString(Market market);
const char* toString(ComboType type);
const char* toString(Discipline discipline);

Market parseMarket(const std::string& text);
ComboType parseComboType(const std::string& text);
// Accepts the French labels used by the feeds: PLAT, TROT, ATTELE, MONTE, OBSTACLE, HAIES, STEEPLE.
Discipline parseDiscipline(const std::string& text);

// Number of runners a basket of this type must name.
std::size_t legCount(ComboType type);

// Number of leading finishing positions the basket must cover to be a hit.
std::size_t placesCovered(ComboType type);

} // namespace gpi
