#include "bet_types.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cctype>

namespace gpi {

namespace {

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return text;
}

} // namespace

const char* toString(BetKind kind) {
    switch (kind) {
    case BetKind::Single:
        return "SP";
    case BetKind::Combo:
        return "COMBO";
    }
    return "UNKNOWN";
}

const char* toString(Market market) {
    switch (market) {
    case Market::Win:
        return "WIN";
    case Market::Place:
        return "PLACE";
    }
    return "UNKNOWN";
}

const char* toString(ComboType type) {
    switch (type) {
    case ComboType::CoupleWinner:
        return "COUPLE_WINNER";
    case ComboType::CouplePlace:
        return "COUPLE_PLACE";
    case ComboType::Trio:
        return "TRIO";
    case ComboType::Quartet:
        return "QUARTET";
    }
    return "UNKNOWN";
}

const char* toString(Discipline discipline) {
    switch (discipline) {
    case Discipline::Flat:
        return "FLAT";
    case Discipline::Trot:
        return "TROT";
    case Discipline::Obstacle:
        return "OBSTACLE";
    }
    return "UNKNOWN";
}

Market parseMarket(const std::string& text) {
    const std::string key = upper(text);
    if (key == "WIN") {
        return Market::Win;
    }
    if (key == "PLACE") {
        return Market::Place;
    }
    throw ConfigInvalid("Unknown market \"" + text + "\" (expected WIN or PLACE)");
}

ComboType parseComboType(const std::string& text) {
    const std::string key = upper(text);
    if (key == "COUPLE_WINNER") {
        return ComboType::CoupleWinner;
    }
    if (key == "COUPLE_PLACE") {
        return ComboType::CouplePlace;
    }
    if (key == "TRIO") {
        return ComboType::Trio;
    }
    if (key == "QUARTET") {
        return ComboType::Quartet;
    }
    throw ConfigInvalid("Unknown combo type \"" + text + "\"");
}

Discipline parseDiscipline(const std::string& text) {
    const std::string key = upper(text);
    if (key == "FLAT" || key == "PLAT") {
        return Discipline::Flat;
    }
    if (key.rfind("TROT", 0) == 0 || key == "ATTELE" || key == "MONTE") {
        return Discipline::Trot;
    }
    if (key == "OBSTACLE" || key == "HAIES" || key == "STEEPLE" || key == "STEEPLE-CHASE" || key == "CROSS") {
        return Discipline::Obstacle;
    }
    throw ConfigInvalid("Unknown discipline \"" + text + "\"");
}

std::size_t legCount(ComboType type) {
    switch (type) {
    case ComboType::CoupleWinner:
    case ComboType::CouplePlace:
        return 2;
    case ComboType::Trio:
        return 3;
    case ComboType::Quartet:
        return 4;
    }
    return 0;
}

std::size_t placesCovered(ComboType type) {
    switch (type) {
    case ComboType::CoupleWinner:
        return 2;
    case ComboType::CouplePlace:
    case ComboType::Trio:
        return 3;
    case ComboType::Quartet:
        return 4;
    }
    return 0;
}

} // namespace gpi
