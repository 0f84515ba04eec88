#include "phase.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cctype>

namespace gpi {

namespace {

std::string normalize(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isspace(c) || c == '-' || c == '_') {
            continue;
        }
        out.push_back(static_cast<char>(std::toupper(c)));
    }
    return out;
}

} // namespace

Phase parsePhase(const std::string& text) {
    const std::string key = normalize(text);
    if (key == "H30") {
        return Phase::H30;
    }
    if (key == "H5") {
        return Phase::H5;
    }
    if (key == "RESULT") {
        return Phase::Result;
    }
    throw UnknownPhase("Unrecognized phase \"" + text + "\" (expected H30, H5 or RESULT)");
}

const char* toString(Phase phase) {
    switch (phase) {
    case Phase::H30:
        return "H30";
    case Phase::H5:
        return "H5";
    case Phase::Result:
        return "RESULT";
    }
    throw UnknownPhase("Phase value outside {H30, H5, RESULT}");
}

} // namespace gpi
