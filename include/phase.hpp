#pragma once

#include <string>

namespace gpi {

enum class Phase { H30, H5, Result };

// Accepts "H30", "H5", "RESULT" (case-insensitive, "H-30"/"H-5" allowed). Throws UnknownPhase.
Phase parsePhase(const std::string& text);

const char* toString(Phase phase);

} // namespace gpi
