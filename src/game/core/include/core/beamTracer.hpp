#pragma once

#include "core/moveContext.hpp"

#include <optional>
#include <vector>

namespace wiz {

struct BeamResult {
	std::vector<Cell> path;    //!< Wizard, conductors and, on success, the target.
	std::optional<Cell> target; //!< Empty when the chain fails.
};

//! Friendly apprentice, or activated bard of the wizard's side or the neutral side.
bool isConductor(const Piece& piece, Side wizardSide);

//! Trace the conductor chain of a wizard. Any ambiguous step aborts the beam.
BeamResult traceBeam(const Piece& wizard, const MoveContext& context);

} // namespace wiz
