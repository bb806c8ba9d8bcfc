#pragma once

#include "core/gameState.hpp"

#include <json/json.h>

#include <optional>

namespace wiz::app {

//! Encode the complete game state. A plain piece selection is not part of the snapshot.
Json::Value toJson(const GameState& state);

//! Rebuild a game state from a snapshot.
//! Returns empty for unknown names, cells off the board, duplicate ids, stacked pieces
//! or a suspended turn that refers to missing pieces.
std::optional<GameState> fromJson(const Json::Value& json);

} // namespace wiz::app
