#pragma once

#include "game_session.hpp"

#include <optional>

#include <json/json.h>

namespace wager::session {

inline constexpr unsigned kSaveFormatVersion = 1;

/*
=============
WriteSaveMetadata

Stamps a document with the save format and program version.
=============
*/
void WriteSaveMetadata(Json::Value& json);

/*
=============
ValidateSaveMetadata

Verifies a document was written with a supported format. A different
program version is reported but still accepted.
=============
*/
bool ValidateSaveMetadata(const Json::Value& json, const char* context);

Json::Value SessionToJson(const GameSession& session);

// Returns nullopt when any field is missing or out of range.
std::optional<GameSession> SessionFromJson(const Json::Value& json);

/*
=============
ValidateRestoredSession

Checks a decoded session against the rules live sessions obey: a valid id,
each player enrolled once, empty slots with no counters, and a status that
matches how full the roster is. SessionFromJson only checks the shape, so
loaders run this before accepting a record.
=============
*/
WagerResult ValidateRestoredSession(const GameSession& session);

} // namespace wager::session
