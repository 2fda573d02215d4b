/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

session_codec.cpp implementation.*/

#include "session_codec.hpp"

#include "../shared/logger.hpp"
#include "../shared/version.hpp"

#include <limits>
#include <string>
#include <unordered_set>

namespace wager::session {
namespace {

Json::Value TeamToJson(const Team& team) {
	Json::Value slots(Json::arrayValue);
	for (const PlayerSlot& slot : team.slots) {
		Json::Value entry(Json::objectValue);
		entry["player"] = slot.player ? Json::Value(slot.player->ToHex()) : Json::Value(Json::nullValue);
		entry["bet"] = Json::Value::UInt64(slot.bet);
		entry["spawns"] = slot.spawns;
		entry["kills"] = slot.kills;
		slots.append(entry);
	}
	return slots;
}

bool ReadU16(const Json::Value& value, uint16_t& out) {
	if (!value.isUInt() || value.asUInt() > std::numeric_limits<uint16_t>::max())
		return false;
	out = static_cast<uint16_t>(value.asUInt());
	return true;
}

bool ReadU8(const Json::Value& value, uint8_t& out) {
	if (!value.isUInt() || value.asUInt() > std::numeric_limits<uint8_t>::max())
		return false;
	out = static_cast<uint8_t>(value.asUInt());
	return true;
}

/*
=============
TeamFromJson

Reads exactly five slots. Slots past the live player count must be empty.
=============
*/
bool TeamFromJson(const Json::Value& json, size_t playerCount, Team& team) {
	if (!json.isArray() || json.size() != kMaxPlayersPerTeam)
		return false;

	for (Json::ArrayIndex i = 0; i < json.size(); ++i) {
		const Json::Value& entry = json[i];
		PlayerSlot& slot = team.slots[i];

		if (!entry.isObject())
			return false;

		const Json::Value& player = entry["player"];
		if (player.isString()) {
			const auto key = Pubkey::FromHex(player.asString());
			if (!key || i >= playerCount)
				return false;
			slot.player = *key;
		}
		else if (!player.isNull()) {
			return false;
		}

		if (!entry["bet"].isUInt64())
			return false;
		slot.bet = entry["bet"].asUInt64();

		if (!ReadU16(entry["spawns"], slot.spawns) || !ReadU16(entry["kills"], slot.kills))
			return false;
	}
	return true;
}

} // namespace

void WriteSaveMetadata(Json::Value& json) {
	json["save_version"] = kSaveFormatVersion;
	json["engine_version"] = std::string(version::kProgramVersion);
}

bool ValidateSaveMetadata(const Json::Value& json, const char* context) {
	const Json::Value& saveVersion = json["save_version"];
	if (!saveVersion.isUInt()) {
		Logf(LogLevel::Warn, "{} save: missing or invalid save_version", context);
		return false;
	}
	if (saveVersion.asUInt() != kSaveFormatVersion) {
		Logf(LogLevel::Warn, "{} save: expected save version {} but found {}", context, kSaveFormatVersion, saveVersion.asUInt());
		return false;
	}

	const Json::Value& engineVersion = json["engine_version"];
	if (!engineVersion.isString()) {
		Logf(LogLevel::Warn, "{} save: missing or invalid engine_version", context);
		return false;
	}
	if (engineVersion.asString() != version::kProgramVersion) {
		Logf(LogLevel::Info, "{} save: written by {} (running {})", context, engineVersion.asString(), version::kProgramVersion);
	}
	return true;
}

Json::Value SessionToJson(const GameSession& session) {
	Json::Value json(Json::objectValue);
	json["sessionId"] = session.SessionId();
	json["authority"] = session.Authority().ToHex();
	json["sessionBet"] = Json::Value::UInt64(session.SessionBet());
	json["gameMode"] = std::string(GameModeName(session.Mode()));
	json["status"] = std::string(GameStatusName(session.Status()));
	json["createdAt"] = Json::Value::Int64(session.CreatedAt());
	json["bump"] = session.Bump();
	json["vaultBump"] = session.VaultBump();
	json["teamA"] = TeamToJson(session.GetTeam(TeamSide::A));
	json["teamB"] = TeamToJson(session.GetTeam(TeamSide::B));
	return json;
}

/*
=============
SessionFromJson

Rebuilds a session from its stored record. Only the shape is checked here;
roster consistency is enforced again by settlement.
=============
*/
std::optional<GameSession> SessionFromJson(const Json::Value& json) {
	if (!json.isObject() || !json["sessionId"].isString() || !json["authority"].isString()
		|| !json["sessionBet"].isUInt64() || !json["gameMode"].isString() || !json["status"].isString()
		|| !json["createdAt"].isInt64())
		return std::nullopt;

	const auto authority = Pubkey::FromHex(json["authority"].asString());
	const auto mode = ParseGameMode(json["gameMode"].asString());
	const auto status = ParseGameStatus(json["status"].asString());
	if (!authority || !mode || !status)
		return std::nullopt;

	uint8_t bump = 0;
	uint8_t vaultBump = 0;
	if (!ReadU8(json["bump"], bump) || !ReadU8(json["vaultBump"], vaultBump))
		return std::nullopt;

	GameSession session(json["sessionId"].asString(), *authority, json["sessionBet"].asUInt64(), *mode,
		json["createdAt"].asInt64(), bump, vaultBump);

	if (!TeamFromJson(json["teamA"], session.PlayerCount(), session.teamA_)
		|| !TeamFromJson(json["teamB"], session.PlayerCount(), session.teamB_))
		return std::nullopt;

	session.status_ = *status;
	return session;
}

WagerResult ValidateRestoredSession(const GameSession& session) {
	if (session.SessionId().empty() || session.SessionId().size() > kMaxSessionIdLength)
		return WagerResult::InvalidSessionId;

	std::unordered_set<Pubkey> seen;
	for (TeamSide side : { TeamSide::A, TeamSide::B }) {
		for (const PlayerSlot& slot : session.GetTeam(side).slots) {
			if (slot.IsEmpty()) {
				if (slot.bet != 0 || slot.spawns != 0 || slot.kills != 0)
					return WagerResult::InvalidGameState;
				continue;
			}
			if (!seen.insert(*slot.player).second)
				return WagerResult::DuplicatePlayer;
		}
	}

	// Seating the last player starts the game; no player ever leaves.
	const bool full = session.CheckAllFilled();
	if (session.Status() == GameStatus::WaitingForPlayers && full)
		return WagerResult::InvalidGameState;
	if (session.Status() == GameStatus::InProgress && !full)
		return WagerResult::InvalidGameState;

	return WagerResult::Success;
}

} // namespace wager::session
