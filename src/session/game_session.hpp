#pragma once

#include "game_mode.hpp"
#include "team.hpp"
#include "wager_result.hpp"
#include "../shared/pubkey.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace Json {
class Value;
}

namespace wager::session {

inline constexpr size_t kRosterSize = kMaxPlayersPerTeam * 2;
inline constexpr size_t kMaxSessionIdLength = 32;
inline constexpr uint16_t kInitialSpawns = 10;
inline constexpr uint16_t kSpawnReplenishment = 10;

using Roster = std::array<std::optional<Pubkey>, kRosterSize>;

/*
=================
GameSession

Aggregate root for one wager: the two rosters, the per-player bet, the
combat counters and the session status. Status only moves forward and the
bet and mode never change after construction.
=================
*/
class GameSession {
public:
	GameSession(std::string sessionId, Pubkey authority, uint64_t sessionBet, GameMode mode,
		int64_t createdAt, uint8_t bump = 0, uint8_t vaultBump = 0);

	const std::string& SessionId() const noexcept { return sessionId_; }
	const Pubkey& Authority() const noexcept { return authority_; }
	uint64_t SessionBet() const noexcept { return sessionBet_; }
	GameMode Mode() const noexcept { return mode_; }
	GameStatus Status() const noexcept { return status_; }
	int64_t CreatedAt() const noexcept { return createdAt_; }
	uint8_t Bump() const noexcept { return bump_; }
	uint8_t VaultBump() const noexcept { return vaultBump_; }

	const Team& GetTeam(TeamSide side) const;
	size_t PlayerCount() const { return PlayersPerTeam(mode_); }
	bool IsPayToSpawn() const { return wager::session::IsPayToSpawn(mode_); }

	/*
	=============
	GameSession::AllPlayers

	Team A slots 0-4 followed by team B slots 0-4, empty slots included.
	Settlement walks the roster in exactly this order.
	=============
	*/
	Roster AllPlayers() const;

	std::optional<size_t> FindEmptySlot(TeamSide side) const;
	bool CheckAllFilled() const;
	size_t FilledSlotCount() const;
	bool IsEnrolled(const Pubkey& player) const;

	std::optional<size_t> PlayerIndex(TeamSide side, const Pubkey& player) const;

	// kills + spawns of the player, team A searched first.
	std::optional<uint32_t> KillPlusSpawnScore(const Pubkey& player) const;

	WagerResult AssignPlayer(TeamSide side, const Pubkey& player, size_t* assignedSlot = nullptr);
	WagerResult RecordKill(TeamSide killerTeam, const Pubkey& killer, TeamSide victimTeam, const Pubkey& victim);
	WagerResult GrantSpawns(TeamSide side, size_t slotIndex);

	/*
	=============
	GameSession::CheckSpawnPurchase

	Runs every check a paid spawn batch would hit without changing
	anything. Both the spawn counter and the slot bet need room for one
	more batch.
	=============
	*/
	WagerResult CheckSpawnPurchase(TeamSide side, size_t slotIndex) const;
	WagerResult AddSlotBet(TeamSide side, size_t slotIndex, uint64_t amount);
	WagerResult AdvanceStatus(GameStatus next);

private:
	Team& MutableTeam(TeamSide side);
	bool IsLiveOccupiedSlot(TeamSide side, size_t slotIndex) const;

	friend std::optional<GameSession> SessionFromJson(const Json::Value& json);

	std::string sessionId_;
	Pubkey authority_;
	uint64_t sessionBet_ = 0;
	GameMode mode_ = GameMode::WinnerTakesAllOneVsOne;
	Team teamA_;
	Team teamB_;
	GameStatus status_ = GameStatus::WaitingForPlayers;
	int64_t createdAt_ = 0;
	uint8_t bump_ = 0;
	uint8_t vaultBump_ = 0;
};

} // namespace wager::session
