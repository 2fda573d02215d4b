/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

game_session.cpp implementation.*/

#include "game_session.hpp"

#include "../shared/checked_math.hpp"
#include "../shared/logger.hpp"

#include <utility>

namespace wager::session {

GameSession::GameSession(std::string sessionId, Pubkey authority, uint64_t sessionBet, GameMode mode,
	int64_t createdAt, uint8_t bump, uint8_t vaultBump)
	: sessionId_(std::move(sessionId))
	, authority_(authority)
	, sessionBet_(sessionBet)
	, mode_(mode)
	, createdAt_(createdAt)
	, bump_(bump)
	, vaultBump_(vaultBump) {}

const Team& GameSession::GetTeam(TeamSide side) const {
	return side == TeamSide::A ? teamA_ : teamB_;
}

Team& GameSession::MutableTeam(TeamSide side) {
	return side == TeamSide::A ? teamA_ : teamB_;
}

Roster GameSession::AllPlayers() const {
	Roster roster{};
	for (size_t i = 0; i < kMaxPlayersPerTeam; ++i) {
		roster[i] = teamA_.slots[i].player;
		roster[kMaxPlayersPerTeam + i] = teamB_.slots[i].player;
	}
	return roster;
}

std::optional<size_t> GameSession::FindEmptySlot(TeamSide side) const {
	return GetTeam(side).FindEmptySlot(PlayerCount());
}

/*
=============
GameSession::CheckAllFilled

Both rosters are full for the active mode.
=============
*/
bool GameSession::CheckAllFilled() const {
	return teamA_.IsFull(PlayerCount()) && teamB_.IsFull(PlayerCount());
}

size_t GameSession::FilledSlotCount() const {
	return teamA_.FilledCount(PlayerCount()) + teamB_.FilledCount(PlayerCount());
}

bool GameSession::IsEnrolled(const Pubkey& player) const {
	return teamA_.IndexOf(player, PlayerCount()).has_value()
		|| teamB_.IndexOf(player, PlayerCount()).has_value();
}

std::optional<size_t> GameSession::PlayerIndex(TeamSide side, const Pubkey& player) const {
	return GetTeam(side).IndexOf(player, PlayerCount());
}

std::optional<uint32_t> GameSession::KillPlusSpawnScore(const Pubkey& player) const {
	for (TeamSide side : { TeamSide::A, TeamSide::B }) {
		const Team& team = GetTeam(side);
		if (const auto index = team.IndexOf(player, PlayerCount())) {
			const PlayerSlot& slot = team.slots[*index];
			return static_cast<uint32_t>(slot.kills) + static_cast<uint32_t>(slot.spawns);
		}
	}
	return std::nullopt;
}

bool GameSession::IsLiveOccupiedSlot(TeamSide side, size_t slotIndex) const {
	return slotIndex < PlayerCount() && !GetTeam(side).slots[slotIndex].IsEmpty();
}

/*
=============
GameSession::AssignPlayer

Places the player in the first empty slot of the chosen team, seeds the
slot with one bet and the starting spawn credits, and starts the game once
both rosters are full. Escrow of the bet itself is the caller's job.
=============
*/
WagerResult GameSession::AssignPlayer(TeamSide side, const Pubkey& player, size_t* assignedSlot) {
	if (status_ != GameStatus::WaitingForPlayers)
		return WagerResult::InvalidGameState;

	if (IsEnrolled(player))
		return WagerResult::PlayerAlreadyJoined;

	const auto slotIndex = FindEmptySlot(side);
	if (!slotIndex)
		return WagerResult::TeamIsFull;

	PlayerSlot& slot = MutableTeam(side).slots[*slotIndex];
	slot.player = player;
	slot.bet = sessionBet_;
	slot.spawns = kInitialSpawns;
	slot.kills = 0;

	if (assignedSlot)
		*assignedSlot = *slotIndex;

	if (CheckAllFilled()) {
		status_ = GameStatus::InProgress;
		Logf(LogLevel::Info, "session {}: all {} slots filled, game in progress", sessionId_, FilledSlotCount());
	}

	return WagerResult::Success;
}

/*
=============
GameSession::RecordKill

Credits the killer with one kill and consumes one spawn credit from the
victim. All checks run before either counter is touched.
=============
*/
WagerResult GameSession::RecordKill(TeamSide killerTeam, const Pubkey& killer, TeamSide victimTeam, const Pubkey& victim) {
	if (status_ != GameStatus::InProgress)
		return WagerResult::GameNotInProgress;

	const auto killerIndex = PlayerIndex(killerTeam, killer);
	if (!killerIndex)
		return WagerResult::PlayerNotFound;

	const auto victimIndex = PlayerIndex(victimTeam, victim);
	if (!victimIndex)
		return WagerResult::PlayerNotFound;

	PlayerSlot& killerSlot = MutableTeam(killerTeam).slots[*killerIndex];
	PlayerSlot& victimSlot = MutableTeam(victimTeam).slots[*victimIndex];

	const auto spawnsLeft = CheckedSub<uint16_t>(victimSlot.spawns, 1);
	if (!spawnsLeft)
		return WagerResult::SpawnUnderflow;

	const auto kills = CheckedAdd<uint16_t>(killerSlot.kills, 1);
	if (!kills)
		return WagerResult::ArithmeticOverflow;

	killerSlot.kills = *kills;
	victimSlot.spawns = *spawnsLeft;
	return WagerResult::Success;
}

WagerResult GameSession::GrantSpawns(TeamSide side, size_t slotIndex) {
	if (status_ != GameStatus::InProgress)
		return WagerResult::GameNotInProgress;

	if (!IsLiveOccupiedSlot(side, slotIndex))
		return WagerResult::PlayerNotFound;

	PlayerSlot& slot = MutableTeam(side).slots[slotIndex];
	const auto spawns = CheckedAdd<uint16_t>(slot.spawns, kSpawnReplenishment);
	if (!spawns)
		return WagerResult::ArithmeticOverflow;

	slot.spawns = *spawns;
	return WagerResult::Success;
}

WagerResult GameSession::CheckSpawnPurchase(TeamSide side, size_t slotIndex) const {
	if (status_ != GameStatus::InProgress)
		return WagerResult::GameNotInProgress;

	if (!IsLiveOccupiedSlot(side, slotIndex))
		return WagerResult::PlayerNotFound;

	const PlayerSlot& slot = GetTeam(side).slots[slotIndex];
	if (!CheckedAdd<uint16_t>(slot.spawns, kSpawnReplenishment) || !CheckedAdd<uint64_t>(slot.bet, sessionBet_))
		return WagerResult::ArithmeticOverflow;

	return WagerResult::Success;
}

WagerResult GameSession::AddSlotBet(TeamSide side, size_t slotIndex, uint64_t amount) {
	if (!IsLiveOccupiedSlot(side, slotIndex))
		return WagerResult::PlayerNotFound;

	PlayerSlot& slot = MutableTeam(side).slots[slotIndex];
	const auto bet = CheckedAdd<uint64_t>(slot.bet, amount);
	if (!bet)
		return WagerResult::ArithmeticOverflow;

	slot.bet = *bet;
	return WagerResult::Success;
}

/*
=============
GameSession::AdvanceStatus

Forward-only status change. Completed can be reached from either earlier
state (a stalled lobby may still be refunded), nothing leaves Completed.
=============
*/
WagerResult GameSession::AdvanceStatus(GameStatus next) {
	if (status_ == GameStatus::Completed)
		return WagerResult::GameAlreadyCompleted;

	if (static_cast<uint8_t>(next) <= static_cast<uint8_t>(status_))
		return WagerResult::InvalidGameState;

	Logf(LogLevel::Debug, "session {}: {} -> {}", sessionId_, GameStatusName(status_), GameStatusName(next));
	status_ = next;
	return WagerResult::Success;
}

} // namespace wager::session
