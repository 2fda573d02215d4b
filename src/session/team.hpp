#pragma once

#include "game_mode.hpp"
#include "../shared/pubkey.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace wager::session {

struct PlayerSlot {
	std::optional<Pubkey> player;	// empty slot when absent
	uint64_t bet = 0;				// total escrowed by this player
	uint16_t spawns = 0;			// remaining spawn credits
	uint16_t kills = 0;

	[[nodiscard]] bool IsEmpty() const noexcept { return !player.has_value(); }
};

/*
=================
Team

Fixed five-slot roster. The active game mode decides how many leading slots
are live; callers always pass that count so trailing slots are never read
or filled.
=================
*/
struct Team {
	std::array<PlayerSlot, kMaxPlayersPerTeam> slots{};

	// Lowest empty live slot, or nullopt when the team is full.
	std::optional<size_t> FindEmptySlot(size_t playerCount) const;
	bool IsFull(size_t playerCount) const;

	std::optional<size_t> IndexOf(const Pubkey& player, size_t playerCount) const;
	size_t FilledCount(size_t playerCount) const;

	// Sum of the slot bets, or nullopt if it does not fit in 64 bits.
	std::optional<uint64_t> TotalBet() const;
};

} // namespace wager::session
