/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

team.cpp implementation.*/

#include "team.hpp"

#include "../shared/checked_math.hpp"

#include <algorithm>

namespace wager::session {

/*
=============
Team::FindEmptySlot

Scans the live slots in index order and returns the first one without a
player. The lowest index always wins so assignment does not depend on the
order in which earlier players left or joined.
=============
*/
std::optional<size_t> Team::FindEmptySlot(size_t playerCount) const {
	const size_t live = std::min(playerCount, slots.size());
	for (size_t i = 0; i < live; ++i) {
		if (slots[i].IsEmpty())
			return i;
	}
	return std::nullopt;
}

bool Team::IsFull(size_t playerCount) const {
	return !FindEmptySlot(playerCount).has_value();
}

std::optional<size_t> Team::IndexOf(const Pubkey& player, size_t playerCount) const {
	const size_t live = std::min(playerCount, slots.size());
	for (size_t i = 0; i < live; ++i) {
		if (slots[i].player == player)
			return i;
	}
	return std::nullopt;
}

size_t Team::FilledCount(size_t playerCount) const {
	const size_t live = std::min(playerCount, slots.size());
	return static_cast<size_t>(std::count_if(slots.begin(), slots.begin() + live,
		[](const PlayerSlot& slot) { return !slot.IsEmpty(); }));
}

std::optional<uint64_t> Team::TotalBet() const {
	uint64_t total = 0;
	for (const PlayerSlot& slot : slots) {
		const auto next = CheckedAdd<uint64_t>(total, slot.bet);
		if (!next)
			return std::nullopt;
		total = *next;
	}
	return total;
}

} // namespace wager::session
