#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace wager::session {

enum class GameMode : uint8_t {
	WinnerTakesAllOneVsOne,
	WinnerTakesAllThreeVsThree,
	WinnerTakesAllFiveVsFive,
	PayToSpawnOneVsOne,
	PayToSpawnThreeVsThree,
	PayToSpawnFiveVsFive,
};

enum class GameStatus : uint8_t {
	WaitingForPlayers,
	InProgress,
	Completed,
};

// Team selector. Raw selectors from callers go through TeamSideFromIndex.
enum class TeamSide : uint8_t {
	A = 0,
	B = 1,
};

inline constexpr size_t kMaxPlayersPerTeam = 5;

size_t PlayersPerTeam(GameMode mode);
bool IsPayToSpawn(GameMode mode);

std::string_view GameModeName(GameMode mode);
std::optional<GameMode> ParseGameMode(std::string_view name);

std::string_view GameStatusName(GameStatus status);
std::optional<GameStatus> ParseGameStatus(std::string_view name);

/*
=============
TeamSideFromIndex

Maps the wire selector onto a team. Only 0 and 1 are valid.
=============
*/
[[nodiscard]] constexpr std::optional<TeamSide> TeamSideFromIndex(uint8_t index) noexcept
{
	switch (index) {
	case 0:
		return TeamSide::A;
	case 1:
		return TeamSide::B;
	default:
		return std::nullopt;
	}
}

[[nodiscard]] constexpr uint8_t TeamSideIndex(TeamSide side) noexcept
{
	return static_cast<uint8_t>(side);
}

} // namespace wager::session
