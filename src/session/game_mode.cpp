/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

game_mode.cpp implementation.*/

#include "game_mode.hpp"

#include <array>
#include <utility>

namespace wager::session {
namespace {

constexpr std::array<std::pair<GameMode, std::string_view>, 6> kGameModeNames{ {
	{ GameMode::WinnerTakesAllOneVsOne, "WinnerTakesAllOneVsOne" },
	{ GameMode::WinnerTakesAllThreeVsThree, "WinnerTakesAllThreeVsThree" },
	{ GameMode::WinnerTakesAllFiveVsFive, "WinnerTakesAllFiveVsFive" },
	{ GameMode::PayToSpawnOneVsOne, "PayToSpawnOneVsOne" },
	{ GameMode::PayToSpawnThreeVsThree, "PayToSpawnThreeVsThree" },
	{ GameMode::PayToSpawnFiveVsFive, "PayToSpawnFiveVsFive" },
} };

constexpr std::array<std::pair<GameStatus, std::string_view>, 3> kGameStatusNames{ {
	{ GameStatus::WaitingForPlayers, "WaitingForPlayers" },
	{ GameStatus::InProgress, "InProgress" },
	{ GameStatus::Completed, "Completed" },
} };

} // namespace

/*
=============
PlayersPerTeam

Number of live slots per team for the given mode.
=============
*/
size_t PlayersPerTeam(GameMode mode)
{
	switch (mode) {
	case GameMode::WinnerTakesAllOneVsOne:
	case GameMode::PayToSpawnOneVsOne:
		return 1;
	case GameMode::WinnerTakesAllThreeVsThree:
	case GameMode::PayToSpawnThreeVsThree:
		return 3;
	case GameMode::WinnerTakesAllFiveVsFive:
	case GameMode::PayToSpawnFiveVsFive:
		return 5;
	}
	return 1;
}

bool IsPayToSpawn(GameMode mode)
{
	return mode == GameMode::PayToSpawnOneVsOne
		|| mode == GameMode::PayToSpawnThreeVsThree
		|| mode == GameMode::PayToSpawnFiveVsFive;
}

std::string_view GameModeName(GameMode mode)
{
	for (const auto& [value, name] : kGameModeNames) {
		if (value == mode)
			return name;
	}
	return "Unknown";
}

std::optional<GameMode> ParseGameMode(std::string_view name)
{
	for (const auto& [value, label] : kGameModeNames) {
		if (label == name)
			return value;
	}
	return std::nullopt;
}

std::string_view GameStatusName(GameStatus status)
{
	for (const auto& [value, name] : kGameStatusNames) {
		if (value == status)
			return name;
	}
	return "Unknown";
}

std::optional<GameStatus> ParseGameStatus(std::string_view name)
{
	for (const auto& [value, label] : kGameStatusNames) {
		if (label == name)
			return value;
	}
	return std::nullopt;
}

} // namespace wager::session
