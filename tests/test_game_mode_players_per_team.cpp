/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

test_game_mode_players_per_team.cpp implementation.*/

#include "session/game_mode.hpp"

#include <cassert>

using namespace wager::session;

int main() {
	assert(PlayersPerTeam(GameMode::WinnerTakesAllOneVsOne) == 1);
	assert(PlayersPerTeam(GameMode::WinnerTakesAllThreeVsThree) == 3);
	assert(PlayersPerTeam(GameMode::WinnerTakesAllFiveVsFive) == 5);
	assert(PlayersPerTeam(GameMode::PayToSpawnOneVsOne) == 1);
	assert(PlayersPerTeam(GameMode::PayToSpawnThreeVsThree) == 3);
	assert(PlayersPerTeam(GameMode::PayToSpawnFiveVsFive) == 5);

	assert(!IsPayToSpawn(GameMode::WinnerTakesAllOneVsOne));
	assert(!IsPayToSpawn(GameMode::WinnerTakesAllFiveVsFive));
	assert(IsPayToSpawn(GameMode::PayToSpawnOneVsOne));
	assert(IsPayToSpawn(GameMode::PayToSpawnThreeVsThree));

	// Persisted names map back onto the same mode.
	assert(ParseGameMode(GameModeName(GameMode::PayToSpawnThreeVsThree)) == GameMode::PayToSpawnThreeVsThree);
	assert(!ParseGameMode("TwoVsTwo").has_value());
	assert(ParseGameStatus("InProgress") == GameStatus::InProgress);
	assert(!ParseGameStatus("Paused").has_value());

	// Only selectors 0 and 1 name a team.
	assert(TeamSideFromIndex(0) == TeamSide::A);
	assert(TeamSideFromIndex(1) == TeamSide::B);
	assert(!TeamSideFromIndex(2).has_value());
	assert(!TeamSideFromIndex(255).has_value());

	return 0;
}
