/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

test_session_registry_authority.cpp implementation.*/

#include "wager_test_fixtures.hpp"
#include "settlement/session_registry.hpp"
#include "shared/logger.hpp"

#include <cassert>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

using namespace wager;
using namespace wager::session;
using wager::settlement::SessionRegistry;
using wager::test::Key;
using wager::test::TokenKey;

namespace {

const Pubkey kServer = Key("game-server");

std::vector<std::string> g_logged;

void CollectLog(std::string_view message) {
	g_logged.emplace_back(message);
}

bool WasLogged(std::string_view needle) {
	for (const std::string& line : g_logged) {
		if (line.find("[WARN]") != std::string::npos && line.find(needle) != std::string::npos)
			return true;
	}
	return false;
}

SessionRegistry MakeRegistry() {
	SessionRegistry registry(Key("program"), Key("mint"));
	for (const char* name : { "alice", "bob", "carol" }) {
		const bool opened = registry.Ledger().OpenAccount(TokenKey(name), Key(name), registry.TokenMint(), 1000);
		assert(opened);
	}
	return registry;
}

} // namespace

/*
=============
TestCreateSession

Ids are unique and bounded, bets are positive and the whole pot must fit.
=============
*/
static void TestCreateSession() {
	SessionRegistry registry = MakeRegistry();

	assert(registry.CreateSession(kServer, "match-1", 100, GameMode::WinnerTakesAllOneVsOne, 10) == WagerResult::Success);
	assert(registry.CreateSession(kServer, "match-1", 100, GameMode::WinnerTakesAllOneVsOne, 11) == WagerResult::SessionIdInUse);
	assert(registry.CreateSession(kServer, "", 100, GameMode::WinnerTakesAllOneVsOne, 10) == WagerResult::InvalidSessionId);
	assert(registry.CreateSession(kServer, std::string(33, 'x'), 100, GameMode::WinnerTakesAllOneVsOne, 10) == WagerResult::InvalidSessionId);
	assert(registry.CreateSession(kServer, "zero", 0, GameMode::WinnerTakesAllOneVsOne, 10) == WagerResult::InvalidBetAmount);
	assert(registry.CreateSession(kServer, "huge", std::numeric_limits<uint64_t>::max() / 4, GameMode::WinnerTakesAllFiveVsFive, 10)
		== WagerResult::InvalidBetAmount);

	const GameSession* created = registry.FindSession("match-1");
	assert(created);
	assert(created->Authority() == kServer);
	assert(created->Status() == GameStatus::WaitingForPlayers);
	assert(created->CreatedAt() == 10);

	const auto vaultToken = registry.VaultTokenAccountFor("match-1");
	const auto vault = registry.VaultAuthorityFor("match-1");
	assert(vaultToken && vault);
	assert(registry.Ledger().FindAccount(*vaultToken)->owner == vault->address);
	assert(registry.Ledger().Balance(*vaultToken) == 0);
	assert(!registry.VaultTokenAccountFor("missing").has_value());
}

/*
=============
TestCreateRejectionsAreLogged

Refused creations are reported like every other refused entry point.
=============
*/
static void TestCreateRejectionsAreLogged() {
	wager::InitLogger("registry", &CollectLog, nullptr);
	wager::SetLogLevel(wager::LogLevel::Info);
	g_logged.clear();

	SessionRegistry registry = MakeRegistry();
	assert(registry.CreateSession(kServer, "", 100, GameMode::WinnerTakesAllOneVsOne, 0) == WagerResult::InvalidSessionId);
	assert(WasLogged("InvalidSessionId"));

	assert(registry.CreateSession(kServer, "logged", 0, GameMode::WinnerTakesAllOneVsOne, 0) == WagerResult::InvalidBetAmount);
	assert(WasLogged("InvalidBetAmount"));

	assert(registry.CreateSession(kServer, "logged", 5, GameMode::WinnerTakesAllOneVsOne, 0) == WagerResult::Success);
	assert(!WasLogged("SessionIdInUse"));
	assert(registry.CreateSession(kServer, "logged", 5, GameMode::WinnerTakesAllOneVsOne, 0) == WagerResult::SessionIdInUse);
	assert(WasLogged("SessionIdInUse"));
	assert(WasLogged("logged"));

	wager::InitLogger("registry", nullptr, nullptr);
}

static void TestJoinRules() {
	SessionRegistry registry = MakeRegistry();
	assert(registry.CreateSession(kServer, "joins", 100, GameMode::WinnerTakesAllOneVsOne, 0) == WagerResult::Success);

	assert(registry.JoinUser(Key("alice"), "joins", 2, TokenKey("alice")) == WagerResult::InvalidTeam);
	assert(registry.JoinUser(Key("alice"), "nope", 0, TokenKey("alice")) == WagerResult::SessionNotFound);
	assert(registry.JoinUser(Key("alice"), "joins", 0, TokenKey("alice")) == WagerResult::Success);
	assert(registry.JoinUser(Key("alice"), "joins", 0, TokenKey("alice")) == WagerResult::PlayerAlreadyJoined);
	assert(registry.JoinUser(Key("alice"), "joins", 1, TokenKey("alice")) == WagerResult::PlayerAlreadyJoined);
	assert(registry.Ledger().Balance(TokenKey("alice")) == 900);

	// Only the owner of a token account can spend from it.
	assert(registry.JoinUser(Key("bob"), "joins", 1, TokenKey("carol")) == WagerResult::InvalidPlayerTokenAccount);
	assert(registry.Ledger().Balance(TokenKey("carol")) == 1000);

	assert(registry.JoinUser(Key("bob"), "joins", 1, TokenKey("bob")) == WagerResult::Success);
	assert(registry.FindSession("joins")->Status() == GameStatus::InProgress);
	assert(registry.Ledger().Balance(*registry.VaultTokenAccountFor("joins")) == 200);
}

/*
=============
TestAuthorityOnlyEntryPoints

Kills and settlement are reserved for the creating authority.
=============
*/
static void TestAuthorityOnlyEntryPoints() {
	SessionRegistry registry = MakeRegistry();
	assert(registry.CreateSession(kServer, "auth", 100, GameMode::PayToSpawnOneVsOne, 0) == WagerResult::Success);
	assert(registry.JoinUser(Key("alice"), "auth", 0, TokenKey("alice")) == WagerResult::Success);
	assert(registry.JoinUser(Key("bob"), "auth", 1, TokenKey("bob")) == WagerResult::Success);

	assert(registry.RecordKill(Key("alice"), "auth", 0, Key("alice"), 1, Key("bob")) == WagerResult::UnauthorizedDistribution);
	assert(registry.RecordKill(kServer, "auth", 0, Key("alice"), 3, Key("bob")) == WagerResult::InvalidTeam);
	assert(registry.RecordKill(kServer, "auth", 0, Key("alice"), 1, Key("bob")) == WagerResult::Success);
	assert(registry.FindSession("auth")->KillPlusSpawnScore(Key("bob")) == 9u);

	const auto evidence = test::BuildEvidence({ "alice", "bob" }, kRosterSize);
	assert(registry.RefundWager(Key("alice"), "auth", evidence) == WagerResult::UnauthorizedDistribution);
	assert(registry.DistributeWinnings(Key("bob"), "auth", 1, evidence) == WagerResult::UnauthorizedDistribution);
	assert(registry.DistributePayToSpawnEarnings(Key("bob"), "auth", evidence) == WagerResult::UnauthorizedDistribution);
	assert(registry.FindSession("auth")->Status() == GameStatus::InProgress);

	assert(registry.RefundWager(kServer, "auth", evidence) == WagerResult::Success);
	assert(registry.Ledger().Balance(TokenKey("alice")) == 1000);
	assert(registry.Ledger().Balance(TokenKey("bob")) == 1000);
	assert(registry.FindSession("auth")->Status() == GameStatus::Completed);
	assert(registry.RefundWager(kServer, "auth", evidence) == WagerResult::GameAlreadyCompleted);
}

/*
=============
TestFailedSettlementRollsBack

A refund that fails after paying some players leaves balances and session
exactly as they were before the call.
=============
*/
static void TestFailedSettlementRollsBack() {
	SessionRegistry registry = MakeRegistry();
	assert(registry.CreateSession(kServer, "rollback", 100, GameMode::WinnerTakesAllOneVsOne, 0) == WagerResult::Success);
	assert(registry.JoinUser(Key("alice"), "rollback", 0, TokenKey("alice")) == WagerResult::Success);
	assert(registry.JoinUser(Key("bob"), "rollback", 1, TokenKey("bob")) == WagerResult::Success);
	registry.Ledger().ClearJournal();

	const auto missingBob = test::BuildEvidence({ "alice" }, kRosterSize);
	assert(registry.RefundWager(kServer, "rollback", missingBob) == WagerResult::InvalidPlayer);
	assert(registry.Ledger().Balance(TokenKey("alice")) == 900);
	assert(registry.Ledger().Balance(*registry.VaultTokenAccountFor("rollback")) == 200);
	assert(registry.Ledger().TransferCount() == 0);
	assert(registry.FindSession("rollback")->Status() == GameStatus::InProgress);

	const auto winners = test::BuildEvidence({ "alice" }, 1);
	assert(registry.DistributeWinnings(kServer, "rollback", 0, winners) == WagerResult::Success);
	assert(registry.Ledger().Balance(TokenKey("alice")) == 1100);
	assert(registry.Ledger().Balance(TokenKey("bob")) == 900);
}

int main() {
	TestCreateSession();
	TestCreateRejectionsAreLogged();
	TestJoinRules();
	TestAuthorityOnlyEntryPoints();
	TestFailedSettlementRollsBack();
	return 0;
}
