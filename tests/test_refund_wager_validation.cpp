/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

test_refund_wager_validation.cpp implementation.*/

#include "wager_test_fixtures.hpp"
#include "session/session_codec.hpp"

#include <cassert>
#include <limits>
#include <vector>

using namespace wager;
using namespace wager::session;
using wager::test::Key;
using wager::test::TokenKey;

namespace {

struct RefundCase {
	test::LedgerFixture fixture{ 200 };
	GameSession game = test::BuildSession(GameMode::WinnerTakesAllOneVsOne, 100, { "alice" }, { "bob" });

	RefundCase() {
		fixture.OpenPlayer("alice");
		fixture.OpenPlayer("bob");
	}

	WagerResult Refund(const std::vector<Pubkey>& evidence) {
		return settlement::RefundWager(fixture.Settle(game, evidence));
	}
};

} // namespace

/*
=============
TestEvidenceShape

The evidence list must carry exactly one pair per roster slot.
=============
*/
static void TestEvidenceShape() {
	RefundCase refund;
	assert(refund.Refund({}) == WagerResult::InvalidRemainingAccounts);

	auto shortList = test::BuildEvidence({ "alice", "bob" }, 9);
	assert(shortList.size() == 18);
	assert(refund.Refund(shortList) == WagerResult::InvalidRemainingAccounts);

	auto longList = test::BuildEvidence({ "alice", "bob" }, 11);
	assert(longList.size() == 22);
	assert(refund.Refund(longList) == WagerResult::InvalidRemainingAccounts);

	auto oddList = test::BuildEvidence({ "alice", "bob" }, kRosterSize);
	oddList.pop_back();
	assert(refund.Refund(oddList) == WagerResult::InvalidRemainingAccounts);

	assert(refund.fixture.ledger.TransferCount() == 0);
	assert(refund.game.Status() == GameStatus::InProgress);
}

static void TestUnknownDestination() {
	RefundCase refund;
	auto evidence = test::BuildEvidence({ "alice", "bob" }, kRosterSize);
	// Last pair points at an account the ledger has never seen.
	evidence.back() = Key("nowhere");
	assert(refund.Refund(evidence) == WagerResult::InvalidPlayerTokenAccount);
	assert(refund.fixture.ledger.TransferCount() == 0);
}

/*
=============
TestDuplicatePlayer

A corrupted record with the same player on both teams is refused before
any funds move.
=============
*/
static void TestDuplicatePlayer() {
	RefundCase refund;
	Json::Value record = SessionToJson(refund.game);
	record["teamB"][0]["player"] = Key("alice").ToHex();
	auto corrupted = SessionFromJson(record);
	assert(corrupted.has_value());

	const auto evidence = test::BuildEvidence({ "alice", "bob" }, kRosterSize);
	assert(settlement::RefundWager(refund.fixture.Settle(*corrupted, evidence)) == WagerResult::DuplicatePlayer);
	assert(refund.fixture.ledger.TransferCount() == 0);
	assert(corrupted->Status() == GameStatus::InProgress);
}

static void TestMissingPlayerEvidence() {
	RefundCase refund;
	const auto evidence = test::BuildEvidence({ "alice" }, kRosterSize);
	assert(refund.Refund(evidence) == WagerResult::InvalidPlayer);
	// Transfers are sequential; rolling back alice's refund is the substrate's job.
	assert(refund.fixture.ledger.TransferCount() == 1);
	assert(refund.game.Status() == GameStatus::InProgress);
}

/*
=============
TestDestinationChecks

Destinations must belong to the paid player and hold the session mint.
=============
*/
static void TestDestinationChecks() {
	{
		RefundCase refund;
		auto evidence = test::BuildEvidence({ "alice", "bob" }, kRosterSize);
		evidence[3] = TokenKey("alice");
		assert(refund.Refund(evidence) == WagerResult::InvalidPlayerTokenAccount);
	}
	{
		RefundCase refund;
		const bool opened = refund.fixture.ledger.OpenAccount(Key("bob-other-mint"), Key("bob"), Key("other-mint"));
		assert(opened);
		auto evidence = test::BuildEvidence({ "alice", "bob" }, kRosterSize);
		evidence[3] = Key("bob-other-mint");
		assert(refund.Refund(evidence) == WagerResult::InvalidTokenMint);
		assert(refund.game.Status() == GameStatus::InProgress);
	}
}

static void TestTotalPotOverflow() {
	test::LedgerFixture fixture(std::numeric_limits<uint64_t>::max());
	fixture.OpenPlayer("alice");
	fixture.OpenPlayer("bob");

	GameSession game = test::BuildSession(GameMode::WinnerTakesAllOneVsOne, std::numeric_limits<uint64_t>::max() / 2 + 1,
		{ "alice" }, { "bob" });
	const auto evidence = test::BuildEvidence({ "alice", "bob" }, kRosterSize);
	assert(settlement::RefundWager(fixture.Settle(game, evidence)) == WagerResult::TotalPotCalculationError);
	assert(fixture.ledger.TransferCount() == 0);
}

static void TestForeignVault() {
	RefundCase refund;
	refund.fixture.vault.address = Key("someone-else");
	const auto evidence = test::BuildEvidence({ "alice", "bob" }, kRosterSize);
	assert(refund.Refund(evidence) == WagerResult::InvalidVaultTokenAccount);
	assert(refund.fixture.ledger.TransferCount() == 0);
}

int main() {
	TestEvidenceShape();
	TestUnknownDestination();
	TestDuplicatePlayer();
	TestMissingPlayerEvidence();
	TestDestinationChecks();
	TestTotalPotOverflow();
	TestForeignVault();
	return 0;
}
