#pragma once

#include "session/game_session.hpp"
#include "settlement/in_memory_token_ledger.hpp"
#include "settlement/settlement_engine.hpp"
#include "settlement/escrow_deposits.hpp"
#include "shared/pubkey.hpp"

#include <cassert>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wager::test {

/*
=============
Key

Stable identity for a named test actor.
=============
*/
inline Pubkey Key(std::string_view name) {
	return Pubkey::FromSeed(name);
}

inline Pubkey TokenKey(std::string_view name) {
	return Pubkey::FromSeed(std::string(name) + "/token");
}

/*
=============
BuildSession

Seats the named players in order, team A first. A session whose rosters end
up full is already InProgress.
=============
*/
inline session::GameSession BuildSession(session::GameMode mode, uint64_t bet,
	std::initializer_list<std::string_view> teamA, std::initializer_list<std::string_view> teamB,
	std::string sessionId = "test-session") {
	session::GameSession game(std::move(sessionId), Key("game-server"), bet, mode, 1700000000);
	for (std::string_view name : teamA) {
		const WagerResult result = game.AssignPlayer(session::TeamSide::A, Key(name));
		assert(result == WagerResult::Success);
	}
	for (std::string_view name : teamB) {
		const WagerResult result = game.AssignPlayer(session::TeamSide::B, Key(name));
		assert(result == WagerResult::Success);
	}
	return game;
}

/*
=============
BuildEvidence

Player / token account pairs for the named players, padded to `pairs` pairs
by repeating the first pair. Settlement finds each player by its first
matching entry so padding never changes who gets paid.
=============
*/
inline std::vector<Pubkey> BuildEvidence(std::initializer_list<std::string_view> names, size_t pairs) {
	std::vector<Pubkey> evidence;
	for (std::string_view name : names) {
		evidence.push_back(Key(name));
		evidence.push_back(TokenKey(name));
	}
	const std::vector<Pubkey> firstPair(evidence.begin(), evidence.begin() + 2);
	while (evidence.size() < pairs * 2)
		evidence.insert(evidence.end(), firstPair.begin(), firstPair.end());
	return evidence;
}

/*
=================
LedgerFixture

A ledger with one funded session vault plus helpers to open player token
accounts in the same mint.
=================
*/
struct LedgerFixture {
	Pubkey mint = Key("test-mint");
	Pubkey vaultToken = Key("test-vault-token");
	settlement::VaultAuthority vault{ Key("test-vault"), "test-session", 255 };
	settlement::InMemoryTokenLedger ledger;

	explicit LedgerFixture(uint64_t vaultBalance) {
		const bool opened = ledger.OpenAccount(vaultToken, vault.address, mint, vaultBalance);
		assert(opened);
	}

	void OpenPlayer(std::string_view name, uint64_t amount = 0) {
		const bool opened = ledger.OpenAccount(TokenKey(name), Key(name), mint, amount);
		assert(opened);
	}

	uint64_t PlayerBalance(std::string_view name) const {
		return ledger.Balance(TokenKey(name));
	}

	uint64_t VaultBalance() const {
		return ledger.Balance(vaultToken);
	}

	settlement::SettlementContext Settle(session::GameSession& game, std::span<const Pubkey> evidence) {
		return { game, vault, vaultToken, ledger, mint, evidence };
	}

	settlement::DepositContext Deposit(session::GameSession& game) {
		return { game, vaultToken, ledger, mint };
	}
};

} // namespace wager::test
