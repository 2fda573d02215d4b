/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

settlement_engine.cpp implementation.*/

#include "settlement_engine.hpp"

#include "../shared/checked_math.hpp"
#include "../shared/logger.hpp"

#include <unordered_set>
#include <vector>

namespace wager::settlement {
namespace {

using session::GameSession;
using session::GameStatus;
using session::TeamSide;

constexpr uint64_t kPayToSpawnDivisor = 10;

struct Payout {
	Pubkey player;
	uint64_t amount = 0;
};

/*
=============
ValidateVault

The vault token account must exist, be owned by the session vault and hold
the configured mint.
=============
*/
WagerResult ValidateVault(const SettlementContext& context, uint64_t& balance) {
	const auto vaultAccount = context.ledger.FindAccount(context.vaultTokenAccount);
	if (!vaultAccount || vaultAccount->owner != context.vault.address || vaultAccount->mint != context.tokenMint)
		return WagerResult::InvalidVaultTokenAccount;

	balance = vaultAccount->amount;
	return WagerResult::Success;
}

/*
=============
ValidateEvidence

Checks the shape of the evidence list and that every destination slot names
an existing token account. Runs before anything moves.
=============
*/
WagerResult ValidateEvidence(const SettlementContext& context, size_t expectedPairs) {
	const auto& evidence = context.evidence;
	if (evidence.empty() || evidence.size() % 2 != 0 || evidence.size() != expectedPairs * 2)
		return WagerResult::InvalidRemainingAccounts;

	for (size_t i = 1; i < evidence.size(); i += 2) {
		if (!context.ledger.FindAccount(evidence[i]))
			return WagerResult::InvalidPlayerTokenAccount;
	}
	return WagerResult::Success;
}

// Collects the enrolled players, failing on the first repeated identity.
WagerResult CollectUniquePlayers(std::span<const std::optional<Pubkey>> roster, std::vector<Pubkey>& players) {
	std::unordered_set<Pubkey> seen;
	for (const auto& entry : roster) {
		if (!entry)
			continue;
		if (!seen.insert(*entry).second)
			return WagerResult::DuplicatePlayer;
		players.push_back(*entry);
	}
	return WagerResult::Success;
}

WagerResult CheckVaultCoversPayouts(const std::vector<Payout>& payouts, uint64_t vaultBalance, WagerResult overflowResult) {
	uint64_t total = 0;
	for (const Payout& payout : payouts) {
		const auto next = CheckedAdd<uint64_t>(total, payout.amount);
		if (!next)
			return overflowResult;
		total = *next;
	}

	Logf(LogLevel::Debug, "total payout {} against vault balance {}", total, vaultBalance);
	if (vaultBalance < total)
		return WagerResult::InsufficientVaultBalance;
	return WagerResult::Success;
}

/*
=============
PayPlayer

Finds the player's pair in the evidence list, checks the destination
belongs to that player and holds the right mint, and moves `amount` out of
the vault under the vault authority.
=============
*/
WagerResult PayPlayer(const SettlementContext& context, const Pubkey& player, uint64_t amount) {
	const auto& evidence = context.evidence;
	std::optional<size_t> pairIndex;
	for (size_t i = 0; i < evidence.size(); i += 2) {
		if (evidence[i] == player) {
			pairIndex = i;
			break;
		}
	}
	if (!pairIndex)
		return WagerResult::InvalidPlayer;

	const auto destination = context.ledger.FindAccount(evidence[*pairIndex + 1]);
	if (!destination || destination->owner != evidence[*pairIndex])
		return WagerResult::InvalidPlayerTokenAccount;

	if (destination->mint != context.tokenMint)
		return WagerResult::InvalidTokenMint;

	if (IsLogLevelEnabled(LogLevel::Debug)) {
		const auto vaultAccount = context.ledger.FindAccount(context.vaultTokenAccount);
		Logf(LogLevel::Debug, "vault balance before transfer: {}", vaultAccount ? vaultAccount->amount : 0);
	}

	const TransferResult transfer = context.ledger.Transfer({
		context.vaultTokenAccount,
		destination->key,
		amount,
		context.vault.address,
	});
	if (transfer != TransferResult::Success) {
		Logf(LogLevel::Error, "session {}: transfer of {} to {} failed: {}", context.vault.sessionId, amount,
			player.ToShortString(), TransferResultName(transfer));
		return WagerResult::TokenTransferFailed;
	}

	return WagerResult::Success;
}

WagerResult PayAll(const SettlementContext& context, const std::vector<Payout>& payouts) {
	for (const Payout& payout : payouts) {
		Logf(LogLevel::Info, "session {}: paying {} to {}", context.session.SessionId(), payout.amount,
			payout.player.ToShortString());
		const WagerResult result = PayPlayer(context, payout.player, payout.amount);
		if (!Succeeded(result))
			return result;
	}
	return context.session.AdvanceStatus(GameStatus::Completed);
}

// Live slots of one team, in slot order.
std::vector<std::optional<Pubkey>> LiveRoster(const GameSession& session, TeamSide side) {
	std::vector<std::optional<Pubkey>> roster;
	const auto& team = session.GetTeam(side);
	for (size_t i = 0; i < session.PlayerCount(); ++i)
		roster.push_back(team.slots[i].player);
	return roster;
}

WagerResult Report(const SettlementContext& context, const char* operation, WagerResult result) {
	if (!Succeeded(result)) {
		Logf(LogLevel::Warn, "{} for session {} rejected: {}", operation, context.session.SessionId(),
			WagerResultName(result));
	}
	return result;
}

} // namespace

WagerResult RefundWager(const SettlementContext& context) {
	GameSession& session = context.session;
	Logf(LogLevel::Info, "starting refund for session: {}", session.SessionId());

	if (session.Status() == GameStatus::Completed)
		return Report(context, "refund", WagerResult::GameAlreadyCompleted);

	uint64_t vaultBalance = 0;
	if (const WagerResult result = ValidateVault(context, vaultBalance); !Succeeded(result))
		return Report(context, "refund", result);

	const session::Roster roster = session.AllPlayers();
	Logf(LogLevel::Debug, "number of players: {}, number of evidence entries: {}", roster.size(), context.evidence.size());

	if (const WagerResult result = ValidateEvidence(context, roster.size()); !Succeeded(result))
		return Report(context, "refund", result);

	std::vector<Pubkey> players;
	if (const WagerResult result = CollectUniquePlayers(roster, players); !Succeeded(result))
		return Report(context, "refund", result);

	const auto totalRefund = CheckedMul<uint64_t>(session.SessionBet(), players.size());
	if (!totalRefund)
		return Report(context, "refund", WagerResult::TotalPotCalculationError);

	if (vaultBalance < *totalRefund)
		return Report(context, "refund", WagerResult::InsufficientVaultBalance);

	std::vector<Payout> payouts;
	for (const Pubkey& player : players) {
		// Same checked path as the winnings payout, with nothing won.
		const auto refund = CheckedAdd<uint64_t>(session.SessionBet(), 0);
		if (!refund)
			return Report(context, "refund", WagerResult::WinningsCalculationError);
		payouts.push_back({ player, *refund });
	}

	return Report(context, "refund", PayAll(context, payouts));
}

WagerResult DistributeWinnings(const SettlementContext& context, TeamSide winningTeam) {
	GameSession& session = context.session;
	Logf(LogLevel::Info, "distributing winnings for session {} to team {}", session.SessionId(),
		session::TeamSideIndex(winningTeam));

	if (session.Status() == GameStatus::Completed)
		return Report(context, "winnings", WagerResult::GameAlreadyCompleted);
	if (session.Status() != GameStatus::InProgress)
		return Report(context, "winnings", WagerResult::GameNotInProgress);

	uint64_t vaultBalance = 0;
	if (const WagerResult result = ValidateVault(context, vaultBalance); !Succeeded(result))
		return Report(context, "winnings", result);

	if (const WagerResult result = ValidateEvidence(context, session.PlayerCount()); !Succeeded(result))
		return Report(context, "winnings", result);

	std::vector<Pubkey> winners;
	const auto winningRoster = LiveRoster(session, winningTeam);
	if (const WagerResult result = CollectUniquePlayers(winningRoster, winners); !Succeeded(result))
		return Report(context, "winnings", result);

	std::vector<Payout> payouts;
	for (const Pubkey& winner : winners) {
		const auto winnings = CheckedMul<uint64_t>(session.SessionBet(), 2);
		if (!winnings)
			return Report(context, "winnings", WagerResult::WinningsCalculationError);
		payouts.push_back({ winner, *winnings });
	}

	if (const WagerResult result = CheckVaultCoversPayouts(payouts, vaultBalance, WagerResult::TotalPotCalculationError); !Succeeded(result))
		return Report(context, "winnings", result);

	return Report(context, "winnings", PayAll(context, payouts));
}

WagerResult DistributePayToSpawnEarnings(const SettlementContext& context) {
	GameSession& session = context.session;
	Logf(LogLevel::Info, "distributing pay-to-spawn earnings for session {}", session.SessionId());

	if (session.Status() == GameStatus::Completed)
		return Report(context, "pay-to-spawn earnings", WagerResult::GameAlreadyCompleted);
	if (session.Status() != GameStatus::InProgress)
		return Report(context, "pay-to-spawn earnings", WagerResult::GameNotInProgress);
	if (!session.IsPayToSpawn())
		return Report(context, "pay-to-spawn earnings", WagerResult::InvalidGameMode);

	uint64_t vaultBalance = 0;
	if (const WagerResult result = ValidateVault(context, vaultBalance); !Succeeded(result))
		return Report(context, "pay-to-spawn earnings", result);

	if (const WagerResult result = ValidateEvidence(context, session.PlayerCount() * 2); !Succeeded(result))
		return Report(context, "pay-to-spawn earnings", result);

	auto roster = LiveRoster(session, TeamSide::A);
	const auto rosterB = LiveRoster(session, TeamSide::B);
	roster.insert(roster.end(), rosterB.begin(), rosterB.end());

	std::vector<Pubkey> players;
	if (const WagerResult result = CollectUniquePlayers(roster, players); !Succeeded(result))
		return Report(context, "pay-to-spawn earnings", result);

	std::vector<Payout> payouts;
	for (const Pubkey& player : players) {
		const auto score = session.KillPlusSpawnScore(player);
		if (!score)
			return Report(context, "pay-to-spawn earnings", WagerResult::PlayerNotFound);

		const auto weighted = CheckedMul<uint64_t>(*score, session.SessionBet());
		if (!weighted)
			return Report(context, "pay-to-spawn earnings", WagerResult::WinningsCalculationError);

		const auto earnings = CheckedDiv<uint64_t>(*weighted, kPayToSpawnDivisor);
		if (!earnings)
			return Report(context, "pay-to-spawn earnings", WagerResult::WinningsCalculationError);

		Logf(LogLevel::Debug, "earnings for player {}: {}", player.ToShortString(), *earnings);
		if (*earnings == 0)
			continue;
		payouts.push_back({ player, *earnings });
	}

	if (const WagerResult result = CheckVaultCoversPayouts(payouts, vaultBalance, WagerResult::TotalPotCalculationError); !Succeeded(result))
		return Report(context, "pay-to-spawn earnings", result);

	return Report(context, "pay-to-spawn earnings", PayAll(context, payouts));
}

} // namespace wager::settlement
