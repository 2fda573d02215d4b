/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

escrow_deposits.cpp implementation.*/

#include "escrow_deposits.hpp"

#include "../shared/logger.hpp"

namespace wager::settlement {
namespace {

using session::GameStatus;

WagerResult CheckPlayerTokenAccount(const DepositContext& context, const Pubkey& player, const Pubkey& playerTokenAccount) {
	const auto account = context.ledger.FindAccount(playerTokenAccount);
	if (!account || account->owner != player)
		return WagerResult::InvalidPlayerTokenAccount;
	if (account->mint != context.tokenMint)
		return WagerResult::InvalidTokenMint;
	return WagerResult::Success;
}

WagerResult Escrow(const DepositContext& context, const Pubkey& player, const Pubkey& playerTokenAccount) {
	const TransferResult transfer = context.ledger.Transfer({
		playerTokenAccount,
		context.vaultTokenAccount,
		context.session.SessionBet(),
		player,
	});
	if (transfer != TransferResult::Success) {
		Logf(LogLevel::Warn, "session {}: escrow from {} failed: {}", context.session.SessionId(),
			player.ToShortString(), TransferResultName(transfer));
		return WagerResult::TokenTransferFailed;
	}
	return WagerResult::Success;
}

} // namespace

WagerResult JoinUser(const DepositContext& context, session::TeamSide team, const Pubkey& player,
	const Pubkey& playerTokenAccount) {
	session::GameSession& session = context.session;

	if (session.Status() != GameStatus::WaitingForPlayers)
		return WagerResult::InvalidGameState;
	if (session.IsEnrolled(player))
		return WagerResult::PlayerAlreadyJoined;
	if (!session.FindEmptySlot(team))
		return WagerResult::TeamIsFull;

	if (const WagerResult result = CheckPlayerTokenAccount(context, player, playerTokenAccount); !Succeeded(result))
		return result;
	if (const WagerResult result = Escrow(context, player, playerTokenAccount); !Succeeded(result))
		return result;

	size_t slot = 0;
	const WagerResult result = session.AssignPlayer(team, player, &slot);
	if (Succeeded(result)) {
		Logf(LogLevel::Info, "session {}: {} joined team {} slot {}", session.SessionId(), player.ToShortString(),
			session::TeamSideIndex(team), slot);
	}
	return result;
}

WagerResult PayToSpawn(const DepositContext& context, session::TeamSide team, const Pubkey& player,
	const Pubkey& playerTokenAccount) {
	session::GameSession& session = context.session;

	if (!session.IsPayToSpawn())
		return WagerResult::InvalidGameMode;
	if (session.Status() != GameStatus::InProgress)
		return WagerResult::GameNotInProgress;

	const auto slot = session.PlayerIndex(team, player);
	if (!slot)
		return WagerResult::PlayerNotFound;
	if (const WagerResult result = session.CheckSpawnPurchase(team, *slot); !Succeeded(result))
		return result;

	if (const WagerResult result = CheckPlayerTokenAccount(context, player, playerTokenAccount); !Succeeded(result))
		return result;
	if (const WagerResult result = Escrow(context, player, playerTokenAccount); !Succeeded(result))
		return result;
	if (const WagerResult result = session.AddSlotBet(team, *slot, session.SessionBet()); !Succeeded(result))
		return result;

	return session.GrantSpawns(team, *slot);
}

} // namespace wager::settlement
