#pragma once

#include "token_ledger.hpp"
#include "../session/game_session.hpp"
#include "../session/wager_result.hpp"

namespace wager::settlement {

struct DepositContext {
	session::GameSession& session;
	const Pubkey& vaultTokenAccount;
	TokenLedger& ledger;
	const Pubkey& tokenMint;
};

/*
=============
JoinUser

Escrows one session bet from the player's token account into the vault and
seats the player in the first empty slot of the chosen team. The roster is
checked before any funds move.
=============
*/
WagerResult JoinUser(const DepositContext& context, session::TeamSide team, const Pubkey& player,
	const Pubkey& playerTokenAccount);

/*
=============
PayToSpawn

Buys another batch of spawn credits for an enrolled player in a
pay-to-spawn session. Costs one session bet.
=============
*/
WagerResult PayToSpawn(const DepositContext& context, session::TeamSide team, const Pubkey& player,
	const Pubkey& playerTokenAccount);

} // namespace wager::settlement
