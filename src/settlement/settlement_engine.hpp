#pragma once

#include "token_ledger.hpp"
#include "../session/game_session.hpp"
#include "../session/wager_result.hpp"

#include <span>

namespace wager::settlement {

/*
=================
SettlementContext

Everything one settlement invocation reads or writes. `evidence` alternates
player identity and destination token account:
[player_1, player_1_token, player_2, player_2_token, ...]
=================
*/
struct SettlementContext {
	session::GameSession& session;
	const VaultAuthority& vault;
	const Pubkey& vaultTokenAccount;
	TokenLedger& ledger;
	const Pubkey& tokenMint;
	std::span<const Pubkey> evidence;
};

/*
=============
RefundWager

Returns exactly one session bet to every enrolled player and completes the
session. The evidence list must hold one pair per roster slot (empty slots
included). Totals are checked against the vault before the first transfer.
=============
*/
WagerResult RefundWager(const SettlementContext& context);

/*
=============
DistributeWinnings

Winner-takes-all payout: every player on the winning team receives twice
the session bet. Evidence holds one pair per live slot of that team.
=============
*/
WagerResult DistributeWinnings(const SettlementContext& context, session::TeamSide winningTeam);

/*
=============
DistributePayToSpawnEarnings

Pay-to-spawn payout: every live player receives
(kills + remaining spawns) * session_bet / 10. Players earning nothing are
skipped. Evidence holds one pair per live slot across both teams.
=============
*/
WagerResult DistributePayToSpawnEarnings(const SettlementContext& context);

} // namespace wager::settlement
