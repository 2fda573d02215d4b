/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

wager_result.cpp implementation.*/

#include "wager_result.hpp"

namespace wager {

/*
=============
WagerResultName

Stable identifier for a result, used in logs and persisted error reports.
=============
*/
std::string_view WagerResultName(WagerResult result)
{
	switch (result) {
	case WagerResult::Success: return "Success";
	case WagerResult::TeamIsFull: return "TeamIsFull";
	case WagerResult::InvalidTeam: return "InvalidTeam";
	case WagerResult::PlayerNotFound: return "PlayerNotFound";
	case WagerResult::PlayerAlreadyJoined: return "PlayerAlreadyJoined";
	case WagerResult::GameNotInProgress: return "GameNotInProgress";
	case WagerResult::InvalidGameState: return "InvalidGameState";
	case WagerResult::GameAlreadyCompleted: return "GameAlreadyCompleted";
	case WagerResult::InvalidGameMode: return "InvalidGameMode";
	case WagerResult::SpawnUnderflow: return "SpawnUnderflow";
	case WagerResult::ArithmeticOverflow: return "ArithmeticOverflow";
	case WagerResult::TotalPotCalculationError: return "TotalPotCalculationError";
	case WagerResult::WinningsCalculationError: return "WinningsCalculationError";
	case WagerResult::InvalidRemainingAccounts: return "InvalidRemainingAccounts";
	case WagerResult::InvalidPlayer: return "InvalidPlayer";
	case WagerResult::InvalidPlayerTokenAccount: return "InvalidPlayerTokenAccount";
	case WagerResult::InvalidTokenMint: return "InvalidTokenMint";
	case WagerResult::DuplicatePlayer: return "DuplicatePlayer";
	case WagerResult::InsufficientVaultBalance: return "InsufficientVaultBalance";
	case WagerResult::InvalidVaultTokenAccount: return "InvalidVaultTokenAccount";
	case WagerResult::TokenTransferFailed: return "TokenTransferFailed";
	case WagerResult::UnauthorizedDistribution: return "UnauthorizedDistribution";
	case WagerResult::SessionIdInUse: return "SessionIdInUse";
	case WagerResult::SessionNotFound: return "SessionNotFound";
	case WagerResult::InvalidBetAmount: return "InvalidBetAmount";
	case WagerResult::InvalidSessionId: return "InvalidSessionId";
	}
	return "Unknown";
}

std::string_view WagerResultMessage(WagerResult result)
{
	switch (result) {
	case WagerResult::Success: return "operation completed";
	case WagerResult::TeamIsFull: return "team has no empty slot for this game mode";
	case WagerResult::InvalidTeam: return "team selector must be 0 or 1";
	case WagerResult::PlayerNotFound: return "player is not enrolled on the given team";
	case WagerResult::PlayerAlreadyJoined: return "player is already enrolled in this session";
	case WagerResult::GameNotInProgress: return "session is not in progress";
	case WagerResult::InvalidGameState: return "operation not allowed in the current session status";
	case WagerResult::GameAlreadyCompleted: return "session has already been settled";
	case WagerResult::InvalidGameMode: return "operation not supported by the session game mode";
	case WagerResult::SpawnUnderflow: return "victim has no spawn credits left";
	case WagerResult::ArithmeticOverflow: return "counter would overflow";
	case WagerResult::TotalPotCalculationError: return "total pot calculation overflowed";
	case WagerResult::WinningsCalculationError: return "payout calculation overflowed";
	case WagerResult::InvalidRemainingAccounts: return "settlement evidence list is malformed";
	case WagerResult::InvalidPlayer: return "no settlement evidence supplied for player";
	case WagerResult::InvalidPlayerTokenAccount: return "destination is not a token account owned by the player";
	case WagerResult::InvalidTokenMint: return "token account is denominated in the wrong mint";
	case WagerResult::DuplicatePlayer: return "player appears in more than one slot";
	case WagerResult::InsufficientVaultBalance: return "vault balance does not cover the payout";
	case WagerResult::InvalidVaultTokenAccount: return "vault token account does not belong to the session vault";
	case WagerResult::TokenTransferFailed: return "token transfer was rejected by the ledger";
	case WagerResult::UnauthorizedDistribution: return "only the session authority may perform this operation";
	case WagerResult::SessionIdInUse: return "a session with this id already exists";
	case WagerResult::SessionNotFound: return "no session with this id";
	case WagerResult::InvalidBetAmount: return "bet amount must be positive and the full pot must fit in 64 bits";
	case WagerResult::InvalidSessionId: return "session id must be 1 to 32 bytes";
	}
	return "unknown result";
}

} // namespace wager
