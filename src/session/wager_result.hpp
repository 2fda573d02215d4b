#pragma once

#include <cstdint>
#include <string_view>

namespace wager {

// Outcome of every mutating wager operation. Anything other than Success
// aborts the invocation that produced it.
enum class WagerResult : uint16_t {
	Success,

	// Roster and state
	TeamIsFull,
	InvalidTeam,
	PlayerNotFound,
	PlayerAlreadyJoined,
	GameNotInProgress,
	InvalidGameState,
	GameAlreadyCompleted,
	InvalidGameMode,

	// Arithmetic
	SpawnUnderflow,
	ArithmeticOverflow,
	TotalPotCalculationError,
	WinningsCalculationError,

	// Settlement evidence
	InvalidRemainingAccounts,
	InvalidPlayer,
	InvalidPlayerTokenAccount,
	InvalidTokenMint,
	DuplicatePlayer,

	// Funds
	InsufficientVaultBalance,
	InvalidVaultTokenAccount,
	TokenTransferFailed,

	// Authorization and registry
	UnauthorizedDistribution,
	SessionIdInUse,
	SessionNotFound,
	InvalidBetAmount,
	InvalidSessionId,
};

std::string_view WagerResultName(WagerResult result);
std::string_view WagerResultMessage(WagerResult result);

[[nodiscard]] constexpr bool Succeeded(WagerResult result) noexcept
{
	return result == WagerResult::Success;
}

} // namespace wager
