#pragma once

#include "in_memory_token_ledger.hpp"
#include "token_ledger.hpp"
#include "../session/game_session.hpp"
#include "../session/wager_result.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace wager::settlement {

inline constexpr uint8_t kCanonicalBump = 255;

/*
=================
SessionRegistry

In-memory storage substrate for wager sessions. It owns the session records
and the token ledger, derives session and vault addresses, enforces who may
call each entry point, and makes every entry point all-or-nothing: when an
invocation fails, the session and the ledger are restored to the state they
had before the call.
=================
*/
class SessionRegistry {
public:
	SessionRegistry(Pubkey programId, Pubkey tokenMint);

	InMemoryTokenLedger& Ledger() { return ledger_; }
	const InMemoryTokenLedger& Ledger() const { return ledger_; }
	const Pubkey& TokenMint() const { return tokenMint_; }
	const Pubkey& ProgramId() const { return programId_; }

	const session::GameSession* FindSession(std::string_view sessionId) const;
	std::optional<Pubkey> VaultTokenAccountFor(std::string_view sessionId) const;
	std::optional<VaultAuthority> VaultAuthorityFor(std::string_view sessionId) const;

	WagerResult CreateSession(const Pubkey& signer, const std::string& sessionId, uint64_t sessionBet,
		session::GameMode mode, int64_t now);
	WagerResult JoinUser(const Pubkey& signer, const std::string& sessionId, uint8_t team, const Pubkey& playerTokenAccount);
	WagerResult PayToSpawn(const Pubkey& signer, const std::string& sessionId, uint8_t team, const Pubkey& playerTokenAccount);
	WagerResult RecordKill(const Pubkey& signer, const std::string& sessionId, uint8_t killerTeam, const Pubkey& killer,
		uint8_t victimTeam, const Pubkey& victim);

	WagerResult RefundWager(const Pubkey& signer, const std::string& sessionId, std::span<const Pubkey> evidence);
	WagerResult DistributeWinnings(const Pubkey& signer, const std::string& sessionId, uint8_t winningTeam,
		std::span<const Pubkey> evidence);
	WagerResult DistributePayToSpawnEarnings(const Pubkey& signer, const std::string& sessionId,
		std::span<const Pubkey> evidence);

	bool SaveSnapshot(const std::filesystem::path& path) const;
	bool LoadSnapshot(const std::filesystem::path& path);

private:
	struct SessionRecord {
		session::GameSession session;
		Pubkey sessionAddress;
		VaultAuthority vault;
		Pubkey vaultTokenAccount;
	};

	template <typename Operation>
	WagerResult Invoke(std::string_view operation, const std::string& sessionId, Operation&& op);

	SessionRecord MakeRecord(session::GameSession session) const;

	Pubkey programId_;
	Pubkey tokenMint_;
	std::map<std::string, SessionRecord, std::less<>> sessions_;
	InMemoryTokenLedger ledger_;
};

} // namespace wager::settlement
