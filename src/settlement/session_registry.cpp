/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

session_registry.cpp implementation.*/

#include "session_registry.hpp"

#include "escrow_deposits.hpp"
#include "settlement_engine.hpp"
#include "../session/session_codec.hpp"
#include "../shared/checked_math.hpp"
#include "../shared/logger.hpp"

#include <fstream>
#include <memory>
#include <system_error>
#include <utility>

#include <json/json.h>

namespace wager::settlement {

using session::GameMode;
using session::GameSession;
using session::TeamSide;

SessionRegistry::SessionRegistry(Pubkey programId, Pubkey tokenMint)
	: programId_(programId)
	, tokenMint_(tokenMint) {}

/*
=============
SessionRegistry::MakeRecord

Derives the session, vault and vault token addresses from the session id.
=============
*/
SessionRegistry::SessionRecord SessionRegistry::MakeRecord(GameSession session) const {
	const std::string& id = session.SessionId();
	const Pubkey sessionAddress = Pubkey::Derive({ "game_session", id }, session.Bump(), programId_);
	const Pubkey vaultAddress = Pubkey::Derive({ "vault", id }, session.VaultBump(), programId_);
	const std::string vaultHex = vaultAddress.ToHex();
	const std::string mintHex = tokenMint_.ToHex();
	const Pubkey vaultTokenAccount = Pubkey::Derive({ "associated_token", vaultHex, mintHex }, kCanonicalBump, programId_);

	return SessionRecord{
		std::move(session),
		sessionAddress,
		VaultAuthority{ vaultAddress, id, kCanonicalBump },
		vaultTokenAccount,
	};
}

const GameSession* SessionRegistry::FindSession(std::string_view sessionId) const {
	const auto it = sessions_.find(sessionId);
	return it == sessions_.end() ? nullptr : &it->second.session;
}

std::optional<Pubkey> SessionRegistry::VaultTokenAccountFor(std::string_view sessionId) const {
	const auto it = sessions_.find(sessionId);
	if (it == sessions_.end())
		return std::nullopt;
	return it->second.vaultTokenAccount;
}

std::optional<VaultAuthority> SessionRegistry::VaultAuthorityFor(std::string_view sessionId) const {
	const auto it = sessions_.find(sessionId);
	if (it == sessions_.end())
		return std::nullopt;
	return it->second.vault;
}

/*
=============
SessionRegistry::Invoke

Runs one entry point against one session. The session record and the ledger
are copied up front and put back if the operation fails, so a failed
invocation leaves no trace.
=============
*/
template <typename Operation>
WagerResult SessionRegistry::Invoke(std::string_view operation, const std::string& sessionId, Operation&& op) {
	const auto it = sessions_.find(sessionId);
	if (it == sessions_.end()) {
		Logf(LogLevel::Warn, "{}: unknown session {}", operation, sessionId);
		return WagerResult::SessionNotFound;
	}

	SessionRecord savedRecord = it->second;
	InMemoryTokenLedger savedLedger = ledger_;

	const WagerResult result = op(it->second);
	if (!Succeeded(result)) {
		it->second = std::move(savedRecord);
		ledger_ = std::move(savedLedger);
		Logf(LogLevel::Warn, "{} on session {} failed: {} ({})", operation, sessionId, WagerResultName(result),
			WagerResultMessage(result));
	}
	return result;
}

WagerResult SessionRegistry::CreateSession(const Pubkey& signer, const std::string& sessionId, uint64_t sessionBet,
	GameMode mode, int64_t now) {
	const auto reject = [&sessionId](WagerResult result) {
		Logf(LogLevel::Warn, "create on session {} failed: {} ({})", sessionId, WagerResultName(result),
			WagerResultMessage(result));
		return result;
	};

	if (sessionId.empty() || sessionId.size() > session::kMaxSessionIdLength)
		return reject(WagerResult::InvalidSessionId);

	if (sessions_.contains(sessionId))
		return reject(WagerResult::SessionIdInUse);

	// The full pot has to be representable or payouts could never be checked.
	const auto fullPot = CheckedMul<uint64_t>(sessionBet, session::PlayersPerTeam(mode) * 2);
	if (sessionBet == 0 || !fullPot)
		return reject(WagerResult::InvalidBetAmount);

	SessionRecord record = MakeRecord(GameSession(sessionId, signer, sessionBet, mode, now, kCanonicalBump, kCanonicalBump));
	if (!ledger_.OpenAccount(record.vaultTokenAccount, record.vault.address, tokenMint_))
		return reject(WagerResult::SessionIdInUse);

	Logf(LogLevel::Info, "created session {} ({}, bet {}) by {}", sessionId, session::GameModeName(mode), sessionBet,
		signer.ToShortString());
	sessions_.emplace(sessionId, std::move(record));
	return WagerResult::Success;
}

WagerResult SessionRegistry::JoinUser(const Pubkey& signer, const std::string& sessionId, uint8_t team,
	const Pubkey& playerTokenAccount) {
	return Invoke("join", sessionId, [&](SessionRecord& record) {
		const auto side = session::TeamSideFromIndex(team);
		if (!side)
			return WagerResult::InvalidTeam;

		return settlement::JoinUser({ record.session, record.vaultTokenAccount, ledger_, tokenMint_ }, *side, signer,
			playerTokenAccount);
	});
}

WagerResult SessionRegistry::PayToSpawn(const Pubkey& signer, const std::string& sessionId, uint8_t team,
	const Pubkey& playerTokenAccount) {
	return Invoke("pay to spawn", sessionId, [&](SessionRecord& record) {
		const auto side = session::TeamSideFromIndex(team);
		if (!side)
			return WagerResult::InvalidTeam;

		return settlement::PayToSpawn({ record.session, record.vaultTokenAccount, ledger_, tokenMint_ }, *side, signer,
			playerTokenAccount);
	});
}

WagerResult SessionRegistry::RecordKill(const Pubkey& signer, const std::string& sessionId, uint8_t killerTeam,
	const Pubkey& killer, uint8_t victimTeam, const Pubkey& victim) {
	return Invoke("record kill", sessionId, [&](SessionRecord& record) {
		if (record.session.Authority() != signer)
			return WagerResult::UnauthorizedDistribution;

		const auto killerSide = session::TeamSideFromIndex(killerTeam);
		const auto victimSide = session::TeamSideFromIndex(victimTeam);
		if (!killerSide || !victimSide)
			return WagerResult::InvalidTeam;

		return record.session.RecordKill(*killerSide, killer, *victimSide, victim);
	});
}

WagerResult SessionRegistry::RefundWager(const Pubkey& signer, const std::string& sessionId,
	std::span<const Pubkey> evidence) {
	return Invoke("refund", sessionId, [&](SessionRecord& record) {
		if (record.session.Authority() != signer)
			return WagerResult::UnauthorizedDistribution;

		return settlement::RefundWager({ record.session, record.vault, record.vaultTokenAccount, ledger_, tokenMint_, evidence });
	});
}

WagerResult SessionRegistry::DistributeWinnings(const Pubkey& signer, const std::string& sessionId, uint8_t winningTeam,
	std::span<const Pubkey> evidence) {
	return Invoke("distribute winnings", sessionId, [&](SessionRecord& record) {
		if (record.session.Authority() != signer)
			return WagerResult::UnauthorizedDistribution;

		const auto side = session::TeamSideFromIndex(winningTeam);
		if (!side)
			return WagerResult::InvalidTeam;

		return settlement::DistributeWinnings({ record.session, record.vault, record.vaultTokenAccount, ledger_, tokenMint_, evidence },
			*side);
	});
}

WagerResult SessionRegistry::DistributePayToSpawnEarnings(const Pubkey& signer, const std::string& sessionId,
	std::span<const Pubkey> evidence) {
	return Invoke("distribute pay-to-spawn earnings", sessionId, [&](SessionRecord& record) {
		if (record.session.Authority() != signer)
			return WagerResult::UnauthorizedDistribution;

		return settlement::DistributePayToSpawnEarnings(
			{ record.session, record.vault, record.vaultTokenAccount, ledger_, tokenMint_, evidence });
	});
}

/*
=============
SessionRegistry::SaveSnapshot

Writes every session and every ledger account to a single JSON document.
=============
*/
bool SessionRegistry::SaveSnapshot(const std::filesystem::path& path) const {
	Json::Value root(Json::objectValue);
	session::WriteSaveMetadata(root);
	root["programId"] = programId_.ToHex();
	root["tokenMint"] = tokenMint_.ToHex();

	Json::Value accounts(Json::arrayValue);
	for (const auto& [key, account] : ledger_.Accounts()) {
		Json::Value entry(Json::objectValue);
		entry["key"] = key.ToHex();
		entry["owner"] = account.owner.ToHex();
		entry["mint"] = account.mint.ToHex();
		entry["amount"] = Json::Value::UInt64(account.amount);
		accounts.append(entry);
	}
	root["accounts"] = accounts;

	Json::Value sessions(Json::arrayValue);
	for (const auto& [id, record] : sessions_)
		sessions.append(session::SessionToJson(record.session));
	root["sessions"] = sessions;

	std::error_code ec;
	if (path.has_parent_path())
		std::filesystem::create_directories(path.parent_path(), ec);
	if (ec) {
		Logf(LogLevel::Warn, "failed to create snapshot directory {}: {}", path.parent_path().string(), ec.message());
		return false;
	}

	std::ofstream out(path);
	if (!out.is_open()) {
		Logf(LogLevel::Warn, "failed to open {} for writing", path.string());
		return false;
	}

	Json::StreamWriterBuilder builder;
	builder["indentation"] = "    ";
	std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
	writer->write(root, &out);
	return static_cast<bool>(out);
}

/*
=============
SessionRegistry::LoadSnapshot

Replaces the registry contents with a snapshot written for the same program
and mint. On any error the current contents are left untouched.
=============
*/
bool SessionRegistry::LoadSnapshot(const std::filesystem::path& path) {
	std::ifstream in(path);
	if (!in.is_open()) {
		Logf(LogLevel::Warn, "failed to open {}", path.string());
		return false;
	}

	Json::Value root;
	Json::CharReaderBuilder builder;
	std::string errs;
	if (!Json::parseFromStream(builder, in, &root, &errs)) {
		Logf(LogLevel::Warn, "parse error in {}: {}", path.string(), errs);
		return false;
	}

	if (!session::ValidateSaveMetadata(root, "registry"))
		return false;

	if (!root["programId"].isString() || !root["tokenMint"].isString()
		|| Pubkey::FromHex(root["programId"].asString()) != programId_
		|| Pubkey::FromHex(root["tokenMint"].asString()) != tokenMint_) {
		Logf(LogLevel::Warn, "{} was written for a different program or mint", path.string());
		return false;
	}

	InMemoryTokenLedger ledger;
	for (const Json::Value& entry : root["accounts"]) {
		const auto key = Pubkey::FromHex(entry["key"].asString());
		const auto owner = Pubkey::FromHex(entry["owner"].asString());
		const auto mint = Pubkey::FromHex(entry["mint"].asString());
		if (!key || !owner || !mint || !entry["amount"].isUInt64()
			|| !ledger.OpenAccount(*key, *owner, *mint, entry["amount"].asUInt64())) {
			Logf(LogLevel::Warn, "{}: invalid ledger account entry", path.string());
			return false;
		}
	}

	std::map<std::string, SessionRecord, std::less<>> sessions;
	for (const Json::Value& entry : root["sessions"]) {
		auto restored = session::SessionFromJson(entry);
		if (!restored) {
			Logf(LogLevel::Warn, "{}: invalid session entry", path.string());
			return false;
		}

		if (const WagerResult check = session::ValidateRestoredSession(*restored); !Succeeded(check)) {
			Logf(LogLevel::Warn, "{}: session {} rejected: {}", path.string(), restored->SessionId(), WagerResultName(check));
			return false;
		}

		std::string id = restored->SessionId();
		SessionRecord record = MakeRecord(std::move(*restored));
		if (!ledger.FindAccount(record.vaultTokenAccount)) {
			Logf(LogLevel::Warn, "{}: session {} has no vault token account", path.string(), id);
			return false;
		}
		if (!sessions.emplace(std::move(id), std::move(record)).second) {
			Logf(LogLevel::Warn, "{}: duplicate session entry", path.string());
			return false;
		}
	}

	ledger_ = std::move(ledger);
	sessions_ = std::move(sessions);
	Logf(LogLevel::Info, "loaded {} sessions and {} accounts from {}", sessions_.size(), ledger_.Accounts().size(), path.string());
	return true;
}

} // namespace wager::settlement
