#pragma once

#include "token_ledger.hpp"

#include <cstddef>
#include <map>
#include <vector>

namespace wager::settlement {

struct TransferRecord {
	Pubkey source;
	Pubkey destination;
	uint64_t amount = 0;
};

/*
=================
InMemoryTokenLedger

Map-backed ledger used by the session registry and the tests. It keeps a
journal of completed transfers so callers can audit what moved. The whole
object is copyable, which is how the registry snapshots it.
=================
*/
class InMemoryTokenLedger : public TokenLedger {
public:
	std::optional<TokenAccount> FindAccount(const Pubkey& key) const override;
	TransferResult Transfer(const TransferRequest& request) override;

	// Returns false when the key is already in use.
	bool OpenAccount(const Pubkey& key, const Pubkey& owner, const Pubkey& mint, uint64_t amount = 0);
	uint64_t Balance(const Pubkey& key) const;

	const std::vector<TransferRecord>& Journal() const { return journal_; }
	size_t TransferCount() const { return journal_.size(); }
	void ClearJournal() { journal_.clear(); }

	const std::map<Pubkey, TokenAccount>& Accounts() const { return accounts_; }

private:
	std::map<Pubkey, TokenAccount> accounts_;
	std::vector<TransferRecord> journal_;
};

} // namespace wager::settlement
