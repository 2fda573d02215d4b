#pragma once

#include "../shared/pubkey.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace wager::settlement {

struct TokenAccount {
	Pubkey key;
	Pubkey owner;
	Pubkey mint;
	uint64_t amount = 0;
};

/*
=================
VaultAuthority

Signing proof for a session vault, derived by the storage substrate from the
session id. Settlement only ever forwards it to the ledger.
=================
*/
struct VaultAuthority {
	Pubkey address;
	std::string sessionId;
	uint8_t bump = 0;
};

enum class TransferResult {
	Success,
	UnknownAccount,
	OwnerMismatch,
	MintMismatch,
	InsufficientFunds,
	Overflow,
};

struct TransferRequest {
	Pubkey source;
	Pubkey destination;
	uint64_t amount = 0;
	Pubkey authority;	// must own the source account
};

/*
=================
TokenLedger

Value-transfer primitive consumed by the deposit and settlement code. A
transfer either moves exactly the requested amount or changes nothing.
=================
*/
class TokenLedger {
public:
	virtual ~TokenLedger() = default;

	virtual std::optional<TokenAccount> FindAccount(const Pubkey& key) const = 0;
	virtual TransferResult Transfer(const TransferRequest& request) = 0;
};

const char* TransferResultName(TransferResult result);

} // namespace wager::settlement
