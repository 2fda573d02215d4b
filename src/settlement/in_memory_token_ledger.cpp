/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

in_memory_token_ledger.cpp implementation.*/

#include "in_memory_token_ledger.hpp"

#include "../shared/checked_math.hpp"

namespace wager::settlement {

std::optional<TokenAccount> InMemoryTokenLedger::FindAccount(const Pubkey& key) const {
	const auto it = accounts_.find(key);
	if (it == accounts_.end())
		return std::nullopt;
	return it->second;
}

/*
=============
InMemoryTokenLedger::Transfer

Validates both ends, the signing authority and both balances before either
account is written.
=============
*/
TransferResult InMemoryTokenLedger::Transfer(const TransferRequest& request) {
	const auto from = accounts_.find(request.source);
	const auto to = accounts_.find(request.destination);
	if (from == accounts_.end() || to == accounts_.end())
		return TransferResult::UnknownAccount;

	if (from->second.owner != request.authority)
		return TransferResult::OwnerMismatch;

	if (from->second.mint != to->second.mint)
		return TransferResult::MintMismatch;

	const auto remaining = CheckedSub<uint64_t>(from->second.amount, request.amount);
	if (!remaining)
		return TransferResult::InsufficientFunds;

	if (request.source == request.destination) {
		journal_.push_back({ request.source, request.destination, request.amount });
		return TransferResult::Success;
	}

	const auto credited = CheckedAdd<uint64_t>(to->second.amount, request.amount);
	if (!credited)
		return TransferResult::Overflow;

	from->second.amount = *remaining;
	to->second.amount = *credited;
	journal_.push_back({ request.source, request.destination, request.amount });
	return TransferResult::Success;
}

bool InMemoryTokenLedger::OpenAccount(const Pubkey& key, const Pubkey& owner, const Pubkey& mint, uint64_t amount) {
	return accounts_.emplace(key, TokenAccount{ key, owner, mint, amount }).second;
}

uint64_t InMemoryTokenLedger::Balance(const Pubkey& key) const {
	const auto it = accounts_.find(key);
	return it == accounts_.end() ? 0 : it->second.amount;
}

} // namespace wager::settlement
