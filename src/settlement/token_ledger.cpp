/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

token_ledger.cpp implementation.*/

#include "token_ledger.hpp"

namespace wager::settlement {

const char* TransferResultName(TransferResult result) {
	switch (result) {
	case TransferResult::Success:
		return "Success";
	case TransferResult::UnknownAccount:
		return "UnknownAccount";
	case TransferResult::OwnerMismatch:
		return "OwnerMismatch";
	case TransferResult::MintMismatch:
		return "MintMismatch";
	case TransferResult::InsufficientFunds:
		return "InsufficientFunds";
	case TransferResult::Overflow:
	default:
		return "Overflow";
	}
}

} // namespace wager::settlement
