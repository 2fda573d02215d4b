/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

pubkey.cpp implementation.*/

#include "pubkey.hpp"

#include <format>

namespace wager {
namespace {

constexpr uint64_t kFnvOffset = 14695981039346656037ull;
constexpr uint64_t kFnvPrime = 1099511628211ull;
constexpr char kHexDigits[] = "0123456789abcdef";

uint64_t FnvMix(uint64_t hash, std::string_view data)
{
	for (unsigned char c : data) {
		hash ^= c;
		hash *= kFnvPrime;
	}
	return hash;
}

uint64_t FnvMixByte(uint64_t hash, uint8_t byte)
{
	hash ^= byte;
	hash *= kFnvPrime;
	return hash;
}

/*
=============
ExpandHash

Stretches a 64-bit running hash over the 32 output bytes, one lane per
8-byte block.
=============
*/
Pubkey::Bytes ExpandHash(uint64_t seedHash)
{
	Pubkey::Bytes out{};
	for (size_t lane = 0; lane < Pubkey::kSize / 8; ++lane) {
		uint64_t laneHash = FnvMixByte(seedHash, static_cast<uint8_t>(lane));
		laneHash = FnvMixByte(laneHash, static_cast<uint8_t>(0xA5 ^ lane));
		for (size_t i = 0; i < 8; ++i)
			out[lane * 8 + i] = static_cast<uint8_t>(laneHash >> (i * 8));
	}
	return out;
}

std::optional<uint8_t> HexNibble(char c)
{
	if (c >= '0' && c <= '9')
		return static_cast<uint8_t>(c - '0');
	if (c >= 'a' && c <= 'f')
		return static_cast<uint8_t>(c - 'a' + 10);
	if (c >= 'A' && c <= 'F')
		return static_cast<uint8_t>(c - 'A' + 10);
	return std::nullopt;
}

} // namespace

std::string Pubkey::ToHex() const
{
	std::string out;
	out.reserve(kSize * 2);
	for (uint8_t byte : bytes_) {
		out.push_back(kHexDigits[byte >> 4]);
		out.push_back(kHexDigits[byte & 0x0F]);
	}
	return out;
}

std::string Pubkey::ToShortString() const
{
	const std::string hex = ToHex();
	return std::format("{}..{}", hex.substr(0, 6), hex.substr(hex.size() - 4));
}

/*
=============
Pubkey::FromHex

Accepts exactly 64 hex digits in either case.
=============
*/
std::optional<Pubkey> Pubkey::FromHex(std::string_view text)
{
	if (text.size() != kSize * 2)
		return std::nullopt;

	Bytes bytes{};
	for (size_t i = 0; i < kSize; ++i) {
		const auto high = HexNibble(text[i * 2]);
		const auto low = HexNibble(text[i * 2 + 1]);
		if (!high || !low)
			return std::nullopt;
		bytes[i] = static_cast<uint8_t>((*high << 4) | *low);
	}
	return Pubkey(bytes);
}

Pubkey Pubkey::FromSeed(std::string_view seed)
{
	return Pubkey(ExpandHash(FnvMix(FnvMix(kFnvOffset, "seed:"), seed)));
}

Pubkey Pubkey::Derive(std::initializer_list<std::string_view> seeds, uint8_t bump, const Pubkey& programId)
{
	uint64_t hash = FnvMix(kFnvOffset, "derive:");
	for (std::string_view seed : seeds) {
		hash = FnvMix(hash, seed);
		// Length separator so ("ab","c") and ("a","bc") differ.
		hash = FnvMixByte(hash, static_cast<uint8_t>(seed.size()));
	}
	hash = FnvMixByte(hash, bump);
	for (uint8_t byte : programId.bytes())
		hash = FnvMixByte(hash, byte);
	return Pubkey(ExpandHash(hash));
}

} // namespace wager
