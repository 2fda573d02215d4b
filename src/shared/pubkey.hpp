#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace wager {

/*
=================
Pubkey

32-byte account identity. Players, session authorities, token accounts,
mints and vault addresses are all addressed by one of these.
=================
*/
class Pubkey {
public:
	static constexpr size_t kSize = 32;
	using Bytes = std::array<uint8_t, kSize>;

	constexpr Pubkey() = default;
	explicit constexpr Pubkey(const Bytes& bytes) : bytes_(bytes) {}

	[[nodiscard]] const Bytes& bytes() const noexcept { return bytes_; }

	std::string ToHex() const;
	// Abbreviated form used in log output.
	std::string ToShortString() const;

	static std::optional<Pubkey> FromHex(std::string_view text);

	/*
	=============
	Pubkey::FromSeed

	Deterministically expands a text seed into an identity. Used to mint
	stable keys for players and mints in tests and tooling.
	=============
	*/
	static Pubkey FromSeed(std::string_view seed);

	/*
	=============
	Pubkey::Derive

	Deterministic address derivation from a list of seeds, the bump byte and
	the owning program id. The same inputs always produce the same address.
	=============
	*/
	static Pubkey Derive(std::initializer_list<std::string_view> seeds, uint8_t bump, const Pubkey& programId);

	friend constexpr bool operator==(const Pubkey&, const Pubkey&) = default;
	friend constexpr auto operator<=>(const Pubkey&, const Pubkey&) = default;

private:
	Bytes bytes_{};
};

} // namespace wager

template <>
struct std::hash<wager::Pubkey> {
	size_t operator()(const wager::Pubkey& key) const noexcept
	{
		size_t value = 0;
		for (size_t i = 0; i < sizeof(size_t); ++i)
			value = (value << 8) | key.bytes()[i];
		return value;
	}
};
