#pragma once

#include <concepts>
#include <limits>
#include <optional>

namespace wager {

// Checked unsigned arithmetic. Every helper returns an empty optional instead
// of wrapping, so callers can map the failure onto their own result code.

template <std::unsigned_integral T>
[[nodiscard]] constexpr std::optional<T> CheckedAdd(T lhs, T rhs) noexcept
{
	if (lhs > std::numeric_limits<T>::max() - rhs)
		return std::nullopt;
	return static_cast<T>(lhs + rhs);
}

template <std::unsigned_integral T>
[[nodiscard]] constexpr std::optional<T> CheckedSub(T lhs, T rhs) noexcept
{
	if (rhs > lhs)
		return std::nullopt;
	return static_cast<T>(lhs - rhs);
}

template <std::unsigned_integral T>
[[nodiscard]] constexpr std::optional<T> CheckedMul(T lhs, T rhs) noexcept
{
	if (lhs != 0 && rhs > std::numeric_limits<T>::max() / lhs)
		return std::nullopt;
	return static_cast<T>(lhs * rhs);
}

template <std::unsigned_integral T>
[[nodiscard]] constexpr std::optional<T> CheckedDiv(T lhs, T rhs) noexcept
{
	if (rhs == 0)
		return std::nullopt;
	return static_cast<T>(lhs / rhs);
}

} // namespace wager
