#pragma once

#include <nettime/visibility.hpp>

#include <system_error>

namespace nettime
{

// Error conditions reported by the library, either through
// `nettime::Exception::error()` or through `cpp::result` returns.
enum class NetTimeErrc : int {
	// Tick rate or message send rate is zero (or otherwise unusable)
	InvalidRate = 1,
	// Frame advance requested while less than one frame of time is accumulated
	InsufficientElapsedTime = 2,
	// Negative duration passed where only non-negative ones make sense
	InvalidDuration = 3,
	// A config object has no requested option but user assumes it exists
	OptionMissing = 4,
	// Input data is invalid/corrupt and can't be used
	InvalidData = 5,
	// Requested file does not exist or is inaccessible
	FileNotFound = 6,
};

// ADL-accessible factory for `std::error_condition { NetTimeErrc }`
NETTIME_API std::error_condition make_error_condition(NetTimeErrc errc) noexcept;

} // namespace nettime

namespace std
{

template<>
struct is_error_condition_enum<nettime::NetTimeErrc> : true_type {};

} // namespace std
