#pragma once

#include <nettime/visibility.hpp>

#include <extras/source_location.hpp>

#include <exception>
#include <string>
#include <system_error>

namespace nettime
{

// The single exception type thrown by the library.
//
// Subsystems don't subclass it; the kind of failure is carried by the stored
// `std::error_condition` (usually `NetTimeErrc` or `std::errc`), and that is
// what callers should compare against when reacting to an error.
//
// Exceptions are reserved for misuse and configuration errors. Operations that
// can fail as a normal part of the host loop (e.g. `tryAdvanceFrame`) report
// through `cpp::result` instead.
class NETTIME_API Exception : public std::exception {
public:
	using Location = extras::source_location;

	Exception() = delete;
	Exception(Exception &&) = default;
	Exception(const Exception &) = default;
	Exception &operator=(Exception &&) = default;
	Exception &operator=(const Exception &) = default;
	~Exception() override;

	const char *what() const noexcept override { return m_what.c_str(); }
	const std::error_condition &error() const noexcept { return m_error; }
	// Where the exception was thrown. Pass it to `Log::log` to
	// attribute a message to the throw site instead of the catch site.
	const Location &where() const noexcept { return m_where; }

	// Wrap `std::error_code` returned from an external library or platform call.
	// `what()` is formatted as "<details> (code [<category>:<value>] <message>)".
	static Exception fromErrorCode(std::error_code ec, const char *details, Location loc = Location::current());

	// Construct from `std::error_condition`, the preferred form.
	// `what()` is formatted as "<details> (cond [<category>:<value>] <message>)".
	static Exception fromError(std::error_condition ec, const char *details, Location loc = Location::current());

protected:
	Exception(std::string what, std::error_condition error, Location loc);

private:
	std::string m_what;
	std::error_condition m_error;
	Location m_where;
};

} // namespace nettime
