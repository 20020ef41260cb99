#pragma once

#include <nettime/visibility.hpp>

#include <extras/enum_utils.hpp>
#include <extras/source_location.hpp>

#include <fmt/core.h>

#include <optional>
#include <string>
#include <string_view>

namespace nettime
{

class NETTIME_API Log {
public:
	using Location = extras::source_location;

	// Levels are ordered by increasing severity, comparing them as integers is valid
	enum class Level : int {
		/* Fine-grained details of one specific action, like per-iteration values
		 * inside an algorithm. Useful during a single debugging session only. */
		Trace,
		/* Low-level program workflow, e.g. configuration values being changed
		 * or a frame counter being resynchronized. */
		Debug,
		/* High-level program workflow, enough to understand what's going on
		 * without drowning in details. */
		Info,
		/* Something went wrong but the current action still completes,
		 * possibly with degraded results. */
		Warn,
		/* Something went wrong and the current action can't complete,
		 * but the program can continue running. */
		Error,
		/* Program can't continue. Usually means a bug. */
		Fatal,

		Off // Not a real level, pass it to `setLevel` to silence logging completely
	};

	// Format string bundled with the source location of the logging call.
	// Implicitly constructed from a string at the call site, which
	// makes the defaulted `where` argument point at that call.
	struct Format {
		Format(const char *format_str, Location loc = Location::current()) noexcept : str(format_str), where(loc) {}
		Format(std::string_view format_str, Location loc = Location::current()) noexcept : str(format_str), where(loc)
		{}
		Format(const std::string &format_str, Location loc = Location::current()) noexcept
			: str(format_str), where(loc)
		{}

		std::string_view str;
		Location where;
	};

	// Log at an explicitly given location. Use it to make a message appear as if
	// it was made from somewhere else, e.g. from the place an exception was thrown.
	template<typename... Args>
	static void log(Level level, Location where, std::string_view format_str, const Args &...args) noexcept
	{
		if (!willBeLogged(level)) {
			return;
		}
		doLog(level, where, format_str, fmt::make_format_args(args...));
	}

	template<typename... Args>
	static void trace(Format format, const Args &...args) noexcept
	{
		log(Level::Trace, format.where, format.str, args...);
	}

	template<typename... Args>
	static void debug(Format format, const Args &...args) noexcept
	{
		log(Level::Debug, format.where, format.str, args...);
	}

	template<typename... Args>
	static void info(Format format, const Args &...args) noexcept
	{
		log(Level::Info, format.where, format.str, args...);
	}

	template<typename... Args>
	static void warn(Format format, const Args &...args) noexcept
	{
		log(Level::Warn, format.where, format.str, args...);
	}

	template<typename... Args>
	static void error(Format format, const Args &...args) noexcept
	{
		log(Level::Error, format.where, format.str, args...);
	}

	template<typename... Args>
	static void fatal(Format format, const Args &...args) noexcept
	{
		log(Level::Fatal, format.where, format.str, args...);
	}

	// Returns the current logging level.
	// Initially it is `Trace` regardless of build type.
	static Level level() noexcept { return m_current_level; }
	static void setLevel(Level level) noexcept;
	// Whether logging with the given level will output anything
	static bool willBeLogged(Level level) noexcept { return level >= m_current_level; }

	// Parse case-insensitive level name ("trace", "debug", ..., "off").
	// Returns `std::nullopt` for unknown names.
	static std::optional<Level> levelFromString(std::string_view name) noexcept;

private:
	Log() = delete;

	static Level m_current_level;

	static void doLog(Level level, Location where, std::string_view format_str, fmt::format_args format_args) noexcept;
};

} // namespace nettime

namespace extras
{

template<>
NETTIME_API std::string_view enum_name(nettime::Log::Level value) noexcept;

}
