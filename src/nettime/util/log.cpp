#include <nettime/util/log.hpp>

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/format.h>

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iterator>
#include <system_error>

namespace nettime
{

Log::Level Log::m_current_level = Log::Level::Trace;

// Per-thread buffer reused between calls to avoid allocating on every message
static thread_local fmt::memory_buffer t_message_buffer;

static fmt::text_style styleForLevel(Log::Level level) noexcept
{
	switch (level) {
	case Log::Level::Trace:
		return fmt::fg(fmt::color::wheat);
	case Log::Level::Debug:
		return fmt::fg(fmt::color::light_sea_green);
	case Log::Level::Info:
		return fmt::fg(fmt::color::green);
	case Log::Level::Warn:
		return fmt::fg(fmt::color::yellow);
	case Log::Level::Error:
		return fmt::fg(fmt::color::red);
	case Log::Level::Fatal:
		return fmt::emphasis::bold | fmt::fg(fmt::color::white) | fmt::bg(fmt::color::red);
	case Log::Level::Off:
		break;
	} // No `default` to keep `-Wswitch` useful

	return {};
}

void Log::doLog(Level level, Location where, std::string_view format_str, fmt::format_args format_args) noexcept
{
	std::string_view text;

	try {
		auto &msgbuf = t_message_buffer;

		try {
			msgbuf.clear();
			fmt::vformat_to(std::back_inserter(msgbuf), format_str, format_args);
		}
		catch (const fmt::format_error &err) {
			// Broken format string is a bug at the call site, make it visible
			level = std::max(level, Level::Error);
			msgbuf.clear();
			fmt::format_to(std::back_inserter(msgbuf), "Caught fmt::format_error when trying to log: {}", err.what());
		}

		text = { msgbuf.data(), msgbuf.size() };
	}
	catch (const std::exception &) {
		// Most likely `std::bad_alloc` while growing the buffer.
		// Nothing potentially-throwing is allowed from here on, use a literal.
		level = std::max(level, Level::Error);
		text = "Caught an exception when trying to format log message";
	}

	const auto pid = getpid();
	const auto tid = gettid();

	try {
		// Info and below go to `stdout`, Warn and above to `stderr`
		FILE *sink = stdout;
		if (level >= Level::Warn) {
			// Keep ordering sane when both streams end up in the same terminal
			fflush(stdout);
			sink = stderr;
		}

		fmt::print(sink, "[{:%F %T}][{} {}][{:s}:{:d}][{:s}] {:s}\n", std::chrono::system_clock::now(), pid, tid,
			where.file_name(), where.line(), fmt::styled(extras::enum_name(level), styleForLevel(level)), text);
	}
	catch (const std::system_error &err) {
		fflush(stdout);
		fprintf(stderr, "[XXXX-XX-XX XX:XX:XX][%d %d][%s:%u][ERROR] std::system_error when printing log: %s:%d (%s)\n",
			pid, tid, where.file_name(), unsigned(where.line()), err.code().category().name(), err.code().value(),
			err.what());
	}
	catch (const std::exception &err) {
		fflush(stdout);
		fprintf(stderr, "[XXXX-XX-XX XX:XX:XX][%d %d][%s:%u][ERROR] Exception when printing log: %s\n", pid, tid,
			where.file_name(), unsigned(where.line()), err.what());
	}
}

void Log::setLevel(Level level) noexcept
{
	m_current_level = level;
	debug("Log level changed to [{}]", extras::enum_name(level));
}

std::optional<Log::Level> Log::levelFromString(std::string_view name) noexcept
{
	constexpr Level LEVELS[] = { Level::Trace, Level::Debug, Level::Info, Level::Warn, Level::Error, Level::Fatal,
		Level::Off };

	for (Level level : LEVELS) {
		std::string_view level_name = extras::enum_name(level);

		bool match = std::ranges::equal(name, level_name, [](char a, char b) {
			return std::toupper(static_cast<unsigned char>(a)) == static_cast<unsigned char>(b);
		});

		if (match) {
			return level;
		}
	}

	return std::nullopt;
}

} // namespace nettime

namespace extras
{

using nettime::Log;

template<>
std::string_view enum_name(Log::Level value) noexcept
{
	using namespace std::string_view_literals;

	switch (value) {
	case Log::Level::Trace:
		return "TRACE"sv;
	case Log::Level::Debug:
		return "DEBUG"sv;
	case Log::Level::Info:
		return "INFO"sv;
	case Log::Level::Warn:
		return "WARN"sv;
	case Log::Level::Error:
		return "ERROR"sv;
	case Log::Level::Fatal:
		return "FATAL"sv;
	case Log::Level::Off:
		return "OFF"sv;
	} // No `default` to keep `-Wswitch` useful

	return "UNKNOWN"sv;
}

} // namespace extras
