#include <nettime/util/log.hpp>

#include "../../test_common.hpp"

#include <string>

namespace nettime
{

TEST_CASE("'Log' level names", "[nettime::log]")
{
	CHECK(extras::enum_name(Log::Level::Trace) == "TRACE");
	CHECK(extras::enum_name(Log::Level::Warn) == "WARN");
	CHECK(extras::enum_name(Log::Level::Off) == "OFF");

	CHECK(Log::levelFromString("trace") == Log::Level::Trace);
	CHECK(Log::levelFromString("Debug") == Log::Level::Debug);
	CHECK(Log::levelFromString("INFO") == Log::Level::Info);
	CHECK(Log::levelFromString("warn") == Log::Level::Warn);
	CHECK(Log::levelFromString("error") == Log::Level::Error);
	CHECK(Log::levelFromString("fatal") == Log::Level::Fatal);
	CHECK(Log::levelFromString("off") == Log::Level::Off);

	CHECK_FALSE(Log::levelFromString("").has_value());
	CHECK_FALSE(Log::levelFromString("warning").has_value());
	CHECK_FALSE(Log::levelFromString("inf").has_value());
}

TEST_CASE("'Log' level filtering", "[nettime::log]")
{
	const Log::Level old_level = Log::level();

	Log::setLevel(Log::Level::Warn);
	CHECK(Log::level() == Log::Level::Warn);
	CHECK_FALSE(Log::willBeLogged(Log::Level::Info));
	CHECK(Log::willBeLogged(Log::Level::Warn));
	CHECK(Log::willBeLogged(Log::Level::Fatal));

	Log::setLevel(Log::Level::Off);
	CHECK_FALSE(Log::willBeLogged(Log::Level::Fatal));

	Log::setLevel(old_level);
}

TEST_CASE("'Log' survives bad format strings", "[nettime::log]")
{
	// Must neither throw nor crash, broken messages are turned into error lines
	Log::info("Missing argument: {} {}", 1);
	Log::info("Bad format: {:Q}", 42);
	Log::debug(std::string("Runtime string {}"), "works");
	Log::log(Log::Level::Warn, Log::Location::current(), "Explicit location {}", 5);
	SUCCEED();
}

} // namespace nettime
