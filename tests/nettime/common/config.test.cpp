#include <nettime/common/config.hpp>

#include "../../nettime_test_common.hpp"

#include <filesystem>
#include <fstream>

namespace nettime
{

namespace
{

Config::Scheme testScheme()
{
	Config::Scheme s;

	s.push_back({ "network", "tick_rate_hz", "Network frames per second", int64_t { 0 } });
	s.push_back({ "network", "message_send_rate", "Send every N frames", int64_t { 1 } });
	s.push_back({ "sim", "host_fps", "Host loop FPS", 60.0 });
	s.push_back({ "sim", "name", "Session name", std::string("default") });
	s.push_back({ "dev", "verbose", "Verbose logging", false });

	return s;
}

// Unique per-test file removed on scope exit
class TempIniFile {
public:
	explicit TempIniFile(const char *name)
		: m_path(std::filesystem::temp_directory_path() / "nettime_tests" / name)
	{
		std::filesystem::create_directories(m_path.parent_path());
		std::filesystem::remove(m_path);
	}

	~TempIniFile()
	{
		std::error_code ec;
		std::filesystem::remove(m_path, ec);
	}

	void write(const char *text) const
	{
		std::ofstream out(m_path);
		out << text;
	}

	const std::filesystem::path &path() const noexcept { return m_path; }

private:
	std::filesystem::path m_path;
};

} // namespace

TEST_CASE("'Config' defaults without a file", "[nettime::config]")
{
	Config config({}, testScheme());

	CHECK(config.getInt64("network", "tick_rate_hz") == 0);
	CHECK(config.getInt64("network", "message_send_rate") == 1);
	CHECK(config.getDouble("sim", "host_fps") == 60.0);
	CHECK(config.getString("sim", "name") == "default");
	CHECK(config.getBool("dev", "verbose") == false);

	// Type mismatch is reported as absent value
	CHECK_FALSE(config.optionDouble("network", "tick_rate_hz").has_value());
	CHECK_FALSE(config.optionInt64("nope", "tick_rate_hz").has_value());

	CHECK_THROWS_MATCHES(config.getInt64("network", "missing"), Exception,
		test::errcExceptionMatcher(NetTimeErrc::OptionMissing));
	CHECK_THROWS_MATCHES(config.getBool("network", "tick_rate_hz"), Exception,
		test::errcExceptionMatcher(NetTimeErrc::OptionMissing));
}

TEST_CASE("'Config' loads values from file", "[nettime::config]")
{
	TempIniFile file("config_load.ini");
	file.write("[network]\n"
			   "tick_rate_hz = 20\n"
			   "message_send_rate = 3\n"
			   "[dev]\n"
			   "verbose = TRUE\n");

	Config config(file.path(), testScheme());

	CHECK(config.getInt64("network", "tick_rate_hz") == 20);
	CHECK(config.getInt64("network", "message_send_rate") == 3);
	CHECK(config.getBool("dev", "verbose") == true);
	// Absent in file - default
	CHECK(config.getDouble("sim", "host_fps") == 60.0);
}

TEST_CASE("'Config' rejects values not matching option type", "[nettime::config]")
{
	TempIniFile file("config_bad.ini");
	file.write("[network]\n"
			   "tick_rate_hz = fast\n");

	CHECK_THROWS_MATCHES(Config(file.path(), testScheme()), Exception,
		test::errcExceptionMatcher(NetTimeErrc::InvalidData));
}

TEST_CASE("'Config' patching", "[nettime::config]")
{
	Config config({}, testScheme());

	config.patch("network", "tick_rate_hz", "64");
	CHECK(config.getInt64("network", "tick_rate_hz") == 64);

	config.patch("sim", "host_fps", "144.5");
	CHECK(config.getDouble("sim", "host_fps") == 144.5);

	config.patch("dev", "verbose", "true");
	CHECK(config.getBool("dev", "verbose"));

	CHECK_THROWS_MATCHES(config.patch("network", "no_such_option", "1"), Exception,
		test::errcExceptionMatcher(NetTimeErrc::OptionMissing));
	CHECK_THROWS_MATCHES(config.patch("network", "tick_rate_hz", "12abc"), Exception,
		test::errcExceptionMatcher(NetTimeErrc::InvalidData));
	// Failed patch keeps the old value
	CHECK(config.getInt64("network", "tick_rate_hz") == 64);
}

TEST_CASE("'Config' save and reload", "[nettime::config]")
{
	TempIniFile file("config_save.ini");

	{
		Config config(file.path(), testScheme());
		config.patch("network", "message_send_rate", "5");
		config.patch("sim", "name", "replay");
		config.save();
	}

	REQUIRE(std::filesystem::exists(file.path()));

	Config reloaded(file.path(), testScheme());
	CHECK(reloaded.getInt64("network", "message_send_rate") == 5);
	CHECK(reloaded.getString("sim", "name") == "replay");
	// Defaults are written out as well
	CHECK(reloaded.getInt64("network", "tick_rate_hz") == 0);
	CHECK(reloaded.getDouble("sim", "host_fps") == 60.0);
}

TEST_CASE("'Config' option string conversion", "[nettime::config]")
{
	CHECK(Config::optionToString(int64_t { -42 }) == "-42");
	CHECK(Config::optionToString(true) == "true");
	CHECK(Config::optionToString(std::string("abc")) == "abc");

	CHECK(Config::optionFromString(" 17 ", 1) == Config::option_t(int64_t { 17 }));
	CHECK(Config::optionFromString("0.25", 2) == Config::option_t(0.25));
	CHECK(Config::optionFromString("False", 3) == Config::option_t(false));
	CHECK(Config::optionFromString("1", 3) == Config::option_t(true));

	CHECK_FALSE(Config::optionFromString("", 1).has_value());
	CHECK_FALSE(Config::optionFromString("1.5", 1).has_value());
	CHECK_FALSE(Config::optionFromString("yes", 3).has_value());
}

} // namespace nettime
