#include <nettime/util/exception.hpp>

#include <nettime/util/error_condition.hpp>

#include "../../nettime_test_common.hpp"

#include <string_view>

namespace nettime
{

TEST_CASE("'NetTimeErrc' condition category", "[nettime::error_condition]")
{
	std::error_condition cond = NetTimeErrc::InvalidRate;

	CHECK(cond == NetTimeErrc::InvalidRate);
	CHECK(cond != NetTimeErrc::InsufficientElapsedTime);
	CHECK(std::string_view(cond.category().name()) == "nettime error");
	CHECK(cond.message() == "Rate must be a positive number");
	CHECK(make_error_condition(NetTimeErrc::InsufficientElapsedTime).message()
		== "Less than one frame of time is accumulated");
}

TEST_CASE("'Exception' carries condition and location", "[nettime::exception]")
{
	const auto loc = Exception::Location::current();
	Exception ex = Exception::fromError(NetTimeErrc::InvalidRate, "tick rate is zero", loc);

	CHECK(ex.error() == NetTimeErrc::InvalidRate);
	CHECK(std::string_view(ex.what()) == "tick rate is zero (cond [nettime error:1] Rate must be a positive number)");
	CHECK(ex.where().line() == loc.line());
	CHECK(std::string_view(ex.where().file_name()) == loc.file_name());

	Exception from_code = Exception::fromErrorCode(std::make_error_code(std::errc::no_such_file_or_directory),
		"can't open");
	CHECK(from_code.error() == std::errc::no_such_file_or_directory);

	CHECK_THROWS_MATCHES(throw ex, Exception, test::errcExceptionMatcher(NetTimeErrc::InvalidRate));
}

} // namespace nettime
