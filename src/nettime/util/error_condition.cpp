#include <nettime/util/error_condition.hpp>

namespace nettime
{

namespace
{

struct NetTimeErrorCategory : std::error_category {
	const char *name() const noexcept override { return "nettime error"; }

	std::string message(int code) const override
	{
		switch (static_cast<NetTimeErrc>(code)) {
		case NetTimeErrc::InvalidRate: return "Rate must be a positive number";
		case NetTimeErrc::InsufficientElapsedTime: return "Less than one frame of time is accumulated";
		case NetTimeErrc::InvalidDuration: return "Duration must not be negative";
		case NetTimeErrc::OptionMissing: return "A config object has no requested option but user assumes it exists";
		case NetTimeErrc::InvalidData: return "Input data is invalid/corrupt and can't be used";
		case NetTimeErrc::FileNotFound: return "Requested file does not exist or is inaccessible";
		// No `default` to keep `-Wswitch` useful
		}

		return "Unknown error";
	}
};

const NetTimeErrorCategory g_category;

} // anonymous namespace

std::error_condition make_error_condition(NetTimeErrc errc) noexcept
{
	return { static_cast<int>(errc), g_category };
}

} // namespace nettime
