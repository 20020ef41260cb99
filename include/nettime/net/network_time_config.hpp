#pragma once

#include <nettime/common/config.hpp>
#include <nettime/visibility.hpp>

#include <cstdint>

namespace cxxopts
{

class Options;
class ParseResult;

} // namespace cxxopts

namespace nettime::net
{

class FrameAccumulator;

// Network timing settings recognized in config files and on the commandline:
//
//    [network]
//    tick_rate_hz = 20        ; --tick-rate
//    message_send_rate = 2    ; --send-rate
//
// Commandline values take priority when both are given.
class NETTIME_API NetworkTimeConfig final {
public:
	constexpr static char SECTION[] = "network";
	constexpr static char TICK_RATE_KEY[] = "tick_rate_hz";
	constexpr static char SEND_RATE_KEY[] = "message_send_rate";

	// Frames per second. Zero means "leave the accumulator's default rate".
	uint32_t tickRateHz() const noexcept { return m_tick_rate_hz; }
	void setTickRateHz(uint32_t hz) noexcept { m_tick_rate_hz = hz; }
	// Send a message every N frames
	uint32_t messageSendRate() const noexcept { return m_message_send_rate; }
	void setMessageSendRate(uint32_t rate) noexcept { m_message_send_rate = rate; }

	// Add config file options to the scheme
	static void addSchemeEntries(Config::Scheme &scheme);
	// Fill from config file options. Throws `nettime::Exception` (`NetTimeErrc::InvalidRate`)
	// if a value is out of range.
	void fillFromConfig(const Config &config);

	// Add commandline options related to this config
	static void addOptions(cxxopts::Options &opts);
	// Fill from parsed commandline options, only the ones actually given are applied.
	// Throws `nettime::Exception` (`NetTimeErrc::InvalidRate`) if a value is out of range.
	void fill(const cxxopts::ParseResult &result);

	// Configure `acc` with these settings. Throws `nettime::Exception`
	// (`NetTimeErrc::InvalidRate`) if message send rate is zero.
	void applyTo(FrameAccumulator &acc) const;

private:
	uint32_t m_tick_rate_hz = 0;
	uint32_t m_message_send_rate = 1;
};

} // namespace nettime::net
