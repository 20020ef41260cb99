#include <nettime/net/network_time_config.hpp>

#include <nettime/net/frame_accumulator.hpp>
#include <nettime/util/error_condition.hpp>
#include <nettime/util/exception.hpp>
#include <nettime/util/log.hpp>

#include <cxxopts/cxxopts.hpp>

#include <limits>

namespace nettime::net
{

namespace
{

uint32_t checkedRate(int64_t value, std::string_view name, bool allow_zero,
	uint32_t max_value = std::numeric_limits<uint32_t>::max())
{
	if (value < (allow_zero ? 0 : 1) || value > max_value) {
		Log::error("Network option '{}' has out of range value {}", name, value);
		throw Exception::fromError(NetTimeErrc::InvalidRate, "network rate option out of range");
	}

	return static_cast<uint32_t>(value);
}

} // namespace

void NetworkTimeConfig::addSchemeEntries(Config::Scheme &scheme)
{
	scheme.push_back({ SECTION, TICK_RATE_KEY, "Network frames per second (0 - default of 100 frames per minute)",
		int64_t { 0 } });
	scheme.push_back({ SECTION, SEND_RATE_KEY, "Send network message every N frames", int64_t { 1 } });
}

void NetworkTimeConfig::fillFromConfig(const Config &config)
{
	m_tick_rate_hz = checkedRate(config.getInt64(SECTION, TICK_RATE_KEY), TICK_RATE_KEY, true,
		FrameAccumulator::MAX_TICK_RATE_HZ);
	m_message_send_rate = checkedRate(config.getInt64(SECTION, SEND_RATE_KEY), SEND_RATE_KEY, false);
}

void NetworkTimeConfig::addOptions(cxxopts::Options &opts)
{
	// clang-format off: breaks nice chaining syntax
	opts.add_options("Network")
		("tick-rate", "Network frames per second (overrides config file)", cxxopts::value<int64_t>())
		("send-rate", "Send network message every N frames (overrides config file)", cxxopts::value<int64_t>());
	// clang-format on
}

void NetworkTimeConfig::fill(const cxxopts::ParseResult &result)
{
	if (result.count("tick-rate")) {
		m_tick_rate_hz = checkedRate(result["tick-rate"].as<int64_t>(), "tick-rate", true,
			FrameAccumulator::MAX_TICK_RATE_HZ);
	}

	if (result.count("send-rate")) {
		m_message_send_rate = checkedRate(result["send-rate"].as<int64_t>(), "send-rate", false);
	}
}

void NetworkTimeConfig::applyTo(FrameAccumulator &acc) const
{
	// Validate before touching anything so `acc` is not left half-configured
	checkedRate(m_tick_rate_hz, TICK_RATE_KEY, true, FrameAccumulator::MAX_TICK_RATE_HZ);
	checkedRate(m_message_send_rate, SEND_RATE_KEY, false);

	if (m_tick_rate_hz != 0) {
		acc.setTickRate(m_tick_rate_hz);
	}

	acc.setMessageSendRate(m_message_send_rate);
}

} // namespace nettime::net
