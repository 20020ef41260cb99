#include "host_loop_sim.hpp"

#include <nettime/util/error_condition.hpp>
#include <nettime/util/exception.hpp>
#include <nettime/util/log.hpp>

#include <algorithm>
#include <cmath>
#include <optional>
#include <random>

namespace nettime::tools
{

namespace
{

constexpr double NS_PER_SECOND = 1'000'000'000.0;
// Keeps host time sums far from `int64_t` overflow (about 31 years)
constexpr double MAX_SIMULATED_NS = 1e18;

void validateParams(const HostLoopParams &params)
{
	if (!(params.host_fps > 0.0) || !std::isfinite(params.host_fps)) {
		Log::error("Host FPS must be positive, got {}", params.host_fps);
		throw Exception::fromError(NetTimeErrc::InvalidData, "invalid host fps");
	}

	// Host frame period must round to at least one nanosecond, or host time never advances
	const double period_ns = NS_PER_SECOND / params.host_fps;
	if (!(period_ns >= 1.0 && period_ns <= MAX_SIMULATED_NS)) {
		Log::error("Host FPS {} gives frame period of {} ns, out of [1; {}] ns", params.host_fps, period_ns,
			MAX_SIMULATED_NS);
		throw Exception::fromError(NetTimeErrc::InvalidData, "host fps out of range");
	}

	if (!(params.duration_sec >= 0.0) || !std::isfinite(params.duration_sec)) {
		Log::error("Simulation duration must be non-negative, got {}", params.duration_sec);
		throw Exception::fromError(NetTimeErrc::InvalidData, "invalid simulation duration");
	}

	if (params.duration_sec * NS_PER_SECOND > MAX_SIMULATED_NS) {
		Log::error("Simulation duration {} s is too long", params.duration_sec);
		throw Exception::fromError(NetTimeErrc::InvalidData, "simulation duration out of range");
	}

	if (!(params.jitter >= 0.0 && params.jitter < 1.0)) {
		Log::error("Host frame jitter must be in [0; 1), got {}", params.jitter);
		throw Exception::fromError(NetTimeErrc::InvalidData, "invalid host frame jitter");
	}
}

} // namespace

HostLoopStats runHostLoop(net::FrameAccumulator &acc, const HostLoopParams &params)
{
	using Duration = net::FrameAccumulator::Duration;

	validateParams(params);

	const auto host_period = Duration(std::llround(NS_PER_SECOND / params.host_fps));
	const auto total_time = Duration(std::llround(params.duration_sec * NS_PER_SECOND));

	std::mt19937_64 rng(params.seed);
	std::uniform_real_distribution<double> jitter_dist(-params.jitter, params.jitter);

	Log::info("Running host loop: {} FPS for {} s (jitter {}), network {} Hz, send every {} frame(s)",
		params.host_fps, params.duration_sec, params.jitter, acc.tickRateHz(), acc.messageSendRate());

	HostLoopStats stats;
	std::optional<uint32_t> last_run_frame;
	Duration host_time { 0 };

	while (host_time < total_time) {
		Duration dt = host_period;
		if (params.jitter > 0.0) {
			dt = Duration(std::llround(double(host_period.count()) * (1.0 + jitter_dist(rng))));
		}

		host_time += dt;
		stats.host_iterations++;

		acc.addElapsed(dt);
		uint32_t advanced = acc.advanceDueFrames(params.max_catchup);
		if (advanced == params.max_catchup && acc.elapsed() >= acc.perFrameDuration()) {
			Log::trace("Host iteration {} hit catch-up limit, {} ns stay banked", stats.host_iterations,
				acc.elapsed().count());
		}

		net::FrameRange frames = acc.framesToRun();
		if (frames.empty()) {
			stats.idle_iterations++;
		}

		for (uint32_t frame : frames) {
			if (last_run_frame.has_value() && frame != *last_run_frame + 1) {
				Log::warn("Frame {} run after frame {}", frame, *last_run_frame);
				stats.order_violated = true;
			}

			last_run_frame = frame;
			stats.frames_simulated++;

			if (acc.shouldSend(frame)) {
				stats.messages_sent++;
			}
		}

		stats.max_frames_per_iteration = std::max(stats.max_frames_per_iteration, frames.size());
		acc.resetFrameLag();
	}

	Log::info("Host loop finished: {} iterations ({} idle), {} frames, {} messages, at most {} frames per iteration",
		stats.host_iterations, stats.idle_iterations, stats.frames_simulated, stats.messages_sent,
		stats.max_frames_per_iteration);

	return stats;
}

} // namespace nettime::tools
