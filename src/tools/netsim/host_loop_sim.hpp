#pragma once

#include <nettime/net/frame_accumulator.hpp>

#include <cstdint>
#include <limits>

namespace nettime::tools
{

struct HostLoopParams {
	// Host loop iterations per second
	double host_fps = 60.0;
	// Simulated wall-clock time to run for, in seconds
	double duration_sec = 10.0;
	// Relative host frame time variation, each iteration takes
	// `1 / host_fps * (1 + U(-jitter; jitter))` seconds. Must be in [0; 1).
	double jitter = 0.0;
	uint64_t seed = 0;
	// Maximal number of network frames advanced in one host iteration
	uint32_t max_catchup = std::numeric_limits<uint32_t>::max();
};

struct HostLoopStats {
	uint64_t host_iterations = 0;
	// Iterations which didn't run any network frame
	uint64_t idle_iterations = 0;
	uint64_t frames_simulated = 0;
	uint64_t messages_sent = 0;
	uint64_t max_frames_per_iteration = 0;
	// Set if frames were not run in strictly consecutive order
	bool order_violated = false;
};

// Drive `acc` the way a real host loop would, but with a synthetic clock:
// bank host frame time, advance due frames, run every frame from `framesToRun()`
// counting messages due on them, then reset the lag.
// Throws `nettime::Exception` (`NetTimeErrc::InvalidData`) on invalid `params`.
HostLoopStats runHostLoop(net::FrameAccumulator &acc, const HostLoopParams &params);

} // namespace nettime::tools
