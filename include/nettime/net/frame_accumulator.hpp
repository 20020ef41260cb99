#pragma once

#include <nettime/net/frame_range.hpp>
#include <nettime/visibility.hpp>

#include <cpp/result.hpp>

#include <chrono>
#include <cstdint>
#include <limits>
#include <system_error>

namespace nettime::net
{

// Tracks network frame timing separately from the host loop timing.
//
// The host loop banks wall-clock time with `addElapsed()` and drains it
// in fixed `perFrameDuration()` chunks, each chunk advancing the frame number
// by one. Frames advanced since the last `resetFrameLag()` form the range
// returned by `framesToRun()`, i.e. the frames simulation still has to execute.
//
// Typical host loop iteration:
//    acc.addElapsed(dt);
//    acc.advanceDueFrames();
//    for (uint32_t frame : acc.framesToRun()) {
//        simulate(frame);
//        if (acc.shouldSend(frame)) { sendState(frame); }
//    }
//    acc.resetFrameLag();
//
// This is a plain value type with no internal synchronization.
class NETTIME_API FrameAccumulator {
public:
	using Duration = std::chrono::nanoseconds;

	// Default rate is 100 frames per minute
	constexpr static uint32_t DEFAULT_TICKS_PER_MINUTE = 100;
	// Send a message with every frame by default
	constexpr static uint32_t DEFAULT_MESSAGE_SEND_RATE = 1;
	// Initial lag of one gives simulation a chance to run frame 0
	// before any wall-clock time is accumulated
	constexpr static uint32_t DEFAULT_FRAME_LAG = 1;

	constexpr static Duration DEFAULT_PER_FRAME_DURATION = Duration(std::chrono::minutes(1))
		/ DEFAULT_TICKS_PER_MINUTE;
	// One nanosecond per frame
	constexpr static uint32_t MAX_TICK_RATE_HZ = 1'000'000'000;

	FrameAccumulator() = default;
	FrameAccumulator(FrameAccumulator &&) = default;
	FrameAccumulator(const FrameAccumulator &) = default;
	FrameAccumulator &operator=(FrameAccumulator &&) = default;
	FrameAccumulator &operator=(const FrameAccumulator &) = default;
	~FrameAccumulator() = default;

	// Bank `duration` of wall-clock time. Does not advance frames by itself.
	// Throws `nettime::Exception` (`NetTimeErrc::InvalidDuration`) if `duration` is negative.
	void addElapsed(Duration duration);

	// Advance the frame number by one, spending exactly one frame of accumulated time
	// and increasing frame lag by one. Does not check that enough time was accumulated,
	// `elapsed()` goes negative if it was not.
	void advanceFrame() noexcept;
	// Same as `advanceFrame()` but fails with `NetTimeErrc::InsufficientElapsedTime`
	// and leaves the state untouched if less than one frame of time is accumulated.
	cpp::result<void, std::error_condition> tryAdvanceFrame() noexcept;
	// Advance frames while at least one frame of time is accumulated, but not more
	// than `max_frames` times. Time not spent due to the limit stays accumulated.
	// Returns the number of frames advanced.
	uint32_t advanceDueFrames(uint32_t max_frames = std::numeric_limits<uint32_t>::max()) noexcept;

	// Frames advanced since the last `resetFrameLag()`, ending at `frameNumber()`.
	// Empty when frame lag is zero. Frames advanced past `UINT32_MAX` wrap to 0
	// and the range wraps with them. Lag accumulated before `setFrameNumber()`
	// is counted back from the new frame number but never below frame 0.
	FrameRange framesToRun() const noexcept;
	// Mark all frames from `framesToRun()` as processed
	void resetFrameLag() noexcept
	{
		m_frame_lag = 0;
		m_lag_since_resync = 0;
	}

	// Whether a network message should be sent on the current frame
	bool shouldSendNow() const noexcept { return shouldSend(m_frame_number); }
	// Whether a network message should be sent on `frame`.
	// Depends only on the frame number, not on how it was reached.
	bool shouldSend(uint32_t frame) const noexcept { return frame % m_message_send_rate == 0; }

	uint32_t frameNumber() const noexcept { return m_frame_number; }
	// Force the frame number, e.g. to resynchronize with an authoritative server.
	// Neither frame lag nor accumulated time are touched.
	void setFrameNumber(uint32_t frame);

	// Accumulated time not yet spent on frames
	Duration elapsed() const noexcept { return m_elapsed; }
	Duration perFrameDuration() const noexcept { return m_per_frame_duration; }
	// Frame rate implied by `perFrameDuration()`, rounded down
	uint32_t tickRateHz() const noexcept;

	// Set frame rate in hertz (frames per second). Per-frame duration becomes
	// one second divided by `hz`, rounded down to whole nanoseconds.
	// Throws `nettime::Exception` (`NetTimeErrc::InvalidRate`) if `hz` is zero
	// or so high that the duration rounds down to zero (above 1 GHz).
	void setTickRate(uint32_t hz);
	// Set per-frame duration directly, for rates not expressible in whole hertz.
	// Throws `nettime::Exception` (`NetTimeErrc::InvalidRate`) if `duration` is not positive.
	void setPerFrameDuration(Duration duration);

	// Messages are sent every N frames where N is this value
	uint32_t messageSendRate() const noexcept { return m_message_send_rate; }
	// Throws `nettime::Exception` (`NetTimeErrc::InvalidRate`) if `rate` is zero
	void setMessageSendRate(uint32_t rate);

	// Number of frames the simulation is behind the network timeline.
	// Usually 0 or 1 if the host loop keeps up.
	uint32_t frameLag() const noexcept { return m_frame_lag; }

	bool operator==(const FrameAccumulator &) const noexcept = default;

private:
	uint32_t m_frame_number = 0;
	Duration m_elapsed { 0 };
	Duration m_per_frame_duration = DEFAULT_PER_FRAME_DURATION;
	uint32_t m_message_send_rate = DEFAULT_MESSAGE_SEND_RATE;
	uint32_t m_frame_lag = DEFAULT_FRAME_LAG;
	// Part of `m_frame_lag` advanced after the last `setFrameNumber()`
	uint32_t m_lag_since_resync = DEFAULT_FRAME_LAG;
};

} // namespace nettime::net
