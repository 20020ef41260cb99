#include <nettime/net/frame_accumulator.hpp>

#include <nettime/util/error_condition.hpp>
#include <nettime/util/exception.hpp>
#include <nettime/util/log.hpp>

#include <algorithm>

namespace nettime::net
{

void FrameAccumulator::addElapsed(Duration duration)
{
	if (duration < Duration::zero()) [[unlikely]] {
		Log::error("Negative elapsed duration {} ns passed to frame accumulator", duration.count());
		throw Exception::fromError(NetTimeErrc::InvalidDuration, "elapsed duration must not be negative");
	}

	m_elapsed += duration;
}

void FrameAccumulator::advanceFrame() noexcept
{
	m_frame_number++;
	m_elapsed -= m_per_frame_duration;
	m_frame_lag++;
	m_lag_since_resync++;
}

cpp::result<void, std::error_condition> FrameAccumulator::tryAdvanceFrame() noexcept
{
	if (m_elapsed < m_per_frame_duration) {
		return cpp::failure(make_error_condition(NetTimeErrc::InsufficientElapsedTime));
	}

	advanceFrame();
	return {};
}

uint32_t FrameAccumulator::advanceDueFrames(uint32_t max_frames) noexcept
{
	uint32_t advanced = 0;

	while (advanced < max_frames && m_elapsed >= m_per_frame_duration) {
		advanceFrame();
		advanced++;
	}

	return advanced;
}

FrameRange FrameAccumulator::framesToRun() const noexcept
{
	if (m_frame_lag == 0) {
		// Nothing is owed, don't report the current frame again
		return FrameRange::emptyRange();
	}

	// Frames advanced since the resync are consecutive even if they wrapped past
	// `UINT32_MAX`. Older lag is counted back from the resync frame and can reach
	// below frame 0 after a backwards resync, clamp it there.
	const uint32_t resync_frame = m_frame_number - m_lag_since_resync;
	const uint64_t older_lag = std::min<uint64_t>(m_frame_lag - m_lag_since_resync, uint64_t(resync_frame) + 1);
	const uint64_t count = uint64_t(m_lag_since_resync) + older_lag;

	return FrameRange::ending(m_frame_number, count);
}

void FrameAccumulator::setFrameNumber(uint32_t frame)
{
	Log::debug("Network frame number resynchronized: {} -> {} (lag {})", m_frame_number, frame, m_frame_lag);
	m_frame_number = frame;
	m_lag_since_resync = 0;
}

uint32_t FrameAccumulator::tickRateHz() const noexcept
{
	return static_cast<uint32_t>(Duration(std::chrono::seconds(1)) / m_per_frame_duration);
}

void FrameAccumulator::setTickRate(uint32_t hz)
{
	if (hz == 0) [[unlikely]] {
		Log::error("Attempted to set zero network tick rate");
		throw Exception::fromError(NetTimeErrc::InvalidRate, "network tick rate must be positive");
	}

	const Duration duration = Duration(std::chrono::seconds(1)) / hz;
	if (duration <= Duration::zero()) [[unlikely]] {
		Log::error("Network tick rate {} Hz is above the limit of {} Hz", hz, MAX_TICK_RATE_HZ);
		throw Exception::fromError(NetTimeErrc::InvalidRate, "network tick rate is too high");
	}

	m_per_frame_duration = duration;
	Log::debug("Network tick rate set to {} Hz ({} ns per frame)", hz, m_per_frame_duration.count());
}

void FrameAccumulator::setPerFrameDuration(Duration duration)
{
	if (duration <= Duration::zero()) [[unlikely]] {
		Log::error("Attempted to set non-positive network frame duration {} ns", duration.count());
		throw Exception::fromError(NetTimeErrc::InvalidRate, "network frame duration must be positive");
	}

	m_per_frame_duration = duration;
	Log::debug("Network frame duration set to {} ns", m_per_frame_duration.count());
}

void FrameAccumulator::setMessageSendRate(uint32_t rate)
{
	if (rate == 0) [[unlikely]] {
		Log::error("Attempted to set zero message send rate");
		throw Exception::fromError(NetTimeErrc::InvalidRate, "message send rate must be positive");
	}

	m_message_send_rate = rate;
	Log::debug("Network messages will be sent every {} frame(s)", rate);
}

} // namespace nettime::net
