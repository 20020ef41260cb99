#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <iterator>

namespace nettime::net
{

// Inclusive range of network frame numbers `[first; last]`, possibly empty.
//
// Frame numbers are modulo 2^32, so a range built with `ending()` may wrap
// around `UINT32_MAX` and have `first() > last()`. Iterating yields frame
// numbers in advancing order, i.e. `UINT32_MAX` is followed by 0:
//    for (uint32_t frame : accumulator.framesToRun()) { ... }
class FrameRange {
public:
	class Iterator {
	public:
		using iterator_category = std::forward_iterator_tag;
		using value_type = uint32_t;
		using difference_type = std::ptrdiff_t;
		using pointer = const uint32_t *;
		using reference = uint32_t;

		constexpr Iterator() = default;
		// Position is kept in 64 bits so the past-the-end iterator
		// of a range ending at `UINT32_MAX` does not wrap around.
		// Dereferencing truncates it back to a frame number.
		constexpr explicit Iterator(uint64_t position) noexcept : m_position(position) {}

		constexpr uint32_t operator*() const noexcept { return static_cast<uint32_t>(m_position); }

		constexpr Iterator &operator++() noexcept
		{
			++m_position;
			return *this;
		}

		constexpr Iterator operator++(int) noexcept
		{
			Iterator it(m_position);
			++m_position;
			return it;
		}

		constexpr bool operator==(const Iterator &) const noexcept = default;

	private:
		uint64_t m_position = 0;
	};

	// Default-constructed range is empty
	constexpr FrameRange() = default;

	constexpr static FrameRange emptyRange() noexcept { return FrameRange(); }

	// Range `[first; last]`. Yields an empty range if `first > last`.
	constexpr static FrameRange inclusive(uint32_t first, uint32_t last) noexcept
	{
		if (first > last) {
			return FrameRange();
		}

		return FrameRange(first, uint64_t(last) - uint64_t(first) + 1);
	}

	// `count` consecutive frames ending at `last`, wrapping from 0 to `UINT32_MAX`
	// when going back past frame 0. `count` is capped at the whole frame number space.
	constexpr static FrameRange ending(uint32_t last, uint64_t count) noexcept
	{
		if (count == 0) {
			return FrameRange();
		}

		count = count < FRAME_SPACE_SIZE ? count : FRAME_SPACE_SIZE;
		return FrameRange(static_cast<uint32_t>(uint64_t(last) + 1 - count), count);
	}

	constexpr bool empty() const noexcept { return m_size == 0; }
	constexpr uint64_t size() const noexcept { return m_size; }

	// Must not be called on empty range
	constexpr uint32_t first() const noexcept
	{
		assert(!empty());
		return m_first;
	}

	// Must not be called on empty range
	constexpr uint32_t last() const noexcept
	{
		assert(!empty());
		return static_cast<uint32_t>(uint64_t(m_first) + m_size - 1);
	}

	constexpr bool contains(uint32_t frame) const noexcept { return uint32_t(frame - m_first) < m_size; }

	constexpr Iterator begin() const noexcept { return Iterator(m_first); }
	constexpr Iterator end() const noexcept { return Iterator(uint64_t(m_first) + m_size); }

	constexpr bool operator==(const FrameRange &) const noexcept = default;

private:
	constexpr static uint64_t FRAME_SPACE_SIZE = uint64_t(1) << 32;

	constexpr FrameRange(uint32_t first, uint64_t size) noexcept : m_first(first), m_size(size) {}

	// Empty range always has `m_first == 0`, defaulted comparison relies on it
	uint32_t m_first = 0;
	uint64_t m_size = 0;
};

} // namespace nettime::net
