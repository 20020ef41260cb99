#include <nettime/net/frame_range.hpp>

#include "../../nettime_test_common.hpp"

#include <algorithm>
#include <iterator>
#include <vector>

namespace nettime::net
{

static_assert(std::forward_iterator<FrameRange::Iterator>);
static_assert(FrameRange().empty());
static_assert(FrameRange::inclusive(3, 5).size() == 3);
static_assert(FrameRange::ending(5, 3) == FrameRange::inclusive(3, 5));

TEST_CASE("'FrameRange' empty range", "[nettime::net::frame_range]")
{
	FrameRange range;

	CHECK(range.empty());
	CHECK(range.size() == 0);
	CHECK(range == FrameRange::emptyRange());
	CHECK_FALSE(range.contains(0));
	CHECK(std::distance(range.begin(), range.end()) == 0);

	// Reversed bounds make an empty range too
	CHECK(FrameRange::inclusive(5, 4) == FrameRange::emptyRange());
}

TEST_CASE("'FrameRange' inclusive bounds", "[nettime::net::frame_range]")
{
	FrameRange single = FrameRange::inclusive(7, 7);
	CHECK_FALSE(single.empty());
	CHECK(single.size() == 1);
	CHECK(single.first() == 7);
	CHECK(single.last() == 7);
	CHECK(single.contains(7));
	CHECK_FALSE(single.contains(6));
	CHECK_FALSE(single.contains(8));

	FrameRange range = FrameRange::inclusive(10, 14);
	std::vector<uint32_t> frames(range.begin(), range.end());
	CHECK(frames == std::vector<uint32_t> { 10, 11, 12, 13, 14 });
	CHECK(range.size() == frames.size());
}

TEST_CASE("'FrameRange' full frame number space", "[nettime::net::frame_range]")
{
	FrameRange range = FrameRange::inclusive(0, UINT32_MAX);
	CHECK(range.size() == uint64_t(UINT32_MAX) + 1);
	CHECK(range.contains(0));
	CHECK(range.contains(UINT32_MAX));

	FrameRange tail = FrameRange::inclusive(UINT32_MAX - 1, UINT32_MAX);
	std::vector<uint32_t> frames;
	std::ranges::copy(tail, std::back_inserter(frames));
	CHECK(frames == std::vector<uint32_t> { UINT32_MAX - 1, UINT32_MAX });
}

TEST_CASE("'FrameRange' counted back from the last frame", "[nettime::net::frame_range]")
{
	CHECK(FrameRange::ending(10, 0) == FrameRange::emptyRange());
	CHECK(FrameRange::ending(10, 11) == FrameRange::inclusive(0, 10));

	SECTION("Wrapping below frame 0")
	{
		FrameRange range = FrameRange::ending(1, 4);
		CHECK(range.size() == 4);
		CHECK(range.first() == UINT32_MAX - 1);
		CHECK(range.last() == 1);
		CHECK(range.contains(UINT32_MAX));
		CHECK(range.contains(0));
		CHECK_FALSE(range.contains(2));
		CHECK_FALSE(range.contains(UINT32_MAX - 2));

		std::vector<uint32_t> frames(range.begin(), range.end());
		CHECK(frames == std::vector<uint32_t> { UINT32_MAX - 1, UINT32_MAX, 0, 1 });
	}

	SECTION("Count is capped at the whole frame number space")
	{
		FrameRange range = FrameRange::ending(7, uint64_t(UINT32_MAX) + 100);
		CHECK(range.size() == uint64_t(UINT32_MAX) + 1);
		CHECK(range.first() == 8);
		CHECK(range.last() == 7);
		CHECK(range.contains(7));
		CHECK(range.contains(8));
	}
}

} // namespace nettime::net
