#pragma once

#include <version>

#if defined(__cpp_lib_source_location) && __cpp_lib_source_location >= 201907L

	#include <source_location>

namespace extras
{

using source_location = std::source_location;

} // namespace extras

#else

	#include <cstdint>

namespace extras
{

// Stand-in for `std::source_location` on standard libraries that don't ship it yet.
// Only file name and line are captured, which is all the logger and exceptions print.
class source_location final {
public:
	constexpr static source_location current(const char *file = __builtin_FILE(),
		uint_least32_t line = __builtin_LINE()) noexcept
	{
		source_location result;
		result.m_file = file;
		result.m_line = line;
		return result;
	}

	constexpr const char *file_name() const noexcept { return m_file; }
	constexpr uint_least32_t line() const noexcept { return m_line; }

private:
	const char *m_file = "unknown";
	uint_least32_t m_line = 0;
};

} // namespace extras

#endif
