#pragma once

#include <nettime/visibility.hpp>

#include <extras/source_location.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#define SI_CONVERT_GENERIC
#include <simpleini/SimpleIni.h>

namespace nettime
{

// INI-backed configuration with a fixed scheme of known options.
//
// Every option declared in the scheme is guaranteed to exist after construction:
// missing ones take their default value. The type of an option is defined by
// the type of its default value and values read from file are parsed accordingly.
class NETTIME_API Config {
public:
	using Location = extras::source_location;
	using option_t = std::variant<std::string, int64_t, double, bool>;

	struct SchemeEntry {
		std::string section;
		std::string parameter_name;
		std::string description;
		option_t default_value;
	};
	using Scheme = std::vector<SchemeEntry>;

	// Load options from `config_filepath`. Missing file is not an error, all
	// options will just take their defaults. Empty path means "defaults only".
	// Throws `nettime::Exception` (`NetTimeErrc::InvalidData`) if the file
	// can't be parsed or some value does not match its option type.
	Config(std::filesystem::path config_filepath, Scheme scheme);
	Config(Config &&) = delete;
	Config(const Config &) = delete;
	Config &operator=(Config &&) = delete;
	Config &operator=(const Config &) = delete;
	~Config() noexcept;

	// Override option value from string, parsed according to the option type.
	// Throws `nettime::Exception` with `NetTimeErrc::OptionMissing` if there is no such
	// option or with `NetTimeErrc::InvalidData` if the string can't be parsed.
	void patch(std::string_view section, std::string_view parameter_name, std::string_view value_string,
		Location loc = Location::current());

	// Write current values (including defaults for missing options) back to the file.
	// Throws `nettime::Exception` if writing failed.
	void save() const;

	std::optional<std::string> optionString(std::string_view section, std::string_view parameter_name) const;
	std::optional<int64_t> optionInt64(std::string_view section, std::string_view parameter_name) const;
	std::optional<double> optionDouble(std::string_view section, std::string_view parameter_name) const;
	std::optional<bool> optionBool(std::string_view section, std::string_view parameter_name) const;

	// These throw `nettime::Exception` (`NetTimeErrc::OptionMissing`) if the option is absent
	std::string getString(std::string_view section, std::string_view parameter_name,
		Location loc = Location::current()) const;
	int64_t getInt64(std::string_view section, std::string_view parameter_name,
		Location loc = Location::current()) const;
	double getDouble(std::string_view section, std::string_view parameter_name,
		Location loc = Location::current()) const;
	bool getBool(std::string_view section, std::string_view parameter_name, Location loc = Location::current()) const;

	const std::filesystem::path &path() const noexcept { return m_path; }

	static std::string optionToString(const option_t &value);
	// Returns `std::nullopt` if `s` can't be parsed as the type with index `type` in `option_t`
	static std::optional<option_t> optionFromString(std::string_view s, size_t type);

private:
	std::map<std::string, std::map<std::string, option_t, std::less<>>, std::less<>> m_data;
	std::filesystem::path m_path;
	CSimpleIniA m_ini;

	const option_t *findOption(std::string_view section, std::string_view parameter_name) const noexcept;
};

} // namespace nettime
