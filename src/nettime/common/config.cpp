#include <nettime/common/config.hpp>

#include <nettime/util/error_condition.hpp>
#include <nettime/util/exception.hpp>
#include <nettime/util/log.hpp>

#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <system_error>

using std::string_view;

namespace nettime
{

Config::Config(std::filesystem::path config_filepath, Config::Scheme scheme) : m_path(std::move(config_filepath))
{
	m_ini.SetUnicode();

	if (!m_path.empty()) {
		std::error_code ec;
		if (std::filesystem::exists(m_path, ec)) {
			const std::string filepath = m_path.string();
			if (SI_Error rc = m_ini.LoadFile(filepath.c_str()); rc < 0) {
				Log::error("Failed to load config file '{}' (SimpleIni error {})", filepath, int(rc));
				throw Exception::fromError(NetTimeErrc::InvalidData, "config file can't be loaded");
			}

			Log::info("Loaded config from '{}'", filepath);
		} else {
			Log::info("Config file '{}' does not exist, using default values", m_path.string());
		}
	}

	for (const SchemeEntry &entry : scheme) {
		option_t value;
		const char *value_ptr = m_ini.GetValue(entry.section.c_str(), entry.parameter_name.c_str());

		if (!value_ptr) {
			const std::string value_str = optionToString(entry.default_value);
			// Only one-line descriptions are supported, every comment line must start with ';'
			const std::string comment = "; " + entry.description;
			m_ini.SetValue(entry.section.c_str(), entry.parameter_name.c_str(), value_str.c_str(), comment.c_str());
			value = entry.default_value;
		} else {
			auto parsed = optionFromString(string_view(value_ptr), entry.default_value.index());
			if (!parsed.has_value()) {
				Log::error("Config option {}/{} has unparsable value '{}'", entry.section, entry.parameter_name,
					value_ptr);
				throw Exception::fromError(NetTimeErrc::InvalidData, "config option value does not match its type");
			}

			value = std::move(*parsed);
		}

		m_data[entry.section][entry.parameter_name] = std::move(value);
	}
}

Config::~Config() noexcept = default;

void Config::patch(string_view section, string_view parameter_name, string_view value_string, Location loc)
{
	if (auto it_ext = m_data.find(section); it_ext != m_data.end()) {
		if (auto it_inter = it_ext->second.find(parameter_name); it_inter != it_ext->second.end()) {
			auto parsed = optionFromString(value_string, it_inter->second.index());
			if (!parsed.has_value()) {
				Log::log(Log::Level::Error, loc, "Can't patch option {}/{} with value '{}'", section, parameter_name,
					value_string);
				throw Exception::fromError(NetTimeErrc::InvalidData, "patch value does not match option type", loc);
			}

			it_inter->second = std::move(*parsed);

			const std::string str = optionToString(it_inter->second);
			m_ini.SetValue(it_ext->first.c_str(), it_inter->first.c_str(), str.c_str());
			return;
		}
	}

	Log::log(Log::Level::Error, loc, "Option {}/{} not found for patching", section, parameter_name);
	throw Exception::fromError(NetTimeErrc::OptionMissing, "missing config option for patching", loc);
}

void Config::save() const
{
	if (m_path.empty()) {
		Log::warn("Config has no file path, not saving");
		return;
	}

	std::error_code ec;
	if (m_path.has_parent_path()) {
		std::filesystem::create_directories(m_path.parent_path(), ec);
		if (ec) {
			Log::error("Can't create directories for config file '{}'", m_path.string());
			throw Exception::fromErrorCode(ec, "can't create config directory");
		}
	}

	const std::string filepath = m_path.string();
	if (SI_Error rc = m_ini.SaveFile(filepath.c_str()); rc < 0) {
		Log::error("Failed to save config file '{}' (SimpleIni error {})", filepath, int(rc));
		throw Exception::fromError(NetTimeErrc::FileNotFound, "config file can't be written");
	}

	Log::debug("Saved config to '{}'", filepath);
}

const Config::option_t *Config::findOption(string_view section, string_view parameter_name) const noexcept
{
	auto it_ext = m_data.find(section);
	if (it_ext == m_data.end()) {
		return nullptr;
	}

	auto it_inter = it_ext->second.find(parameter_name);
	if (it_inter == it_ext->second.end()) {
		return nullptr;
	}

	return &it_inter->second;
}

std::optional<std::string> Config::optionString(string_view section, string_view parameter_name) const
{
	if (const option_t *opt = findOption(section, parameter_name); opt) {
		if (auto *value = std::get_if<std::string>(opt); value) {
			return *value;
		}
	}

	return std::nullopt;
}

std::optional<int64_t> Config::optionInt64(string_view section, string_view parameter_name) const
{
	if (const option_t *opt = findOption(section, parameter_name); opt) {
		if (auto *value = std::get_if<int64_t>(opt); value) {
			return *value;
		}
	}

	return std::nullopt;
}

std::optional<double> Config::optionDouble(string_view section, string_view parameter_name) const
{
	if (const option_t *opt = findOption(section, parameter_name); opt) {
		if (auto *value = std::get_if<double>(opt); value) {
			return *value;
		}
	}

	return std::nullopt;
}

std::optional<bool> Config::optionBool(string_view section, string_view parameter_name) const
{
	if (const option_t *opt = findOption(section, parameter_name); opt) {
		if (auto *value = std::get_if<bool>(opt); value) {
			return *value;
		}
	}

	return std::nullopt;
}

std::string Config::getString(string_view section, string_view parameter_name, Location loc) const
{
	if (auto opt = optionString(section, parameter_name); opt.has_value()) {
		return std::move(*opt);
	}

	Log::log(Log::Level::Error, loc, "Option {}/{} (string) not found", section, parameter_name);
	throw Exception::fromError(NetTimeErrc::OptionMissing, "missing config option assumed existing", loc);
}

int64_t Config::getInt64(string_view section, string_view parameter_name, Location loc) const
{
	if (auto opt = optionInt64(section, parameter_name); opt.has_value()) {
		return *opt;
	}

	Log::log(Log::Level::Error, loc, "Option {}/{} (int64) not found", section, parameter_name);
	throw Exception::fromError(NetTimeErrc::OptionMissing, "missing config option assumed existing", loc);
}

double Config::getDouble(string_view section, string_view parameter_name, Location loc) const
{
	if (auto opt = optionDouble(section, parameter_name); opt.has_value()) {
		return *opt;
	}

	Log::log(Log::Level::Error, loc, "Option {}/{} (double) not found", section, parameter_name);
	throw Exception::fromError(NetTimeErrc::OptionMissing, "missing config option assumed existing", loc);
}

bool Config::getBool(string_view section, string_view parameter_name, Location loc) const
{
	if (auto opt = optionBool(section, parameter_name); opt.has_value()) {
		return *opt;
	}

	Log::log(Log::Level::Error, loc, "Option {}/{} (bool) not found", section, parameter_name);
	throw Exception::fromError(NetTimeErrc::OptionMissing, "missing config option assumed existing", loc);
}

std::string Config::optionToString(const option_t &value)
{
	switch (value.index()) {
	case 0:
		static_assert(std::is_same_v<std::string, std::variant_alternative_t<0, option_t>>);
		return std::get<std::string>(value);

	case 1:
		static_assert(std::is_same_v<int64_t, std::variant_alternative_t<1, option_t>>);
		return fmt::format("{}", std::get<int64_t>(value));

	case 2:
		static_assert(std::is_same_v<double, std::variant_alternative_t<2, option_t>>);
		return fmt::format("{}", std::get<double>(value));

	case 3:
		static_assert(std::is_same_v<bool, std::variant_alternative_t<3, option_t>>);
		return std::get<bool>(value) ? "true" : "false";

	default:
		static_assert(std::variant_size_v<option_t> == 4);
		return "";
	}
}

std::optional<Config::option_t> Config::optionFromString(string_view s, size_t type)
{
	// Tolerate whitespace around numbers, SimpleIni only trims the line ends
	auto trim = [](string_view str) {
		while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front()))) {
			str.remove_prefix(1);
		}
		while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back()))) {
			str.remove_suffix(1);
		}
		return str;
	};

	switch (type) {
	case 0:
		return option_t(std::string(s));

	case 1: {
		string_view t = trim(s);
		int64_t value = 0;
		auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), value);
		if (ec != std::errc() || ptr != t.data() + t.size() || t.empty()) {
			return std::nullopt;
		}
		return option_t(value);
	}

	case 2: {
		string_view t = trim(s);
		double value = 0.0;
		auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), value);
		if (ec != std::errc() || ptr != t.data() + t.size() || t.empty()) {
			return std::nullopt;
		}
		return option_t(value);
	}

	case 3: {
		string_view t = trim(s);
		auto equals_icase = [t](string_view word) {
			if (t.size() != word.size()) {
				return false;
			}
			for (size_t i = 0; i < t.size(); i++) {
				if (std::tolower(static_cast<unsigned char>(t[i])) != word[i]) {
					return false;
				}
			}
			return true;
		};

		if (equals_icase("true") || equals_icase("1")) {
			return option_t(true);
		}
		if (equals_icase("false") || equals_icase("0")) {
			return option_t(false);
		}
		return std::nullopt;
	}

	default:
		static_assert(std::variant_size_v<option_t> == 4);
		return std::nullopt;
	}
}

} // namespace nettime
