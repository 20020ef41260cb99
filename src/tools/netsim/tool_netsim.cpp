#include "host_loop_sim.hpp"

#include <nettime/common/config.hpp>
#include <nettime/net/frame_accumulator.hpp>
#include <nettime/net/network_time_config.hpp>
#include <nettime/util/exception.hpp>
#include <nettime/util/log.hpp>

#include <cxxopts/cxxopts.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstdio>
#include <cstdlib>

namespace
{

cxxopts::Options makeCliOptions()
{
	cxxopts::Options options("nettime_sim", "Headless host loop driving a network frame accumulator");

	// clang-format off: breaks nice chaining syntax
	options.add_options()
		("h,help", "Display help information")
		("c,config", "INI config file with [network] section", cxxopts::value<std::string>())
		("log-level", "Logging level (trace, debug, info, warn, error, fatal, off)",
			cxxopts::value<std::string>()->default_value("info"));

	options.add_options("Host loop")
		("host-fps", "Host loop iterations per second", cxxopts::value<double>()->default_value("60"))
		("duration", "Simulated seconds to run", cxxopts::value<double>()->default_value("10"))
		("jitter", "Relative host frame time variation, [0; 1)", cxxopts::value<double>()->default_value("0"))
		("seed", "Jitter random seed", cxxopts::value<uint64_t>()->default_value("0"))
		("max-catchup", "Max network frames advanced per host iteration (0 - unlimited)",
			cxxopts::value<uint32_t>()->default_value("0"));
	// clang-format on

	nettime::net::NetworkTimeConfig::addOptions(options);

	return options;
}

} // namespace

int main(int argc, char *argv[])
{
	using nettime::Log;

	cxxopts::Options opts = makeCliOptions();
	cxxopts::ParseResult args;

	try {
		args = opts.parse(argc, argv);
	}
	catch (const cxxopts::exceptions::exception &ex) {
		fmt::print(stderr, "Invalid options provided, use -h (--help) to get usage help.\nError details:\n{}\n",
			ex.what());
		return EXIT_FAILURE;
	}

	if (args.count("help")) {
		fmt::print("{}\n", opts.help());
		return EXIT_SUCCESS;
	}

	if (!args.unmatched().empty()) {
		fmt::print(stderr, "Unknown arguments provided:\n{}\n", args.unmatched());
		return EXIT_FAILURE;
	}

	const std::string level_name = args["log-level"].as<std::string>();
	if (auto level = Log::levelFromString(level_name); level.has_value()) {
		Log::setLevel(*level);
	} else {
		fmt::print(stderr, "Unknown log level '{}'\n", level_name);
		return EXIT_FAILURE;
	}

	try {
		nettime::Config::Scheme scheme;
		nettime::net::NetworkTimeConfig::addSchemeEntries(scheme);

		std::string config_path;
		if (args.count("config")) {
			config_path = args["config"].as<std::string>();
		}

		nettime::Config config(config_path, std::move(scheme));

		nettime::net::NetworkTimeConfig net_config;
		net_config.fillFromConfig(config);
		net_config.fill(args);

		nettime::net::FrameAccumulator acc;
		net_config.applyTo(acc);

		nettime::tools::HostLoopParams params;
		params.host_fps = args["host-fps"].as<double>();
		params.duration_sec = args["duration"].as<double>();
		params.jitter = args["jitter"].as<double>();
		params.seed = args["seed"].as<uint64_t>();
		if (uint32_t cap = args["max-catchup"].as<uint32_t>(); cap > 0) {
			params.max_catchup = cap;
		}

		nettime::tools::HostLoopStats stats = nettime::tools::runHostLoop(acc, params);

		fmt::print("host iterations:   {}\n", stats.host_iterations);
		fmt::print("idle iterations:   {}\n", stats.idle_iterations);
		fmt::print("frames simulated:  {}\n", stats.frames_simulated);
		fmt::print("messages sent:     {}\n", stats.messages_sent);
		fmt::print("max frames/iter:   {}\n", stats.max_frames_per_iteration);
		fmt::print("final frame:       {}\n", acc.frameNumber());
		fmt::print("banked time (ns):  {}\n", acc.elapsed().count());

		if (stats.order_violated) {
			Log::error("Network frames were run out of order");
			return EXIT_FAILURE;
		}
	}
	catch (const nettime::Exception &e) {
		Log::log(Log::Level::Fatal, e.where(), "{}", e.what());
		return EXIT_FAILURE;
	}
	catch (const std::exception &e) {
		Log::fatal("Uncaught std::exception instance");
		Log::fatal("what(): {}", e.what());
		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
}
