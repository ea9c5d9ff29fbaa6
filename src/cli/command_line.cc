#include "command_line.h"

#include <exception>
#include <iostream>
#include <sstream>
#include <vector>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "common/network_utils.h"
#include "harness/scenario.h"

namespace XtSim {

namespace {

std::vector<std::string> SplitCommaList(const std::string& value) {
	std::vector<std::string> items;
	std::stringstream ss(value);
	std::string item;
	while (std::getline(ss, item, ',')) {
		if (!item.empty()) {
			items.push_back(item);
		}
	}
	return items;
}

cxxopts::Options MakeOptions() {
	cxxopts::Options options("xtsim", "Simulated sequencers for the cross-chain 2PC coordinator");

	options.add_options()
		("coordinator", "Coordinator address as host:port", cxxopts::value<std::string>())
		("host", "Coordinator host (default " + std::string(kDefaultCoordinatorHost) + ")",
		 cxxopts::value<std::string>())
		("port", "Coordinator port (default " + std::to_string(kDefaultCoordinatorPort) + ")",
		 cxxopts::value<int>())
		("n,clients", "Number of participants (default 3)", cxxopts::value<int>())
		("vote-strategy", "commit, abort, random or delay (default commit)", cxxopts::value<std::string>())
		("strategies", "Comma separated per-participant strategies", cxxopts::value<std::string>())
		("send-tx", "First participant originates transactions")
		("tx-count", "Transactions the initiator sends (default 1)", cxxopts::value<int>())
		("d,duration", "Run duration in seconds (default 30)", cxxopts::value<int>())
		("scenario", "Preset: happy-path, abort-test, random-votes, timeout-test, stress-test",
		 cxxopts::value<std::string>())
		("config", "YAML configuration file", cxxopts::value<std::string>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");
	return options;
}

// Command line options override the file and the scenario preset.
void ApplyCommandLine(const cxxopts::ParseResult& args, XtSimConfig* config) {
	if (args.count("coordinator")) {
		auto [host, port] = ParseAddressPort(args["coordinator"].as<std::string>());
		config->coordinator.host.set(host);
		config->coordinator.port.set(port);
	}
	if (args.count("host")) config->coordinator.host.set(args["host"].as<std::string>());
	if (args.count("port")) config->coordinator.port.set(args["port"].as<int>());
	if (args.count("clients")) config->harness.clients.set(args["clients"].as<int>());
	if (args.count("vote-strategy")) {
		config->harness.vote_strategy.set(args["vote-strategy"].as<std::string>());
	}
	if (args.count("strategies")) {
		config->harness.strategies = SplitCommaList(args["strategies"].as<std::string>());
	}
	if (args.count("send-tx")) config->harness.send_tx.set(true);
	if (args.count("tx-count")) config->harness.tx_count.set(args["tx-count"].as<int>());
	if (args.count("duration")) config->harness.duration_sec.set(args["duration"].as<int>());
}

void PrintValidationErrors(const Configuration& configuration) {
	for (const auto& error : configuration.getValidationErrors()) {
		std::cerr << "Configuration error: " << error << std::endl;
	}
}

CommandLine Fail() {
	CommandLine result;
	result.exit_code = 1;
	return result;
}

}  // namespace

CommandLine ParseCommandLine(int argc, char** argv, Configuration& configuration) {
	cxxopts::Options options = MakeOptions();
	CommandLine result;

	try {
		auto args = options.parse(argc, argv);

		if (args.count("help")) {
			std::cout << options.help() << std::endl;
			return result;
		}

		result.log_level = args["log_level"].as<int>();

		if (args.count("config")) {
			std::string path = args["config"].as<std::string>();
			if (!configuration.loadFromFile(path)) {
				PrintValidationErrors(configuration);
				LOG(ERROR) << "Failed to load configuration from " << path;
				return Fail();
			}
		}

		if (args.count("scenario")) {
			ApplyScenario(FindScenario(args["scenario"].as<std::string>()), &configuration.config());
		}
		ApplyCommandLine(args, &configuration.config());
		if (!configuration.validate()) {
			PrintValidationErrors(configuration);
			return Fail();
		}
		result.harness = HarnessOptionsFromConfig(configuration.config());
	} catch (const std::exception& e) {
		// cxxopts parse and conversion errors, bad strategy or scenario names,
		// malformed host:port
		std::cerr << "Configuration error: " << e.what() << "\n" << options.help() << std::endl;
		return Fail();
	}

	result.run = true;
	return result;
}

}  // namespace XtSim
