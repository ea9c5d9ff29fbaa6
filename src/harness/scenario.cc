#include "scenario.h"

#include <stdexcept>

#include <glog/logging.h>

namespace XtSim {

const std::vector<Scenario>& AllScenarios() {
	static const std::vector<Scenario> kScenarios = {
		{"happy-path", "All participants vote commit", "commit", true, 2, 0},
		{"abort-test", "All participants vote abort", "abort", true, 1, 0},
		{"random-votes", "Participants vote randomly", "random", true, 3, 0},
		{"timeout-test", "Participants vote late", "delay", true, 1, 0},
		{"stress-test", "Five random voters, five proposals", "random", true, 5, 5},
	};
	return kScenarios;
}

const Scenario& FindScenario(const std::string& name) {
	for (const auto& scenario : AllScenarios()) {
		if (scenario.name == name) {
			return scenario;
		}
	}
	std::string known;
	for (const auto& scenario : AllScenarios()) {
		if (!known.empty()) known += ", ";
		known += scenario.name;
	}
	throw std::invalid_argument("Unknown scenario: " + name + " (expected one of " + known + ")");
}

void ApplyScenario(const Scenario& scenario, XtSimConfig* config) {
	LOG(INFO) << "Scenario " << scenario.name << ": " << scenario.description;
	config->harness.vote_strategy.set(scenario.vote_strategy);
	config->harness.strategies.clear();
	config->harness.send_tx.set(scenario.send_tx);
	config->harness.tx_count.set(scenario.tx_count);
	if (scenario.clients > 0) {
		config->harness.clients.set(scenario.clients);
	}
}

}  // namespace XtSim
