#pragma once

#include <string>
#include <vector>

#include "common/configuration.h"

namespace XtSim {

/**
 * Named preset for a harness run. clients == 0 keeps the configured count.
 */
struct Scenario {
	std::string name;
	std::string description;
	std::string vote_strategy;
	bool send_tx;
	int tx_count;
	int clients;
};

const std::vector<Scenario>& AllScenarios();

/**
 * @throws std::invalid_argument if no preset has this name
 */
const Scenario& FindScenario(const std::string& name);

/**
 * Writes the preset into config. Options given explicitly on the command
 * line are applied afterwards and win.
 */
void ApplyScenario(const Scenario& scenario, XtSimConfig* config);

}  // namespace XtSim
