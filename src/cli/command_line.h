#pragma once

#include <string>

#include "common/configuration.h"
#include "harness/harness.h"

namespace XtSim {

/**
 * Outcome of turning argv into harness options.
 * When run is false the process exits with exit_code.
 */
struct CommandLine {
	bool run = false;
	int exit_code = 0;
	int log_level = 0;
	HarnessOptions harness;
};

/**
 * Layers the YAML file (--config), the scenario preset and explicit options
 * onto configuration, validates the result and builds harness options.
 * Every configuration error, unknown or malformed options included, is
 * reported on stderr and yields exit code 1; --help yields exit code 0.
 */
CommandLine ParseCommandLine(int argc, char** argv, Configuration& configuration);

}  // namespace XtSim
