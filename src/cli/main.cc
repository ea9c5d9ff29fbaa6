#include <thread>
#include <utility>

// System includes
#include <pthread.h>
#include <signal.h>

// Third-party libraries
#include <glog/logging.h>

// Project includes
#include "cli/command_line.h"
#include "common/configuration.h"
#include "harness/harness.h"

namespace {

// SIGINT/SIGTERM are blocked in every thread and consumed here, so the
// harness is told to stop from an ordinary thread context.
void WaitForSignals(sigset_t signals, XtSim::Harness* harness) {
	int sig = 0;
	while (sigwait(&signals, &sig) == 0) {
		if (sig == SIGUSR1) {
			return;
		}
		LOG(INFO) << "Received signal " << sig << ", stopping";
		harness->RequestStop();
	}
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files.

	XtSim::CommandLine command_line =
		XtSim::ParseCommandLine(argc, argv, XtSim::Configuration::getInstance());
	if (!command_line.run) {
		return command_line.exit_code;
	}
	FLAGS_v = command_line.log_level;

	sigset_t signals;
	sigemptyset(&signals);
	sigaddset(&signals, SIGINT);
	sigaddset(&signals, SIGTERM);
	sigaddset(&signals, SIGUSR1);
	pthread_sigmask(SIG_BLOCK, &signals, nullptr);

	XtSim::Harness harness(std::move(command_line.harness));
	std::thread signal_thread(WaitForSignals, signals, &harness);

	harness.Run();

	pthread_kill(signal_thread.native_handle(), SIGUSR1);
	signal_thread.join();
	return 0;
}
