#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "common/configuration.h"
#include "common/errors.h"
#include "dynamic/driver.h"
#include "sampler/gaussian_sampler.h"
#include "sampler/subprocess_sampler.h"

namespace {

DynamicNest::CancellationToken g_cancel;

void HandleInterrupt(int) {
	g_cancel.Cancel();
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("dynamicnest", "Dynamic nested sampling");

	options.add_options()
		("c,config", "YAML configuration file", cxxopts::value<std::string>())
		("dynamic_goal", "0 for evidence, 1 for parameter estimation", cxxopts::value<double>())
		("ninit", "Live points of the initial run", cxxopts::value<int>())
		("nlive_const", "Live points of the equivalent constant run", cxxopts::value<int>())
		("seed", "Base random seed (negative for unseeded)", cxxopts::value<int64_t>())
		("workers", "Threads run in parallel", cxxopts::value<int>())
		("base_dir", "Output directory", cxxopts::value<std::string>())
		("file_root", "Output file root", cxxopts::value<std::string>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"))
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	DynamicNest::Configuration& configuration = DynamicNest::Configuration::getInstance();
	if (arguments.count("config")) {
		std::string path = arguments["config"].as<std::string>();
		if (!configuration.loadFromFile(path)) {
			LOG(ERROR) << "Invalid configuration in " << path;
			for (const std::string& error : configuration.getValidationErrors()) {
				LOG(ERROR) << "  " << error;
			}
			return EXIT_FAILURE;
		}
	}

	// Command line overrides the file
	DynamicNest::DynamicNestConfig& config = configuration.config();
	if (arguments.count("dynamic_goal")) config.run.dynamic_goal.set(arguments["dynamic_goal"].as<double>());
	if (arguments.count("ninit")) config.run.ninit.set(arguments["ninit"].as<int>());
	if (arguments.count("nlive_const")) config.run.nlive_const.set(arguments["nlive_const"].as<int>());
	if (arguments.count("seed")) config.run.seed.set(arguments["seed"].as<int64_t>());
	if (arguments.count("workers")) config.dispatch.num_workers.set(arguments["workers"].as<int>());
	if (arguments.count("base_dir")) config.run.base_dir.set(arguments["base_dir"].as<std::string>());
	if (arguments.count("file_root")) config.run.file_root.set(arguments["file_root"].as<std::string>());

	if (!configuration.validate()) {
		for (const std::string& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Invalid configuration: " << error;
		}
		return EXIT_FAILURE;
	}

	std::signal(SIGINT, HandleInterrupt);
	std::signal(SIGTERM, HandleInterrupt);

	try {
		std::unique_ptr<DynamicNest::ISampler> sampler;
		std::unique_ptr<DynamicNest::GaussianSampler> gaussian;
		if (config.sampler.kind.get() == "subprocess") {
			sampler = std::make_unique<DynamicNest::SubprocessSampler>(configuration.ToSubprocessOptions());
		} else {
			gaussian = std::make_unique<DynamicNest::GaussianSampler>(configuration.ToGaussianProblem());
		}
		DynamicNest::ISampler& active = sampler ? *sampler : *gaussian;

		DynamicNest::DriverOptions driver_options = configuration.ToDriverOptions();
		driver_options.cancel = &g_cancel;

		DynamicNest::DynamicResult result = DynamicNest::RunDynamicNestedSampling(
			active, config.run.dynamic_goal.get(), configuration.ToDriverSettings(),
			config.run.ninit.get(), config.run.nlive_const.get(), driver_options);

		std::cout << std::setprecision(6)
			<< "ndead        " << result.summary.ndead << "\n"
			<< "threads      " << result.summary.nthreads << "\n"
			<< "log evidence " << result.summary.log_evidence << "\n";
		if (gaussian) {
			std::cout << "analytic     " << gaussian->AnalyticLogEvidence() << "\n";
		}
		if (!result.summary.param_means.empty()) {
			std::cout << "mean theta1  " << result.summary.param_means[0] << " +/- "
				<< result.summary.param_sigmas[0] << "\n";
		}
	} catch (const DynamicNest::DynamicNestError& e) {
		LOG(ERROR) << "Dynamic nested sampling failed: " << e.what();
		return EXIT_FAILURE;
	} catch (const std::runtime_error& e) {
		LOG(ERROR) << "I/O failure: " << e.what();
		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
}
