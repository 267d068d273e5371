#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <chrono>

// System includes
#include <pthread.h>
#include <signal.h>
#include <stdlib.h>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "common/configuration.h"
#include "common/errors.h"
#include "common/key_paths.h"
#include "common/one_shot.h"
#include "consumer_group_leader.h"
#include "producer_selector.h"
#include "store/etcd_store.h"
#include "store/managed_lease.h"

namespace {

sigset_t ShutdownSignals() {
	sigset_t set;
	sigemptyset(&set);
	sigaddset(&set, SIGINT);
	sigaddset(&set, SIGTERM);
	return set;
}

// Takes the leader lock key for this process. Only a create-if-absent write:
// campaigning for leadership is the supervisor's job.
bool AcquireLeaderLock(Shepherd::CoordinationStore* store, const std::string& leader_key,
		const std::string& instance_id, Shepherd::LeaseId lease) {
	Shepherd::TxnResult result = store->Txn(
			{Shepherd::Compare::Version(leader_key, Shepherd::CompareOp::kEqual, 0)},
			{Shepherd::TxnPut{leader_key, instance_id, lease}});
	return result.succeeded;
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("shepherd_leader", "Consumer group leader: producer failover coordination");

	options.add_options()
		("f,config", "YAML configuration file", cxxopts::value<std::string>())
		("g,group", "Consumer group id", cxxopts::value<std::string>())
		("i,instance", "Instance id written into the leader lock", cxxopts::value<std::string>()->default_value("leader"))
		("endpoint", "etcd endpoint (host:port), overrides the config file", cxxopts::value<std::string>())
		("policy", "Producer selection policy (random|lowest)", cxxopts::value<std::string>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"))
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	if (!arguments.count("group")) {
		LOG(ERROR) << "--group is required";
		return EXIT_FAILURE;
	}
	const std::string group = arguments["group"].as<std::string>();
	const std::string instance_id = arguments["instance"].as<std::string>();

	// *************** Configuration **********************
	Shepherd::Configuration& config = Shepherd::Configuration::getInstance();
	if (arguments.count("config") && !config.loadFromFile(arguments["config"].as<std::string>())) {
		for (const auto& error : config.getValidationErrors()) {
			LOG(ERROR) << "Config validation error: " << error;
		}
		return EXIT_FAILURE;
	}
	if (arguments.count("endpoint")) {
		config.config().store.endpoint.set(arguments["endpoint"].as<std::string>());
	}
	if (arguments.count("policy")) {
		config.config().leader.selection_policy.set(arguments["policy"].as<std::string>());
	}
	if (!config.validate()) {
		for (const auto& error : config.getValidationErrors()) {
			LOG(ERROR) << "Validation error: " << error;
		}
		return EXIT_FAILURE;
	}
	const Shepherd::ShepherdConfig& cfg = config.config();

	// Block shutdown signals before any thread starts so only the waiter below sees them.
	sigset_t signals = ShutdownSignals();
	pthread_sigmask(SIG_BLOCK, &signals, nullptr);

	// *************** Store and leadership **********************
	Shepherd::EtcdStore store(cfg.store.endpoint.get(), std::chrono::milliseconds(cfg.store.rpc_timeout_ms.get()));
	if (!store.Connect(std::chrono::milliseconds(cfg.store.connect_timeout_ms.get()))) {
		return EXIT_FAILURE;
	}

	Shepherd::LeaderOptions leader_options;
	leader_options.barrier_lease_ttl_s = cfg.leader.barrier_lease_ttl_s.get();
	leader_options.marker_lease_ttl_s = cfg.leader.marker_lease_ttl_s.get();
	leader_options.paths = Shepherd::KeyPaths(cfg.store.key_root.get());
	const std::string leader_key = leader_options.paths.LeaderLockKey(group);

	Shepherd::OneShotSignal interrupt;
	std::thread signal_thread([&signals, &interrupt]() {
			int sig = 0;
			sigwait(&signals, &sig);
			LOG(INFO) << "Received signal " << sig << ", interrupting leader";
			interrupt.Fire();
			});

	int exit_code = EXIT_SUCCESS;
	try {
		std::unique_ptr<Shepherd::ManagedLease> lease =
			Shepherd::ManagedLease::Grant(&store, cfg.leader.lease_ttl_s.get());
		if (!AcquireLeaderLock(&store, leader_key, instance_id, lease->id())) {
			LOG(ERROR) << "Leader lock " << leader_key << " is held by another instance";
			lease->Revoke();
			exit_code = EXIT_FAILURE;
		} else {
			LOG(INFO) << "Instance " << instance_id << " holds " << leader_key << " with lease " << lease->id();
			Shepherd::ConsumerGroupLeader leader(&store, leader_key, std::move(lease), group,
					Shepherd::MakeProducerSelector(cfg.leader.selection_policy.get()), leader_options);
			leader.Run(interrupt);
			// Hand leadership over without waiting for the lease TTL.
			store.Delete(leader_key);
			LOG(INFO) << "Consumer group " << group << " leader stopped in state " << leader.state();
		}
	} catch (const Shepherd::CoordinationError& e) {
		LOG(ERROR) << "Leader for consumer group " << group << " failed: " << e.what();
		exit_code = EXIT_FAILURE;
	}

	if (!interrupt.IsFired()) {
		pthread_kill(signal_thread.native_handle(), SIGTERM);
	}
	signal_thread.join();

	LOG(INFO) << "Shepherd leader terminating";
	return exit_code;
}
