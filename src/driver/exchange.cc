// sluice_exchange: all-to-all message exchange among N worker threads over one
// intra-process channel. Every worker sends (its index, round) to every worker
// each round and only advances once it has heard from all of them.

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "allocator/process.h"
#include "common/configuration.h"
#include "common/transport_error.h"

namespace {

struct ExchangeMessage {
	size_t sender;
	int round;
};

struct WorkerStats {
	size_t pulled = 0;
	size_t pushed_reports = 0;
	size_t pulled_reports = 0;
	size_t fifo_violations = 0;
	size_t parks = 0;
};

// Tallies and clears the worker's event queue so the next AwaitEvents parks.
void DrainEvents(Sluice::ProcessAllocator& allocator, WorkerStats& stats) {
	allocator.Receive();
	Sluice::EventQueue& events = *allocator.Events();
	for (const auto& [channel, event] : events) {
		if (event.kind == Sluice::Event::Kind::kPushed) {
			stats.pushed_reports += event.count;
		} else {
			stats.pulled_reports += event.count;
		}
	}
	events.clear();
}

void RunWorker(Sluice::ProcessBuilder builder,
		size_t channel,
		int rounds,
		std::chrono::milliseconds await_timeout,
		std::atomic<size_t>& still_sending,
		WorkerStats& stats) {
	Sluice::ProcessAllocator allocator = builder.Build();
	const size_t index = allocator.Index();
	const size_t peers = allocator.Peers();

	auto endpoints = allocator.Allocate<ExchangeMessage>(channel);
	auto& pushers = endpoints.first;
	auto& puller = endpoints.second;

	// A sender can run at most one round ahead of us.
	std::vector<size_t> received(static_cast<size_t>(rounds) + 1, 0);
	std::vector<int> last_round(peers, -1);

	for (int round = 0; round < rounds; ++round) {
		for (auto& pusher : pushers) {
			pusher->Push(ExchangeMessage{index, round});
		}
		while (received[round] < peers) {
			while (true) {
				std::optional<ExchangeMessage>& message = puller->Pull();
				if (!message.has_value()) {
					break;
				}
				if (message->round != last_round[message->sender] + 1) {
					++stats.fifo_violations;
				}
				last_round[message->sender] = message->round;
				++received[message->round];
				++stats.pulled;
			}
			DrainEvents(allocator, stats);
			if (received[round] < peers) {
				++stats.parks;
				allocator.AwaitEvents(await_timeout);
			}
		}
		VLOG(4) << "Worker " << index << " finished round " << round;
	}

	// Every progress report is sent before its sender leaves the loop above.
	// The last worker out wakes everyone parked below.
	if (still_sending.fetch_sub(1, std::memory_order_acq_rel) == 1) {
		for (const auto& buzzer : allocator.Buzzers()) {
			buzzer.Buzz();
		}
	}
	while (still_sending.load(std::memory_order_acquire) > 0) {
		DrainEvents(allocator, stats);
		allocator.AwaitEvents(await_timeout);
	}
	DrainEvents(allocator, stats);
	VLOG(1) << "Worker " << index << " done: pulled=" << stats.pulled << " parks=" << stats.parks;
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("sluice_exchange", "All-to-all exchange over intra-process channels");
	options.add_options()
		("config", "Config file path", cxxopts::value<std::string>()->default_value("config/sluice.yaml"))
		("w,workers", "Number of worker threads (overrides config file, not SLUICE_WORKERS)", cxxopts::value<int>())
		("r,rounds", "Exchange rounds (overrides config file, not SLUICE_EXCHANGE_ROUNDS)", cxxopts::value<int>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"));
	auto arguments = options.parse(argc, argv);

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	Sluice::Configuration& configuration = Sluice::Configuration::getInstance();
	if (!configuration.loadFromFile(arguments["config"].as<std::string>())) {
		LOG(WARNING) << "Config load failed, using defaults";
	}
	Sluice::SluiceConfig& config = configuration.config();
	// Environment variables win over both the file and the flags.
	if (arguments.count("workers")) {
		config.runtime.workers.set(arguments["workers"].as<int>());
		if (config.runtime.workers.overriddenByEnv()) {
			LOG(WARNING) << "--workers ignored, environment sets workers=" << config.runtime.workers.get();
		}
	}
	if (arguments.count("rounds")) {
		config.exchange.rounds.set(arguments["rounds"].as<int>());
		if (config.exchange.rounds.overriddenByEnv()) {
			LOG(WARNING) << "--rounds ignored, environment sets rounds=" << config.exchange.rounds.get();
		}
	}
	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << error;
		}
		return EXIT_FAILURE;
	}

	const size_t workers = static_cast<size_t>(config.runtime.workers.get());
	const int rounds = config.exchange.rounds.get();
	const size_t channel = config.exchange.channel_id.get();
	const std::chrono::milliseconds await_timeout(config.runtime.await_timeout_ms.get());

	LOG(INFO) << "Starting exchange: workers=" << workers << " rounds=" << rounds
		<< " channel=" << channel << " await_timeout_ms=" << await_timeout.count();

	std::vector<Sluice::ProcessBuilder> builders = Sluice::ProcessAllocator::NewVector(workers);
	std::vector<WorkerStats> stats(workers);
	std::atomic<size_t> still_sending{workers};

	auto start = std::chrono::steady_clock::now();
	std::vector<std::thread> threads;
	threads.reserve(workers);
	for (size_t i = 0; i < workers; ++i) {
		threads.emplace_back([&, i, builder = std::move(builders[i])]() mutable {
			try {
				RunWorker(std::move(builder), channel, rounds, await_timeout, still_sending, stats[i]);
			} catch (const Sluice::TransportError& e) {
				LOG(FATAL) << "Worker " << i << " failed: " << e.what();
			}
		});
	}
	for (auto& thread : threads) {
		thread.join();
	}
	auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
			std::chrono::steady_clock::now() - start);

	WorkerStats total;
	for (const auto& s : stats) {
		total.pulled += s.pulled;
		total.pushed_reports += s.pushed_reports;
		total.pulled_reports += s.pulled_reports;
		total.fifo_violations += s.fifo_violations;
		total.parks += s.parks;
	}
	const size_t expected = workers * workers * static_cast<size_t>(rounds);
	double seconds = elapsed.count() / 1e6;

	LOG(INFO) << "Exchanged " << total.pulled << "/" << expected << " messages in " << seconds << " s ("
		<< (seconds > 0 ? total.pulled / seconds : 0.0) << " msg/s), parks=" << total.parks;

	if (total.pulled != expected || total.pushed_reports != expected ||
			total.pulled_reports != expected || total.fifo_violations != 0) {
		LOG(ERROR) << "Exchange mismatch: pulled=" << total.pulled
			<< " pushed_reports=" << total.pushed_reports
			<< " pulled_reports=" << total.pulled_reports
			<< " fifo_violations=" << total.fifo_violations;
		return EXIT_FAILURE;
	}
	return EXIT_SUCCESS;
}
