#include "process.h"

#include <string>

#include <glog/logging.h>

#include "common/transport_error.h"
#include "one_shot.h"

namespace Sluice {

ProcessBuilder::ProcessBuilder(size_t index,
		size_t peers,
		std::shared_ptr<ChannelRegistry> channels,
		std::vector<std::promise<Buzzer>> buzzers_send,
		std::vector<std::future<Buzzer>> buzzers_recv,
		std::vector<std::shared_ptr<CounterMailbox>> counters_send,
		ProcessPuller<std::pair<size_t, Event>> counters_recv)
	: index_(index),
	peers_(peers),
	channels_(std::move(channels)),
	buzzers_send_(std::move(buzzers_send)),
	buzzers_recv_(std::move(buzzers_recv)),
	counters_send_(std::move(counters_send)),
	counters_recv_(std::move(counters_recv)) {}

ProcessAllocator ProcessBuilder::Build() {
	if (!channels_) {
		RaiseTransportError(ErrorKind::kBuzzerExchangeFailed,
				"builder of worker " + std::to_string(index_) + " was already built");
	}
	// Taken up front so a failed exchange also spends the builder.
	std::shared_ptr<ChannelRegistry> channels = std::move(channels_);

	// Send to everyone first, then receive. Handoffs do not rendezvous, so
	// receiving first could leave every worker waiting on a peer that has not
	// sent yet.
	for (auto& peer : buzzers_send_) {
		peer.set_value(Buzzer());
	}

	std::vector<Buzzer> buzzers;
	buzzers.reserve(peers_);
	for (size_t peer = 0; peer < buzzers_recv_.size(); ++peer) {
		try {
			buzzers.push_back(buzzers_recv_[peer].get());
		} catch (const std::future_error& e) {
			RaiseTransportError(ErrorKind::kBuzzerExchangeFailed,
					"worker " + std::to_string(index_) + " did not receive a buzzer from worker " +
					std::to_string(peer) + ": " + e.what());
		}
	}
	VLOG(1) << "[ProcessBuilder] worker " << index_ << "/" << peers_ << " exchanged buzzers";

	return ProcessAllocator(ThreadAllocator(index_, peers_),
			std::move(channels),
			std::move(buzzers),
			std::move(counters_send_),
			std::move(counters_recv_));
}

ProcessAllocator::ProcessAllocator(ThreadAllocator inner,
		std::shared_ptr<ChannelRegistry> channels,
		std::vector<Buzzer> buzzers,
		std::vector<std::shared_ptr<CounterMailbox>> counters_send,
		ProcessPuller<std::pair<size_t, Event>> counters_recv)
	: inner_(std::move(inner)),
	channels_(std::move(channels)),
	buzzers_(std::move(buzzers)),
	counters_send_(std::move(counters_send)),
	counters_recv_(std::move(counters_recv)) {}

std::vector<ProcessBuilder> ProcessAllocator::NewVector(size_t peers) {
	std::vector<std::shared_ptr<CounterMailbox>> counters_send;
	std::vector<ProcessPuller<std::pair<size_t, Event>>> counters_recv;
	counters_send.reserve(peers);
	counters_recv.reserve(peers);
	for (size_t i = 0; i < peers; ++i) {
		auto mailbox = std::make_shared<CounterMailbox>();
		counters_send.push_back(mailbox);
		counters_recv.emplace_back(mailbox);
	}

	auto channels = std::make_shared<ChannelRegistry>(peers);

	auto exchange = PromiseFutures<Buzzer>(peers, peers);
	auto& buzzers_send = exchange.first;
	auto& buzzers_recv = exchange.second;

	std::vector<ProcessBuilder> builders;
	builders.reserve(peers);
	for (size_t index = 0; index < peers; ++index) {
		builders.push_back(ProcessBuilder(index,
					peers,
					channels,
					std::move(buzzers_send[index]),
					std::move(buzzers_recv[index]),
					counters_send,
					std::move(counters_recv[index])));
	}
	return builders;
}

void ProcessAllocator::AwaitEvents(std::optional<std::chrono::milliseconds> timeout) {
	inner_.AwaitEvents(timeout);
}

void ProcessAllocator::Receive() {
	EventQueue& events = *inner_.Events();
	while (true) {
		std::optional<std::pair<size_t, Event>>& report = counters_recv_.Pull();
		if (!report.has_value()) {
			break;
		}
		events.push_back(std::move(*report));
	}
}

} // namespace Sluice
