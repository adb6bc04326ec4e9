#ifndef SLUICE_SRC_ALLOCATOR_PROCESS_H_
#define SLUICE_SRC_ALLOCATOR_PROCESS_H_

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "allocate.h"
#include "buzzer.h"
#include "channel_registry.h"
#include "counters.h"
#include "intra_process.h"
#include "thread.h"

namespace Sluice {

class ProcessAllocator;

template<typename T>
using Endpoints = std::pair<std::vector<std::unique_ptr<IPush<T>>>, std::unique_ptr<IPull<T>>>;

/**
 * Staging half of a worker's allocator. Created on the setup thread by
 * ProcessAllocator::NewVector, moved to its worker, and built there.
 */
class ProcessBuilder {
	public:
		ProcessBuilder(ProcessBuilder&&) = default;
		ProcessBuilder& operator=(ProcessBuilder&&) = default;

		/**
		 * Exchange buzzers with every peer and produce the allocator.
		 * Must run on the worker's own thread: the buzzer handed to peers wakes
		 * the thread that calls Build. Blocks until every peer has sent its
		 * buzzer. The builder is spent afterwards.
		 *
		 * @throws TransportError kBuzzerExchangeFailed if a peer's builder
		 *         was destroyed without building, or if this one was already built
		 */
		ProcessAllocator Build();

		size_t Index() const { return index_; }
		size_t Peers() const { return peers_; }

	private:
		friend class ProcessAllocator;

		ProcessBuilder(size_t index,
				size_t peers,
				std::shared_ptr<ChannelRegistry> channels,
				std::vector<std::promise<Buzzer>> buzzers_send,
				std::vector<std::future<Buzzer>> buzzers_recv,
				std::vector<std::shared_ptr<CounterMailbox>> counters_send,
				ProcessPuller<std::pair<size_t, Event>> counters_recv);

		size_t index_;
		size_t peers_;
		std::shared_ptr<ChannelRegistry> channels_;

		// One outbound handoff per peer for our buzzer, one inbound per peer for theirs.
		std::vector<std::promise<Buzzer>> buzzers_send_;
		std::vector<std::future<Buzzer>> buzzers_recv_;

		std::vector<std::shared_ptr<CounterMailbox>> counters_send_;
		ProcessPuller<std::pair<size_t, Event>> counters_recv_;
};

/**
 * Allocator for inter-thread, intra-process communication among a fixed
 * group of workers sharing one ChannelRegistry.
 */
class ProcessAllocator : public IAllocator {
	public:
		// Builders for `peers` connected workers; builder i becomes worker i.
		static std::vector<ProcessBuilder> NewVector(size_t peers);

		/**
		 * Endpoints of this worker for `channel`: a pusher towards every
		 * worker (index = destination) and the puller for messages addressed
		 * here. Call once per channel; all workers must use the same T.
		 *
		 * @throws TransportError see ChannelRegistry::Allocate
		 */
		template<typename T>
		Endpoints<T> Allocate(size_t channel);

		size_t Index() const override { return inner_.Index(); }
		size_t Peers() const override { return inner_.Peers(); }
		const SharedEventQueue& Events() const override { return inner_.Events(); }
		void AwaitEvents(std::optional<std::chrono::milliseconds> timeout) override;

		// Non-blocking: moves every pending peer progress report into Events().
		void Receive() override;

		ThreadAllocator& Inner() { return inner_; }
		// buzzers()[j] wakes worker j.
		const std::vector<Buzzer>& Buzzers() const { return buzzers_; }
		const std::shared_ptr<ChannelRegistry>& Channels() const { return channels_; }

	private:
		friend class ProcessBuilder;

		ProcessAllocator(ThreadAllocator inner,
				std::shared_ptr<ChannelRegistry> channels,
				std::vector<Buzzer> buzzers,
				std::vector<std::shared_ptr<CounterMailbox>> counters_send,
				ProcessPuller<std::pair<size_t, Event>> counters_recv);

		ThreadAllocator inner_;
		std::shared_ptr<ChannelRegistry> channels_;
		std::vector<Buzzer> buzzers_;
		std::vector<std::shared_ptr<CounterMailbox>> counters_send_;
		ProcessPuller<std::pair<size_t, Event>> counters_recv_;
};

template<typename T>
Endpoints<T> ProcessAllocator::Allocate(size_t channel) {
	ChannelBundle<T> bundle = channels_->Allocate<T>(channel, Index(), buzzers_);

	std::vector<std::unique_ptr<IPush<T>>> pushers;
	pushers.reserve(bundle.pushers.size());
	for (size_t dest = 0; dest < bundle.pushers.size(); ++dest) {
		auto& [pusher, buzzer] = bundle.pushers[dest];
		pushers.push_back(std::make_unique<CountingPusher<T, ProcessPusher<T>>>(
					std::move(pusher), channel, counters_send_[dest], std::move(buzzer)));
	}
	std::unique_ptr<IPull<T>> puller = std::make_unique<CountingPuller<T, ProcessPuller<T>>>(
			std::move(bundle.puller), channel, inner_.Events());

	return {std::move(pushers), std::move(puller)};
}

} // namespace Sluice

#endif // SLUICE_SRC_ALLOCATOR_PROCESS_H_
