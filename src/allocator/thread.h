#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include "allocate.h"
#include "buzzer.h"
#include "event.h"

namespace Sluice {

/**
 * Base allocator of one worker thread: identity plus the worker's event queue.
 * Richer allocators delegate identity, event access and waiting to it.
 * Bound to the constructing thread; only that thread may wait on it.
 */
class ThreadAllocator : public IAllocator {
	public:
		ThreadAllocator(size_t index, size_t peers)
			: index_(index),
			peers_(peers),
			events_(std::make_shared<EventQueue>()) {}

		// Wakes the thread this allocator belongs to.
		const Buzzer& Owner() const { return owner_; }

		size_t Index() const override { return index_; }
		size_t Peers() const override { return peers_; }
		const SharedEventQueue& Events() const override { return events_; }

		// Returns immediately if events are pending; otherwise parks the
		// calling thread until a buzzer bound to it fires or the timeout passes.
		void AwaitEvents(std::optional<std::chrono::milliseconds> timeout) override;

	private:
		size_t index_;
		size_t peers_;
		SharedEventQueue events_;
		Buzzer owner_;
};

} // namespace Sluice
