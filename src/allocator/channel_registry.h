#ifndef SLUICE_SRC_ALLOCATOR_CHANNEL_REGISTRY_H_
#define SLUICE_SRC_ALLOCATOR_CHANNEL_REGISTRY_H_

#include <algorithm>
#include <functional>
#include <memory>
#include <optional>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include <glog/logging.h>

#include "buzzer.h"
#include "intra_process.h"

namespace Sluice {

/**
 * What one worker receives for one channel id: a pusher towards every worker
 * (each paired with that worker's buzzer) and the single puller that drains
 * the messages addressed to it.
 */
template<typename T>
struct ChannelBundle {
	std::vector<std::pair<ProcessPusher<T>, Buzzer>> pushers;
	ProcessPuller<T> puller;
};

/**
 * Shared table of channels for one group of workers.
 *
 * The first worker to ask for an id builds the endpoints of every worker and
 * parks them in per-worker slots; each worker then takes its own slot exactly
 * once. When the last slot is taken the id is forgotten and may be reused,
 * with any payload type. Workers must agree on id and payload type among
 * themselves; the registry only detects a disagreement while the id is live.
 *
 * The lock covers table bookkeeping only. Endpoints never touch the registry.
 */
class ChannelRegistry {
	public:
		// Invoked inside the critical section right after an entry is built.
		using ConstructionObserver = std::function<void(size_t channel)>;

		explicit ChannelRegistry(size_t peers);

		/**
		 * Take worker `index`'s endpoints for `channel`, building the whole
		 * channel if this is the first request for it.
		 *
		 * @param channel Channel id agreed on by all workers
		 * @param index Calling worker, in [0, Peers())
		 * @param buzzers One buzzer per worker, in worker order
		 * @throws TransportError kRegistryLockCorrupted, kTypeMismatch, kSlotAlreadyConsumed
		 */
		template<typename T>
		ChannelBundle<T> Allocate(size_t channel, size_t index, const std::vector<Buzzer>& buzzers);

		bool Contains(size_t channel) const;
		size_t Size() const;
		// Number of entries built so far, over the registry's lifetime.
		size_t Constructions() const;
		size_t Peers() const { return peers_; }
		bool Poisoned() const;

		void SetConstructionObserver(ConstructionObserver observer);

	private:
		struct EntryBase {
			EntryBase(std::type_index type, const char* type_name) : type(type), type_name(type_name) {}
			virtual ~EntryBase() = default;

			const std::type_index type;
			const char* const type_name;
		};

		template<typename T>
		struct Entry : EntryBase {
			Entry() : EntryBase(std::type_index(typeid(T)), typeid(T).name()) {}

			// Slot i holds worker i's bundle until taken.
			std::vector<std::optional<ChannelBundle<T>>> slots;
		};

		template<typename T>
		std::unique_ptr<Entry<T>> BuildEntry(const std::vector<Buzzer>& buzzers) const;

		void CheckUsableLocked(size_t channel) const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
		void NoteConstructionLocked(size_t channel) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
		void PoisonLocked(size_t channel) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
		[[noreturn]] static void RaiseTypeMismatch(size_t channel, const EntryBase& entry, const char* requested);
		[[noreturn]] static void RaiseSlotConsumed(size_t channel, size_t index);

		const size_t peers_;

		mutable absl::Mutex mutex_;
		absl::flat_hash_map<size_t, std::unique_ptr<EntryBase>> channels_ ABSL_GUARDED_BY(mutex_);
		size_t constructions_ ABSL_GUARDED_BY(mutex_) = 0;
		// Set when a request failed half way through the critical section.
		bool poisoned_ ABSL_GUARDED_BY(mutex_) = false;
		ConstructionObserver observer_ ABSL_GUARDED_BY(mutex_);
};

template<typename T>
std::unique_ptr<ChannelRegistry::Entry<T>> ChannelRegistry::BuildEntry(const std::vector<Buzzer>& buzzers) const {
	std::vector<std::pair<ProcessPusher<T>, Buzzer>> pushers;
	std::vector<ProcessPuller<T>> pullers;
	pushers.reserve(peers_);
	pullers.reserve(peers_);

	// One sub-channel per destination worker; everyone pushes into it.
	for (size_t dest = 0; dest < peers_; ++dest) {
		auto channel = NewProcessChannel<T>();
		pushers.emplace_back(std::move(channel.first), buzzers[dest]);
		pullers.push_back(std::move(channel.second));
	}

	auto entry = std::make_unique<Entry<T>>();
	entry->slots.reserve(peers_);
	for (auto& puller : pullers) {
		entry->slots.emplace_back(ChannelBundle<T>{pushers, std::move(puller)});
	}
	return entry;
}

template<typename T>
ChannelBundle<T> ChannelRegistry::Allocate(size_t channel, size_t index, const std::vector<Buzzer>& buzzers) {
	CHECK_LT(index, peers_) << "worker index out of range for channel " << channel;
	CHECK_EQ(buzzers.size(), peers_) << "one buzzer per worker is required";

	absl::MutexLock lock(&mutex_);
	CheckUsableLocked(channel);

	auto it = channels_.find(channel);
	if (it == channels_.end()) {
		try {
			std::unique_ptr<Entry<T>> entry = BuildEntry<T>(buzzers);
			it = channels_.emplace(channel, std::move(entry)).first;
			NoteConstructionLocked(channel);
		} catch (...) {
			PoisonLocked(channel);
			throw;
		}
	}

	if (it->second->type != std::type_index(typeid(T))) {
		RaiseTypeMismatch(channel, *it->second, typeid(T).name());
	}
	auto& entry = static_cast<Entry<T>&>(*it->second);

	std::optional<ChannelBundle<T>>& slot = entry.slots[index];
	if (!slot.has_value()) {
		RaiseSlotConsumed(channel, index);
	}
	ChannelBundle<T> bundle = std::move(*slot);
	slot.reset();
	VLOG(3) << "[ChannelRegistry] worker " << index << " took its slot of channel " << channel;

	bool drained = std::all_of(entry.slots.begin(), entry.slots.end(),
			[](const std::optional<ChannelBundle<T>>& s) { return !s.has_value(); });
	if (drained) {
		channels_.erase(it);
		VLOG(3) << "[ChannelRegistry] channel " << channel << " fully allocated, entry removed";
	}
	return bundle;
}

} // namespace Sluice

#endif // SLUICE_SRC_ALLOCATOR_CHANNEL_REGISTRY_H_
