#include "channel_registry.h"

#include <string>

#include "common/transport_error.h"

namespace Sluice {

ChannelRegistry::ChannelRegistry(size_t peers) : peers_(peers) {
	CHECK_GT(peers_, 0u) << "a channel registry needs at least one worker";
	VLOG(3) << "\t[ChannelRegistry]\tConstructed for " << peers_ << " workers";
}

bool ChannelRegistry::Contains(size_t channel) const {
	absl::MutexLock lock(&mutex_);
	return channels_.contains(channel);
}

size_t ChannelRegistry::Size() const {
	absl::MutexLock lock(&mutex_);
	return channels_.size();
}

size_t ChannelRegistry::Constructions() const {
	absl::MutexLock lock(&mutex_);
	return constructions_;
}

bool ChannelRegistry::Poisoned() const {
	absl::MutexLock lock(&mutex_);
	return poisoned_;
}

void ChannelRegistry::SetConstructionObserver(ConstructionObserver observer) {
	absl::MutexLock lock(&mutex_);
	observer_ = std::move(observer);
}

void ChannelRegistry::CheckUsableLocked(size_t channel) const {
	if (poisoned_) {
		RaiseTransportError(ErrorKind::kRegistryLockCorrupted,
				"channel table was left inconsistent by an earlier failure; refusing channel " +
				std::to_string(channel));
	}
}

void ChannelRegistry::NoteConstructionLocked(size_t channel) {
	++constructions_;
	VLOG(3) << "[ChannelRegistry] built channel " << channel << " for " << peers_ << " workers";
	if (observer_) {
		observer_(channel);
	}
}

void ChannelRegistry::PoisonLocked(size_t channel) {
	poisoned_ = true;
	LOG(ERROR) << "[ChannelRegistry] failure while building channel " << channel
		<< "; channel table is no longer trusted";
}

void ChannelRegistry::RaiseTypeMismatch(size_t channel, const EntryBase& entry, const char* requested) {
	RaiseTransportError(ErrorKind::kTypeMismatch,
			"channel " + std::to_string(channel) + " holds payload type " + entry.type_name +
			" but " + requested + " was requested");
}

void ChannelRegistry::RaiseSlotConsumed(size_t channel, size_t index) {
	RaiseTransportError(ErrorKind::kSlotAlreadyConsumed,
			"worker " + std::to_string(index) + " already allocated channel " + std::to_string(channel));
}

} // namespace Sluice
