#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <utility>

namespace Sluice {

/**
 * Progress record emitted by the counting decorators.
 * Pushed/Pulled carry the number of messages moved.
 */
struct Event {
	enum class Kind { kPushed, kPulled };

	Kind kind;
	size_t count;

	static Event Pushed(size_t count) { return Event{Kind::kPushed, count}; }
	static Event Pulled(size_t count) { return Event{Kind::kPulled, count}; }

	bool operator==(const Event& other) const {
		return kind == other.kind && count == other.count;
	}
};

// (channel id, event) in arrival order. Owned by a single worker.
using EventQueue = std::deque<std::pair<size_t, Event>>;
using SharedEventQueue = std::shared_ptr<EventQueue>;

} // namespace Sluice
