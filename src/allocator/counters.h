#pragma once

#include <memory>
#include <optional>
#include <utility>

#include <glog/logging.h>

#include "allocate.h"
#include "buzzer.h"
#include "event.h"
#include "intra_process.h"

namespace Sluice {

// Progress reports travel between workers over these mailboxes.
using CounterMailbox = Mailbox<std::pair<size_t, Event>>;

/**
 * Wraps a pusher so the destination worker learns about every message.
 * Order matters: data first, then the progress report, then the wake-up.
 * Any other order lets the destination wake, find nothing, and park again.
 */
template<typename T, typename P>
class CountingPusher : public IPush<T> {
	public:
		CountingPusher(P pusher, size_t channel, std::shared_ptr<CounterMailbox> events, Buzzer buzzer)
			: pusher_(std::move(pusher)),
			channel_(channel),
			events_(std::move(events)),
			buzzer_(std::move(buzzer)) {}

		void Push(std::optional<T> element) override {
			if (!element.has_value()) {
				pusher_.Push(std::nullopt);
				return;
			}
			pusher_.Push(std::move(element));
			if (!events_->Send({channel_, Event::Pushed(1)})) {
				// Destination already tore down its counter inbox; it is shutting down.
				VLOG(3) << "[CountingPusher] dropped progress report for channel " << channel_;
			}
			buzzer_.Buzz();
		}

	private:
		P pusher_;
		size_t channel_;
		std::shared_ptr<CounterMailbox> events_;
		Buzzer buzzer_;
};

/**
 * Wraps a puller and records each delivered message in the owning worker's
 * event queue.
 */
template<typename T, typename P>
class CountingPuller : public IPull<T> {
	public:
		CountingPuller(P puller, size_t channel, SharedEventQueue events)
			: puller_(std::move(puller)),
			channel_(channel),
			events_(std::move(events)) {}

		std::optional<T>& Pull() override {
			std::optional<T>& result = puller_.Pull();
			if (result.has_value()) {
				events_->emplace_back(channel_, Event::Pulled(1));
			}
			return result;
		}

	private:
		P puller_;
		size_t channel_;
		SharedEventQueue events_;
};

} // namespace Sluice
