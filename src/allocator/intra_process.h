#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <utility>

#include "folly/concurrency/UnboundedQueue.h"

#include "allocate.h"
#include "common/transport_error.h"

namespace Sluice {

/**
 * One sub-channel: an unbounded multi-producer, single-consumer queue.
 * Senders share it through ProcessPusher copies; exactly one ProcessPuller
 * drains it. Lives as long as any endpoint holds it.
 */
template<typename T>
class Mailbox {
	public:
		// Returns false if the receiving end is gone; the element is dropped.
		bool Send(T element) {
			if (!receiver_alive_.load(std::memory_order_acquire)) {
				return false;
			}
			queue_.enqueue(std::move(element));
			return true;
		}

		std::optional<T> TryReceive() {
			folly::Optional<T> item = queue_.try_dequeue();
			if (!item.has_value()) {
				return std::nullopt;
			}
			return std::optional<T>(std::move(*item));
		}

		void CloseReceiver() { receiver_alive_.store(false, std::memory_order_release); }
		bool ReceiverAlive() const { return receiver_alive_.load(std::memory_order_acquire); }

	private:
		folly::UMPSCQueue<T, /*MayBlock=*/false> queue_;
		std::atomic<bool> receiver_alive_{true};
};

template<typename T>
class ProcessPusher : public IPush<T> {
	public:
		explicit ProcessPusher(std::shared_ptr<Mailbox<T>> target) : target_(std::move(target)) {}

		void Push(std::optional<T> element) override {
			if (!element.has_value()) {
				return;
			}
			if (!target_->Send(std::move(*element))) {
				RaiseTransportError(ErrorKind::kChannelDisconnected,
						"push to a channel whose receiver was destroyed");
			}
		}

		// Pushers copied from one another feed the same mailbox.
		bool SharesTargetWith(const ProcessPusher& other) const { return target_ == other.target_; }

	private:
		std::shared_ptr<Mailbox<T>> target_;
};

template<typename T>
class ProcessPuller : public IPull<T> {
	public:
		explicit ProcessPuller(std::shared_ptr<Mailbox<T>> source) : source_(std::move(source)) {}

		~ProcessPuller() override {
			if (source_) {
				source_->CloseReceiver();
			}
		}

		ProcessPuller(ProcessPuller&&) = default;
		ProcessPuller& operator=(ProcessPuller&& other) {
			if (this != &other) {
				if (source_) {
					source_->CloseReceiver();
				}
				source_ = std::move(other.source_);
				current_ = std::move(other.current_);
			}
			return *this;
		}
		ProcessPuller(const ProcessPuller&) = delete;
		ProcessPuller& operator=(const ProcessPuller&) = delete;

		std::optional<T>& Pull() override {
			current_ = source_->TryReceive();
			return current_;
		}

	private:
		std::shared_ptr<Mailbox<T>> source_;
		std::optional<T> current_;
};

// Creates the pusher/puller pair for one fresh sub-channel.
template<typename T>
std::pair<ProcessPusher<T>, ProcessPuller<T>> NewProcessChannel() {
	auto mailbox = std::make_shared<Mailbox<T>>();
	return {ProcessPusher<T>(mailbox), ProcessPuller<T>(mailbox)};
}

} // namespace Sluice
