#ifndef SLUICE_SRC_ALLOCATOR_BUZZER_H_
#define SLUICE_SRC_ALLOCATOR_BUZZER_H_

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace Sluice {

/**
 * Wake token for one OS thread. Unpark before Park is remembered, so a wake
 * that races ahead of the wait is never lost.
 */
class Parker {
	public:
		void Unpark();

		// Returns once unparked or when the timeout elapses; consumes the token.
		void Park(std::optional<std::chrono::milliseconds> timeout);

	private:
		std::mutex mutex_;
		std::condition_variable cv_;
		bool notified_ = false;
};

/**
 * Cloneable handle that wakes the thread which constructed it.
 * Copies share the target; hand copies to peers, never references.
 */
class Buzzer {
	public:
		// Binds to the calling thread.
		Buzzer();

		void Buzz() const;

		bool SameTarget(const Buzzer& other) const { return parker_ == other.parker_; }
		bool BoundToCurrentThread() const;

		// Parks the calling thread until some buzzer bound to it fires.
		static void ParkCurrentThread(std::optional<std::chrono::milliseconds> timeout);

	private:
		std::shared_ptr<Parker> parker_;
};

} // namespace Sluice

#endif // SLUICE_SRC_ALLOCATOR_BUZZER_H_
