#include "thread.h"

#include <glog/logging.h>

namespace Sluice {

void ThreadAllocator::AwaitEvents(std::optional<std::chrono::milliseconds> timeout) {
	// Peers buzz the owning thread; parking anywhere else would never wake.
	CHECK(owner_.BoundToCurrentThread())
		<< "worker " << index_ << " awaited events off the thread that built it";
	if (events_->empty()) {
		Buzzer::ParkCurrentThread(timeout);
	}
}

} // namespace Sluice
