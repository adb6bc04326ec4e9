#include "buzzer.h"

namespace Sluice {

namespace {

const std::shared_ptr<Parker>& CurrentParker() {
	thread_local std::shared_ptr<Parker> parker = std::make_shared<Parker>();
	return parker;
}

} // end of namespace

void Parker::Unpark() {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		notified_ = true;
	}
	cv_.notify_one();
}

void Parker::Park(std::optional<std::chrono::milliseconds> timeout) {
	std::unique_lock<std::mutex> lock(mutex_);
	if (timeout.has_value()) {
		cv_.wait_for(lock, *timeout, [this] { return notified_; });
	} else {
		cv_.wait(lock, [this] { return notified_; });
	}
	notified_ = false;
}

Buzzer::Buzzer() : parker_(CurrentParker()) {}

void Buzzer::Buzz() const {
	parker_->Unpark();
}

bool Buzzer::BoundToCurrentThread() const {
	return parker_ == CurrentParker();
}

void Buzzer::ParkCurrentThread(std::optional<std::chrono::milliseconds> timeout) {
	CurrentParker()->Park(timeout);
}

} // namespace Sluice
