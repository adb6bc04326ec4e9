#pragma once

#include <future>
#include <utility>
#include <vector>

namespace Sluice {

/**
 * Matrix of one-shot handoffs between `senders` and `receivers`.
 * sends[i][j] is fulfilled by sender i and read as recvs[j][i] by receiver j.
 * Handoffs do not rendezvous: a sender never waits for its receiver.
 */
template<typename T>
std::pair<std::vector<std::vector<std::promise<T>>>, std::vector<std::vector<std::future<T>>>>
PromiseFutures(size_t senders, size_t receivers) {
	std::vector<std::vector<std::promise<T>>> sends(senders);
	std::vector<std::vector<std::future<T>>> recvs(receivers);
	for (auto& row : sends) {
		row.resize(receivers);
	}
	for (auto& row : recvs) {
		row.reserve(senders);
	}
	for (size_t i = 0; i < senders; ++i) {
		for (size_t j = 0; j < receivers; ++j) {
			recvs[j].push_back(sends[i][j].get_future());
		}
	}
	return {std::move(sends), std::move(recvs)};
}

} // namespace Sluice
