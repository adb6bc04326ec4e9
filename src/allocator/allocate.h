#pragma once

#include <chrono>
#include <optional>
#include <utility>

#include "event.h"

namespace Sluice {

/**
 * Sending half of a channel, shared by every transport.
 * Push consumes the element; an empty element is a flush and sends nothing.
 */
template<typename T>
class IPush {
public:
    virtual ~IPush() = default;

    virtual void Push(std::optional<T> element) = 0;

    void Done() { Push(std::nullopt); }
};

/**
 * Receiving half of a channel. Pull never blocks: it refreshes the held slot
 * with the next available element, or clears it if nothing is pending.
 */
template<typename T>
class IPull {
public:
    virtual ~IPull() = default;

    virtual std::optional<T>& Pull() = 0;
};

/**
 * Per-worker allocator surface that does not depend on payload types.
 * Allocation itself is a template on the concrete allocator.
 */
class IAllocator {
public:
    virtual ~IAllocator() = default;

    virtual size_t Index() const = 0;
    virtual size_t Peers() const = 0;
    virtual const SharedEventQueue& Events() const = 0;

    // Blocks the calling worker until events are pending, it is buzzed, or
    // the timeout elapses. No timeout waits indefinitely.
    virtual void AwaitEvents(std::optional<std::chrono::milliseconds> timeout) = 0;

    // Moves progress reported by peers into the local event queue.
    virtual void Receive() {}
};

} // namespace Sluice
