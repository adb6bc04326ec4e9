#ifndef SLUICE_SRC_COMMON_TRANSPORT_ERROR_H_
#define SLUICE_SRC_COMMON_TRANSPORT_ERROR_H_

#include <stdexcept>
#include <string>

namespace Sluice {

/**
 * Failure classes of the transport layer. None of them is recoverable here;
 * the worker that observes one is expected to terminate.
 */
enum class ErrorKind {
	kRegistryLockCorrupted,
	kSlotAlreadyConsumed,
	kTypeMismatch,
	kChannelDisconnected,
	kBuzzerExchangeFailed,
};

const char* ErrorKindName(ErrorKind kind);

class TransportError : public std::runtime_error {
	public:
		TransportError(ErrorKind kind, const std::string& what)
			: std::runtime_error(std::string(ErrorKindName(kind)) + ": " + what),
			kind_(kind) {}

		ErrorKind kind() const { return kind_; }

	private:
		ErrorKind kind_;
};

// Logs at ERROR and throws. Every fatal path in the allocator goes through here.
[[noreturn]] void RaiseTransportError(ErrorKind kind, const std::string& what);

} // namespace Sluice

#endif // SLUICE_SRC_COMMON_TRANSPORT_ERROR_H_
