#include "transport_error.h"

#include <glog/logging.h>

namespace Sluice {

const char* ErrorKindName(ErrorKind kind) {
	switch (kind) {
		case ErrorKind::kRegistryLockCorrupted:
			return "RegistryLockCorrupted";
		case ErrorKind::kSlotAlreadyConsumed:
			return "SlotAlreadyConsumed";
		case ErrorKind::kTypeMismatch:
			return "TypeMismatch";
		case ErrorKind::kChannelDisconnected:
			return "ChannelDisconnected";
		case ErrorKind::kBuzzerExchangeFailed:
			return "BuzzerExchangeFailed";
	}
	return "Unknown";
}

void RaiseTransportError(ErrorKind kind, const std::string& what) {
	LOG(ERROR) << "[Sluice] " << ErrorKindName(kind) << ": " << what;
	throw TransportError(kind, what);
}

} // namespace Sluice
