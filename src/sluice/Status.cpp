#include "sluice/Status.hpp"

namespace sluice {

const char* statusName(Status status) {
    switch (status) {
    case kOk:
        return "Ok";
    case kArenaExhausted:
        return "ArenaExhausted";
    case kOutOfBounds:
        return "OutOfBounds";
    case kNotRegistered:
        return "NotRegistered";
    case kArenaUnmapped:
        return "ArenaUnmapped";
    case kInvalidArguments:
        return "InvalidArguments";
    case kImplementationFailed:
        return "ImplementationFailed";
    }
    return "Unknown";
}

} // namespace sluice
