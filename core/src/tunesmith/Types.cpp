#include "tunesmith/Types.h"

namespace tunesmith {

const char* errorToString(const Error error) noexcept
{
    switch (error) {
        case Error::kInvalidParameter:
            return "invalid parameter";
        case Error::kInvalidWavetable:
            return "invalid wavetable";
        case Error::kCacheFull:
            return "cache full";
        case Error::kExtremePitchShift:
            return "extreme pitch shift";
        case Error::kRenderAborted:
            return "render aborted";
    }
    return "unknown error";
}

}  // namespace tunesmith
