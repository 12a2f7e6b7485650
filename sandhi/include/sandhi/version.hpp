#pragma once

#define SANDHI_VERSION "1.4.0"
#define SANDHI_CACHE_FORMAT_VERSION 1

namespace sandhi {
namespace version {

inline bool cache_format_compatible(int format) {
    // Older payloads are readable, newer ones are not
    return format >= 1 && format <= SANDHI_CACHE_FORMAT_VERSION;
}

} // namespace version
} // namespace sandhi
