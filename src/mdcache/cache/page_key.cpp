#include "mdcache/cache/page_key.h"

#include <sstream>

namespace mdcache {
namespace cache {

std::string PageKey::to_string() const {
    std::ostringstream oss;
    oss << core::to_string(kind) << ":" << symbol << ":" << sub_key << ":" << range.start << ":"
        << range.end;
    return oss.str();
}

} // namespace cache
} // namespace mdcache
