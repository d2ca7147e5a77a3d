#pragma once

#include <string>

namespace meetscribe {
namespace utils {

// Random (version 4) UUIDs with an optional readable prefix, e.g. "chunk_<uuid>"
class IdGenerator {
public:
    static std::string uuid();
    static std::string generate(const std::string& prefix);
};

} // namespace utils
} // namespace meetscribe
