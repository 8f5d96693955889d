#pragma once

#include <string>

namespace audioscribe::infrastructure {

/**
 * @brief Random (v4) UUIDs, lower-case, used as job identifiers.
 */
class JobIdGenerator {
public:
    static std::string Generate();
};

} // namespace audioscribe::infrastructure
