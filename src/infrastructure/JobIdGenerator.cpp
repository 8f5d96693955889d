#include "infrastructure/JobIdGenerator.hpp"

#include <uuid/uuid.h>

namespace audioscribe::infrastructure {

std::string JobIdGenerator::Generate() {
    uuid_t id;
    uuid_generate_random(id);
    char text[37];
    uuid_unparse_lower(id, text);
    return std::string(text);
}

} // namespace audioscribe::infrastructure
