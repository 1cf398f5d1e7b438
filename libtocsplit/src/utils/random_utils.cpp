#include "random_utils.hpp"
#include <uuid/uuid.h>

std::string RandomUtils::uuid_v4() {
    uuid_t uu;
    uuid_generate_random(uu);
    char out[37];
    uuid_unparse_lower(uu, out);
    return std::string(out);
}
