#ifndef TOCSPLIT_RANDOM_UTILS_HPP
#define TOCSPLIT_RANDOM_UTILS_HPP

#include <string>

/**
 * @brief Random identifiers, backed by libuuid.
 */
namespace RandomUtils {

    /**
     * @brief Generates a random (version 4) UUID in lowercase canonical form.
     * @return 36 character string such as "1b4e28ba-2fa1-41d2-883f-0016d3cca427".
     */
    std::string uuid_v4();

} // namespace RandomUtils

#endif // TOCSPLIT_RANDOM_UTILS_HPP
