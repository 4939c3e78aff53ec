#pragma once

#include <stdexcept>

namespace Stanchion {

/**
 * @brief Invalid configuration (weight ordering, malformed file, bad bounds)
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace Stanchion
