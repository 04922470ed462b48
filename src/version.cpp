/**
 * @file version.cpp
 * @brief Library version
 */

#include "smcpso/smcpso.hpp"

namespace smcpso {

const char* getVersion() {
    return Version::getString();
}

}  // namespace smcpso
