#pragma once

#include <string>

namespace net_survey::engine
{
    // 128 random bits from OpenSSL, hex encoded. Throws std::runtime_error if
    // the RNG cannot be seeded.
    std::string NewJobId();
}
