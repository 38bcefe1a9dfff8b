#include "JobId.hpp"

#include <openssl/rand.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace net_survey::engine
{
    std::string NewJobId()
    {
        std::vector<unsigned char> bytes(16);
        if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1)
            throw std::runtime_error("RAND_bytes failed while generating a job id");

        std::stringstream ss;
        for (unsigned char b : bytes)
            ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
        return ss.str();
    }
}
