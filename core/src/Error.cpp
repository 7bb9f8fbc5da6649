/**
 * @file Error.cpp
 * @brief Implementation of Error::format().
 */

#include "bio/core/Error.hpp"

#include <sstream>

namespace bio::core {

std::string Error::format() const
{
    std::ostringstream os;
    os << '[' << errorCodeName(code) << "] " << message
       << " (" << location.file_name() << ':' << location.line() << ')';
    return os.str();
}

} // namespace bio::core
