// SPDX-License-Identifier: Apache-2.0

#include "Error.hpp"
#include "Logger.hpp"

namespace Quarry
{

Error::Error(ErrorCode code, std::string_view message, std::source_location sourceLocation):
    std::runtime_error(std::string(message)),
    _code { code }
{
    Logger::GetLogger().OnError(code, message, sourceLocation);
}

} // namespace Quarry
