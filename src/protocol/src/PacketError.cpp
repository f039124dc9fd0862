// /////////////////////////////////////////////////////////////////////////////
/// @file PacketError.cpp
/// @brief PacketError::format() implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <fdp/protocol/PacketError.hpp>

#include <sstream>

namespace fdp::protocol {

std::string PacketError::format() const
{
    std::ostringstream os;
    os << '[' << packetErrorName(code_) << "] " << message_
       << " (" << location_.file_name() << ':' << location_.line() << ')';
    return os.str();
}

} // namespace fdp::protocol
