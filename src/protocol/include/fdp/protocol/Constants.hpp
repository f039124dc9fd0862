// /////////////////////////////////////////////////////////////////////////////
/// @file Constants.hpp
/// @brief Wire-format constants: protocol version, sizes and field offsets.
///
/// Layout of an encoded packet:
///
///     offset  size  field
///     0       1     version
///     1       16    session id
///     17      1     intent code
///     18      1     priority
///     19      1     flags
///     20      4     sequence (big-endian)
///     24      4     payload length (big-endian)
///     28      8     timestamp, ms since epoch (big-endian)
///     36      N     payload
///     36+N    32    integrity hash (SHA-256)
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <fdp/core/Types.hpp>

namespace fdp::protocol {

inline constexpr core::u8    kProtocolVersion     = 1;

inline constexpr core::usize kSessionIdSize       = 16;
inline constexpr core::usize kHeaderSize          = 36;
inline constexpr core::usize kHashSize            = 32;
inline constexpr core::usize kMinPacketSize       = kHeaderSize + kHashSize;
inline constexpr core::usize kMaxPayloadSize      = 10 * 1024 * 1024;
inline constexpr core::usize kMaxPacketSize       = kHeaderSize + kMaxPayloadSize + kHashSize;

inline constexpr core::usize kVersionOffset       = 0;
inline constexpr core::usize kSessionIdOffset     = 1;
inline constexpr core::usize kIntentOffset        = 17;
inline constexpr core::usize kPriorityOffset      = 18;
inline constexpr core::usize kFlagsOffset         = 19;
inline constexpr core::usize kSequenceOffset      = 20;
inline constexpr core::usize kPayloadLengthOffset = 24;
inline constexpr core::usize kTimestampOffset     = 28;

static_assert(kTimestampOffset + sizeof(core::u64) == kHeaderSize);
static_assert(kMinPacketSize == 68);

} // namespace fdp::protocol
