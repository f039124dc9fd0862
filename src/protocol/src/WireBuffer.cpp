// /////////////////////////////////////////////////////////////////////////////
/// @file WireBuffer.cpp
/// @brief WireWriter / WireReader implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <fdp/protocol/WireBuffer.hpp>

namespace fdp::protocol {

// -------------------------------------------------------------------------- //
//  Write                                                                     //
// -------------------------------------------------------------------------- //

WireWriter::WireWriter(core::usize reserve)
{
    buffer_.reserve(reserve);
}

void WireWriter::writeU8(core::u8 value)
{
    buffer_.push_back(value);
}

void WireWriter::writeU32(core::u32 value)
{
    for (int shift = 24; shift >= 0; shift -= 8)
    {
        buffer_.push_back(static_cast<core::u8>(value >> shift));
    }
}

void WireWriter::writeU64(core::u64 value)
{
    for (int shift = 56; shift >= 0; shift -= 8)
    {
        buffer_.push_back(static_cast<core::u8>(value >> shift));
    }
}

void WireWriter::writeBytes(std::span<const core::u8> bytes)
{
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

std::span<const core::u8> WireWriter::data() const noexcept { return buffer_; }
core::usize               WireWriter::size() const noexcept { return buffer_.size(); }

std::vector<core::u8> WireWriter::release() noexcept
{
    return std::move(buffer_);
}

// -------------------------------------------------------------------------- //
//  Read                                                                      //
// -------------------------------------------------------------------------- //

WireReader::WireReader(std::span<const core::u8> data) noexcept
    : data_{data}
{}

core::Expected<core::u8> WireReader::readU8()
{
    if (remaining() < 1)
    {
        return core::makeError(core::ErrorCode::kBufferUnderflow, "WireReader underflow");
    }
    return data_[cursor_++];
}

core::Expected<core::u32> WireReader::readU32()
{
    if (remaining() < sizeof(core::u32))
    {
        return core::makeError(core::ErrorCode::kBufferUnderflow, "WireReader underflow");
    }

    core::u32 value = 0;
    for (core::usize i = 0; i < sizeof(core::u32); ++i)
    {
        value = (value << 8) | data_[cursor_++];
    }
    return value;
}

core::Expected<core::u64> WireReader::readU64()
{
    if (remaining() < sizeof(core::u64))
    {
        return core::makeError(core::ErrorCode::kBufferUnderflow, "WireReader underflow");
    }

    core::u64 value = 0;
    for (core::usize i = 0; i < sizeof(core::u64); ++i)
    {
        value = (value << 8) | data_[cursor_++];
    }
    return value;
}

core::Expected<std::span<const core::u8>> WireReader::readBytes(core::usize count)
{
    if (remaining() < count)
    {
        return core::makeError(core::ErrorCode::kBufferUnderflow, "WireReader underflow");
    }

    auto view = data_.subspan(cursor_, count);
    cursor_ += count;
    return view;
}

// -------------------------------------------------------------------------- //
//  Query                                                                     //
// -------------------------------------------------------------------------- //

core::usize WireReader::position() const noexcept  { return cursor_; }
core::usize WireReader::remaining() const noexcept { return data_.size() - cursor_; }

} // namespace fdp::protocol
