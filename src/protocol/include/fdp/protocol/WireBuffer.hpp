// /////////////////////////////////////////////////////////////////////////////
/// @file WireBuffer.hpp
/// @brief Byte-aligned big-endian writer and bounds-checked reader.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <fdp/core/Expected.hpp>
#include <fdp/core/NonCopyable.hpp>
#include <fdp/core/Types.hpp>

#include <span>
#include <vector>

namespace fdp::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @class WireWriter
/// @brief Appends fixed-width integers in network byte order.
// /////////////////////////////////////////////////////////////////////////////
class WireWriter final : public core::NonCopyable<WireWriter>
{
public:
    /// @brief Constructs an empty writer.
    /// @param reserve Capacity to allocate up front.
    explicit WireWriter(core::usize reserve = 0);

    void writeU8(core::u8 value);
    void writeU32(core::u32 value);
    void writeU64(core::u64 value);
    void writeBytes(std::span<const core::u8> bytes);

    /// @brief Returns the bytes written so far.
    [[nodiscard]] std::span<const core::u8> data() const noexcept;

    [[nodiscard]] core::usize size() const noexcept;

    /// @brief Hands over the buffer, leaving the writer empty.
    [[nodiscard]] std::vector<core::u8> release() noexcept;

private:
    std::vector<core::u8> buffer_;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class WireReader
/// @brief Reads fixed-width big-endian integers from a borrowed span.
///
/// Every read checks the remaining length first and fails with
/// kBufferUnderflow instead of touching memory past the end.
// /////////////////////////////////////////////////////////////////////////////
class WireReader final
{
public:
    explicit WireReader(std::span<const core::u8> data) noexcept;

    [[nodiscard]] core::Expected<core::u8>  readU8();
    [[nodiscard]] core::Expected<core::u32> readU32();
    [[nodiscard]] core::Expected<core::u64> readU64();

    /// @brief Returns a view of the next @p count bytes without copying.
    [[nodiscard]] core::Expected<std::span<const core::u8>> readBytes(core::usize count);

    [[nodiscard]] core::usize position() const noexcept;
    [[nodiscard]] core::usize remaining() const noexcept;

private:
    std::span<const core::u8> data_;
    core::usize               cursor_{0};
};

} // namespace fdp::protocol
