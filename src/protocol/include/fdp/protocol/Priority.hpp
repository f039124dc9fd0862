// /////////////////////////////////////////////////////////////////////////////
/// @file Priority.hpp
/// @brief Ordered scheduling hint, one byte on the wire.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <fdp/core/Types.hpp>

#include <compare>

namespace fdp::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @class Priority
/// @brief Plain ordered scalar. Every byte value is a legal priority; the
///        five named levels are reference points, not an exhaustive set.
// /////////////////////////////////////////////////////////////////////////////
class Priority
{
public:
    constexpr Priority() noexcept = default;
    constexpr explicit Priority(core::u8 value) noexcept : value_{value} {}

    [[nodiscard]] static constexpr Priority lowest()   noexcept { return Priority{0}; }
    [[nodiscard]] static constexpr Priority low()      noexcept { return Priority{64}; }
    [[nodiscard]] static constexpr Priority normal()   noexcept { return Priority{128}; }
    [[nodiscard]] static constexpr Priority high()     noexcept { return Priority{192}; }
    [[nodiscard]] static constexpr Priority critical() noexcept { return Priority{255}; }

    [[nodiscard]] constexpr core::u8 value() const noexcept { return value_; }

    constexpr auto operator<=>(const Priority&) const noexcept = default;

private:
    core::u8 value_{128};
};

} // namespace fdp::protocol
