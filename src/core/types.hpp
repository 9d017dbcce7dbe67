#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace folio {

/**
 * Block and section identity. Stored and compared as the canonical lowercase
 * hyphenated UUID text; the same string is written into identity anchors.
 */
using BlockId = std::string;
using ProjectId = std::string;

/**
 * Generate a random (version 4) UUID string.
 */
[[nodiscard]] BlockId generate_block_id();

/**
 * True if every character is a hex digit or '-', which is what the
 * identity anchor grammar accepts.
 */
[[nodiscard]] bool is_anchor_safe_id(std::string_view id) noexcept;

/**
 * Timestamp - milliseconds since the Unix epoch, as stored in SQLite.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;

    constexpr Timestamp() noexcept : millis_(0) {}
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::duration_cast<Duration>(
            Clock::now().time_since_epoch()).count());
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept { return millis_; }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

private:
    int64_t millis_;
};

} // namespace folio
