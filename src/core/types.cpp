#include "core/types.hpp"

#include <array>
#include <iomanip>
#include <random>
#include <sstream>

namespace folio {

BlockId generate_block_id() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dist;

    std::array<uint8_t, 16> bytes{};
    for (size_t half = 0; half < 2; ++half) {
        auto word = dist(gen);
        for (size_t i = 0; i < 8; ++i) {
            bytes[half * 8 + i] = static_cast<uint8_t>(word >> (i * 8));
        }
    }

    // Version 4, RFC 4122 variant
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

bool is_anchor_safe_id(std::string_view id) noexcept {
    if (id.empty()) return false;
    for (char c : id) {
        bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        if (!hex && c != '-') return false;
    }
    return true;
}

static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");

} // namespace folio
