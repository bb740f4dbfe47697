#pragma once

#include <string>
#include <chrono>
#include <array>
#include <cstdint>
#include <compare>
#include <random>
#include <sstream>
#include <iomanip>

namespace tinsel {

/**
 * Uuid - random (version 4) identifier used for outbox operation ids.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    constexpr Uuid() noexcept : bytes_{} {}
    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    [[nodiscard]] static Uuid generate() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dist;

        Bytes bytes;
        for (size_t i = 0; i < BYTE_SIZE; i += 8) {
            auto word = dist(gen);
            for (size_t j = 0; j < 8; ++j) {
                bytes[i + j] = static_cast<uint8_t>(word >> (j * 8));
            }
        }

        bytes[6] = (bytes[6] & 0x0F) | 0x40;
        bytes[8] = (bytes[8] & 0x3F) | 0x80;

        return Uuid(bytes);
    }

    /**
     * Hyphenated lowercase form: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
     */
    [[nodiscard]] std::string to_string() const {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (size_t i = 0; i < BYTE_SIZE; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                oss << '-';
            }
            oss << std::setw(2) << static_cast<int>(bytes_[i]);
        }
        return oss.str();
    }

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    Bytes bytes_;
};

/**
 * Timestamp - milliseconds since the Unix epoch.
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

    Timestamp operator+(Duration d) const { return Timestamp(millis_ + d.count()); }
    Duration operator-(const Timestamp& other) const { return Duration(millis_ - other.millis_); }

private:
    int64_t millis_;
};

} // namespace tinsel
