#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace gpi {

// Currency amount held in micro-units so stake rounding to increments is exact.
class Money {
public:
    static constexpr std::int64_t kScale = 1'000'000;

    Money() : micros_(0) {}

    static Money fromMicros(std::int64_t micros) { return Money(micros); }

    static Money fromDouble(double value) {
        if (!std::isfinite(value)) {
            throw std::domain_error("Money amount must be finite");
        }
        return Money(saturate(std::round(value * static_cast<double>(kScale))));
    }

    // Rounds toward zero at micro-unit precision; used where exceeding a bound is not allowed.
    static Money fromDoubleFloor(double value) {
        if (!std::isfinite(value)) {
            throw std::domain_error("Money amount must be finite");
        }
        return Money(saturate(std::floor(value * static_cast<double>(kScale))));
    }

    double toDouble() const { return static_cast<double>(micros_) / static_cast<double>(kScale); }
    std::int64_t micros() const { return micros_; }

    bool isZero() const { return micros_ == 0; }
    bool isPositive() const { return micros_ > 0; }

    // Largest multiple of step not greater than this amount.
    Money floorTo(Money step) const {
        if (step.micros_ <= 0) {
            throw std::invalid_argument("Money::floorTo requires a positive step");
        }
        std::int64_t rem = micros_ % step.micros_;
        if (rem < 0) {
            rem += step.micros_;
        }
        return Money(micros_ - rem);
    }

    Money scaledDown(double factor) const { return fromDoubleFloor(toDouble() * factor); }

    // Two-decimal rendering, half away from zero. Only used at artifact boundaries.
    std::string format() const {
        constexpr std::int64_t kCent = kScale / 100;
        __int128 cents = static_cast<__int128>(micros_) / kCent;
        __int128 rem = static_cast<__int128>(micros_) % kCent;
        if (rem * 2 >= kCent) {
            ++cents;
        } else if (rem * 2 <= -kCent) {
            --cents;
        }
        bool negative = cents < 0;
        if (negative) {
            cents = -cents;
        }
        auto whole = static_cast<std::int64_t>(cents / 100);
        auto frac = static_cast<int>(cents % 100);
        std::string out = negative ? "-" : "";
        out += std::to_string(whole);
        out += '.';
        out += static_cast<char>('0' + frac / 10);
        out += static_cast<char>('0' + frac % 10);
        return out;
    }

    Money operator+(Money other) const {
        return Money(clampToInt64(static_cast<__int128>(micros_) + other.micros_));
    }
    Money operator-(Money other) const {
        return Money(clampToInt64(static_cast<__int128>(micros_) - other.micros_));
    }
    Money& operator+=(Money other) {
        micros_ = clampToInt64(static_cast<__int128>(micros_) + other.micros_);
        return *this;
    }
    Money& operator-=(Money other) {
        micros_ = clampToInt64(static_cast<__int128>(micros_) - other.micros_);
        return *this;
    }

    bool operator<(Money other) const { return micros_ < other.micros_; }
    bool operator>(Money other) const { return micros_ > other.micros_; }
    bool operator<=(Money other) const { return micros_ <= other.micros_; }
    bool operator>=(Money other) const { return micros_ >= other.micros_; }
    bool operator==(Money other) const { return micros_ == other.micros_; }
    bool operator!=(Money other) const { return micros_ != other.micros_; }

private:
    explicit Money(std::int64_t micros) : micros_(micros) {}

    static std::int64_t saturate(double scaled) {
        if (scaled >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
            return std::numeric_limits<std::int64_t>::max();
        }
        if (scaled <= static_cast<double>(std::numeric_limits<std::int64_t>::min())) {
            return std::numeric_limits<std::int64_t>::min();
        }
        return static_cast<std::int64_t>(scaled);
    }

    static std::int64_t clampToInt64(__int128 value) {
        if (value > static_cast<__int128>(std::numeric_limits<std::int64_t>::max())) {
            return std::numeric_limits<std::int64_t>::max();
        }
        if (value < static_cast<__int128>(std::numeric_limits<std::int64_t>::min())) {
            return std::numeric_limits<std::int64_t>::min();
        }
        return static_cast<std::int64_t>(value);
    }

    std::int64_t micros_;
};

inline Money minMoney(Money a, Money b) {
    return (b < a) ? b : a;
}

inline Money maxMoney(Money a, Money b) {
    return (a < b) ? b : a;
}

} // namespace gpi
