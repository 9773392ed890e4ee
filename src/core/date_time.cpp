// EN: ISO-8601 calendar types - parsing, formatting and ordering of Date, Time and DateTime
// FR: Types calendaires ISO-8601 - parsing, formatage et ordre de Date, Time et DateTime

#include "core/value.hpp"

#include <cstdio>
#include <regex>

namespace BJS {

namespace {

constexpr int64_t MICROS_PER_SECOND = 1000000;
constexpr int64_t MICROS_PER_DAY = 86400LL * MICROS_PER_SECOND;

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return days[month - 1];
}

// EN: Days from civil date (H. Hinnant's algorithm), relative to 1970-01-01.
// FR: Jours depuis une date civile (algorithme de H. Hinnant), relatif au 1970-01-01.
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

int parseOffset(const std::string& text) {
    if (text.empty()) {
        return 0;
    }
    if (text == "Z") {
        return 0;
    }
    int sign = text[0] == '-' ? -1 : 1;
    int hours = std::stoi(text.substr(1, 2));
    int minutes = std::stoi(text.substr(4, 2));
    if (hours > 23 || minutes > 59) {
        throw CoercionError("UTC offset out of range: '" + text + "'");
    }
    return sign * (hours * 60 + minutes);
}

std::string formatOffset(int offset_minutes) {
    char buffer[8];
    int absolute = offset_minutes < 0 ? -offset_minutes : offset_minutes;
    std::snprintf(buffer, sizeof(buffer), "%c%02d:%02d", offset_minutes < 0 ? '-' : '+',
                  absolute / 60, absolute % 60);
    return buffer;
}

int sign(int64_t delta) {
    return delta < 0 ? -1 : (delta > 0 ? 1 : 0);
}

} // namespace

// EN: Date implementation
// FR: Implémentation Date
Date::Date(int y, int m, int d) : year(y), month(m), day(d) {
    if (y < 1 || y > 9999) {
        throw CoercionError("year " + std::to_string(y) + " is out of range");
    }
    if (m < 1 || m > 12) {
        throw CoercionError("month must be in 1..12 (received " + std::to_string(m) + ")");
    }
    if (d < 1 || d > daysInMonth(y, m)) {
        throw CoercionError("day is out of range for month (received " + std::to_string(d) + ")");
    }
}

Date Date::fromIsoFormat(const std::string& text) {
    static const std::regex date_pattern(R"((\d{4})-(\d{2})-(\d{2}))");
    std::smatch match;
    if (!std::regex_match(text, match, date_pattern)) {
        throw CoercionError("invalid isoformat string for date: '" + text + "'");
    }
    return Date(std::stoi(match[1].str()), std::stoi(match[2].str()), std::stoi(match[3].str()));
}

std::string Date::toIsoFormat() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return buffer;
}

int64_t Date::toEpochDays() const {
    return daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

int Date::compare(const Date& other) const {
    return sign(toEpochDays() - other.toEpochDays());
}

// EN: Time implementation
// FR: Implémentation Time
Time::Time(int h, int m, int s, int us, std::optional<int> offset)
    : hour(h), minute(m), second(s), microsecond(us), utc_offset_minutes(offset) {
    if (h < 0 || h > 23 || m < 0 || m > 59 || s < 0 || s > 59) {
        throw CoercionError("time component out of range");
    }
    if (us < 0 || us > 999999) {
        throw CoercionError("microsecond must be in 0..999999");
    }
    if (offset && (*offset <= -24 * 60 || *offset >= 24 * 60)) {
        throw CoercionError("UTC offset must be strictly between -24 and 24 hours");
    }
}

Time Time::fromIsoFormat(const std::string& text) {
    static const std::regex time_pattern(
        R"((\d{2}):(\d{2})(?::(\d{2})(?:\.(\d{6}|\d{3}))?)?(Z|[+-]\d{2}:\d{2})?)");
    std::smatch match;
    if (!std::regex_match(text, match, time_pattern)) {
        throw CoercionError("invalid isoformat string for time: '" + text + "'");
    }

    int seconds = match[3].matched ? std::stoi(match[3].str()) : 0;
    int micros = 0;
    if (match[4].matched) {
        const std::string fraction = match[4].str();
        micros = std::stoi(fraction);
        if (fraction.size() == 3) {
            micros *= 1000;
        }
    }

    std::optional<int> offset;
    if (match[5].matched) {
        offset = parseOffset(match[5].str());
    }
    return Time(std::stoi(match[1].str()), std::stoi(match[2].str()), seconds, micros, offset);
}

std::string Time::toIsoFormat() const {
    char buffer[24];
    if (microsecond != 0) {
        std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d.%06d", hour, minute, second, microsecond);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d", hour, minute, second);
    }
    std::string result = buffer;
    if (utc_offset_minutes) {
        result += formatOffset(*utc_offset_minutes);
    }
    return result;
}

int64_t Time::toMicroseconds() const {
    return ((hour * 60LL + minute) * 60LL + second) * MICROS_PER_SECOND + microsecond;
}

int Time::compare(const Time& other) const {
    if (isAware() != other.isAware()) {
        throw ValueTypeError("cannot compare offset-naive and offset-aware times");
    }
    int64_t lhs = toMicroseconds();
    int64_t rhs = other.toMicroseconds();
    if (isAware()) {
        lhs -= *utc_offset_minutes * 60LL * MICROS_PER_SECOND;
        rhs -= *other.utc_offset_minutes * 60LL * MICROS_PER_SECOND;
    }
    return sign(lhs - rhs);
}

bool Time::operator==(const Time& other) const {
    if (isAware() != other.isAware()) {
        return false;
    }
    return compare(other) == 0;
}

// EN: DateTime implementation
// FR: Implémentation DateTime
DateTime DateTime::fromIsoFormat(const std::string& text) {
    if (text.size() == 10) {
        return DateTime(Date::fromIsoFormat(text), Time());
    }
    if (text.size() < 11 || (text[10] != 'T' && text[10] != ' ')) {
        throw CoercionError("invalid isoformat string for datetime: '" + text + "'");
    }
    return DateTime(Date::fromIsoFormat(text.substr(0, 10)), Time::fromIsoFormat(text.substr(11)));
}

std::string DateTime::toIsoFormat() const {
    return date.toIsoFormat() + "T" + time.toIsoFormat();
}

int DateTime::compare(const DateTime& other) const {
    if (isAware() != other.isAware()) {
        throw ValueTypeError("cannot compare offset-naive and offset-aware datetimes");
    }
    auto instant = [](const DateTime& value) {
        int64_t micros = value.date.toEpochDays() * MICROS_PER_DAY + value.time.toMicroseconds();
        if (value.isAware()) {
            micros -= *value.time.utc_offset_minutes * 60LL * MICROS_PER_SECOND;
        }
        return micros;
    };
    return sign(instant(*this) - instant(other));
}

bool DateTime::operator==(const DateTime& other) const {
    if (isAware() != other.isAware()) {
        return false;
    }
    return compare(other) == 0;
}

} // namespace BJS
