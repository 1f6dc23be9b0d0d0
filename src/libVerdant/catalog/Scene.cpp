#include "Scene.hpp"

#include <charconv>
#include <cstdio>

namespace verdant {

Optional<Date> ParseDate(StringView text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    auto parseField = [&text](usize offset, usize length, int& out) {
        const char* begin = text.data() + offset;
        auto [ptr, ec] = std::from_chars(begin, begin + length, out);
        return ec == std::errc{} && ptr == begin + length;
    };

    int year = 0;
    int month = 0;
    int day = 0;
    if (!parseField(0, 4, year) || !parseField(5, 2, month) || !parseField(8, 2, day)) {
        return std::nullopt;
    }

    Date date{std::chrono::year{year},
              std::chrono::month{static_cast<unsigned>(month)},
              std::chrono::day{static_cast<unsigned>(day)}};
    if (!date.ok()) {
        return std::nullopt;
    }
    return date;
}

String FormatDate(const Date& date) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u",
                  static_cast<int>(date.year()),
                  static_cast<unsigned>(date.month()),
                  static_cast<unsigned>(date.day()));
    return buffer;
}

} // namespace verdant
