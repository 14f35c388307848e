#include <cstdio>

#include "docwire/write/types.hpp"

namespace docwire {

    namespace {
        // Days since 1970-01-01 of a proleptic Gregorian date.
        std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
            y -= m <= 2;
            const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
            const auto yoe = static_cast<unsigned>(y - era * 400);
            const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
            const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
        }

        void civil_from_days(std::int64_t z, std::int64_t& y, unsigned& m,
                             unsigned& d) {
            z += 719468;
            const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
            const auto doe = static_cast<unsigned>(z - era * 146097);
            const unsigned yoe =
                (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            y = static_cast<std::int64_t>(yoe) + era * 400;
            const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const unsigned mp = (5 * doy + 2) / 153;
            d = doy - (153 * mp + 2) / 5 + 1;
            m = mp < 10 ? mp + 3 : mp - 9;
            y += m <= 2;
        }

        bool read_digits(std::string_view s, std::size_t pos, std::size_t n,
                         unsigned& out) {
            if (pos + n > s.size()) return false;
            out = 0;
            for (std::size_t i = pos; i < pos + n; ++i) {
                if (s[i] < '0' || s[i] > '9') return false;
                out = out * 10 + static_cast<unsigned>(s[i] - '0');
            }
            return true;
        }
    }  // namespace

    std::optional<Timestamp> parse_rfc3339(std::string_view s) {
        // YYYY-MM-DDTHH:MM:SS[.fraction]Z
        unsigned year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        if (!read_digits(s, 0, 4, year) || s.size() < 20 || s[4] != '-' ||
            !read_digits(s, 5, 2, month) || s[7] != '-' ||
            !read_digits(s, 8, 2, day) || (s[10] != 'T' && s[10] != 't') ||
            !read_digits(s, 11, 2, hour) || s[13] != ':' ||
            !read_digits(s, 14, 2, minute) || s[16] != ':' ||
            !read_digits(s, 17, 2, second)) {
            return std::nullopt;
        }
        if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
            minute > 59 || second > 60) {
            return std::nullopt;
        }

        std::size_t pos = 19;
        std::int32_t nanos = 0;
        if (s[pos] == '.') {
            ++pos;
            int digits = 0;
            while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
                if (digits < 9) {
                    nanos = nanos * 10 + (s[pos] - '0');
                    ++digits;
                }
                ++pos;
            }
            if (digits == 0) return std::nullopt;
            for (; digits < 9; ++digits) nanos *= 10;
        }
        if (pos + 1 != s.size() || (s[pos] != 'Z' && s[pos] != 'z')) {
            return std::nullopt;
        }

        Timestamp ts;
        ts.seconds = days_from_civil(year, month, day) * 86400 +
                     static_cast<std::int64_t>(hour) * 3600 + minute * 60 +
                     second;
        ts.nanos = nanos;
        return ts;
    }

    std::string to_rfc3339(const Timestamp& ts) {
        std::int64_t days = ts.seconds / 86400;
        std::int64_t rem = ts.seconds % 86400;
        if (rem < 0) {
            rem += 86400;
            --days;
        }
        std::int64_t year = 0;
        unsigned month = 0, day = 0;
        civil_from_days(days, year, month, day);

        char buf[40];
        std::snprintf(buf, sizeof(buf),
                      "%04lld-%02u-%02uT%02lld:%02lld:%02lld.%09dZ",
                      static_cast<long long>(year), month, day,
                      static_cast<long long>(rem / 3600),
                      static_cast<long long>((rem % 3600) / 60),
                      static_cast<long long>(rem % 60), ts.nanos);
        return buf;
    }

}  // namespace docwire
