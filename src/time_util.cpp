#include "agenttreasury/time_util.hpp"

#include <cstdio>
#include <random>

namespace agenttreasury {

namespace {

constexpr std::int64_t MILLIS_PER_DAY = 86400000;

std::int64_t floor_div(std::int64_t a, std::int64_t b) {
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

} // anonymous namespace

std::int64_t to_unix_millis(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()).count();
}

Timestamp from_unix_millis(std::int64_t millis) {
    return Timestamp(std::chrono::duration_cast<Duration>(
        std::chrono::milliseconds(millis)));
}

LocalDate local_date(Timestamp t, std::int32_t utc_offset_minutes) {
    std::int64_t local_ms = to_unix_millis(t) +
                            static_cast<std::int64_t>(utc_offset_minutes) * 60000;
    return floor_div(local_ms, MILLIS_PER_DAY);
}

std::string format_date(LocalDate date) {
    // Days-to-civil conversion (proleptic Gregorian calendar)
    std::int64_t z = date + 719468;
    std::int64_t era = floor_div(z, 146097);
    std::int64_t doe = z - era * 146097;
    std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    std::int64_t y = yoe + era * 400;
    std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    std::int64_t mp = (5 * doy + 2) / 153;
    std::int64_t d = doy - (153 * mp + 2) / 5 + 1;
    std::int64_t m = mp < 10 ? mp + 3 : mp - 9;
    if (m <= 2) {
        ++y;
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04lld-%02lld-%02lld",
                  static_cast<long long>(y), static_cast<long long>(m),
                  static_cast<long long>(d));
    return buf;
}

std::string generate_uuid() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dis;

    std::uint64_t hi = dis(gen);
    std::uint64_t lo = dis(gen);

    // Version 4, RFC 4122 variant
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

} // namespace agenttreasury
