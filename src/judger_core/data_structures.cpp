#include "proctor/judger/data_structures.hpp"
#include <cstdio>
#include <ctime>

namespace proctor::judger {

std::string msToISO8601(int64_t ts_ms) {
    time_t sec = static_cast<time_t>(ts_ms / 1000);
    int millis = static_cast<int>(ts_ms % 1000);
    if (millis < 0) { millis += 1000; --sec; }
    struct tm utc_tm{};
#ifdef _WIN32
    gmtime_s(&utc_tm, &sec);
#else
    gmtime_r(&sec, &utc_tm);
#endif
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc_tm);
    char out[40];
    snprintf(out, sizeof(out), "%s.%03dZ", buf, millis);
    return std::string(out);
}

nlohmann::json ViolationSignal::toJson() const {
    return {
        {"id", id},
        {"sessionId", session_id},
        {"kind", vision::toString(kind)},
        {"severity", vision::toString(severity)},
        {"message", message},
        {"timestamp", msToISO8601(ts_ms)}
    };
}

} // namespace proctor::judger
