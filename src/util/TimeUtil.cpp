#include "util/TimeUtil.h"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace TimeUtil {

namespace {

std::string FormatLocal(time_t ts, const char* format) {
    std::tm tm = LocalTime(ts);
    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

} // namespace

int64_t NowTs() {
    return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
}

std::tm LocalTime(time_t ts) {
    std::tm out{};
#ifdef _WIN32
    localtime_s(&out, &ts);
#else
    localtime_r(&ts, &out);
#endif
    return out;
}

std::string FormatTimeHHMMSS(time_t ts) {
    return FormatLocal(ts, "%H:%M:%S");
}

std::string FormatLong(time_t ts) {
    return FormatLocal(ts, "%a %d %b, %H:%M %Z");
}

std::string FormatShort(time_t ts) {
    return FormatLocal(ts, "%H:%M %a");
}

} // namespace TimeUtil
