#pragma once

#include <cstdint>
#include <string>
#include <ctime>

namespace TimeUtil {

int64_t NowTs();
std::tm LocalTime(time_t ts);
std::string FormatTimeHHMMSS(time_t ts);
// "Mon 06 Jan, 14:00 GMT"
std::string FormatLong(time_t ts);
// "14:00 Mon"
std::string FormatShort(time_t ts);
}
