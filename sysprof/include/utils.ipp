#include <string>

#include <date/date.h>
#include <date/tz.h>

namespace SysProf {

template <typename Duration>
std::string formatTime(
    const date::sys_time<Duration> &tp, const std::string &time_format,
    const date::time_zone *zone) {
    if (!zone) zone = date::current_zone();
    return date::format(time_format, date::make_zoned(zone, tp));
}

}  // namespace SysProf
