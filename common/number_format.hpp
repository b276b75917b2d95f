#ifndef LASERCUT_COMMON_NUMBER_FORMAT_HPP
#define LASERCUT_COMMON_NUMBER_FORMAT_HPP

#include <iomanip>
#include <locale>
#include <sstream>
#include <string>

namespace lasercut {

// Locale independent fixed-point formatting. A value that rounds to zero
// never prints with a minus sign.
inline std::string format_fixed(double value, int decimals) {
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::fixed << std::setprecision(decimals) << value;
    std::string text = ss.str();
    if (text[0] == '-' && text.find_first_not_of("-0.") == std::string::npos) {
        text.erase(0, 1);
    }
    return text;
}

// Three decimals, as used by every path command ("12.500")
inline std::string format_fixed3(double value) {
    return format_fixed(value, 3);
}

// Up to three decimals with trailing zeros trimmed ("0.2", "1", "0.125").
inline std::string format_trimmed3(double value) {
    std::string text = format_fixed3(value);
    size_t dot = text.find('.');
    if (dot != std::string::npos) {
        size_t last = text.find_last_not_of('0');
        if (last == dot) {
            text.erase(dot);
        } else {
            text.erase(last + 1);
        }
    }
    return text;
}

// "x,y" pair as it appears inside path data
inline std::string format_pair(double x, double y) {
    return format_fixed3(x) + "," + format_fixed3(y);
}

}  // namespace lasercut

#endif // LASERCUT_COMMON_NUMBER_FORMAT_HPP
