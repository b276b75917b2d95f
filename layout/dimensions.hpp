#ifndef LASERCUT_LAYOUT_DIMENSIONS_HPP
#define LASERCUT_LAYOUT_DIMENSIONS_HPP

#include <algorithm>
#include <array>
#include <iomanip>
#include <locale>
#include <sstream>
#include <string>

namespace lasercut {

// Extents of a solid (mm)
struct Dimensions {
    double width = 0.0;
    double height = 0.0;
    double depth = 0.0;

    // True if any extent lies within [min_thickness, max_thickness]
    bool has_thin_dimension(double min_thickness, double max_thickness) const {
        std::array<double, 3> sorted = {width, height, depth};
        std::sort(sorted.begin(), sorted.end());
        return std::any_of(sorted.begin(), sorted.end(), [&](double d) {
            return d >= min_thickness && d <= max_thickness;
        });
    }

    // "[50.0, 30.0, 3.0]"
    std::string to_string() const {
        std::ostringstream ss;
        ss.imbue(std::locale::classic());
        ss << std::fixed << std::setprecision(1)
           << "[" << width << ", " << height << ", " << depth << "]";
        return ss.str();
    }
};

}  // namespace lasercut

#endif // LASERCUT_LAYOUT_DIMENSIONS_HPP
