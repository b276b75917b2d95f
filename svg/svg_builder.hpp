#ifndef LASERCUT_SVG_SVG_BUILDER_HPP
#define LASERCUT_SVG_SVG_BUILDER_HPP

#include <sstream>
#include <string>
#include <vector>

namespace lasercut {

// Stroke colours understood by the laser software: outer cuts and inner cuts
constexpr const char* OUTLINE_STROKE = "#9600c8";
constexpr const char* HOLE_STROKE = "#960000";
constexpr double CUT_STROKE_WIDTH = 0.2;

struct SvgPath {
    std::string d;
    std::string stroke = OUTLINE_STROKE;
    double stroke_width = CUT_STROKE_WIDTH;
    std::string fill = "none";
};

// One solid's drawing; id is the raw solid name (sanitized on output)
struct SvgGroup {
    std::string id;
    std::vector<SvgPath> paths;
};

// Accumulates groups and paths into an SVG document sized in millimetres
class SvgBuilder {
public:
    void begin_group(const std::string& name);
    void end_group();
    void path(const std::string& d, double stroke_width, const std::string& fill,
              const std::string& stroke = OUTLINE_STROKE);

    // begin_group + paths + end_group
    void add_group(const SvgGroup& group);

    std::string build() const;

    // Letters, digits, '_' and '-' survive; anything else is dropped.
    // Returns "object" when nothing is left.
    static std::string sanitize(const std::string& name);

private:
    std::ostringstream content_;
};

}  // namespace lasercut

#endif // LASERCUT_SVG_SVG_BUILDER_HPP
