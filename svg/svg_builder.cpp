#include "svg_builder.hpp"
#include <common/number_format.hpp>

namespace lasercut {

void SvgBuilder::begin_group(const std::string& name) {
    content_ << "  <g id=\"" << sanitize(name) << "\">\n";
}

void SvgBuilder::end_group() {
    content_ << "  </g>\n";
}

void SvgBuilder::path(const std::string& d, double stroke_width, const std::string& fill,
                      const std::string& stroke) {
    content_ << "    <path d=\"" << d << "\" stroke=\"" << stroke
             << "\" stroke-width=\"" << format_trimmed3(stroke_width)
             << "\" fill=\"" << fill << "\" vector-effect=\"non-scaling-stroke\"/>\n";
}

void SvgBuilder::add_group(const SvgGroup& group) {
    begin_group(group.id);
    for (const auto& p : group.paths) {
        path(p.d, p.stroke_width, p.fill, p.stroke);
    }
    end_group();
}

std::string SvgBuilder::build() const {
    std::ostringstream ss;
    // Physical size in mm, one user unit per mm
    ss << "<svg xmlns=\"http://www.w3.org/2000/svg\" version=\"1.1\" width=\"482mm\" height=\"266mm\" "
          "viewBox=\"0 0 482 266\">\n";
    ss << "<defs/>\n";
    ss << content_.str();
    ss << "</svg>\n";
    return ss.str();
}

std::string SvgBuilder::sanitize(const std::string& name) {
    std::string result;
    for (char c : name) {
        bool ascii_alnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
        if (ascii_alnum || c == '_' || c == '-') {
            result += c;
        }
    }
    return result.empty() ? "object" : result;
}

}  // namespace lasercut
