#ifndef LASERCUT_PROCESS_PROCESSING_OPTIONS_HPP
#define LASERCUT_PROCESS_PROCESSING_OPTIONS_HPP

#include <layout/axis_alignment.hpp>
#include <functional>
#include <stdexcept>
#include <string>

namespace lasercut {

// Receives messages that pass the visibility policy (see MessageLog)
using MessageCallback = std::function<void(const std::string& text, bool is_debug_only)>;

struct ProcessingOptions {
    double thickness = 3.0;            // target material thickness (mm)
    double thickness_tolerance = 0.5;  // accepted deviation (mm)
    bool debug_mode = false;           // forward debug-only messages to on_message
    MessageCallback on_message;        // optional

    AlignmentConfig alignment;
    int samples_per_curve = 32;        // curve sampling density for reports
    int num_threads = 0;               // 0 = OpenMP default

    double min_thickness() const { return thickness - thickness_tolerance; }
    double max_thickness() const { return thickness + thickness_tolerance; }

    // Throws std::invalid_argument for values the pipeline cannot work with
    void validate() const {
        if (!(thickness > 0.0)) {
            throw std::invalid_argument("thickness must be positive, got " + std::to_string(thickness));
        }
        if (!(thickness_tolerance >= 0.0)) {
            throw std::invalid_argument("thickness tolerance must not be negative, got " +
                                        std::to_string(thickness_tolerance));
        }
        if (samples_per_curve < 1) {
            throw std::invalid_argument("samples_per_curve must be at least 1");
        }
        if (num_threads < 0) {
            throw std::invalid_argument("num_threads must not be negative");
        }
    }
};

}  // namespace lasercut

#endif // LASERCUT_PROCESS_PROCESSING_OPTIONS_HPP
