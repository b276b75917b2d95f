#ifndef LASERCUT_SERIALIZATION_CONFIG_JSON_HPP
#define LASERCUT_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <layout/axis_alignment.hpp>
#include <layout/dimensions.hpp>
#include <process/process_result.hpp>
#include <process/processing_options.hpp>

namespace lasercut {

// AlignmentConfig serialization
inline void to_json(nlohmann::json& j, const AlignmentConfig& config) {
    j = {
        {"min_edge_length", config.min_edge_length},
        {"axis_tolerance_deg", config.axis_tolerance_deg},
        {"axis_aligned_fraction", config.axis_aligned_fraction},
        {"diagonal_angle_deg", config.diagonal_angle_deg},
        {"diagonal_tolerance_deg", config.diagonal_tolerance_deg},
        {"diagonal_fraction", config.diagonal_fraction}
    };
}

inline void from_json(const nlohmann::json& j, AlignmentConfig& config) {
    config.min_edge_length = j.value("min_edge_length", 1.0);
    config.axis_tolerance_deg = j.value("axis_tolerance_deg", 5.0);
    config.axis_aligned_fraction = j.value("axis_aligned_fraction", 0.6);
    config.diagonal_angle_deg = j.value("diagonal_angle_deg", 45.0);
    config.diagonal_tolerance_deg = j.value("diagonal_tolerance_deg", 10.0);
    config.diagonal_fraction = j.value("diagonal_fraction", 0.3);
}

// ProcessingOptions serialization (without on_message)
inline void to_json(nlohmann::json& j, const ProcessingOptions& options) {
    j = {
        {"thickness", options.thickness},
        {"thickness_tolerance", options.thickness_tolerance},
        {"debug_mode", options.debug_mode},
        {"alignment", options.alignment},
        {"samples_per_curve", options.samples_per_curve},
        {"num_threads", options.num_threads}
    };
}

inline void from_json(const nlohmann::json& j, ProcessingOptions& options) {
    options.thickness = j.value("thickness", 3.0);
    options.thickness_tolerance = j.value("thickness_tolerance", 0.5);
    options.debug_mode = j.value("debug_mode", false);
    if (j.contains("alignment")) {
        options.alignment = j["alignment"].get<AlignmentConfig>();
    }
    options.samples_per_curve = j.value("samples_per_curve", 32);
    options.num_threads = j.value("num_threads", 0);
    // Note: on_message cannot be serialized
}

// Dimensions serialization
inline void to_json(nlohmann::json& j, const Dimensions& d) {
    j = {{"width", d.width}, {"height", d.height}, {"depth", d.depth}};
}

inline void from_json(const nlohmann::json& j, Dimensions& d) {
    d.width = j.value("width", 0.0);
    d.height = j.value("height", 0.0);
    d.depth = j.value("depth", 0.0);
}

// ProcessMessage serialization
inline void to_json(nlohmann::json& j, const ProcessMessage& message) {
    j = {{"text", message.text}, {"debug_only", message.is_debug_only}};
}

inline void from_json(const nlohmann::json& j, ProcessMessage& message) {
    message.text = j.value("text", "");
    message.is_debug_only = j.value("debug_only", true);
}

// ProcessResult serialization; the document itself is written separately
inline void to_json(nlohmann::json& j, const ProcessResult& result) {
    j = {
        {"return_code", static_cast<int>(result.return_code)},
        {"solid_count", result.solid_count},
        {"thin_solid_count", result.thin_solid_count},
        {"group_count", result.group_count},
        {"messages", result.messages}
    };
}

}  // namespace lasercut

#endif // LASERCUT_SERIALIZATION_CONFIG_JSON_HPP
