#ifndef LASERCUT_SERIALIZATION_REPORT_JSON_HPP
#define LASERCUT_SERIALIZATION_REPORT_JSON_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace lasercut::json {

// Version of the report format
constexpr const char* REPORT_VERSION = "1.0.0";

// Envelope written by every command that produces a JSON report.
// step names the command ("convert", "inspect").
struct Report {
    std::string version = REPORT_VERSION;
    std::string step;
    std::string timestamp;
    std::string source_file;
    nlohmann::json config;
    nlohmann::json stats;
    nlohmann::json data;
};

inline void to_json(nlohmann::json& j, const Report& report) {
    j = {
        {"version", report.version},
        {"step", report.step}
    };
    if (!report.timestamp.empty()) j["timestamp"] = report.timestamp;
    if (!report.source_file.empty()) j["source_file"] = report.source_file;
    if (!report.config.is_null()) j["config"] = report.config;
    if (!report.stats.is_null()) j["stats"] = report.stats;
    j["data"] = report.data;
}

inline void from_json(const nlohmann::json& j, Report& report) {
    report.version = j.value("version", "unknown");
    report.step = j.value("step", "unknown");
    report.timestamp = j.value("timestamp", "");
    report.source_file = j.value("source_file", "");
    report.config = j.value("config", nlohmann::json());
    report.stats = j.value("stats", nlohmann::json());
    report.data = j.value("data", nlohmann::json());
}

// Current UTC time in ISO 8601 format
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Pretty JSON text. Strings from STEP files are raw bytes, so invalid UTF-8
// is written as U+FFFD instead of failing the whole report.
inline std::string dump_json(const nlohmann::json& j) {
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << dump_json(j) << "\n";
}

inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
}

}  // namespace lasercut::json

#endif // LASERCUT_SERIALIZATION_REPORT_JSON_HPP
