#include <gtest/gtest.h>
#include <serialization/config_json.hpp>
#include <serialization/report_json.hpp>
#include <cstdio>
#include <fstream>
#include <stdexcept>

using namespace lasercut;

namespace {

std::string temp_path(const std::string& name) {
    return ::testing::TempDir() + name;
}

}  // namespace

// ============== ProcessingOptions ==============

TEST(ConfigJsonTest, EmptyObjectGivesDefaults) {
    ProcessingOptions options = nlohmann::json::object().get<ProcessingOptions>();
    EXPECT_DOUBLE_EQ(options.thickness, 3.0);
    EXPECT_DOUBLE_EQ(options.thickness_tolerance, 0.5);
    EXPECT_FALSE(options.debug_mode);
    EXPECT_EQ(options.samples_per_curve, 32);
    EXPECT_EQ(options.num_threads, 0);
    EXPECT_DOUBLE_EQ(options.alignment.diagonal_fraction, 0.3);
}

TEST(ConfigJsonTest, PartialOverrides) {
    nlohmann::json j = {
        {"thickness", 6.0},
        {"debug_mode", true},
        {"alignment", {{"axis_tolerance_deg", 2.5}}}
    };
    ProcessingOptions options = j.get<ProcessingOptions>();
    EXPECT_DOUBLE_EQ(options.thickness, 6.0);
    EXPECT_DOUBLE_EQ(options.thickness_tolerance, 0.5);
    EXPECT_TRUE(options.debug_mode);
    EXPECT_DOUBLE_EQ(options.alignment.axis_tolerance_deg, 2.5);
    EXPECT_DOUBLE_EQ(options.alignment.min_edge_length, 1.0);
}

TEST(ConfigJsonTest, OptionsRoundTrip) {
    ProcessingOptions options;
    options.thickness = 4.0;
    options.thickness_tolerance = 0.25;
    options.num_threads = 2;
    options.alignment.diagonal_tolerance_deg = 7.0;

    nlohmann::json j = options;
    EXPECT_DOUBLE_EQ(j["thickness"].get<double>(), 4.0);
    EXPECT_FALSE(j.contains("on_message"));

    ProcessingOptions back = j.get<ProcessingOptions>();
    EXPECT_DOUBLE_EQ(back.thickness_tolerance, 0.25);
    EXPECT_EQ(back.num_threads, 2);
    EXPECT_DOUBLE_EQ(back.alignment.diagonal_tolerance_deg, 7.0);
}

TEST(ConfigJsonTest, WrongTypeThrows) {
    nlohmann::json j = {{"thickness", "thick"}};
    EXPECT_THROW(j.get<ProcessingOptions>(), nlohmann::json::type_error);
}

// ============== ProcessResult ==============

TEST(ConfigJsonTest, ResultSerialization) {
    ProcessResult result;
    result.return_code = ReturnCode::Success;
    result.solid_count = 3;
    result.thin_solid_count = 2;
    result.group_count = 2;
    result.document_text = "<svg/>";
    result.messages = {{"Parsing STEP file contents...", false}, {"Found 3 solids", true}};

    nlohmann::json j = result;
    EXPECT_EQ(j["return_code"], 1);
    EXPECT_EQ(j["solid_count"], 3);
    EXPECT_EQ(j["group_count"], 2);
    EXPECT_FALSE(j.contains("document_text"));
    ASSERT_EQ(j["messages"].size(), 2u);
    EXPECT_EQ(j["messages"][1]["text"], "Found 3 solids");
    EXPECT_EQ(j["messages"][1]["debug_only"], true);
}

TEST(ConfigJsonTest, DimensionsSerialization) {
    nlohmann::json j = Dimensions{50.0, 30.0, 3.0};
    EXPECT_DOUBLE_EQ(j["depth"].get<double>(), 3.0);
    Dimensions back = j.get<Dimensions>();
    EXPECT_DOUBLE_EQ(back.width, 50.0);
}

// ============== Report ==============

TEST(ReportJsonTest, OptionalFieldsOmitted) {
    lasercut::json::Report report;
    report.step = "convert";
    nlohmann::json j = report;
    EXPECT_EQ(j["version"], lasercut::json::REPORT_VERSION);
    EXPECT_EQ(j["step"], "convert");
    EXPECT_FALSE(j.contains("timestamp"));
    EXPECT_FALSE(j.contains("config"));
    EXPECT_TRUE(j.contains("data"));
}

TEST(ReportJsonTest, FileRoundTrip) {
    lasercut::json::Report report;
    report.step = "inspect";
    report.timestamp = lasercut::json::get_timestamp();
    report.source_file = "part.step";
    report.stats = {{"solid_count", 2}};
    report.data = nlohmann::json::array({1, 2});

    std::string path = temp_path("lasercut_report.json");
    lasercut::json::write_json_file(path, report);
    auto back = lasercut::json::read_json_file(path).get<lasercut::json::Report>();
    std::remove(path.c_str());

    EXPECT_EQ(back.step, "inspect");
    EXPECT_EQ(back.source_file, "part.step");
    EXPECT_EQ(back.timestamp.size(), 20u);
    EXPECT_EQ(back.stats["solid_count"], 2);
    EXPECT_EQ(back.data.size(), 2u);
}

TEST(ReportJsonTest, InvalidUtf8IsReplaced) {
    ProcessResult result;
    result.messages = {{"[FILTER] Pl\xE9: dimensions [50.0, 30.0, 3.0] - PASS", true}};
    lasercut::json::Report report;
    report.step = "convert";
    report.data = result;

    std::string text;
    ASSERT_NO_THROW(text = lasercut::json::dump_json(report));
    EXPECT_NE(text.find("Pl\xEF\xBF\xBD:"), std::string::npos);

    std::string path = temp_path("lasercut_latin1_report.json");
    ASSERT_NO_THROW(lasercut::json::write_json_file(path, report));
    auto back = lasercut::json::read_json_file(path).get<lasercut::json::Report>();
    std::remove(path.c_str());
    EXPECT_EQ(back.data["messages"][0]["text"].get<std::string>().rfind("[FILTER] Pl\xEF\xBF\xBD", 0), 0u);
}

TEST(ReportJsonTest, ReadErrors) {
    EXPECT_THROW(lasercut::json::read_json_file(temp_path("lasercut_missing.json")), std::runtime_error);

    std::string path = temp_path("lasercut_broken.json");
    {
        std::ofstream out(path);
        out << "{ \"thickness\": ";
    }
    EXPECT_THROW(lasercut::json::read_json_file(path), std::runtime_error);
    std::remove(path.c_str());
}
