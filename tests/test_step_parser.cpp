#include <gtest/gtest.h>
#include <step/parser.hpp>
#include <stdexcept>

using namespace lasercut::step;

namespace {

std::string wrap_data(const std::string& data) {
    return "ISO-10303-21;\n"
           "HEADER;\n"
           "FILE_DESCRIPTION((''),'2;1');\n"
           "ENDSEC;\n"
           "DATA;\n" + data +
           "ENDSEC;\n"
           "END-ISO-10303-21;\n";
}

EntityTable parse_ok(const std::string& text) {
    Parser parser{Tokenizer(text)};
    EntityTable table = parser.parse();
    for (const auto& error : parser.errors()) {
        ADD_FAILURE() << "unexpected parse error: " << error;
    }
    return table;
}

}  // namespace

// ============== Simple instances ==============

TEST(StepParserTest, ParsesSimpleInstances) {
    std::string text = wrap_data(
        "#1=CARTESIAN_POINT('origin',(0.,0.,0.));\n"
        "#2=DIRECTION('',(0.,0.,1.));\n"
        "#3=AXIS2_PLACEMENT_3D('',#1,#2,$);\n");
    EntityTable table = parse_ok(text);
    ASSERT_EQ(table.size(), 3u);

    const EntityRecord* point = table.find(1);
    ASSERT_NE(point, nullptr);
    EXPECT_EQ(point->type(), "CARTESIAN_POINT");
    ASSERT_EQ(point->parts.front().params.size(), 2u);
    EXPECT_EQ(point->parts.front().params[0].kind, Parameter::Kind::String);
    EXPECT_EQ(point->parts.front().params[0].text, "origin");
    ASSERT_TRUE(point->parts.front().params[1].is_list());
    EXPECT_EQ(point->parts.front().params[1].items.size(), 3u);

    const EntityRecord* placement = table.find(3);
    ASSERT_NE(placement, nullptr);
    const auto& params = placement->parts.front().params;
    ASSERT_EQ(params.size(), 4u);
    EXPECT_TRUE(params[1].is_reference());
    EXPECT_EQ(params[1].ref, 1u);
    EXPECT_TRUE(params[3].is_null());
}

TEST(StepParserTest, DerivedEnumerationAndTypedParameters) {
    std::string text = wrap_data(
        "#10=ORIENTED_EDGE('',*,*,#11,.F.);\n"
        "#20=CIRCLE('',#21,POSITIVE_LENGTH_MEASURE(2.5));\n");
    EntityTable table = parse_ok(text);

    const auto& edge = table.find(10)->parts.front().params;
    EXPECT_EQ(edge[1].kind, Parameter::Kind::Derived);
    EXPECT_EQ(edge[4].kind, Parameter::Kind::Enumeration);
    EXPECT_EQ(edge[4].text, "F");

    const auto& circle = table.find(20)->parts.front().params;
    ASSERT_EQ(circle[2].kind, Parameter::Kind::Typed);
    EXPECT_EQ(circle[2].text, "POSITIVE_LENGTH_MEASURE");
    ASSERT_EQ(circle[2].items.size(), 1u);
    EXPECT_DOUBLE_EQ(circle[2].items[0].number, 2.5);
}

TEST(StepParserTest, EmptyAndNestedLists) {
    EntityTable table = parse_ok(wrap_data("#1=B_SPLINE_CURVE_WITH_KNOTS('',2,(#2,#3),.UNSPECIFIED.,.F.,.F.,(3,3),(0.,1.),.UNSPECIFIED.);\n"
                                           "#4=EMPTY_THING(());\n"));
    const auto& spline = table.find(1)->parts.front().params;
    ASSERT_EQ(spline.size(), 9u);
    EXPECT_EQ(spline[2].items.size(), 2u);
    EXPECT_EQ(spline[6].items.size(), 2u);

    const auto& empty = table.find(4)->parts.front().params;
    ASSERT_EQ(empty.size(), 1u);
    EXPECT_TRUE(empty[0].is_list());
    EXPECT_TRUE(empty[0].items.empty());
}

// ============== Complex instances ==============

TEST(StepParserTest, ParsesComplexInstance) {
    std::string text = wrap_data(
        "#7=(BOUNDED_CURVE() B_SPLINE_CURVE(2,(#1,#2,#3),.UNSPECIFIED.,.F.,.F.)"
        " B_SPLINE_CURVE_WITH_KNOTS((3,3),(0.,1.),.UNSPECIFIED.) CURVE()"
        " RATIONAL_B_SPLINE_CURVE((1.,0.7,1.)) REPRESENTATION_ITEM(''));\n");
    EntityTable table = parse_ok(text);
    const EntityRecord* record = table.find(7);
    ASSERT_NE(record, nullptr);
    EXPECT_TRUE(record->is_complex());
    EXPECT_EQ(record->type(), "");
    EXPECT_EQ(record->parts.size(), 6u);
    ASSERT_NE(record->find_part("RATIONAL_B_SPLINE_CURVE"), nullptr);
    EXPECT_EQ(record->find_part("NOT_THERE"), nullptr);
}

// ============== Sections ==============

TEST(StepParserTest, DataSectionWithSchemaParameters) {
    std::string text =
        "ISO-10303-21;\nHEADER;\nENDSEC;\n"
        "DATA('main',('CONFIG_CONTROL_DESIGN'));\n"
        "#1=CARTESIAN_POINT('',(1.,2.,3.));\n"
        "ENDSEC;\n"
        "DATA;\n"
        "#2=CARTESIAN_POINT('',(4.,5.,6.));\n"
        "ENDSEC;\n"
        "END-ISO-10303-21;\n";
    EntityTable table = parse_ok(text);
    EXPECT_EQ(table.size(), 2u);
}

TEST(StepParserTest, HeaderContentIsSkipped) {
    std::string text =
        "ISO-10303-21;\nHEADER;\n"
        "FILE_NAME('part.step','2024-01-01T00:00:00',('me'),('org'),'pre','sys','');\n"
        "FILE_SCHEMA(('AUTOMOTIVE_DESIGN'));\n"
        "ENDSEC;\nDATA;\nENDSEC;\nEND-ISO-10303-21;\n";
    EntityTable table = parse_ok(text);
    EXPECT_EQ(table.size(), 0u);
}

// ============== Errors ==============

TEST(StepParserTest, RejectsMissingMagic) {
    Parser parser{Tokenizer("HEADER;ENDSEC;DATA;ENDSEC;END-ISO-10303-21;")};
    parser.parse();
    ASSERT_TRUE(parser.has_errors());
    EXPECT_NE(parser.errors().front().find("ISO-10303-21"), std::string::npos);
}

TEST(StepParserTest, RecoversFromBadInstance) {
    std::string text = wrap_data(
        "#1=CARTESIAN_POINT('',(0.,0.,0.));\n"
        "#2=CARTESIAN_POINT('',(0.,@,0.));\n"
        "#3=CARTESIAN_POINT('',(1.,1.,1.));\n");
    Parser parser{Tokenizer(text)};
    EntityTable table = parser.parse();
    EXPECT_EQ(parser.errors().size(), 1u);
    EXPECT_EQ(table.size(), 2u);
    EXPECT_NE(table.find(1), nullptr);
    EXPECT_EQ(table.find(2), nullptr);
    EXPECT_NE(table.find(3), nullptr);
}

TEST(StepParserTest, DuplicateIdKeepsFirst) {
    std::string text = wrap_data(
        "#1=CARTESIAN_POINT('first',(0.,0.,0.));\n"
        "#1=CARTESIAN_POINT('second',(1.,1.,1.));\n");
    Parser parser{Tokenizer(text)};
    EntityTable table = parser.parse();
    ASSERT_EQ(parser.errors().size(), 1u);
    EXPECT_NE(parser.errors().front().find("Duplicate"), std::string::npos);
    EXPECT_EQ(table.find(1)->parts.front().params[0].text, "first");
}

TEST(StepParserTest, MissingEndIsAnError) {
    std::string text = "ISO-10303-21;\nHEADER;\nENDSEC;\nDATA;\n#1=PLANE('',#2);\nENDSEC;\n";
    Parser parser{Tokenizer(text)};
    EntityTable table = parser.parse();
    EXPECT_TRUE(parser.has_errors());
    EXPECT_EQ(table.size(), 1u);
}

TEST(StepParserTest, DeepNestingIsAnError) {
    std::string deep = "#1=CARTESIAN_POINT(''," + std::string(100000, '(') + "0." +
                       std::string(100000, ')') + ");\n"
                       "#2=CARTESIAN_POINT('',(1.,1.,1.));\n";
    std::string text = wrap_data(deep);
    Parser parser{Tokenizer(text)};
    EntityTable table = parser.parse();
    ASSERT_EQ(parser.errors().size(), 1u);
    EXPECT_NE(parser.errors().front().find("nested"), std::string::npos);
    EXPECT_EQ(table.find(1), nullptr);
    EXPECT_NE(table.find(2), nullptr);

    EXPECT_THROW(parse_step_text(wrap_data(deep)), std::runtime_error);
}

TEST(StepParserTest, ModerateNestingIsAccepted) {
    EntityTable table = parse_ok(wrap_data("#1=THING(" + std::string(10, '(') + "1" + std::string(10, ')') + ");\n"));
    const Parameter* p = &table.find(1)->parts.front().params[0];
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(p->is_list());
        ASSERT_EQ(p->items.size(), 1u);
        p = &p->items[0];
    }
    EXPECT_EQ(p->kind, Parameter::Kind::Number);
}

TEST(StepParserTest, ParseStepTextThrowsWithFirstError) {
    try {
        parse_step_text("not a step file");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("STEP parse error"), std::string::npos);
    }
}

TEST(StepParserTest, ParseStepTextReturnsTable) {
    EntityTable table = parse_step_text(wrap_data("#1=CARTESIAN_POINT('',(0.,0.,0.));\n"));
    EXPECT_EQ(table.size(), 1u);
}
