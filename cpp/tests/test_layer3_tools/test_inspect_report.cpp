// tests/test_layer3_tools/test_inspect_report.cpp
/**
 * @file test_inspect_report.cpp
 * @brief Unit tests for the report printed by fieldkit-inspect.
 */
#include "fk_model.hpp"
#include "inspect_report.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>

using namespace fieldkit::model;
using namespace fieldkit::tools;
using nlohmann::json;

namespace
{

ClassSchema sensor_schema()
{
    return parse_class_schema(json::parse(R"({
        "name": "Sensor",
        "auto_dirty": false,
        "fields": [
            {"name": "serial", "read_only": true, "doc": "Factory serial"},
            {"name": "level", "default": 3, "listener": "on_level", "auto_dirty": true},
            {"name": "mode", "default": "auto", "listener": true},
            {"name": "stamp", "default_provider": "now"}
        ]
    })"));
}

} // namespace

TEST(InspectReportTest, PlaceholderBindingsCoverEveryReference)
{
    const ClassSchema schema = sensor_schema();
    const Bindings bindings = placeholder_bindings(schema);

    EXPECT_EQ(bindings.providers.size(), 1u);
    EXPECT_EQ(bindings.providers.count("now"), 1u);
    EXPECT_EQ(bindings.listeners.size(), 2u);
    EXPECT_EQ(bindings.listeners.count("on_level"), 1u);
    EXPECT_EQ(bindings.listeners.count("on_field_changed"), 1u);
    EXPECT_TRUE(bindings.methods.empty());

    ClassPtr cls = define_class(schema, bindings);
    Instance s = cls->create();
    EXPECT_TRUE(s.get("stamp").is_null());
    EXPECT_NO_THROW(s.set("level", 4));
    EXPECT_NO_THROW(s.set("mode", "manual"));
}

TEST(InspectReportTest, DescribeFieldListsOptions)
{
    const ClassSchema schema = sensor_schema();

    const std::string serial = describe_field(schema, schema.fields[0]);
    EXPECT_NE(serial.find("serial"), std::string::npos);
    EXPECT_NE(serial.find("_serial"), std::string::npos);
    EXPECT_NE(serial.find("read-only, default=null"), std::string::npos);

    const std::string level = describe_field(schema, schema.fields[1]);
    EXPECT_NE(level.find("listener=on_level, auto-dirty, default=3"), std::string::npos);

    const std::string mode = describe_field(schema, schema.fields[2]);
    EXPECT_NE(mode.find("listener=on_field_changed, default=\"auto\""), std::string::npos);

    const std::string stamp = describe_field(schema, schema.fields[3]);
    EXPECT_NE(stamp.find("default=<now>"), std::string::npos);
}

TEST(InspectReportTest, ClassLevelAutoDirtyIsShownOnEveryField)
{
    ClassSchema schema = sensor_schema();
    schema.auto_dirty = true;
    EXPECT_NE(describe_field(schema, schema.fields[3]).find("auto-dirty"), std::string::npos);
}

TEST(InspectReportTest, ReportShowsLayoutFieldsAndDocs)
{
    const ClassSchema schema = sensor_schema();
    ClassPtr cls = define_class(schema, placeholder_bindings(schema));

    const std::string report = format_class_report(schema, *cls);
    EXPECT_EQ(report.rfind("Class:  Sensor\n", 0), 0u);
    EXPECT_NE(report.find("Layout: [_serial, _dirty, _level, _mode, _stamp]\n"), std::string::npos);
    EXPECT_NE(report.find("      Factory serial\n"), std::string::npos);
    EXPECT_NE(report.find("default=<now>"), std::string::npos);
}
