// tests/test_layer2_model/test_instance_storage.cpp
/**
 * @file test_instance_storage.cpp
 * @brief Unit tests for Class::build validation and fixed instance storage.
 */
#include "fk_model.hpp"
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace fieldkit::model;

namespace
{

using Slots = std::vector<std::string>;

ClassPtr make_thermostat()
{
    ClassNamespace ns("Thermostat");
    ns.define_constant("UNIT", "celsius");
    ns.define_method(
        "describe",
        [](Instance &self, const std::vector<Value> &) -> Value
        { return fmt::format("{} {}", self.get("target").dump(), self.get("UNIT").get<std::string>()); },
        "Human readable target");
    with_properties(ns, "p",
                    [](PropertyBuilder &p)
                    {
                        p.prop("target", constant_default(20), {.auto_dirty = true});
                        p.prop("mode", constant_default("auto"), {.doc = "Control mode"});
                    });
    return Class::build(std::move(ns));
}

} // namespace

// ============================================================================
// Storage
// ============================================================================

TEST(InstanceStorageTest, StorageMatchesLayout)
{
    auto cls = make_thermostat();
    EXPECT_EQ(cls->layout(), (Slots{"_dirty", "_target", "_mode"}));
    EXPECT_EQ(cls->slot_index("_target"), std::optional<std::size_t>(1));
    EXPECT_FALSE(cls->slot_index("_model").has_value());

    Instance t = cls->create();
    for (const auto &slot : cls->layout())
    {
        EXPECT_TRUE(t.has_slot(slot));
        EXPECT_FALSE(t.slot(slot).has_value());
    }
    EXPECT_FALSE(t.has_slot("_model"));
}

TEST(InstanceStorageTest, UndeclaredAttributeIsFieldInjectionError)
{
    Instance t = make_thermostat()->create();
    try
    {
        t.set("model", 2020);
        FAIL() << "assignment to an undeclared attribute must fail";
    }
    catch (const FieldInjectionError &e)
    {
        EXPECT_EQ(e.attribute(), "model");
        EXPECT_NE(std::string(e.what()).find("Thermostat"), std::string::npos);
    }

    EXPECT_THROW(t.write_slot("_model", 1), FieldInjectionError);
    EXPECT_THROW(t.set("UNIT", "kelvin"), FieldInjectionError);
    EXPECT_THROW(static_cast<void>(t.slot("_model")), FieldInjectionError);
}

TEST(InstanceStorageTest, SlotsAreDirectlyAddressable)
{
    Instance t = make_thermostat()->create();
    EXPECT_THROW(t.get("_target"), UnknownAttributeError);

    t.set("_target", 18);
    EXPECT_EQ(t.get("_target"), 18);
    EXPECT_EQ(t.get("target"), 18);
    EXPECT_FALSE(t.dirty());
}

TEST(InstanceStorageTest, ResolvesConstantsAndMethods)
{
    Instance t = make_thermostat()->create();
    EXPECT_EQ(t.get("UNIT"), "celsius");
    EXPECT_EQ(t.call("describe"), "20 celsius");

    EXPECT_THROW(t.get("colour"), UnknownAttributeError);
    EXPECT_THROW(t.call("reset"), UnknownAttributeError);
}

TEST(InstanceStorageTest, DirtyFlagLifecycle)
{
    Instance t = make_thermostat()->create();
    EXPECT_FALSE(t.dirty());

    t.set("mode", "heat");
    EXPECT_FALSE(t.dirty());

    t.set("target", 22);
    EXPECT_TRUE(t.dirty());
    EXPECT_EQ(t.get("_dirty"), true);

    t.clear_dirty();
    EXPECT_FALSE(t.dirty());
}

TEST(InstanceStorageTest, InstancesAreIndependent)
{
    auto cls = make_thermostat();
    Instance a = cls->create();
    Instance b = cls->create();
    a.set("target", 25);
    EXPECT_EQ(a.get("target"), 25);
    EXPECT_EQ(b.get("target"), 20);
    EXPECT_EQ(&a.type(), &b.type());
    EXPECT_EQ(a.type_ptr(), cls);
}

// ============================================================================
// Introspection
// ============================================================================

TEST(ClassIntrospectionTest, FieldsDocsAndMembers)
{
    auto cls = make_thermostat();
    EXPECT_EQ(cls->name(), "Thermostat");
    EXPECT_EQ(cls->field_names(), (Slots{"target", "mode"}));
    EXPECT_EQ(cls->doc("mode"), "Control mode");
    EXPECT_EQ(cls->doc("describe"), "Human readable target");
    EXPECT_EQ(cls->doc("UNIT"), "");
    EXPECT_TRUE(cls->has_member("describe"));
    EXPECT_TRUE(cls->has_member("__layout__"));
    EXPECT_EQ(cls->accessor("UNIT"), nullptr);
    EXPECT_EQ(cls->method("target"), nullptr);
    ASSERT_NE(cls->constant("UNIT"), nullptr);
}

// ============================================================================
// Build validation
// ============================================================================

TEST(ClassBuildTest, EmptyNamespaceBuildsEmptyClass)
{
    auto cls = Class::build(ClassNamespace("Empty"));
    EXPECT_TRUE(cls->layout().empty());
    Instance e = cls->create();
    EXPECT_THROW(e.set("anything", 1), FieldInjectionError);
    EXPECT_THROW(ClassNamespace(""), ConfigurationError);
}

TEST(ClassBuildTest, DuplicateSlotsAreRejected)
{
    ClassNamespace ns("Broken");
    ns.declare_layout({"_a", "_b", "_a"});
    EXPECT_THROW(Class::build(ns), ConfigurationError);

    ns.declare_layout({"_a", ""});
    EXPECT_THROW(Class::build(ns), ConfigurationError);
}

TEST(ClassBuildTest, AccessorSlotMustBeInLayout)
{
    FieldDefinition def;
    def.name = "speed";
    def.slot = "_speed";
    def.provider = constant_default(0);

    ClassNamespace ns("Broken");
    ns.set("speed", Member(std::in_place_type<AccessorPtr>, make_accessor(def)));
    EXPECT_THROW(Class::build(ns), ConfigurationError);

    ns.declare_layout({"_speed"});
    EXPECT_NO_THROW(Class::build(ns));
}

TEST(ClassBuildTest, AutoDirtyFieldNeedsDirtySlot)
{
    FieldDefinition def;
    def.name = "speed";
    def.slot = "_speed";
    def.provider = constant_default(0);
    def.auto_dirty = true;

    ClassNamespace ns("Broken");
    ns.set("speed", Member(std::in_place_type<AccessorPtr>, make_accessor(def)));
    ns.declare_layout({"_speed"});
    EXPECT_THROW(Class::build(ns), ConfigurationError);
}

TEST(ClassBuildTest, NonListLayoutIsRejected)
{
    ClassNamespace ns("Broken");
    ns.define_constant("__layout__", "_speed");
    EXPECT_THROW(Class::build(ns), ConfigurationError);
}
