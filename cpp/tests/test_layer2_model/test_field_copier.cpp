// tests/test_layer2_model/test_field_copier.cpp
/**
 * @file test_field_copier.cpp
 * @brief Unit tests for copy_fields() and constructor handling in Class::create().
 */
#include "fk_model.hpp"
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace fieldkit::model;

namespace
{

/// Point with fields x, y and an `_args` slot for saved arguments.
ClassNamespace point_namespace()
{
    ClassNamespace ns("Point");
    ns.declare_layout({"_args"});
    with_properties(ns, "p",
                    [](PropertyBuilder &p)
                    {
                        p.prop("x", constant_default(0));
                        p.prop("y", constant_default(0));
                    });
    return ns;
}

} // namespace

TEST(FieldCopierTest, CopiesArgumentsIntoSlots)
{
    auto cls = Class::build(point_namespace());
    Instance pt = cls->create();

    copy_fields(pt, {{"x", 3}, {"y", 4}});
    ASSERT_TRUE(pt.slot("_x").has_value());
    EXPECT_EQ(*pt.slot("_x"), 3);
    EXPECT_EQ(pt.get("y"), 4);
    EXPECT_FALSE(pt.slot("_args").has_value());
}

TEST(FieldCopierTest, CopyBypassesListeners)
{
    int calls = 0;
    ClassNamespace ns("Point");
    ns.define_listener("on_move",
                       [&calls](Instance &, const std::string &, const Value &, const Value &)
                       { ++calls; });
    with_properties(ns, "p", [](PropertyBuilder &p)
                    { p.prop("x", constant_default(0), {.listener = "on_move", .auto_dirty = true}); });
    auto cls = Class::build(std::move(ns));

    Instance pt = cls->create({{"x", 9}});
    EXPECT_EQ(pt.get("x"), 9);
    EXPECT_EQ(calls, 0);
    EXPECT_FALSE(pt.dirty());
}

TEST(FieldCopierTest, SkipsSelfAndExcludedNames)
{
    auto cls = Class::build(point_namespace());
    Instance pt = cls->create();

    copy_fields(pt, {{"self", "ignored"}, {"x", 1}, {"verbose", true}, {"y", 2}}, {"verbose"});
    EXPECT_EQ(pt.get("x"), 1);
    EXPECT_EQ(pt.get("y"), 2);
}

TEST(FieldCopierTest, CustomSelfName)
{
    auto cls = Class::build(point_namespace());
    Instance pt = cls->create();

    copy_fields(pt, {{"this", 0}, {"x", 5}}, {}, false, "this");
    EXPECT_EQ(pt.get("x"), 5);
}

TEST(FieldCopierTest, SaveArgsStoresCopiedValuesInOrder)
{
    auto cls = Class::build(point_namespace());
    Instance pt = cls->create();

    copy_fields(pt, {{"self", nullptr}, {"y", 2}, {"verbose", true}, {"x", 1}}, {"verbose"},
                /*save_args=*/true);
    EXPECT_EQ(pt.get("_args"), Value::array({2, 1}));
}

TEST(FieldCopierTest, UndeclaredArgumentIsFieldInjectionError)
{
    auto cls = Class::build(point_namespace());
    Instance pt = cls->create();

    try
    {
        copy_fields(pt, {{"x", 1}, {"z", 3}});
        FAIL() << "copying into an undeclared slot must fail";
    }
    catch (const FieldInjectionError &e)
    {
        EXPECT_EQ(e.attribute(), "_z");
    }
    // Earlier arguments are already written.
    EXPECT_EQ(pt.get("x"), 1);
}

TEST(FieldCopierTest, SaveArgsWithoutArgsSlotFails)
{
    ClassNamespace ns("Bare");
    with_properties(ns, "p", [](PropertyBuilder &p) { p.prop("x", constant_default(0)); });
    auto cls = Class::build(std::move(ns));
    Instance b = cls->create();

    EXPECT_THROW(copy_fields(b, {{"x", 1}}, {}, true), FieldInjectionError);
}

// ============================================================================
// Class::create()
// ============================================================================

TEST(ClassCreateTest, ConstructorRunsInsteadOfDefaultCopy)
{
    ClassNamespace ns = point_namespace();
    ns.define_constructor(
        [](Instance &self, const Arguments &args)
        {
            copy_fields(self, args, {"scale"}, true);
            for (const auto &[name, value] : args)
            {
                if (name == "scale")
                {
                    self.set("x", self.get("x").get<int>() * value.get<int>());
                    self.set("y", self.get("y").get<int>() * value.get<int>());
                }
            }
        });
    auto cls = Class::build(std::move(ns));

    Instance pt = cls->create({{"x", 1}, {"y", 2}, {"scale", 10}});
    EXPECT_EQ(pt.get("x"), 10);
    EXPECT_EQ(pt.get("y"), 20);
    EXPECT_EQ(pt.get("_args"), Value::array({1, 2}));
}

TEST(ClassCreateTest, DefaultCopyRejectsUnknownArguments)
{
    auto cls = Class::build(point_namespace());
    EXPECT_THROW(cls->create({{"model", 2020}}), FieldInjectionError);
}
