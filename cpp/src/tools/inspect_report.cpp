/**
 * @file inspect_report.cpp
 * @brief Report formatting for fieldkit-inspect.
 */
#include "inspect_report.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <string_view>

namespace fieldkit::tools
{

using namespace fieldkit::model;

Bindings placeholder_bindings(const ClassSchema &schema)
{
    Bindings bindings;
    for (const auto &field : schema.fields)
    {
        if (!field.default_provider.empty())
        {
            bindings.providers.emplace(field.default_provider,
                                       [](const Instance &) { return Value(); });
        }
        if (auto listener = field.listener.resolve())
        {
            bindings.listeners.emplace(*listener, [](Instance &, const std::string &,
                                                     const Value &, const Value &) {});
        }
    }
    return bindings;
}

std::string describe_field(const ClassSchema &schema, const FieldSchema &field)
{
    std::string options;
    auto add = [&options](std::string_view text)
    {
        if (!options.empty())
            options += ", ";
        options += text;
    };

    if (field.read_only)
        add("read-only");
    if (auto listener = field.listener.resolve())
        add(fmt::format("listener={}", *listener));
    if (field.auto_dirty || schema.auto_dirty)
        add("auto-dirty");
    if (!field.default_provider.empty())
        add(fmt::format("default=<{}>", field.default_provider));
    else
        add(fmt::format("default={}", field.default_value.dump()));

    return fmt::format("  {:<16} {:<18} {}", field.name, slot_name(field.name), options);
}

std::string format_class_report(const ClassSchema &schema, const Class &cls)
{
    std::string report = fmt::format("Class:  {}\nLayout: [{}]\nFields:\n", cls.name(),
                                     fmt::join(cls.layout(), ", "));
    for (const auto &field : schema.fields)
    {
        report += describe_field(schema, field);
        report += '\n';
        const std::string doc = cls.doc(field.name);
        if (!doc.empty())
            report += fmt::format("      {}\n", doc);
    }
    return report;
}

} // namespace fieldkit::tools
