#pragma once
/**
 * @file inspect_report.hpp
 * @brief Text report of a schema-defined class, as printed by fieldkit-inspect.
 */
#include <string>

#include "model/class_schema.hpp"

namespace fieldkit::tools
{

/**
 * @brief Bindings for every name `schema` refers to.
 * @details Listeners are no-ops and providers return null, so the class can be
 *          built without the host program's code.
 */
model::Bindings placeholder_bindings(const model::ClassSchema &schema);

/// One line: name, slot, then options (read-only, listener, auto-dirty, default).
std::string describe_field(const model::ClassSchema &schema, const model::FieldSchema &field);

/// Class name, layout, and one `describe_field` line (plus doc) per field.
std::string format_class_report(const model::ClassSchema &schema, const model::Class &cls);

} // namespace fieldkit::tools
