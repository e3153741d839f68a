#pragma once
/**
 * @file field_copier.hpp
 * @brief Copies constructor arguments into an instance's field slots.
 *
 * Typical use inside a class constructor:
 * @code
 *   ns.define_constructor([](Instance &self, const Arguments &args) {
 *       copy_fields(self, args, {"verbose"}, true);
 *   });
 * @endcode
 *
 * Each argument `name` is written to slot `_name`. The entry named
 * `self_name` (the receiving object itself, when a caller forwards its whole
 * argument frame) and every name in `exclude` are skipped. With `save_args`
 * the copied values, in argument order, are also stored as an array in the
 * `_args` slot.
 */
#include <set>
#include <string>
#include <string_view>

#include "fieldkit_export.h"
#include "model/class_namespace.hpp"

namespace fieldkit::model
{

/**
 * @throws FieldInjectionError if a target slot (or `_args`) is not declared.
 */
FIELDKIT_EXPORT void copy_fields(Instance &self, const Arguments &args,
                                 const std::set<std::string, std::less<>> &exclude = {},
                                 bool save_args = false, std::string_view self_name = "self");

} // namespace fieldkit::model
