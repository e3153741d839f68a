#pragma once
/**
 * @file fk_model.hpp
 * @brief Layer 2: the managed field model.
 *
 * Declaring fields with a PropertyBuilder, building a Class from the
 * namespace, creating instances with fixed slot storage, and loading class
 * definitions from JSON schemas.
 */
#include "fk_base.hpp"

#include "model/class_namespace.hpp"
#include "model/class_schema.hpp"
#include "model/class_type.hpp"
#include "model/errors.hpp"
#include "model/field_accessor.hpp"
#include "model/field_copier.hpp"
#include "model/instance.hpp"
#include "model/property_builder.hpp"
