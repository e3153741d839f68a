#pragma once
/**
 * @file class_schema.hpp
 * @brief Class definitions loaded from a JSON schema document.
 *
 * JSON schema object example:
 * @code{.json}
 * {
 *   "name": "Car",
 *   "auto_dirty": false,
 *   "save_args": false,
 *   "exclude": ["verbose"],
 *   "fields": [
 *     {"name": "brand", "read_only": true, "doc": "Manufacturer"},
 *     {"name": "speed", "default": 0, "listener": "on_speed"},
 *     {"name": "on",    "default": false, "listener": true, "auto_dirty": true},
 *     {"name": "label", "default_provider": "make_label"}
 *   ]
 * }
 * @endcode
 *
 * - `default` is a constant (missing → null); `default_provider` names a
 *   provider from the Bindings instead. Both at once is an error.
 * - `listener` is a method name, `true` (generic listener) or `false`.
 * - `exclude` lists constructor arguments that are not copied into slots.
 *
 * Listener and provider code cannot live in JSON; `define_class()` takes it
 * from a Bindings table supplied by the host program.
 */
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "fieldkit_export.h"
#include "model/class_namespace.hpp"
#include "model/class_type.hpp"
#include "model/property_builder.hpp"

namespace fieldkit::model
{

struct FieldSchema
{
    std::string name;
    Value default_value;          ///< Used when `default_provider` is empty
    std::string default_provider; ///< Key into Bindings::providers
    bool read_only{false};
    ListenerOption listener{};
    bool auto_dirty{false};
    std::string doc;
};

struct ClassSchema
{
    std::string name;
    bool auto_dirty{false};           ///< Builder-level auto-dirty default
    bool save_args{false};            ///< Constructor stores copied args in `_args`
    std::vector<std::string> exclude; ///< Constructor arguments not copied
    std::vector<FieldSchema> fields;
};

/// Code the schema refers to by name.
struct Bindings
{
    std::map<std::string, DefaultProvider> providers;
    std::map<std::string, ListenerFn> listeners;
    std::map<std::string, MethodFn> methods;
};

/**
 * @brief Parses a schema object.
 * @throws ConfigurationError on missing or invalid entries.
 */
FIELDKIT_EXPORT ClassSchema parse_class_schema(const nlohmann::json &schema_obj);

/**
 * @brief Reads and parses a schema file.
 * @throws ConfigurationError if the file cannot be read or parsed.
 */
FIELDKIT_EXPORT ClassSchema load_class_schema(const std::filesystem::path &path);

/**
 * @brief Builds the class described by `schema`.
 * @details Binds `bindings` into a fresh namespace, declares every field
 *          through a PropertyBuilder, and installs a constructor that copies
 *          arguments into slots (honoring `exclude` and `save_args`).
 * @throws ConfigurationError for unknown providers, missing listener
 *         methods, or any declaration error.
 */
FIELDKIT_EXPORT ClassPtr define_class(const ClassSchema &schema, const Bindings &bindings = {});

} // namespace fieldkit::model
