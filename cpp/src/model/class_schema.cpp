/**
 * @file class_schema.cpp
 * @brief JSON parsing of class schemas and class definition from them.
 */
#include "model/class_schema.hpp"
#include "model/errors.hpp"
#include "model/field_copier.hpp"
#include "utils/logger.hpp"

#include <nlohmann/json.hpp>

#include <fmt/format.h>

#include <fstream>
#include <set>

namespace fieldkit::model
{

namespace
{

constexpr const char *kSchemaBuilderAlias = "__schema_fields__";

bool read_bool(const nlohmann::json &obj, const char *key, const std::string &context)
{
    if (!obj.contains(key))
    {
        return false;
    }
    const auto &v = obj[key];
    if (!v.is_boolean())
    {
        throw ConfigurationError(fmt::format("Schema: {} '{}' must be a boolean", context, key));
    }
    return v.get<bool>();
}

ListenerOption parse_listener(const nlohmann::json &v, const std::string &field)
{
    if (v.is_null())
    {
        return {};
    }
    if (v.is_boolean())
    {
        return ListenerOption(v.get<bool>());
    }
    if (v.is_string() && !v.get<std::string>().empty())
    {
        return ListenerOption(v.get<std::string>());
    }
    throw ConfigurationError(fmt::format(
        "Schema: field '{}' 'listener' must be a method name or a boolean", field));
}

FieldSchema parse_field(const nlohmann::json &f)
{
    if (!f.is_object())
    {
        throw ConfigurationError("Schema: each field must be an object");
    }
    if (!f.contains("name") || !f["name"].is_string() || f["name"].get<std::string>().empty())
    {
        throw ConfigurationError("Schema: each field must have a non-empty string 'name'");
    }

    FieldSchema fs;
    fs.name = f["name"].get<std::string>();
    const std::string context = "field '" + fs.name + "'";

    if (f.contains("default_provider"))
    {
        if (f.contains("default"))
        {
            throw ConfigurationError(fmt::format(
                "Schema: {} sets both 'default' and 'default_provider'", context));
        }
        if (!f["default_provider"].is_string())
        {
            throw ConfigurationError(
                fmt::format("Schema: {} 'default_provider' must be a string", context));
        }
        fs.default_provider = f["default_provider"].get<std::string>();
    }
    else if (f.contains("default"))
    {
        fs.default_value = f["default"];
    }

    fs.read_only = read_bool(f, "read_only", context);
    fs.auto_dirty = read_bool(f, "auto_dirty", context);
    if (f.contains("listener"))
    {
        fs.listener = parse_listener(f["listener"], fs.name);
    }
    if (f.contains("doc"))
    {
        if (!f["doc"].is_string())
        {
            throw ConfigurationError(fmt::format("Schema: {} 'doc' must be a string", context));
        }
        fs.doc = f["doc"].get<std::string>();
    }

    if (fs.read_only && fs.listener.enabled())
    {
        throw ConfigurationError(
            fmt::format("Schema: {} is read-only and cannot have a listener", context));
    }
    return fs;
}

} // namespace

ClassSchema parse_class_schema(const nlohmann::json &schema_obj)
{
    if (!schema_obj.is_object())
    {
        throw ConfigurationError("Schema: document must be a JSON object");
    }
    if (!schema_obj.contains("name") || !schema_obj["name"].is_string() ||
        schema_obj["name"].get<std::string>().empty())
    {
        throw ConfigurationError("Schema: missing non-empty string 'name'");
    }

    ClassSchema schema;
    schema.name = schema_obj["name"].get<std::string>();
    const std::string context = "class '" + schema.name + "'";
    schema.auto_dirty = read_bool(schema_obj, "auto_dirty", context);
    schema.save_args = read_bool(schema_obj, "save_args", context);

    if (schema_obj.contains("exclude"))
    {
        const auto &ex = schema_obj["exclude"];
        if (!ex.is_array())
        {
            throw ConfigurationError("Schema: 'exclude' must be an array of names");
        }
        for (const auto &name : ex)
        {
            if (!name.is_string())
            {
                throw ConfigurationError("Schema: 'exclude' entries must be strings");
            }
            schema.exclude.push_back(name.get<std::string>());
        }
    }

    if (!schema_obj.contains("fields") || !schema_obj["fields"].is_array())
    {
        throw ConfigurationError("Schema: " + context + " requires a 'fields' array");
    }

    std::set<std::string> seen;
    for (const auto &f : schema_obj["fields"])
    {
        FieldSchema fs = parse_field(f);
        if (!seen.insert(fs.name).second)
        {
            throw ConfigurationError(
                fmt::format("Schema: field '{}' is declared more than once", fs.name));
        }
        schema.fields.push_back(std::move(fs));
    }

    return schema;
}

ClassSchema load_class_schema(const std::filesystem::path &path)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        throw ConfigurationError("Schema: cannot open '" + path.string() + "'");
    }

    nlohmann::json doc;
    try
    {
        in >> doc;
    }
    catch (const nlohmann::json::parse_error &ex)
    {
        throw ConfigurationError("Schema: parse error in '" + path.string() + "': " + ex.what());
    }

    LOGGER_DEBUG("loaded class schema from '{}'", path.string());
    return parse_class_schema(doc);
}

ClassPtr define_class(const ClassSchema &schema, const Bindings &bindings)
{
    ClassNamespace ns(schema.name);

    for (const auto &[name, fn] : bindings.methods)
    {
        ns.define_method(name, fn);
    }
    for (const auto &[name, fn] : bindings.listeners)
    {
        ns.define_listener(name, fn);
    }
    if (schema.save_args)
    {
        ns.declare_layout({std::string(kArgsSlot)});
    }

    with_properties(
        ns, kSchemaBuilderAlias,
        [&](PropertyBuilder &p)
        {
            for (const auto &fs : schema.fields)
            {
                DefaultProvider provider;
                if (!fs.default_provider.empty())
                {
                    auto it = bindings.providers.find(fs.default_provider);
                    if (it == bindings.providers.end())
                    {
                        throw ConfigurationError(
                            fmt::format("Schema: field '{}' refers to unknown provider '{}'",
                                        fs.name, fs.default_provider));
                    }
                    provider = it->second;
                }
                else
                {
                    provider = constant_default(fs.default_value);
                }

                PropOptions options;
                options.read_only = fs.read_only;
                options.listener = fs.listener;
                options.auto_dirty = fs.auto_dirty;
                options.doc = fs.doc;
                p.prop(fs.name, std::move(provider), options);
            }
        },
        schema.auto_dirty);

    const std::set<std::string, std::less<>> exclude(schema.exclude.begin(), schema.exclude.end());
    const bool save_args = schema.save_args;
    ns.define_constructor([exclude, save_args](Instance &self, const Arguments &args)
                          { copy_fields(self, args, exclude, save_args); });

    return Class::build(std::move(ns));
}

} // namespace fieldkit::model
