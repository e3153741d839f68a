/**
 * @file class_type.cpp
 * @brief Class construction from a finished namespace.
 */
#include "model/class_type.hpp"
#include "model/errors.hpp"
#include "model/field_accessor.hpp"
#include "model/field_copier.hpp"
#include "utils/logger.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <unordered_set>

namespace fieldkit::model
{

namespace
{

void require_slot(const ClassNamespace &ns, const std::unordered_set<std::string> &slots,
                  const std::string &field, const std::string &slot)
{
    if (slots.count(slot) == 0)
    {
        throw ConfigurationError(fmt::format("field '{}' of '{}' needs slot '{}', which is not in "
                                             "the storage layout",
                                             field, ns.class_name(), slot));
    }
}

} // namespace

ClassPtr Class::build(ClassNamespace ns)
{
    for (const auto &name : ns.names())
    {
        if (ns.find_as<BuilderAlias>(name) != nullptr)
        {
            throw UsageError(fmt::format(
                "property builder '{}' of '{}' is still open; release it before building the class",
                name, ns.class_name()));
        }
    }

    std::vector<std::string> layout = ns.layout();
    std::unordered_set<std::string> seen;
    for (const auto &slot : layout)
    {
        if (slot.empty())
        {
            throw ConfigurationError(fmt::format("'{}' declares an empty slot identifier",
                                                 ns.class_name()));
        }
        if (!seen.insert(slot).second)
        {
            throw ConfigurationError(fmt::format("slot '{}' is declared more than once in '{}'",
                                                 slot, ns.class_name()));
        }
    }

    for (const auto &name : ns.names())
    {
        const auto *acc = ns.find_as<AccessorPtr>(name);
        if (acc == nullptr || !*acc)
        {
            continue;
        }
        const FieldDefinition &def = (*acc)->definition();
        require_slot(ns, seen, name, def.slot);
        if (def.auto_dirty)
        {
            require_slot(ns, seen, name, std::string(kDirtySlot));
        }
        if (def.listener && ns.find_as<Method>(*def.listener) == nullptr)
        {
            throw ConfigurationError(fmt::format("listener '{}' of field '{}' is not a method of '{}'",
                                                 *def.listener, name, ns.class_name()));
        }
    }

    LOGGER_DEBUG("class '{}' built: members [{}], layout [{}]", ns.class_name(),
                 fmt::join(ns.names(), ", "), fmt::join(layout, ", "));

    return ClassPtr(new Class(std::move(ns), std::move(layout)));
}

Class::Class(ClassNamespace members, std::vector<std::string> layout)
    : m_members(std::move(members)), m_layout(std::move(layout))
{
    for (std::size_t i = 0; i < m_layout.size(); ++i)
    {
        m_slot_index.emplace(m_layout[i], i);
    }
}

std::optional<std::size_t> Class::slot_index(const std::string &slot) const
{
    auto it = m_slot_index.find(slot);
    if (it == m_slot_index.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> Class::field_names() const
{
    std::vector<std::string> fields;
    for (const auto &name : m_members.names())
    {
        if (m_members.find_as<AccessorPtr>(name) != nullptr)
        {
            fields.push_back(name);
        }
    }
    return fields;
}

AccessorPtr Class::accessor(const std::string &name) const
{
    const auto *acc = m_members.find_as<AccessorPtr>(name);
    return acc != nullptr ? *acc : nullptr;
}

const Method *Class::method(const std::string &name) const
{
    return m_members.find_as<Method>(name);
}

const Value *Class::constant(const std::string &name) const
{
    return m_members.find_as<Value>(name);
}

std::string Class::doc(const std::string &name) const
{
    if (auto acc = accessor(name))
    {
        return acc->doc();
    }
    if (const auto *m = method(name))
    {
        return m->doc;
    }
    if (const auto *p = m_members.find_as<Provider>(name))
    {
        return p->doc;
    }
    return {};
}

Instance Class::create(const Arguments &args) const
{
    Instance self(shared_from_this());
    if (const auto *ctor = m_members.find_as<Constructor>(std::string(kConstructorKey)))
    {
        ctor->fn(self, args);
    }
    else if (!args.empty())
    {
        copy_fields(self, args);
    }
    return self;
}

} // namespace fieldkit::model
