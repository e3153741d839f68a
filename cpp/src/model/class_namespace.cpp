/**
 * @file class_namespace.cpp
 * @brief Member table of a class under construction.
 */
#include "model/class_namespace.hpp"
#include "model/errors.hpp"

#include <algorithm>

namespace fieldkit::model
{

ClassNamespace::ClassNamespace(std::string class_name) : m_class_name(std::move(class_name))
{
    if (m_class_name.empty())
    {
        throw ConfigurationError("class name must not be empty");
    }
}

void ClassNamespace::set(const std::string &name, Member member)
{
    auto it = m_members.find(name);
    if (it != m_members.end())
    {
        it->second = std::move(member);
        return;
    }
    m_members.emplace(name, std::move(member));
    m_order.push_back(name);
}

bool ClassNamespace::erase(const std::string &name)
{
    if (m_members.erase(name) == 0)
    {
        return false;
    }
    m_order.erase(std::find(m_order.begin(), m_order.end(), name));
    return true;
}

bool ClassNamespace::contains(const std::string &name) const
{
    return m_members.find(name) != m_members.end();
}

Member *ClassNamespace::find(const std::string &name)
{
    auto it = m_members.find(name);
    return it != m_members.end() ? &it->second : nullptr;
}

const Member *ClassNamespace::find(const std::string &name) const
{
    auto it = m_members.find(name);
    return it != m_members.end() ? &it->second : nullptr;
}

void ClassNamespace::define_constant(const std::string &name, Value value)
{
    set(name, Member(std::in_place_type<Value>, std::move(value)));
}

void ClassNamespace::define_provider(const std::string &name, DefaultProvider fn, std::string doc)
{
    if (!fn)
    {
        throw ConfigurationError("default provider '" + name + "' is empty");
    }
    set(name, Member(std::in_place_type<Provider>, Provider{std::move(fn), std::move(doc)}));
}

void ClassNamespace::define_method(const std::string &name, MethodFn fn, std::string doc)
{
    if (!fn)
    {
        throw ConfigurationError("method '" + name + "' is empty");
    }
    set(name, Member(std::in_place_type<Method>, Method{std::move(fn), std::move(doc)}));
}

void ClassNamespace::define_listener(const std::string &name, ListenerFn fn, std::string doc)
{
    if (!fn)
    {
        throw ConfigurationError("listener '" + name + "' is empty");
    }
    define_method(
        name,
        [fn = std::move(fn), name](Instance &self, const std::vector<Value> &args) -> Value
        {
            if (args.size() != 3 || !args[0].is_string())
            {
                throw UsageError("listener '" + name +
                                 "' expects (slot, old_value, new_value)");
            }
            fn(self, args[0].get<std::string>(), args[1], args[2]);
            return Value();
        },
        std::move(doc));
}

void ClassNamespace::define_constructor(ConstructorFn fn)
{
    if (!fn)
    {
        throw ConfigurationError("constructor of '" + m_class_name + "' is empty");
    }
    set(std::string(kConstructorKey), Member(std::in_place_type<Constructor>, Constructor{std::move(fn)}));
}

void ClassNamespace::declare_layout(std::vector<std::string> slots, bool frozen)
{
    if (frozen)
    {
        set(std::string(kLayoutKey),
            Member(std::in_place_type<FrozenSlotList>, FrozenSlotList{std::move(slots)}));
    }
    else
    {
        set(std::string(kLayoutKey),
            Member(std::in_place_type<SlotList>,
                   SlotList{std::make_shared<std::vector<std::string>>(std::move(slots))}));
    }
}

std::vector<std::string> ClassNamespace::layout() const
{
    const Member *m = find(std::string(kLayoutKey));
    if (m == nullptr)
    {
        return {};
    }
    if (const auto *list = std::get_if<SlotList>(m))
    {
        return list->names ? *list->names : std::vector<std::string>{};
    }
    if (const auto *frozen = std::get_if<FrozenSlotList>(m))
    {
        return frozen->names;
    }
    throw ConfigurationError("'" + std::string(kLayoutKey) + "' of '" + m_class_name +
                             "' is not a slot list");
}

} // namespace fieldkit::model
