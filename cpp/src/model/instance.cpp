/**
 * @file instance.cpp
 * @brief Attribute resolution and fixed slot storage.
 */
#include "model/instance.hpp"
#include "model/class_type.hpp"
#include "model/errors.hpp"
#include "model/field_accessor.hpp"

#include <fmt/format.h>

namespace fieldkit::model
{

Instance::Instance(std::shared_ptr<const Class> cls)
    : m_class(std::move(cls)), m_slots(m_class->layout().size())
{
}

std::size_t Instance::index_of(const std::string &slot) const
{
    auto index = m_class->slot_index(slot);
    if (!index)
    {
        throw FieldInjectionError(m_class->name(), slot);
    }
    return *index;
}

Value Instance::get(const std::string &name) const
{
    if (auto acc = m_class->accessor(name))
    {
        return acc->get(*this);
    }
    if (auto index = m_class->slot_index(name))
    {
        const auto &stored = m_slots[*index];
        if (!stored)
        {
            throw UnknownAttributeError(
                fmt::format("slot '{}' of '{}' has not been assigned", name, m_class->name()),
                name);
        }
        return *stored;
    }
    if (const Value *constant = m_class->constant(name))
    {
        return *constant;
    }
    throw UnknownAttributeError(
        fmt::format("'{}' object has no attribute '{}'", m_class->name(), name), name);
}

void Instance::set(const std::string &name, const Value &value)
{
    if (auto acc = m_class->accessor(name))
    {
        acc->set(*this, value);
        return;
    }
    m_slots[index_of(name)] = value;
}

Value Instance::call(const std::string &method, const std::vector<Value> &args)
{
    if (const Method *m = m_class->method(method))
    {
        return m->fn(*this, args);
    }
    throw UnknownAttributeError(
        fmt::format("'{}' object has no method '{}'", m_class->name(), method), method);
}

bool Instance::has_slot(const std::string &slot) const
{
    return m_class->has_slot(slot);
}

const std::optional<Value> &Instance::slot(const std::string &slot) const
{
    return m_slots[index_of(slot)];
}

void Instance::write_slot(const std::string &slot, Value value)
{
    m_slots[index_of(slot)] = std::move(value);
}

bool Instance::dirty() const
{
    auto index = m_class->slot_index(std::string(kDirtySlot));
    if (!index || !m_slots[*index])
    {
        return false;
    }
    const Value &flag = *m_slots[*index];
    return flag.is_boolean() && flag.get<bool>();
}

void Instance::clear_dirty()
{
    if (has_slot(std::string(kDirtySlot)))
    {
        write_slot(std::string(kDirtySlot), false);
    }
}

} // namespace fieldkit::model
