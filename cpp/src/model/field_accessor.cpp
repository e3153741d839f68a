/**
 * @file field_accessor.cpp
 * @brief Accessor pair generation.
 */
#include "model/field_accessor.hpp"
#include "model/class_type.hpp"
#include "model/errors.hpp"
#include "model/instance.hpp"

namespace fieldkit::model
{

ManagedAccessor::ManagedAccessor(std::shared_ptr<const FieldDefinition> definition,
                                 Getter getter, Setter setter)
    : m_definition(std::move(definition)), m_getter(std::move(getter)),
      m_setter(std::move(setter))
{
}

Value ManagedAccessor::get(const Instance &self) const
{
    return m_getter(self);
}

void ManagedAccessor::set(Instance &self, const Value &value) const
{
    if (!m_setter)
    {
        throw ReadOnlyFieldError(self.type().name(), m_definition->name);
    }
    m_setter(self, value);
}

AccessorPtr make_accessor(FieldDefinition definition)
{
    if (definition.read_only && definition.listener)
    {
        throw ConfigurationError("field '" + definition.name +
                                 "' is read-only and cannot have a listener");
    }
    if (!definition.provider)
    {
        throw ConfigurationError("field '" + definition.name + "' has no default provider");
    }

    auto def = std::make_shared<const FieldDefinition>(std::move(definition));

    ManagedAccessor::Getter getter = [def](const Instance &self) -> Value
    {
        const auto &stored = self.slot(def->slot);
        if (stored)
        {
            return *stored;
        }
        return def->provider(self);
    };

    ManagedAccessor::Setter setter;
    if (!def->read_only)
    {
        setter = [def](Instance &self, const Value &value)
        {
            const auto &stored = self.slot(def->slot);
            Value old_value = stored ? *stored : Value();
            if (old_value == value)
            {
                return;
            }
            self.write_slot(def->slot, value);
            if (def->auto_dirty)
            {
                self.write_slot(std::string(kDirtySlot), true);
            }
            if (def->listener)
            {
                self.call(*def->listener, {Value(def->slot), old_value, value});
            }
        };
    }

    return std::make_shared<const ManagedAccessor>(def, std::move(getter), std::move(setter));
}

} // namespace fieldkit::model
