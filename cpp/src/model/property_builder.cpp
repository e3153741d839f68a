/**
 * @file property_builder.cpp
 * @brief Field declaration and storage layout manifest merge.
 */
#include "model/property_builder.hpp"
#include "model/errors.hpp"
#include "model/field_accessor.hpp"
#include "utils/logger.hpp"
#include "utils/scope_guard.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

namespace fieldkit::model
{

namespace
{

bool contains(const std::vector<std::string> &names, const std::string &name)
{
    return std::find(names.begin(), names.end(), name) != names.end();
}

bool is_reserved(const std::string &name)
{
    return name == kLayoutKey || name == kConstructorKey;
}

/// Slots the library manages itself; no field may be backed by them.
bool is_reserved_slot(const std::string &slot)
{
    return slot == kDirtySlot || slot == kArgsSlot;
}

/// Checks `manifest` against `layout`. A `_dirty` already in the layout is
/// shared by every session and is dropped from the returned slots.
std::vector<std::string> slots_to_merge(const std::vector<std::string> &layout,
                                        const std::vector<std::string> &manifest,
                                        const std::string &class_name)
{
    std::vector<std::string> added;
    for (const auto &slot : manifest)
    {
        if (std::find(layout.begin(), layout.end(), slot) == layout.end())
        {
            added.push_back(slot);
            continue;
        }
        if (slot != kDirtySlot)
        {
            throw ConfigurationError(
                fmt::format("slot '{}' is already in the layout of '{}'", slot, class_name));
        }
    }
    return added;
}

} // namespace

std::optional<std::string> ListenerOption::resolve() const
{
    if (!m_method.empty())
    {
        return m_method;
    }
    if (m_generic)
    {
        return std::string(kGenericListener);
    }
    return std::nullopt;
}

PropertyBuilder::PropertyBuilder(ClassNamespace &ns, std::string alias, bool auto_dirty)
    : m_ns(&ns), m_alias(std::move(alias)), m_auto_dirty(auto_dirty)
{
    if (m_alias.empty() || is_reserved(m_alias))
    {
        throw ConfigurationError("invalid property builder alias '" + m_alias + "'");
    }
}

PropertyBuilder::~PropertyBuilder()
{
    if (m_state == State::Open)
    {
        exit_noexcept();
    }
}

PropertyBuilder &PropertyBuilder::enter()
{
    if (m_state != State::Pending)
    {
        throw UsageError(fmt::format("property builder '{}' cannot be entered twice", m_alias));
    }
    if (m_ns->contains(m_alias))
    {
        throw UsageError(fmt::format("'{}' is already bound in '{}'; choose another builder alias",
                                     m_alias, m_ns->class_name()));
    }
    m_ns->set(m_alias, Member(std::in_place_type<BuilderAlias>, BuilderAlias{this}));
    m_state = State::Open;
    LOGGER_TRACE("property builder '{}' opened on '{}'", m_alias, m_ns->class_name());
    return *this;
}

void PropertyBuilder::exit()
{
    require_open("exit");
    auto unbind = basics::make_scope_guard([this]() noexcept { release(); });
    merge_manifest();
}

void PropertyBuilder::exit_noexcept() noexcept
{
    try
    {
        exit();
    }
    catch (const std::exception &ex)
    {
        LOGGER_ERROR("releasing property builder '{}' failed: {}", m_alias, ex.what());
    }
}

void PropertyBuilder::release() noexcept
{
    if (m_ns != nullptr)
    {
        m_ns->erase(m_alias);
    }
    m_ns = nullptr;
    m_manifest.clear();
    m_manifest.shrink_to_fit();
    m_state = State::Released;
}

void PropertyBuilder::require_open(const char *operation) const
{
    switch (m_state)
    {
    case State::Open: return;
    case State::Pending:
        throw UsageError(fmt::format("{}: property builder '{}' has not been entered", operation,
                                     m_alias));
    case State::Released:
        throw UsageError(fmt::format("{}: property builder '{}' has already been released",
                                     operation, m_alias));
    }
}

const std::vector<std::string> &PropertyBuilder::manifest() const
{
    if (m_state == State::Released)
    {
        throw UsageError(
            fmt::format("manifest: property builder '{}' has already been released", m_alias));
    }
    return m_manifest;
}

AccessorPtr PropertyBuilder::prop(const std::string &name, const PropOptions &options)
{
    require_open("prop");
    const auto *provider = m_ns->find_as<Provider>(name);
    if (provider == nullptr)
    {
        LOGGER_WARN("field '{}' rejected: no default provider bound in '{}'", name,
                    m_ns->class_name());
        throw ConfigurationError(fmt::format("no default provider named '{}' in '{}'", name,
                                             m_ns->class_name()));
    }
    PropOptions effective = options;
    if (effective.doc.empty())
    {
        effective.doc = provider->doc;
    }
    // Copy: prop() replaces the namespace entry the pointer refers to.
    DefaultProvider fn = provider->fn;
    return prop(name, std::move(fn), effective);
}

AccessorPtr PropertyBuilder::prop(const std::string &name, DefaultProvider provider,
                                  const PropOptions &options)
{
    require_open("prop");

    if (name.empty() || name == m_alias || is_reserved(name))
    {
        throw ConfigurationError(fmt::format("'{}' cannot be used as a field name", name));
    }
    if (options.read_only && options.listener.enabled())
    {
        LOGGER_WARN("field '{}.{}' rejected: read-only fields cannot be observed",
                    m_ns->class_name(), name);
        throw ConfigurationError(fmt::format("field '{}' of '{}' is read-only and cannot have a "
                                             "listener",
                                             name, m_ns->class_name()));
    }

    const std::string slot = slot_name(name);
    if (is_reserved_slot(slot))
    {
        LOGGER_WARN("field '{}.{}' rejected: slot '{}' is reserved", m_ns->class_name(), name,
                    slot);
        throw ConfigurationError(fmt::format("field '{}' of '{}' would use the reserved slot '{}'",
                                             name, m_ns->class_name(), slot));
    }
    if (contains(m_manifest, slot))
    {
        throw ConfigurationError(fmt::format("slot '{}' is already declared by builder '{}'", slot,
                                             m_alias));
    }

    const bool dirty = m_auto_dirty || options.auto_dirty;

    FieldDefinition def;
    def.name = name;
    def.slot = slot;
    def.provider = std::move(provider);
    def.read_only = options.read_only;
    def.listener = options.listener.resolve();
    def.auto_dirty = dirty;
    def.doc = options.doc;

    AccessorPtr accessor = make_accessor(std::move(def));

    const std::string dirty_slot(kDirtySlot);
    if (dirty && !contains(m_manifest, dirty_slot))
    {
        m_manifest.push_back(dirty_slot);
    }
    m_manifest.push_back(slot);
    m_ns->set(name, Member(std::in_place_type<AccessorPtr>, accessor));

    LOGGER_DEBUG("field '{}.{}' declared (slot={}, read_only={}, listener={}, auto_dirty={})",
                 m_ns->class_name(), name, slot, accessor->definition().read_only,
                 accessor->definition().listener.value_or("-"), dirty);
    return accessor;
}

void PropertyBuilder::merge_manifest()
{
    const std::string key(kLayoutKey);
    Member *existing = m_ns->find(key);

    if (existing == nullptr)
    {
        m_ns->declare_layout(m_manifest);
    }
    else if (auto *list = std::get_if<SlotList>(existing))
    {
        if (!list->names)
        {
            list->names = std::make_shared<std::vector<std::string>>();
        }
        const auto added = slots_to_merge(*list->names, m_manifest, m_ns->class_name());
        list->names->insert(list->names->end(), added.begin(), added.end());
    }
    else if (auto *frozen = std::get_if<FrozenSlotList>(existing))
    {
        std::vector<std::string> merged = frozen->names;
        const auto added = slots_to_merge(merged, m_manifest, m_ns->class_name());
        merged.insert(merged.end(), added.begin(), added.end());
        m_ns->declare_layout(std::move(merged), /*frozen=*/true);
    }
    else
    {
        throw ConfigurationError(fmt::format("'{}' of '{}' is bound to something other than a "
                                             "slot list",
                                             key, m_ns->class_name()));
    }

    LOGGER_DEBUG("builder '{}' merged [{}] into layout of '{}'", m_alias,
                 fmt::join(m_manifest, ", "), m_ns->class_name());
}

} // namespace fieldkit::model
