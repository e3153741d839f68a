/**
 * @file field_copier.cpp
 * @brief Construction-time argument copy.
 */
#include "model/field_copier.hpp"
#include "model/instance.hpp"

namespace fieldkit::model
{

void copy_fields(Instance &self, const Arguments &args,
                 const std::set<std::string, std::less<>> &exclude, bool save_args,
                 std::string_view self_name)
{
    Value saved = Value::array();
    for (const auto &[name, value] : args)
    {
        if (name == self_name || exclude.count(name) != 0)
        {
            continue;
        }
        self.write_slot(slot_name(name), value);
        if (save_args)
        {
            saved.push_back(value);
        }
    }
    if (save_args)
    {
        self.write_slot(std::string(kArgsSlot), std::move(saved));
    }
}

} // namespace fieldkit::model
