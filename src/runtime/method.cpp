#include "ferry/runtime/method.hpp"

#include <fmt/core.h>

namespace ferry::runtime
{

PartialMethodId PartialMethodId::from_name(std::string name)
{
    return PartialMethodId{std::move(name)};
}

PartialMethodId PartialMethodId::from_index(std::uint32_t index)
{
    return PartialMethodId{index};
}

std::string PartialMethodId::to_string() const
{
    if (is_name()) {
        return fmt::format("name '{}'", name());
    }
    return fmt::format("index {}", index());
}

Result<MethodId> MethodTable::add(std::string name)
{
    if (index_by_name_.contains(name)) {
        return unexpected_result<MethodId>(ErrorCode::IllegalState,
                                           fmt::format("method '{}' declared twice", name));
    }
    auto index = static_cast<std::uint32_t>(names_.size());
    index_by_name_.emplace(name, index);
    names_.push_back(std::move(name));
    return MethodId{names_.back(), index};
}

std::optional<std::uint32_t> MethodTable::resolve(const PartialMethodId& id) const
{
    if (id.is_index()) {
        if (id.index() < names_.size()) {
            return id.index();
        }
        return std::nullopt;
    }
    auto it = index_by_name_.find(id.name());
    if (it == index_by_name_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<MethodId> MethodTable::at(std::uint32_t index) const
{
    if (index >= names_.size()) {
        return std::nullopt;
    }
    return MethodId{names_[index], index};
}

}  // namespace ferry::runtime
