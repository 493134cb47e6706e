#pragma once

#include "ferry/runtime/result.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace ferry::runtime
{

/**
 * @brief Identifies a method by both name and index.
 *
 * Indices are assigned in declaration order starting at 0 and never change
 * at runtime. The name must outlive every call made with the identifier.
 */
struct MethodId {
    std::string_view name;
    std::uint32_t index = 0;
};

/**
 * @brief A method identifier as recovered by a server transport.
 *
 * Positional encodings only carry the index, named encodings only the name.
 */
class PartialMethodId
{
public:
    static PartialMethodId from_name(std::string name);
    static PartialMethodId from_index(std::uint32_t index);

    bool is_name() const
    {
        return std::holds_alternative<std::string>(value_);
    }

    bool is_index() const
    {
        return std::holds_alternative<std::uint32_t>(value_);
    }

    const std::string& name() const
    {
        return std::get<std::string>(value_);
    }

    std::uint32_t index() const
    {
        return std::get<std::uint32_t>(value_);
    }

    std::string to_string() const;

private:
    explicit PartialMethodId(std::variant<std::string, std::uint32_t> value)
        : value_(std::move(value))
    {
    }

    std::variant<std::string, std::uint32_t> value_;
};

/**
 * @brief Fixed name/index table for the methods of one service.
 *
 * Built once while the owning server is set up; resolves either half of a
 * PartialMethodId to the dispatch index.
 */
class MethodTable
{
public:
    /// Appends the next method. Fails with IllegalState on a duplicate name.
    Result<MethodId> add(std::string name);

    std::optional<std::uint32_t> resolve(const PartialMethodId& id) const;

    /// Identifier for the method at `index`; the name view stays valid while the table lives.
    std::optional<MethodId> at(std::uint32_t index) const;

    std::size_t size() const
    {
        return names_.size();
    }

private:
    std::deque<std::string> names_;
    std::unordered_map<std::string, std::uint32_t> index_by_name_;
};

}  // namespace ferry::runtime
