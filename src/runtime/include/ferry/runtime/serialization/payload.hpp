#pragma once

#include "ferry/runtime/error.hpp"
#include "ferry/runtime/result.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace ferry::runtime
{

class PayloadSink
{
public:
    virtual ~PayloadSink() = default;
    virtual Result<void> append(std::span<const std::uint8_t> data) = 0;
};

class PayloadSource
{
public:
    virtual ~PayloadSource() = default;
    virtual Result<std::span<const std::uint8_t>> read(std::size_t size) = 0;
    virtual std::size_t remaining() const = 0;

    bool empty() const
    {
        return remaining() == 0;
    }
};

class VectorSink : public PayloadSink
{
public:
    explicit VectorSink(std::vector<std::uint8_t>& buffer)
        : buffer_(buffer)
    {
    }

    Result<void> append(std::span<const std::uint8_t> data) override
    {
        buffer_.insert(buffer_.end(), data.begin(), data.end());
        return {};
    }

private:
    std::vector<std::uint8_t>& buffer_;
};

class SpanSource : public PayloadSource
{
public:
    explicit SpanSource(std::span<const std::uint8_t> data)
        : data_(data)
    {
    }

    Result<std::span<const std::uint8_t>> read(std::size_t size) override
    {
        if (size > remaining()) {
            return unexpected_result<std::span<const std::uint8_t>>(ErrorCode::SerializationError, "payload underrun");
        }
        auto view = data_.subspan(offset_, size);
        offset_ += size;
        return view;
    }

    std::size_t remaining() const override
    {
        return data_.size() - offset_;
    }

private:
    std::span<const std::uint8_t> data_;
    std::size_t offset_ = 0;
};

}  // namespace ferry::runtime
