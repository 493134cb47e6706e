#include "ferry/runtime/serialization/json_stream.hpp"

#include "ferry/runtime/serialization/json.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace ferry::runtime
{
namespace
{

bool is_space(char ch)
{
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

bool ends_scalar(char ch)
{
    return is_space(ch) || ch == '{' || ch == '}' || ch == '[' || ch == ']' || ch == ',' || ch == ':' || ch == '"';
}

}  // namespace

std::optional<std::size_t> JsonValueScanner::feed(std::string_view buffer)
{
    while (pos_ < buffer.size()) {
        char ch = buffer[pos_];
        switch (mode_) {
            case Mode::Leading:
                if (is_space(ch)) {
                    break;
                }
                if (ch == '{' || ch == '[') {
                    mode_ = Mode::Container;
                    depth_ = 1;
                } else if (ch == '"') {
                    mode_ = Mode::String;
                } else {
                    mode_ = Mode::Scalar;
                }
                break;
            case Mode::Container:
                if (in_string_) {
                    if (escape_) {
                        escape_ = false;
                    } else if (ch == '\\') {
                        escape_ = true;
                    } else if (ch == '"') {
                        in_string_ = false;
                    }
                } else if (ch == '"') {
                    in_string_ = true;
                } else if (ch == '{' || ch == '[') {
                    ++depth_;
                } else if (ch == '}' || ch == ']') {
                    if (--depth_ == 0) {
                        return ++pos_;
                    }
                }
                break;
            case Mode::String:
                if (escape_) {
                    escape_ = false;
                } else if (ch == '\\') {
                    escape_ = true;
                } else if (ch == '"') {
                    return ++pos_;
                }
                break;
            case Mode::Scalar:
                if (ends_scalar(ch)) {
                    return pos_;
                }
                break;
        }
        ++pos_;
    }
    return std::nullopt;
}

std::optional<std::size_t> JsonValueScanner::finish(std::string_view buffer)
{
    if (auto end = feed(buffer)) {
        return end;
    }
    if (mode_ == Mode::Scalar) {
        return buffer.size();
    }
    return std::nullopt;
}

void JsonValueScanner::reset()
{
    *this = JsonValueScanner{};
}

void JsonValueBuffer::append(std::span<const std::uint8_t> data)
{
    data_.append(reinterpret_cast<const char*>(data.data()), data.size());
}

void JsonValueBuffer::append(std::string_view data)
{
    data_.append(data);
}

std::optional<std::string> JsonValueBuffer::next_value()
{
    auto end = scanner_.feed(data_);
    if (!end) {
        return std::nullopt;
    }
    return take(*end);
}

std::optional<std::string> JsonValueBuffer::finish()
{
    auto end = scanner_.finish(data_);
    if (!end) {
        return std::nullopt;
    }
    return take(*end);
}

bool JsonValueBuffer::blank() const
{
    return std::all_of(data_.begin(), data_.end(), is_space);
}

std::string JsonValueBuffer::take(std::size_t end)
{
    std::string value = data_.substr(0, end);
    data_.erase(0, end);
    scanner_.reset();
    return value;
}

Result<nlohmann::json> parse_json_text(std::string_view text)
{
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(json_conversion_error(ex));
    }
}

Error json_eof_error()
{
    return make_error(ErrorCode::TransportEOF, "EOF during json deserialization");
}

std::optional<Result<nlohmann::json>> take_json_value(JsonValueBuffer& buffer, bool at_eof)
{
    auto text = at_eof ? buffer.finish() : buffer.next_value();
    if (text) {
        return parse_json_text(*text);
    }
    if (at_eof) {
        return std::unexpected(json_eof_error());
    }
    return std::nullopt;
}

Result<nlohmann::json> read_json_value(ByteStream& stream, JsonValueBuffer& buffer, std::size_t chunk)
{
    std::vector<std::uint8_t> scratch(chunk == 0 ? 1 : chunk);
    while (true) {
        if (auto value = take_json_value(buffer, false)) {
            return std::move(*value);
        }
        auto count = stream.read_some(scratch);
        if (!count) {
            return std::unexpected(count.error());
        }
        if (*count == 0) {
            return std::move(*take_json_value(buffer, true));
        }
        buffer.append(std::span<const std::uint8_t>(scratch.data(), *count));
    }
}

}  // namespace ferry::runtime
