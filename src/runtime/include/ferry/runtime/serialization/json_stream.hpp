#pragma once

#include "ferry/runtime/result.hpp"
#include "ferry/runtime/stream.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace ferry::runtime
{

/**
 * @brief Finds the end of the first complete JSON text in a growing buffer.
 *
 * Tracks brace/bracket depth outside of strings, honouring escapes. A top
 * level string completes at its closing quote; a top level scalar completes
 * at the first delimiter, or at EOF via `finish`. Scanning resumes where the
 * previous call stopped, so feeding a buffer that only grew is linear.
 */
class JsonValueScanner
{
public:
    /// Offset one past the complete value, or nullopt if more input is needed.
    std::optional<std::size_t> feed(std::string_view buffer);

    /// Same as `feed`, treating the end of `buffer` as end of input.
    std::optional<std::size_t> finish(std::string_view buffer);

    void reset();

private:
    enum class Mode {
        Leading,
        Container,
        String,
        Scalar,
    };

    Mode mode_ = Mode::Leading;
    std::size_t pos_ = 0;
    std::size_t depth_ = 0;
    bool in_string_ = false;
    bool escape_ = false;
};

/**
 * @brief Byte buffer that hands out one JSON text at a time.
 *
 * Bytes following a complete value stay buffered for the next one.
 */
class JsonValueBuffer
{
public:
    void append(std::span<const std::uint8_t> data);
    void append(std::string_view data);

    /// Removes and returns the next complete value text, if there is one.
    std::optional<std::string> next_value();

    /// Like `next_value`, at end of input.
    std::optional<std::string> finish();

    /// Nothing but whitespace buffered.
    bool blank() const;

private:
    std::string take(std::size_t end);

    std::string data_;
    JsonValueScanner scanner_;
};

Result<nlohmann::json> parse_json_text(std::string_view text);

/// Error reported when the input ends before a value is complete.
Error json_eof_error();

/**
 * @brief Takes the next parsed value out of `buffer`.
 *
 * Returns nullopt while more input is needed. With `at_eof` set a value is
 * always produced: the trailing value, or the EOF error if it is incomplete.
 */
std::optional<Result<nlohmann::json>> take_json_value(JsonValueBuffer& buffer, bool at_eof);

/**
 * @brief Reads exactly one JSON value from a blocking stream.
 *
 * `chunk` bytes are requested per read; surplus bytes stay in `buffer`.
 */
Result<nlohmann::json> read_json_value(ByteStream& stream, JsonValueBuffer& buffer, std::size_t chunk);

}  // namespace ferry::runtime
