// === Message Codec Contract ==================================================
//
// Field-oriented reader/writer interfaces every wire entity encodes itself
// through. Fields are addressed by a (numeric tag, name) pair so that binary
// encoders can key on the tag and text encoders on the name; either way the
// schema can grow without breaking older readers. Concrete engines live
// outside the relay core; `json_codec.hpp` provides a JSON rendition.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "maritime_relay/errors.hpp"

namespace maritime_relay {

class MessageWriter;
class MessageReader;

using MessageWriteFunction = std::function<void(MessageWriter&)>;
using MessageReadFunction = std::function<void(MessageReader&)>;

/** @brief Sink for the fields of one message. */
class MessageWriter {
  public:
    virtual ~MessageWriter() = default;

    virtual void write_int32(int tag, std::string_view name, std::int32_t value) = 0;
    virtual void write_int64(int tag, std::string_view name, std::int64_t value) = 0;
    virtual void write_double(int tag, std::string_view name, double value) = 0;
    /** @brief Write a nested message whose fields @p body emits. */
    virtual void write_message(int tag, std::string_view name, const MessageWriteFunction& body) = 0;
    /** @brief Write @p count nested messages; @p element emits the fields of the i-th one. */
    virtual void write_message_list(int tag,
                                    std::string_view name,
                                    std::size_t count,
                                    const std::function<void(std::size_t, MessageWriter&)>& element) = 0;
};

/**
 * @brief Source for the fields of one message.
 *
 * Every read of a missing or ill-typed field throws DecodeError.
 */
class MessageReader {
  public:
    virtual ~MessageReader() = default;

    /** @brief Whether the message carries the field identified by (@p tag, @p name). */
    [[nodiscard]] virtual bool is_next(int tag, std::string_view name) = 0;

    virtual std::int32_t read_int32(int tag, std::string_view name) = 0;
    virtual std::int64_t read_int64(int tag, std::string_view name) = 0;
    /** @brief Read an optional int64, yielding @p default_value when absent. */
    virtual std::int64_t read_int64(int tag, std::string_view name, std::int64_t default_value) = 0;
    virtual double read_double(int tag, std::string_view name) = 0;
    /** @brief Hand a reader positioned on the nested message to @p body. */
    virtual void read_message(int tag, std::string_view name, const MessageReadFunction& body) = 0;
    /** @brief Invoke @p element once per nested message; returns the element count. */
    virtual std::size_t read_message_list(int tag, std::string_view name, const MessageReadFunction& element) = 0;
};

/** @brief Read a nested message of type @p T through its static `read`. */
template <typename T>
T read_message_as(MessageReader& reader, int tag, std::string_view name) {
    std::optional<T> optional_value;
    reader.read_message(tag, name, [&optional_value](MessageReader& nested) {
        optional_value.emplace(T::read(nested));
    });
    if (!optional_value.has_value()) {
        throw DecodeError("Nested message '" + std::string{name} + "' was not decoded");
    }
    return std::move(*optional_value);
}

/** @brief Write a nested message through the value's `write`. */
template <typename T>
void write_message_of(MessageWriter& writer, int tag, std::string_view name, const T& value) {
    writer.write_message(tag, name, [&value](MessageWriter& nested) { value.write(nested); });
}

}  // namespace maritime_relay
