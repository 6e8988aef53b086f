// === JSON Codec ==============================================================
//
// JSON rendition of the message codec contract backed by nlohmann::json.
// Fields are keyed by name; tags are accepted for contract compatibility but
// not emitted. Used for diagnostics (`Area::to_json`) and round-trip tests.

#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "maritime_relay/message_codec.hpp"

namespace maritime_relay {

class JsonMessageWriter final : public MessageWriter {
  public:
    /** @brief Writer that owns a fresh JSON object. */
    JsonMessageWriter();
    /** @brief Writer that fills @p target, which must outlive the writer. */
    explicit JsonMessageWriter(nlohmann::json& target);

    JsonMessageWriter(const JsonMessageWriter&) = delete;
    JsonMessageWriter& operator=(const JsonMessageWriter&) = delete;

    void write_int32(int tag, std::string_view name, std::int32_t value) override;
    void write_int64(int tag, std::string_view name, std::int64_t value) override;
    void write_double(int tag, std::string_view name, double value) override;
    void write_message(int tag, std::string_view name, const MessageWriteFunction& body) override;
    void write_message_list(int tag,
                            std::string_view name,
                            std::size_t count,
                            const std::function<void(std::size_t, MessageWriter&)>& element) override;

    [[nodiscard]] const nlohmann::json& json() const noexcept;
    [[nodiscard]] std::string dump() const;

  private:
    nlohmann::json owned_json_;
    nlohmann::json& target_json_;
};

class JsonMessageReader final : public MessageReader {
  public:
    /** @brief Reader over @p source, which must outlive the reader. */
    explicit JsonMessageReader(const nlohmann::json& source);

    [[nodiscard]] bool is_next(int tag, std::string_view name) override;
    std::int32_t read_int32(int tag, std::string_view name) override;
    std::int64_t read_int64(int tag, std::string_view name) override;
    std::int64_t read_int64(int tag, std::string_view name, std::int64_t default_value) override;
    double read_double(int tag, std::string_view name) override;
    void read_message(int tag, std::string_view name, const MessageReadFunction& body) override;
    std::size_t read_message_list(int tag, std::string_view name, const MessageReadFunction& element) override;

  private:
    const nlohmann::json& field(int tag, std::string_view name) const;

    const nlohmann::json& source_json_;
};

/** @brief Encode @p value as compact JSON text. */
template <typename T>
std::string write_json(const T& value) {
    JsonMessageWriter writer;
    value.write(writer);
    return writer.dump();
}

/** @brief Parse JSON text into the JSON tree; throws DecodeError on malformed text. */
nlohmann::json parse_json_text(std::string_view text);

/** @brief Decode a value of type @p T from JSON text. */
template <typename T>
T read_json(std::string_view text) {
    const nlohmann::json document = parse_json_text(text);
    JsonMessageReader reader{document};
    return T::read(reader);
}

}  // namespace maritime_relay
