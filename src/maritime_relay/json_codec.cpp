#include "maritime_relay/json_codec.hpp"

#include <limits>

#include <fmt/format.h>

#include "maritime_relay/errors.hpp"

namespace maritime_relay {

JsonMessageWriter::JsonMessageWriter()
    : owned_json_(nlohmann::json::object()),
      target_json_(owned_json_) {}

JsonMessageWriter::JsonMessageWriter(nlohmann::json& target)
    : target_json_(target) {
    if (!target_json_.is_object()) {
        target_json_ = nlohmann::json::object();
    }
}

void JsonMessageWriter::write_int32(int, std::string_view name, std::int32_t value) {
    target_json_[std::string{name}] = value;
}

void JsonMessageWriter::write_int64(int, std::string_view name, std::int64_t value) {
    target_json_[std::string{name}] = value;
}

void JsonMessageWriter::write_double(int, std::string_view name, double value) {
    target_json_[std::string{name}] = value;
}

void JsonMessageWriter::write_message(int, std::string_view name, const MessageWriteFunction& body) {
    nlohmann::json& nested = target_json_[std::string{name}];
    nested = nlohmann::json::object();
    JsonMessageWriter nested_writer{nested};
    body(nested_writer);
}

void JsonMessageWriter::write_message_list(int,
                                           std::string_view name,
                                           std::size_t count,
                                           const std::function<void(std::size_t, MessageWriter&)>& element) {
    nlohmann::json list = nlohmann::json::array();
    for (std::size_t index = 0; index < count; ++index) {
        nlohmann::json nested = nlohmann::json::object();
        JsonMessageWriter nested_writer{nested};
        element(index, nested_writer);
        list.push_back(std::move(nested));
    }
    target_json_[std::string{name}] = std::move(list);
}

const nlohmann::json& JsonMessageWriter::json() const noexcept {
    return target_json_;
}

std::string JsonMessageWriter::dump() const {
    return target_json_.dump();
}

JsonMessageReader::JsonMessageReader(const nlohmann::json& source)
    : source_json_(source) {}

bool JsonMessageReader::is_next(int, std::string_view name) {
    return source_json_.is_object() && source_json_.contains(std::string{name});
}

const nlohmann::json& JsonMessageReader::field(int tag, std::string_view name) const {
    if (!source_json_.is_object()) {
        throw DecodeError(fmt::format("Expected an object while reading field {} ({})", name, tag));
    }
    const auto iterator_field = source_json_.find(std::string{name});
    if (iterator_field == source_json_.end()) {
        throw DecodeError(fmt::format("Missing field {} ({})", name, tag));
    }
    return *iterator_field;
}

std::int32_t JsonMessageReader::read_int32(int tag, std::string_view name) {
    const std::int64_t value = read_int64(tag, name);
    if (value < std::numeric_limits<std::int32_t>::min() || value > std::numeric_limits<std::int32_t>::max()) {
        throw DecodeError(fmt::format("Field {} ({}) does not fit in 32 bits: {}", name, tag, value));
    }
    return static_cast<std::int32_t>(value);
}

std::int64_t JsonMessageReader::read_int64(int tag, std::string_view name) {
    const nlohmann::json& value = field(tag, name);
    if (!value.is_number_integer()) {
        throw DecodeError(fmt::format("Field {} ({}) is not an integer", name, tag));
    }
    return value.get<std::int64_t>();
}

std::int64_t JsonMessageReader::read_int64(int tag, std::string_view name, std::int64_t default_value) {
    if (!is_next(tag, name)) {
        return default_value;
    }
    return read_int64(tag, name);
}

double JsonMessageReader::read_double(int tag, std::string_view name) {
    const nlohmann::json& value = field(tag, name);
    if (!value.is_number()) {
        throw DecodeError(fmt::format("Field {} ({}) is not a number", name, tag));
    }
    return value.get<double>();
}

void JsonMessageReader::read_message(int tag, std::string_view name, const MessageReadFunction& body) {
    const nlohmann::json& value = field(tag, name);
    if (!value.is_object()) {
        throw DecodeError(fmt::format("Field {} ({}) is not a message", name, tag));
    }
    JsonMessageReader nested_reader{value};
    body(nested_reader);
}

std::size_t JsonMessageReader::read_message_list(int tag, std::string_view name, const MessageReadFunction& element) {
    const nlohmann::json& value = field(tag, name);
    if (!value.is_array()) {
        throw DecodeError(fmt::format("Field {} ({}) is not a list", name, tag));
    }
    for (const nlohmann::json& nested : value) {
        JsonMessageReader nested_reader{nested};
        element(nested_reader);
    }
    return value.size();
}

nlohmann::json parse_json_text(std::string_view text) {
    try {
        return nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& exc) {
        throw DecodeError(fmt::format("Malformed JSON: {}", exc.what()));
    }
}

}  // namespace maritime_relay
