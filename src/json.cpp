#include "secretgen/json.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <utility>

namespace secretgen {

namespace {

void AppendUtf8(std::string& out, const std::uint32_t cp) {
    if (cp <= 0x7FU) {
        out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FFU) {
        out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
        out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else if (cp <= 0xFFFFU) {
        out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
        out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else {
        out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
        out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    }
}

void Indent(std::string& out, const int depth) {
    out.push_back('\n');
    out.append(static_cast<std::size_t>(depth) * 2U, ' ');
}

void SerializeInto(const JsonValue& value, const bool pretty, const int depth, std::string& out) {
    switch (value.type) {
        case JsonValue::Type::Null:
            out += "null";
            return;
        case JsonValue::Type::Bool:
            out += value.bool_value ? "true" : "false";
            return;
        case JsonValue::Type::Integer:
            out += std::to_string(value.integer_value);
            return;
        case JsonValue::Type::Number:
            out += FormatJsonNumber(value.number_value);
            return;
        case JsonValue::Type::String:
            out.push_back('"');
            out += EscapeJson(value.string_value);
            out.push_back('"');
            return;
        case JsonValue::Type::Array: {
            out.push_back('[');
            for (std::size_t i = 0; i < value.array_value.size(); ++i) {
                if (i > 0) {
                    out.push_back(',');
                }
                if (pretty) {
                    Indent(out, depth + 1);
                }
                SerializeInto(value.array_value[i], pretty, depth + 1, out);
            }
            if (pretty && !value.array_value.empty()) {
                Indent(out, depth);
            }
            out.push_back(']');
            return;
        }
        case JsonValue::Type::Object: {
            out.push_back('{');
            for (std::size_t i = 0; i < value.object_value.size(); ++i) {
                if (i > 0) {
                    out.push_back(',');
                }
                if (pretty) {
                    Indent(out, depth + 1);
                }
                out.push_back('"');
                out += EscapeJson(value.object_value[i].key);
                out += pretty ? "\": " : "\":";
                SerializeInto(value.object_value[i].value, pretty, depth + 1, out);
            }
            if (pretty && !value.object_value.empty()) {
                Indent(out, depth);
            }
            out.push_back('}');
            return;
        }
    }
}

}  // namespace

JsonValue JsonValue::Null() {
    return JsonValue{};
}

JsonValue JsonValue::Bool(const bool value) {
    JsonValue out;
    out.type = Type::Bool;
    out.bool_value = value;
    return out;
}

JsonValue JsonValue::Integer(const long long value) {
    JsonValue out;
    out.type = Type::Integer;
    out.integer_value = value;
    out.number_value = static_cast<double>(value);
    return out;
}

JsonValue JsonValue::Number(const double value) {
    JsonValue out;
    out.type = Type::Number;
    out.number_value = value;
    return out;
}

JsonValue JsonValue::String(std::string value) {
    JsonValue out;
    out.type = Type::String;
    out.string_value = std::move(value);
    return out;
}

JsonValue JsonValue::Array() {
    JsonValue out;
    out.type = Type::Array;
    return out;
}

JsonValue JsonValue::Object() {
    JsonValue out;
    out.type = Type::Object;
    return out;
}

JsonValue& JsonValue::Set(std::string key, JsonValue value) {
    type = Type::Object;
    for (auto& member : object_value) {
        if (member.key == key) {
            member.value = std::move(value);
            return member.value;
        }
    }
    object_value.push_back(JsonMember{std::move(key), std::move(value)});
    return object_value.back().value;
}

void JsonValue::Push(JsonValue value) {
    type = Type::Array;
    array_value.push_back(std::move(value));
}

const JsonValue* JsonValue::Find(const std::string_view key) const {
    if (type != Type::Object) {
        return nullptr;
    }
    for (const auto& member : object_value) {
        if (member.key == key) {
            return &member.value;
        }
    }
    return nullptr;
}

bool JsonParser::ParseRoot(JsonValue& out_value) {
    SkipWhitespace();
    if (!ParseValue(out_value, 0)) {
        return false;
    }
    SkipWhitespace();
    return position_ == input_.size();
}

bool JsonParser::ParseRootObject(JsonValue& out_value) {
    SkipWhitespace();
    if (!ParseObject(out_value, 0)) {
        return false;
    }
    SkipWhitespace();
    return position_ == input_.size();
}

bool JsonParser::ParseValue(JsonValue& out_value, const int depth) {
    SkipWhitespace();
    if (End() || depth > kMaxDepth) {
        return false;
    }
    const char ch = input_[position_];
    if (ch == '{') {
        return ParseObject(out_value, depth + 1);
    }
    if (ch == '[') {
        return ParseArray(out_value, depth + 1);
    }
    if (ch == '"') {
        out_value.type = JsonValue::Type::String;
        return ParseString(out_value.string_value);
    }
    if (ch == 't') {
        if (!ConsumeLiteral("true")) {
            return false;
        }
        out_value.type = JsonValue::Type::Bool;
        out_value.bool_value = true;
        return true;
    }
    if (ch == 'f') {
        if (!ConsumeLiteral("false")) {
            return false;
        }
        out_value.type = JsonValue::Type::Bool;
        out_value.bool_value = false;
        return true;
    }
    if (ch == 'n') {
        if (!ConsumeLiteral("null")) {
            return false;
        }
        out_value.type = JsonValue::Type::Null;
        return true;
    }
    if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch)) != 0) {
        return ParseNumber(out_value);
    }
    return false;
}

bool JsonParser::ParseObject(JsonValue& out_value, const int depth) {
    if (!ConsumeChar('{')) {
        return false;
    }

    out_value.type = JsonValue::Type::Object;
    out_value.object_value.clear();

    SkipWhitespace();
    if (ConsumeChar('}')) {
        return true;
    }

    while (true) {
        SkipWhitespace();
        std::string key;
        if (!ParseString(key)) {
            return false;
        }

        SkipWhitespace();
        if (!ConsumeChar(':')) {
            return false;
        }

        JsonValue value;
        if (!ParseValue(value, depth)) {
            return false;
        }
        out_value.Set(std::move(key), std::move(value));

        SkipWhitespace();
        if (ConsumeChar('}')) {
            return true;
        }
        if (!ConsumeChar(',')) {
            return false;
        }
    }
}

bool JsonParser::ParseArray(JsonValue& out_value, const int depth) {
    if (!ConsumeChar('[')) {
        return false;
    }

    out_value.type = JsonValue::Type::Array;
    out_value.array_value.clear();

    SkipWhitespace();
    if (ConsumeChar(']')) {
        return true;
    }

    while (true) {
        JsonValue value;
        if (!ParseValue(value, depth)) {
            return false;
        }
        out_value.array_value.push_back(std::move(value));

        SkipWhitespace();
        if (ConsumeChar(']')) {
            return true;
        }
        if (!ConsumeChar(',')) {
            return false;
        }
    }
}

bool JsonParser::ParseString(std::string& out_text) {
    if (!ConsumeChar('"')) {
        return false;
    }
    out_text.clear();

    while (!End()) {
        const char ch = input_[position_++];
        if (ch == '"') {
            return true;
        }
        if (ch == '\\') {
            if (End()) {
                return false;
            }
            const char esc = input_[position_++];
            switch (esc) {
                case '"':
                    out_text.push_back('"');
                    break;
                case '\\':
                    out_text.push_back('\\');
                    break;
                case '/':
                    out_text.push_back('/');
                    break;
                case 'b':
                    out_text.push_back('\b');
                    break;
                case 'f':
                    out_text.push_back('\f');
                    break;
                case 'n':
                    out_text.push_back('\n');
                    break;
                case 'r':
                    out_text.push_back('\r');
                    break;
                case 't':
                    out_text.push_back('\t');
                    break;
                case 'u': {
                    std::uint32_t cp = 0;
                    if (!ParseHex4(cp)) {
                        return false;
                    }
                    if (cp >= 0xD800U && cp <= 0xDBFFU) {
                        std::uint32_t low = 0;
                        if (!ConsumeChar('\\') || !ConsumeChar('u') || !ParseHex4(low) ||
                            low < 0xDC00U || low > 0xDFFFU) {
                            return false;
                        }
                        cp = 0x10000U + ((cp - 0xD800U) << 10U) + (low - 0xDC00U);
                    } else if (cp >= 0xDC00U && cp <= 0xDFFFU) {
                        return false;
                    }
                    AppendUtf8(out_text, cp);
                    break;
                }
                default:
                    return false;
            }
            continue;
        }

        if (static_cast<unsigned char>(ch) < 0x20U) {
            return false;
        }
        out_text.push_back(ch);
    }
    return false;
}

bool JsonParser::ParseHex4(std::uint32_t& out_value) {
    if (position_ + 4 > input_.size()) {
        return false;
    }
    out_value = 0;
    for (int i = 0; i < 4; ++i) {
        const char ch = input_[position_++];
        int digit = 0;
        if (ch >= '0' && ch <= '9') {
            digit = ch - '0';
        } else if (ch >= 'a' && ch <= 'f') {
            digit = 10 + (ch - 'a');
        } else if (ch >= 'A' && ch <= 'F') {
            digit = 10 + (ch - 'A');
        } else {
            return false;
        }
        out_value = (out_value << 4U) | static_cast<std::uint32_t>(digit);
    }
    return true;
}

bool JsonParser::ParseNumber(JsonValue& out_value) {
    const std::size_t start = position_;
    if (input_[position_] == '-') {
        ++position_;
        if (End()) {
            return false;
        }
    }
    if (std::isdigit(static_cast<unsigned char>(input_[position_])) == 0) {
        return false;
    }
    while (!End() && std::isdigit(static_cast<unsigned char>(input_[position_])) != 0) {
        ++position_;
    }

    bool fractional = false;
    if (!End() && input_[position_] == '.') {
        fractional = true;
        ++position_;
        if (End() || std::isdigit(static_cast<unsigned char>(input_[position_])) == 0) {
            return false;
        }
        while (!End() && std::isdigit(static_cast<unsigned char>(input_[position_])) != 0) {
            ++position_;
        }
    }
    if (!End() && (input_[position_] == 'e' || input_[position_] == 'E')) {
        fractional = true;
        ++position_;
        if (!End() && (input_[position_] == '+' || input_[position_] == '-')) {
            ++position_;
        }
        if (End() || std::isdigit(static_cast<unsigned char>(input_[position_])) == 0) {
            return false;
        }
        while (!End() && std::isdigit(static_cast<unsigned char>(input_[position_])) != 0) {
            ++position_;
        }
    }

    const std::string text(input_.substr(start, position_ - start));
    char* end_ptr = nullptr;
    errno = 0;
    if (!fractional) {
        const long long value = std::strtoll(text.c_str(), &end_ptr, 10);
        if (end_ptr == nullptr || *end_ptr != '\0' || errno == ERANGE) {
            return false;
        }
        out_value = JsonValue::Integer(value);
        return true;
    }
    const double value = std::strtod(text.c_str(), &end_ptr);
    if (end_ptr == nullptr || *end_ptr != '\0' || errno == ERANGE) {
        return false;
    }
    out_value = JsonValue::Number(value);
    return true;
}

bool JsonParser::ConsumeLiteral(const std::string_view literal) {
    if (position_ + literal.size() > input_.size()) {
        return false;
    }
    if (input_.substr(position_, literal.size()) != literal) {
        return false;
    }
    position_ += literal.size();
    return true;
}

bool JsonParser::ConsumeChar(const char expected) {
    if (!End() && input_[position_] == expected) {
        ++position_;
        return true;
    }
    return false;
}

void JsonParser::SkipWhitespace() {
    while (!End() && std::isspace(static_cast<unsigned char>(input_[position_])) != 0) {
        ++position_;
    }
}

bool JsonParser::End() const {
    return position_ >= input_.size();
}

std::string EscapeJson(const std::string_view input) {
    std::string output;
    output.reserve(input.size() + 8);
    for (const char ch : input) {
        switch (ch) {
            case '"':
                output += "\\\"";
                break;
            case '\\':
                output += "\\\\";
                break;
            case '\b':
                output += "\\b";
                break;
            case '\f':
                output += "\\f";
                break;
            case '\n':
                output += "\\n";
                break;
            case '\r':
                output += "\\r";
                break;
            case '\t':
                output += "\\t";
                break;
            default: {
                const unsigned char byte = static_cast<unsigned char>(ch);
                if (byte < 0x20U) {
                    static constexpr char kHex[] = "0123456789abcdef";
                    output += "\\u00";
                    output.push_back(kHex[(byte >> 4U) & 0x0FU]);
                    output.push_back(kHex[byte & 0x0FU]);
                } else {
                    output.push_back(ch);
                }
                break;
            }
        }
    }
    return output;
}

std::string FormatJsonNumber(const double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    const double normalized = value == 0.0 ? 0.0 : value;
    char buffer[64];
    if (std::fabs(normalized) < 1e15 && std::floor(normalized) == normalized) {
        std::snprintf(buffer, sizeof(buffer), "%.1f", normalized);
        return buffer;
    }
    std::snprintf(buffer, sizeof(buffer), "%.15g", normalized);
    return buffer;
}

std::string SerializeJson(const JsonValue& value, const bool pretty) {
    std::string out;
    SerializeInto(value, pretty, 0, out);
    return out;
}

}  // namespace secretgen
