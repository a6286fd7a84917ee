#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace secretgen {

struct JsonMember;

struct JsonValue {
    enum class Type {
        Null,
        Bool,
        Integer,
        Number,
        String,
        Array,
        Object
    };

    Type type = Type::Null;
    bool bool_value = false;
    long long integer_value = 0;
    double number_value = 0.0;
    std::string string_value;
    std::vector<JsonValue> array_value;
    std::vector<JsonMember> object_value;  // insertion order is kept for output

    static JsonValue Null();
    static JsonValue Bool(bool value);
    static JsonValue Integer(long long value);
    static JsonValue Number(double value);
    static JsonValue String(std::string value);
    static JsonValue Array();
    static JsonValue Object();

    // Object insert, replacing an existing key in place.
    JsonValue& Set(std::string key, JsonValue value);
    void Push(JsonValue value);

    const JsonValue* Find(std::string_view key) const;
};

struct JsonMember {
    std::string key;
    JsonValue value;
};

class JsonParser {
public:
    explicit JsonParser(const std::string_view input) : input_(input) {}

    bool ParseRoot(JsonValue& out_value);
    bool ParseRootObject(JsonValue& out_value);

private:
    static constexpr int kMaxDepth = 64;

    bool ParseValue(JsonValue& out_value, int depth);
    bool ParseObject(JsonValue& out_value, int depth);
    bool ParseArray(JsonValue& out_value, int depth);
    bool ParseString(std::string& out_text);
    bool ParseHex4(std::uint32_t& out_value);
    bool ParseNumber(JsonValue& out_value);
    bool ConsumeLiteral(std::string_view literal);
    bool ConsumeChar(char expected);
    void SkipWhitespace();
    bool End() const;

    std::string_view input_;
    std::size_t position_ = 0;
};

std::string EscapeJson(std::string_view input);

// Shortest stable text for a double; integral values keep one decimal ("2.0").
std::string FormatJsonNumber(double value);

// Compact form by default; pretty uses two-space indentation.
std::string SerializeJson(const JsonValue& value, bool pretty = false);

}  // namespace secretgen
