#pragma once

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <limits>
#include <locale>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace json
{
struct JsonValue
{
    enum class Type
    {
        Null,
        Number,
        String,
        Object,
        Array,
        Bool
    };

    Type type = Type::Null;
    double number = 0.0;
    bool boolean = false;
    std::string string;
    std::unordered_map<std::string, JsonValue> object;
    std::vector<JsonValue> array;

    bool isObject() const { return type == Type::Object; }
    bool isArray() const { return type == Type::Array; }
    bool isNumber() const { return type == Type::Number; }
    bool isString() const { return type == Type::String; }
};

struct JsonParseError
{
    std::size_t offset = 0;
    std::string message;
};

// Recursive-descent reader for config and save files. The first error wins and
// is kept with its byte offset.
class JsonParser
{
  public:
    // Arrays and objects nest at most this deep.
    static constexpr int kMaxDepth = 256;

    explicit JsonParser(std::string_view text) : m_text(text) {}

    std::optional<JsonValue> parse()
    {
        auto value = parseValue();
        skipWhitespace();
        if (value && !atEnd())
        {
            return fail("trailing characters");
        }
        return value;
    }

    const JsonParseError &error() const { return m_error; }

  private:
    std::string_view m_text;
    std::size_t m_pos = 0;
    int m_depth = 0;
    JsonParseError m_error;

    bool atEnd() const { return m_pos >= m_text.size(); }
    char peek() const { return atEnd() ? '\0' : m_text[m_pos]; }

    bool consume(char expected)
    {
        skipWhitespace();
        if (peek() != expected)
        {
            return false;
        }
        ++m_pos;
        return true;
    }

    std::nullopt_t fail(const char *message)
    {
        if (m_error.message.empty())
        {
            m_error.offset = m_pos;
            m_error.message = message;
        }
        return std::nullopt;
    }

    void skipWhitespace()
    {
        while (!atEnd() && (peek() == ' ' || peek() == '\n' || peek() == '\r' || peek() == '\t'))
        {
            ++m_pos;
        }
    }

    std::optional<JsonValue> parseValue()
    {
        skipWhitespace();
        switch (peek())
        {
        case '\0': return fail("unexpected end of input");
        case '{': return parseContainer(JsonValue::Type::Object, '}');
        case '[': return parseContainer(JsonValue::Type::Array, ']');
        case '"':
        {
            JsonValue v;
            v.type = JsonValue::Type::String;
            if (!parseString(v.string))
            {
                return std::nullopt;
            }
            return v;
        }
        case 't': return parseKeyword("true", JsonValue::Type::Bool, true);
        case 'f': return parseKeyword("false", JsonValue::Type::Bool, false);
        case 'n': return parseKeyword("null", JsonValue::Type::Null, false);
        default: return parseNumber();
        }
    }

    std::optional<JsonValue> parseKeyword(std::string_view word, JsonValue::Type type, bool flag)
    {
        if (m_text.substr(m_pos, word.size()) != word)
        {
            return fail("invalid literal");
        }
        m_pos += word.size();
        JsonValue v;
        v.type = type;
        v.boolean = flag;
        return v;
    }

    std::optional<JsonValue> parseNumber()
    {
        const std::size_t start = m_pos;
        if (peek() == '-')
        {
            ++m_pos;
        }
        while (!atEnd() && std::string_view("0123456789.eE+-").find(peek()) != std::string_view::npos)
        {
            ++m_pos;
        }
        if (m_pos == start)
        {
            return fail("unexpected character");
        }

        std::istringstream stream{std::string(m_text.substr(start, m_pos - start))};
        stream.imbue(std::locale::classic());
        JsonValue v;
        v.type = JsonValue::Type::Number;
        if (!(stream >> v.number) || stream.peek() != std::char_traits<char>::eof())
        {
            m_pos = start;
            return fail("invalid number");
        }
        return v;
    }

    bool readHex4(std::uint32_t &code)
    {
        if (m_pos + 4 > m_text.size())
        {
            return false;
        }
        code = 0;
        for (char c : m_text.substr(m_pos, 4))
        {
            const int digit = (c >= '0' && c <= '9')   ? c - '0'
                              : (c >= 'a' && c <= 'f') ? c - 'a' + 10
                              : (c >= 'A' && c <= 'F') ? c - 'A' + 10
                                                       : -1;
            if (digit < 0)
            {
                return false;
            }
            code = (code << 4) | static_cast<std::uint32_t>(digit);
        }
        m_pos += 4;
        return true;
    }

    // Basic multilingual plane only; surrogate pairs are kept as two code points.
    static void appendUtf8(std::string &out, std::uint32_t code)
    {
        if (code < 0x80)
        {
            out += static_cast<char>(code);
            return;
        }
        if (code < 0x800)
        {
            out += static_cast<char>(0xC0 | (code >> 6));
        }
        else
        {
            out += static_cast<char>(0xE0 | (code >> 12));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        }
        out += static_cast<char>(0x80 | (code & 0x3F));
    }

    bool parseString(std::string &out)
    {
        ++m_pos;
        while (!atEnd())
        {
            const char c = m_text[m_pos++];
            if (c == '"')
            {
                return true;
            }
            if (c != '\\')
            {
                out += c;
                continue;
            }
            const char escaped = peek();
            ++m_pos;
            std::uint32_t code = 0;
            switch (escaped)
            {
            case '"':
            case '\\':
            case '/': out += escaped; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'u':
                if (!readHex4(code))
                {
                    fail("invalid unicode escape");
                    return false;
                }
                appendUtf8(out, code);
                break;
            default:
                fail("invalid escape");
                return false;
            }
        }
        fail("unterminated string");
        return false;
    }

    // Objects and arrays share the comma-separated loop; only objects read keys.
    std::optional<JsonValue> parseContainer(JsonValue::Type type, char close)
    {
        if (m_depth >= kMaxDepth)
        {
            return fail("nesting too deep");
        }
        ++m_depth;
        ++m_pos;

        JsonValue container;
        container.type = type;
        bool ok = true;
        if (!consume(close))
        {
            do
            {
                ok = parseMember(container);
            } while (ok && consume(','));
            if (ok && !consume(close))
            {
                ok = false;
                fail(type == JsonValue::Type::Object ? "expected ',' or '}'" : "expected ',' or ']'");
            }
        }

        --m_depth;
        if (!ok)
        {
            return std::nullopt;
        }
        return container;
    }

    bool parseMember(JsonValue &container)
    {
        if (container.type == JsonValue::Type::Array)
        {
            auto element = parseValue();
            if (!element)
            {
                return false;
            }
            container.array.push_back(std::move(*element));
            return true;
        }

        skipWhitespace();
        std::string key;
        if (peek() != '"')
        {
            fail("expected object key");
            return false;
        }
        if (!parseString(key))
        {
            return false;
        }
        if (!consume(':'))
        {
            fail("expected ':'");
            return false;
        }
        auto value = parseValue();
        if (!value)
        {
            return false;
        }
        container.object.insert_or_assign(std::move(key), std::move(*value));
        return true;
    }
};

// Reads and parses a whole file. On failure |error| names the reason.
inline std::optional<JsonValue> readJsonFile(const std::string &path, std::string &error)
{
    std::ifstream stream(path, std::ios::in | std::ios::binary);
    if (!stream.is_open())
    {
        error = "Failed to open JSON";
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    if (stream.bad())
    {
        error = "Failed to read JSON";
        return std::nullopt;
    }
    const std::string text = buffer.str();
    JsonParser parser(text);
    auto parsed = parser.parse();
    if (!parsed)
    {
        error = "Failed to parse JSON at offset " + std::to_string(parser.error().offset) + ": " +
                parser.error().message;
    }
    return parsed;
}

inline const JsonValue *getObjectField(const JsonValue &obj, const std::string &key)
{
    if (!obj.isObject())
    {
        return nullptr;
    }
    const auto it = obj.object.find(key);
    return it == obj.object.end() ? nullptr : &it->second;
}

// True when |number| is finite, integral and representable as an int.
inline bool toInt(double number, int &out)
{
    if (!std::isfinite(number) || std::floor(number) != number)
    {
        return false;
    }
    if (number < static_cast<double>(std::numeric_limits<int>::min()) ||
        number > static_cast<double>(std::numeric_limits<int>::max()))
    {
        return false;
    }
    out = static_cast<int>(number);
    return true;
}

inline float getNumber(const JsonValue &obj, const std::string &key, float fallback)
{
    const JsonValue *value = getObjectField(obj, key);
    return value && value->isNumber() ? static_cast<float>(value->number) : fallback;
}

// Non-integral or out-of-range numbers yield |fallback|.
inline int getInt(const JsonValue &obj, const std::string &key, int fallback)
{
    const JsonValue *value = getObjectField(obj, key);
    int result = 0;
    return value && value->isNumber() && toInt(value->number, result) ? result : fallback;
}

inline bool getBool(const JsonValue &obj, const std::string &key, bool fallback)
{
    const JsonValue *value = getObjectField(obj, key);
    return value && value->type == JsonValue::Type::Bool ? value->boolean : fallback;
}

inline std::string getString(const JsonValue &obj, const std::string &key, std::string fallback)
{
    const JsonValue *value = getObjectField(obj, key);
    return value && value->isString() ? value->string : fallback;
}

// Reads an array of exactly |count| integers, e.g. [x, y] or [r, g, b].
inline std::optional<std::vector<int>> getIntTuple(const JsonValue &obj, const std::string &key, std::size_t count)
{
    const JsonValue *value = getObjectField(obj, key);
    if (!value || !value->isArray() || value->array.size() != count)
    {
        return std::nullopt;
    }
    std::vector<int> result(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        const JsonValue &element = value->array[i];
        if (!element.isNumber() || !toInt(element.number, result[i]))
        {
            return std::nullopt;
        }
    }
    return result;
}

// |value| as a JSON string literal, quotes included.
inline std::string quote(std::string_view value)
{
    std::string out = "\"";
    out.reserve(value.size() + 2);
    for (char ch : value)
    {
        switch (ch)
        {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (static_cast<unsigned char>(ch) < 0x20)
            {
                char escaped[8];
                std::snprintf(escaped, sizeof(escaped), "\\u%04X", static_cast<unsigned>(static_cast<unsigned char>(ch)));
                out += escaped;
            }
            else
            {
                out += ch;
            }
            break;
        }
    }
    out += '"';
    return out;
}

} // namespace json
