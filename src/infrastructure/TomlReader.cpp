/**
 * @file TomlReader.cpp
 * @brief Recursive-descent reader for the configuration TOML subset.
 */

#include "infrastructure/TomlReader.hpp"
#include <cctype>
#include <cstring>
#include <limits>
#include <set>
#include <stdexcept>
#include <vector>

namespace shipwright::infrastructure {

using json = nlohmann::json;

namespace {

bool IsBareKeyChar(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || c == '-';
}

void AppendUtf8(std::string& out, unsigned long cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string JoinKeys(const std::vector<std::string>& keys) {
    std::string joined;
    for (const auto& key : keys) {
        if (!joined.empty()) joined += '.';
        joined += key;
    }
    return joined;
}

class Parser {
public:
    explicit Parser(const std::string& text) : m_text(text) {
        if (m_text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            m_pos = 3;
        }
    }

    json parseDocument() {
        while (true) {
            skipBlank();
            if (atEnd()) break;
            if (peek() == '[') {
                parseHeader();
            } else {
                parseKeyValue(*m_current);
            }
            expectLineEnd();
        }
        return std::move(m_root);
    }

private:
    bool atEnd() const { return m_pos >= m_text.size(); }

    char peek(std::size_t offset = 0) const {
        return m_pos + offset < m_text.size() ? m_text[m_pos + offset] : '\0';
    }

    char advance() {
        char c = m_text[m_pos++];
        if (c == '\n') ++m_line;
        return c;
    }

    bool startsWith(const char* token) const {
        return m_text.compare(m_pos, std::strlen(token), token) == 0;
    }

    [[noreturn]] void fail(const std::string& message) const {
        throw TomlParseError(message, m_line);
    }

    void skipInlineSpace() {
        while (peek() == ' ' || peek() == '\t') advance();
    }

    void skipComment() {
        if (peek() != '#') return;
        while (!atEnd() && peek() != '\n') advance();
    }

    // Whitespace, newlines and comments; used between statements and inside arrays.
    void skipBlank() {
        while (!atEnd()) {
            char c = peek();
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
                advance();
            } else if (c == '#') {
                skipComment();
            } else {
                break;
            }
        }
    }

    void expectLineEnd() {
        skipInlineSpace();
        skipComment();
        if (atEnd()) return;
        if (peek() == '\r') advance();
        if (peek() != '\n') fail("expected end of line");
        advance();
    }

    void parseHeader() {
        bool arrayTable = startsWith("[[");
        advance();
        if (arrayTable) advance();

        std::vector<std::string> keys = parseKeyPath();
        if (peek() != ']') fail("expected ']' to close table header");
        advance();
        if (arrayTable) {
            if (peek() != ']') fail("expected ']]' to close array-of-tables header");
            advance();
        }

        json* node = &m_root;
        for (std::size_t i = 0; i + 1 < keys.size(); ++i) {
            node = &descend(*node, keys[i]);
        }
        const std::string& last = keys.back();

        if (arrayTable) {
            json& array = (*node)[last];
            if (array.is_null()) {
                array = json::array();
            } else if (!array.is_array()) {
                fail("key '" + last + "' is not an array of tables");
            }
            array.push_back(json::object());
            m_current = &array.back();
            return;
        }

        std::string joined = JoinKeys(keys);
        if (!m_definedTables.insert(joined).second) {
            fail("table [" + joined + "] defined more than once");
        }
        json& table = (*node)[last];
        if (table.is_null()) {
            table = json::object();
        } else if (!table.is_object()) {
            fail("key '" + last + "' is not a table");
        }
        m_current = &table;
    }

    json& descend(json& node, const std::string& key) {
        json& child = node[key];
        if (child.is_null()) {
            child = json::object();
        }
        if (child.is_array()) {
            if (child.empty() || !child.back().is_object()) {
                fail("key '" + key + "' is not a table");
            }
            return child.back();
        }
        if (!child.is_object()) {
            fail("key '" + key + "' is not a table");
        }
        return child;
    }

    std::vector<std::string> parseKeyPath() {
        std::vector<std::string> keys;
        while (true) {
            skipInlineSpace();
            keys.push_back(parseKey());
            skipInlineSpace();
            if (peek() == '.') {
                advance();
                continue;
            }
            break;
        }
        return keys;
    }

    std::string parseKey() {
        if (peek() == '"') return parseBasicString();
        if (peek() == '\'') return parseLiteralString();

        std::string key;
        while (IsBareKeyChar(peek())) {
            key.push_back(advance());
        }
        if (key.empty()) fail("expected a key");
        return key;
    }

    void parseKeyValue(json& table) {
        std::vector<std::string> keys = parseKeyPath();
        if (peek() != '=') fail("expected '=' after key '" + JoinKeys(keys) + "'");
        advance();
        skipInlineSpace();
        json value = parseValue();

        json* node = &table;
        for (std::size_t i = 0; i + 1 < keys.size(); ++i) {
            json& child = (*node)[keys[i]];
            if (child.is_null()) {
                child = json::object();
            } else if (!child.is_object()) {
                fail("key '" + keys[i] + "' is not a table");
            }
            node = &child;
        }

        const std::string& last = keys.back();
        if (node->contains(last)) {
            fail("duplicate key '" + last + "'");
        }
        (*node)[last] = std::move(value);
    }

    json parseValue() {
        char c = peek();
        if (startsWith("\"\"\"")) return parseMultilineString('"');
        if (c == '"') return parseBasicString();
        if (startsWith("'''")) return parseMultilineString('\'');
        if (c == '\'') return parseLiteralString();
        if (c == '[') return parseArray();
        if (c == '{') return parseInlineTable();
        if (startsWith("true") && !IsBareKeyChar(peek(4))) {
            m_pos += 4;
            return true;
        }
        if (startsWith("false") && !IsBareKeyChar(peek(5))) {
            m_pos += 5;
            return false;
        }
        if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)) ||
            startsWith("inf") || startsWith("nan")) {
            return parseNumber();
        }
        if (atEnd() || c == '\n' || c == '\r' || c == '#') fail("missing value");
        fail(std::string("unsupported value starting with '") + c + "'");
    }

    unsigned long parseHexDigits(int count) {
        unsigned long cp = 0;
        for (int i = 0; i < count; ++i) {
            char h = peek();
            if (!std::isxdigit(static_cast<unsigned char>(h))) fail("invalid unicode escape");
            advance();
            cp = cp * 16 + static_cast<unsigned long>(std::isdigit(static_cast<unsigned char>(h))
                                                          ? h - '0'
                                                          : std::tolower(static_cast<unsigned char>(h)) - 'a' + 10);
        }
        return cp;
    }

    void parseEscape(std::string& out) {
        if (atEnd()) fail("unterminated escape sequence");
        char e = advance();
        switch (e) {
            case 'b': out.push_back('\b'); break;
            case 't': out.push_back('\t'); break;
            case 'n': out.push_back('\n'); break;
            case 'f': out.push_back('\f'); break;
            case 'r': out.push_back('\r'); break;
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case 'u': AppendUtf8(out, parseHexDigits(4)); break;
            case 'U': AppendUtf8(out, parseHexDigits(8)); break;
            default: fail(std::string("invalid escape '\\") + e + "'");
        }
    }

    std::string parseBasicString() {
        advance();
        std::string out;
        while (true) {
            if (atEnd() || peek() == '\n') fail("unterminated string");
            char c = advance();
            if (c == '"') break;
            if (c == '\\') {
                parseEscape(out);
            } else {
                out.push_back(c);
            }
        }
        return out;
    }

    std::string parseLiteralString() {
        advance();
        std::string out;
        while (true) {
            if (atEnd() || peek() == '\n') fail("unterminated literal string");
            char c = advance();
            if (c == '\'') break;
            out.push_back(c);
        }
        return out;
    }

    std::string parseMultilineString(char quote) {
        m_pos += 3;
        if (peek() == '\r' && peek(1) == '\n') {
            advance();
        }
        if (peek() == '\n') {
            advance();
        }

        std::string out;
        while (true) {
            if (atEnd()) fail("unterminated multi-line string");
            if (peek() == quote && peek(1) == quote && peek(2) == quote) {
                std::size_t run = 0;
                while (peek(run) == quote) ++run;
                if (run > 5) fail("too many quotes closing multi-line string");
                out.append(run - 3, quote);
                m_pos += run;
                break;
            }
            char c = advance();
            if (quote == '"' && c == '\\') {
                // line-ending backslash trims following whitespace and newlines
                std::size_t look = 0;
                while (peek(look) == ' ' || peek(look) == '\t') ++look;
                if (peek(look) == '\n' || (peek(look) == '\r' && peek(look + 1) == '\n')) {
                    while (peek() == ' ' || peek() == '\t' || peek() == '\r' || peek() == '\n') advance();
                } else {
                    parseEscape(out);
                }
                continue;
            }
            out.push_back(c);
        }
        return out;
    }

    json parseArray() {
        advance();
        json array = json::array();
        while (true) {
            skipBlank();
            if (peek() == ']') {
                advance();
                break;
            }
            array.push_back(parseValue());
            skipBlank();
            if (peek() == ',') {
                advance();
                continue;
            }
            if (peek() == ']') {
                advance();
                break;
            }
            fail("expected ',' or ']' in array");
        }
        return array;
    }

    json parseInlineTable() {
        advance();
        json table = json::object();
        skipInlineSpace();
        if (peek() == '}') {
            advance();
            return table;
        }
        while (true) {
            parseKeyValue(table);
            skipInlineSpace();
            if (peek() == ',') {
                advance();
                continue;
            }
            if (peek() == '}') {
                advance();
                break;
            }
            fail("expected ',' or '}' in inline table");
        }
        return table;
    }

    json parseNumber() {
        std::string token;
        while (!atEnd()) {
            char c = peek();
            if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '+' || c == '-' || c == '.' || c == ':') {
                token.push_back(advance());
            } else {
                break;
            }
        }

        for (std::size_t i = 1; i < token.size(); ++i) {
            if (token[i] == ':' || (token[i] == '-' && token[i - 1] != 'e' && token[i - 1] != 'E')) {
                fail("date/time values are not supported");
            }
        }

        std::string cleaned;
        for (char c : token) {
            if (c != '_') cleaned.push_back(c);
        }

        std::string unsignedPart = cleaned;
        if (!unsignedPart.empty() && (unsignedPart[0] == '+' || unsignedPart[0] == '-')) {
            unsignedPart.erase(0, 1);
        }
        if (unsignedPart == "inf") {
            return cleaned[0] == '-' ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
        }
        if (unsignedPart == "nan") {
            return std::numeric_limits<double>::quiet_NaN();
        }

        try {
            if (cleaned.size() > 2 && cleaned[0] == '0' && (cleaned[1] == 'x' || cleaned[1] == 'o' || cleaned[1] == 'b')) {
                int base = cleaned[1] == 'x' ? 16 : (cleaned[1] == 'o' ? 8 : 2);
                std::size_t used = 0;
                long long value = std::stoll(cleaned.substr(2), &used, base);
                if (used != cleaned.size() - 2) fail("invalid number '" + token + "'");
                return value;
            }

            bool isFloat = cleaned.find_first_of(".eE") != std::string::npos;
            std::size_t used = 0;
            if (isFloat) {
                double value = std::stod(cleaned, &used);
                if (used != cleaned.size()) fail("invalid number '" + token + "'");
                return value;
            }
            long long value = std::stoll(cleaned, &used, 10);
            if (used != cleaned.size()) fail("invalid number '" + token + "'");
            return value;
        } catch (const std::invalid_argument&) {
            fail("invalid number '" + token + "'");
        } catch (const std::out_of_range&) {
            fail("number out of range '" + token + "'");
        }
    }

    const std::string& m_text;
    std::size_t m_pos = 0;
    std::size_t m_line = 1;
    json m_root = json::object();
    json* m_current = &m_root;
    std::set<std::string> m_definedTables;
};

} // namespace

json TomlReader::Parse(const std::string& text) {
    Parser parser(text);
    return parser.parseDocument();
}

} // namespace shipwright::infrastructure
