#ifndef TOKENVAULT_DETECTION_DETECTION_WIRE_HPP
#define TOKENVAULT_DETECTION_DETECTION_WIRE_HPP

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/entity.hpp"
#include "core/errors.hpp"
#include "util/utf8.hpp"

/**
 * @file detection_wire.hpp
 * @brief JSON framing spoken with a remote detection service.
 *
 * Request:
 *   {"text":"...","entities":["email address","person"]}
 *   ("entities" is omitted to ask for every type)
 *
 * Response:
 *   {"detected_entities":[
 *      {"type":"email address","text":"a@b.de","start":5,"end":11,"score":0.98}, ...]}
 *
 *   - "entities" is accepted instead of "detected_entities", "entity_type"
 *     instead of "type", "confidence" instead of "score".
 *   - Unknown keys are skipped.
 *   - Offsets are code points unless the caller says they are bytes.
 *
 * No JSON library is used; the reader below covers the subset of JSON the
 * service produces (objects, arrays, strings with escapes, numbers, literals).
 */

namespace tokenvault {
namespace detection {

enum class OffsetUnit {
    Byte,
    Codepoint
};

/**
 * @brief Escape @p s as a JSON string literal, quotes included.
 */
inline std::string jsonQuote(const std::string &s)
{
    std::ostringstream out;
    out << '"';
    for (char c : s) {
        switch (c) {
            case '"':  out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            case '\b': out << "\\b"; break;
            case '\f': out << "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    static const char *hex = "0123456789abcdef";
                    out << "\\u00" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
                } else {
                    out << c;
                }
        }
    }
    out << '"';
    return out.str();
}

inline std::string buildDetectionRequest(const std::string &text, const std::vector<std::string> &types)
{
    std::string body = "{\"text\":" + jsonQuote(text);
    if (!types.empty()) {
        body += ",\"entities\":[";
        for (size_t i = 0; i < types.size(); ++i) {
            if (i > 0) body += ",";
            body += jsonQuote(types[i]);
        }
        body += "]";
    }
    body += "}";
    return body;
}

/**
 * @class JsonReader
 * @brief Forward-only cursor over a JSON document. Throws std::runtime_error
 *        with the byte position on malformed input.
 */
class JsonReader
{
public:
    explicit JsonReader(const std::string &json) : json_(json), pos_(0) {}

    void skipWhitespace()
    {
        while (pos_ < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
            ++pos_;
        }
    }

    char peek()
    {
        skipWhitespace();
        if (pos_ >= json_.size()) {
            fail("unexpected end of input");
        }
        return json_[pos_];
    }

    void expect(char c)
    {
        if (peek() != c) {
            fail(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    /// Consumes @p c if it is next.
    bool consume(char c)
    {
        if (peek() == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    std::string readString()
    {
        expect('"');
        std::string out;
        while (true) {
            if (pos_ >= json_.size()) {
                fail("unterminated string");
            }
            char c = json_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= json_.size()) {
                fail("unterminated escape");
            }
            char esc = json_[pos_++];
            switch (esc) {
                case '"':  out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/':  out.push_back('/'); break;
                case 'b':  out.push_back('\b'); break;
                case 'f':  out.push_back('\f'); break;
                case 'n':  out.push_back('\n'); break;
                case 'r':  out.push_back('\r'); break;
                case 't':  out.push_back('\t'); break;
                case 'u': {
                    uint32_t cp = readHex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (pos_ + 1 >= json_.size() || json_[pos_] != '\\' || json_[pos_ + 1] != 'u') {
                            fail("unpaired surrogate");
                        }
                        pos_ += 2;
                        uint32_t low = readHex4();
                        if (low < 0xDC00 || low > 0xDFFF) {
                            fail("invalid low surrogate");
                        }
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                    util::utf8::appendCodepoint(out, cp);
                    break;
                }
                default:
                    fail("invalid escape");
            }
        }
    }

    double readNumber()
    {
        skipWhitespace();
        size_t start = pos_;
        while (pos_ < json_.size() &&
               (std::isdigit(static_cast<unsigned char>(json_[pos_])) || json_[pos_] == '-' ||
                json_[pos_] == '+' || json_[pos_] == '.' || json_[pos_] == 'e' || json_[pos_] == 'E'))
        {
            ++pos_;
        }
        if (start == pos_) {
            fail("expected a number");
        }
        std::string num = json_.substr(start, pos_ - start);
        char *endp = nullptr;
        double v = std::strtod(num.c_str(), &endp);
        if (endp != num.c_str() + num.size()) {
            fail("malformed number '" + num + "'");
        }
        return v;
    }

    /// Skips any value: object, array, string, number, true/false/null.
    void skipValue()
    {
        char c = peek();
        if (c == '"') {
            readString();
        } else if (c == '{') {
            ++pos_;
            if (consume('}')) return;
            do {
                readString();
                expect(':');
                skipValue();
            } while (consume(','));
            expect('}');
        } else if (c == '[') {
            ++pos_;
            if (consume(']')) return;
            do {
                skipValue();
            } while (consume(','));
            expect(']');
        } else if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            readNumber();
        } else {
            for (const char *lit : {"true", "false", "null"}) {
                std::string l(lit);
                if (json_.compare(pos_, l.size(), l) == 0) {
                    pos_ += l.size();
                    return;
                }
            }
            fail("unexpected character");
        }
    }

    bool atEnd()
    {
        skipWhitespace();
        return pos_ >= json_.size();
    }

private:
    uint32_t readHex4()
    {
        if (pos_ + 4 > json_.size()) {
            fail("truncated \\u escape");
        }
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            char h = json_[pos_++];
            v <<= 4;
            if (h >= '0' && h <= '9') v |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') v |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') v |= static_cast<uint32_t>(h - 'A' + 10);
            else fail("bad hex digit in \\u escape");
        }
        return v;
    }

    [[noreturn]] void fail(const std::string &what) const
    {
        throw std::runtime_error("JsonReader: " + what + " at byte " + std::to_string(pos_));
    }

    const std::string &json_;
    size_t pos_;
};

/**
 * @brief Decode a detection response into entities over @p text.
 *
 * Types are canonicalised; offsets are converted to bytes. Span/text
 * consistency is checked later by core::validateEntity().
 *
 * @throw core::DetectionError on malformed JSON, missing fields, offsets
 *        outside the text, or types that cannot be canonicalised.
 */
inline std::vector<core::Entity> parseDetectionResponse(const std::string &body,
                                                        const std::string &text,
                                                        OffsetUnit unit)
{
    std::vector<core::Entity> entities;
    try {
        JsonReader reader(body);
        reader.expect('{');
        if (!reader.consume('}')) {
            do {
                std::string key = reader.readString();
                reader.expect(':');
                if (key != "detected_entities" && key != "entities") {
                    reader.skipValue();
                    continue;
                }
                reader.expect('[');
                if (reader.consume(']')) {
                    continue;
                }
                do {
                    core::Entity e;
                    bool haveType = false, haveStart = false, haveEnd = false;
                    double start = 0, end = 0;
                    reader.expect('{');
                    if (!reader.consume('}')) {
                        do {
                            std::string field = reader.readString();
                            reader.expect(':');
                            if (field == "type" || field == "entity_type") {
                                e.type = core::canonicalEntityType(reader.readString());
                                haveType = true;
                            } else if (field == "text") {
                                e.text = reader.readString();
                            } else if (field == "start") {
                                start = reader.readNumber();
                                haveStart = true;
                            } else if (field == "end") {
                                end = reader.readNumber();
                                haveEnd = true;
                            } else if (field == "score" || field == "confidence") {
                                e.confidence = reader.readNumber();
                            } else {
                                reader.skipValue();
                            }
                        } while (reader.consume(','));
                        reader.expect('}');
                    }
                    if (!haveType || !haveStart || !haveEnd || start < 0 || end < start) {
                        throw std::runtime_error("entity without valid type/start/end");
                    }
                    // Offsets are whole units and never past the text, in either unit.
                    if (std::floor(start) != start || std::floor(end) != end) {
                        throw std::runtime_error("entity offsets must be integers");
                    }
                    if (end > static_cast<double>(text.size())) {
                        throw std::runtime_error("entity offset " + std::to_string(end) +
                                                 " exceeds text length " + std::to_string(text.size()));
                    }
                    size_t s = static_cast<size_t>(start);
                    size_t en = static_cast<size_t>(end);
                    if (unit == OffsetUnit::Codepoint) {
                        s = util::utf8::codepointToByteOffset(text, s);
                        en = util::utf8::codepointToByteOffset(text, en);
                    }
                    e.start = s;
                    e.end = en;
                    entities.push_back(std::move(e));
                } while (reader.consume(','));
                reader.expect(']');
            } while (reader.consume(','));
            reader.expect('}');
        }
        if (!reader.atEnd()) {
            throw std::runtime_error("trailing data after response object");
        }
    }
    catch (const std::exception &ex) {
        throw core::DetectionError(std::string("parseDetectionResponse: ") + ex.what());
    }
    return entities;
}

} // namespace detection
} // namespace tokenvault

#endif // TOKENVAULT_DETECTION_DETECTION_WIRE_HPP
