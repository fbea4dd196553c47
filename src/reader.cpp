#include "stanza/reader.hpp"

#include <istream>
#include <utility>


namespace Stanza {

    namespace detail {

        inline bool is_valid_utf8(std::string_view s, size_t& error_idx) {
            const unsigned char* data = reinterpret_cast<const unsigned char*>(s.data());
            size_t i = 0;
            size_t n = s.size();

            auto fail = [&](size_t idx) { error_idx = idx; return false; };
            auto cont = [&](size_t idx) { return (data[idx] & 0xC0) == 0x80; };

            while (i < n) {
                unsigned char c = data[i];

                if (c <= 0x7F) {
                    i++;
                    continue;
                }

                if (c >= 0xC2 && c <= 0xDF) {
                    if (i + 1 >= n || !cont(i + 1)) return fail(i);
                    i += 2;
                    continue;
                }

                if (c >= 0xE0 && c <= 0xEF) {
                    if (i + 2 >= n) return fail(i);
                    unsigned char c1 = data[i + 1];
                    if (c == 0xE0 && (c1 < 0xA0 || c1 > 0xBF)) return fail(i);
                    if (c == 0xED && (c1 < 0x80 || c1 > 0x9F)) return fail(i);
                    if (!cont(i + 1) || !cont(i + 2)) return fail(i);
                    i += 3;
                    continue;
                }

                if (c >= 0xF0 && c <= 0xF4) {
                    if (i + 3 >= n) return fail(i);
                    unsigned char c1 = data[i + 1];
                    if (c == 0xF0 && (c1 < 0x90 || c1 > 0xBF)) return fail(i);
                    if (c == 0xF4 && (c1 < 0x80 || c1 > 0x8F)) return fail(i);
                    if (!cont(i + 1) || !cont(i + 2) || !cont(i + 3)) return fail(i);
                    i += 4;
                    continue;
                }

                return fail(i);
            }
            return true;
        }

        void append_utf8(uint32_t cp, std::string& out) {
            if (cp <= 0x7F) {
                out.push_back(static_cast<char>(cp));
            } else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0x10FFFF) {
                out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                // Invalid codepoint; replace with replacement character
                append_utf8(0xFFFDu, out);
            }
        }

        constexpr bool is_number_char(char c) noexcept {
            switch (c) {
            case '-': case '+': case '.': case 'e': case 'E':
            case '0': case '1': case '2': case '3': case '4':
            case '5': case '6': case '7': case '8': case '9':
                return true;
            default:
                return false;
            }
        }

    } // namespace detail

    reader::reader(std::string_view input, const ReaderOptions& opts)
        : m_Buf{ input }, m_Opts{ opts } {}

    reader::reader(std::istream& is, const ReaderOptions& opts)
        : m_Stream{ &is }, m_Opts{ opts } {}

#pragma region Buffer
    bool reader::load_more() {
        if (!m_Stream) return false;

        std::string next{ m_Buf.substr(m_Head) };
        const std::size_t keep = next.size();
        const std::size_t chunk = m_Opts.buffer_size == 0 ? 1 : m_Opts.buffer_size;
        m_Consumed += m_Head;

        next.resize(keep + chunk);
        m_Stream->read(next.data() + keep, static_cast<std::streamsize>(chunk));
        const auto got = static_cast<std::size_t>(m_Stream->gcount());
        next.resize(keep + got);

        m_Chunk = std::move(next);
        m_Buf = m_Chunk;
        m_Head = 0;

        if (m_Stream->bad()) {
            report_error(Error::code::io_error, "Failed to read from input stream");
            return false;
        }
        return got > 0;
    }

    bool reader::fill() {
        while (m_Head >= m_Buf.size()) {
            if (!load_more()) return false;
        }
        return true;
    }

    char reader::peek() {
        return fill() ? m_Buf[m_Head] : '\0';
    }

    char reader::peek_at(std::size_t ahead) {
        while (m_Head + ahead >= m_Buf.size()) {
            if (!load_more()) return '\0';
        }
        return m_Buf[m_Head + ahead];
    }

    char reader::get() {
        if (!fill()) return '\0';
        char c = m_Buf[m_Head++];
        if (c == '\n') {
            m_Line++;
            m_Column = 1;
        } else m_Column++;
        return c;
    }

    void reader::advance(std::size_t n) noexcept {
        for (std::size_t i = 0; i < n; i++) {
            if (m_Buf[m_Head + i] == '\n') {
                m_Line++;
                m_Column = 1;
            } else m_Column++;
        }
        m_Head += n;
        if (n > 0) m_ExpectValue = false;
    }

    bool reader::consume(char c) {
        if (peek() == c) {
            get();
            return true;
        }
        return false;
    }
#pragma endregion

#pragma region Errors
    void reader::report_error(Error e) {
        if (!m_Error) m_Error = std::move(e);
    }

    void reader::report_error(Error::code c, std::string_view msg) {
        if (m_Error) return;
        m_Error = Error::make(c, offset(), m_Line, m_Column, msg);
    }
#pragma endregion

#pragma region Tokens
    bool reader::skip_ws() {
        while (fill()) {
            char c = peek();

            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
                get();
                continue;
            }

            if (!m_Opts.allow_comments || c != '/') break;

            char next = peek_at(1);
            if (next == '/') {
                // Line comment
                get();
                get();
                while (fill() && peek() != '\n') {
                    get();
                }
                continue;
            } else if (next == '*') {
                get();
                get();
                bool closed = false;
                while (fill()) {
                    char ch = get();
                    if (ch == '*' && peek() == '/') {
                        get();
                        closed = true;
                        break;
                    }
                }
                if (!closed) {
                    report_error(Error::code::unexpected_end_of_input, "Nonterminated block comment");
                    return false;
                }
                continue;
            } else {
                break;
            }
        }
        return !failed();
    }

    bool reader::read_literal(std::string_view literal, std::string_view fail_msg) {
        m_ExpectValue = false;
        for (char expected : literal) {
            if (!fill()) {
                report_error(Error::code::unexpected_end_of_input, fail_msg);
                return false;
            }
            if (get() != expected) {
                report_error(Error::code::unexpected_character, fail_msg);
                return false;
            }
        }
        return true;
    }

    value_kind reader::next_kind() {
        if (failed() || !skip_ws()) return value_kind::invalid;
        if (!fill()) {
            report_error(Error::code::unexpected_end_of_input, "Expected JSON value");
            return value_kind::invalid;
        }
        char c = peek();
        switch (c) {
        case 'n': return value_kind::null;
        case 't':
        case 'f': return value_kind::boolean;
        case '"': return value_kind::string;
        case '[': return value_kind::array;
        case '{': return value_kind::object;
        default:
            if (c == '-' || (c >= '0' && c <= '9')) return value_kind::number;
            else if (c == '.') report_error(Error::code::invalid_number, "Fractional values must start with a 0");
            else report_error(Error::code::unexpected_character, "Unexpected character while reading value");
            return value_kind::invalid;
        }
    }

    bool reader::read_null() {
        if (failed() || !skip_ws()) return false;
        if (peek() != 'n') return false;
        return read_literal("null", "Invalid 'null' literal");
    }

    bool reader::read_bool() {
        if (failed() || !skip_ws()) return false;
        switch (peek()) {
        case 't': return read_literal("true", "Invalid 'true' literal");
        case 'f': read_literal("false", "Invalid 'false' literal"); return false;
        default:
            if (!fill()) report_error(Error::code::unexpected_end_of_input, "Expected boolean");
            else report_error(Error::code::unexpected_character, "Expected 'true' or 'false'");
            return false;
        }
    }

    std::string reader::read_string() {
        std::string out;
        if (failed() || !skip_ws()) return out;
        if (!consume('"')) {
            if (!fill()) report_error(Error::code::unexpected_end_of_input, "Expected string");
            else report_error(Error::code::invalid_string, "Expected '\"' to start a string");
            return out;
        }
        m_ExpectValue = false;

        auto parse_hex4 = [&](uint16_t& out_code) -> bool {
            uint16_t val = 0;
            for (int i = 0; i < 4; i++) {
                if (!fill()) {
                    report_error(Error::code::invalid_unicode_escape, "Unexpected end in unicode escape");
                    return false;
                }
                char h = get();
                unsigned digit = 0;
                if (h >= '0' && h <= '9') digit = h - '0';
                else if (h >= 'A' && h <= 'F') digit = 10 + (h - 'A');
                else if (h >= 'a' && h <= 'f') digit = 10 + (h - 'a');
                else {
                    report_error(Error::code::invalid_unicode_escape, "Invalid hex digit in unicode escape");
                    return false;
                }
                val = static_cast<uint16_t>((val << 4) | digit);
            }
            out_code = val;
            return true;
        };

        while (fill()) {
            char c = get();
            if (c == '"') {
                size_t bad_idx = 0;
                if (!detail::is_valid_utf8(out, bad_idx)) {
                    report_error(Error::code::invalid_string, "Invalid UTF-8 sequence in string");
                    return {};
                }
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                report_error(Error::code::invalid_string, "Control character in string");
                return {};
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }

            if (!fill()) {
                report_error(Error::code::invalid_escape, "Unfinished escape sequence");
                return {};
            }
            char esc = get();
            switch (esc) {
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/': out.push_back('/'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'u': {
                uint16_t first = 0;
                if (!parse_hex4(first)) return {};

                uint32_t codepoint = 0;
                if (first >= 0xD800 && first <= 0xDBFF) {
                    if (!(consume('\\') && consume('u'))) {
                        report_error(Error::code::invalid_unicode_escape, "Expected low surrogate after high surrogate");
                        return {};
                    }
                    uint16_t second = 0;
                    if (!parse_hex4(second)) return {};
                    if (!(second >= 0xDC00 && second <= 0xDFFF)) {
                        report_error(Error::code::invalid_unicode_escape, "Invalid low surrogate");
                        return {};
                    }
                    codepoint = 0x10000u + ((static_cast<uint32_t>(first - 0xD800) << 10) | (static_cast<uint32_t>(second - 0xDC00)));
                } else if (first >= 0xDC00 && first <= 0xDFFF) {
                    report_error(Error::code::invalid_unicode_escape, "Unpaired low surrogate");
                    return {};
                } else codepoint = first;

                detail::append_utf8(codepoint, out);
                break;
            }
            default:
                report_error(Error::code::invalid_escape, "Invalid escape sequence");
                return {};
            }
        }

        report_error(Error::code::unexpected_end_of_input, "Nonterminated string");
        return {};
    }

    std::string reader::read_number_literal() {
        std::string literal;
        if (failed() || !skip_ws()) return literal;
        while (detail::is_number_char(peek())) literal.push_back(get());
        if (literal.empty()) {
            if (!fill()) report_error(Error::code::unexpected_end_of_input, "Expected number");
            else report_error(Error::code::unexpected_character, "Expected number");
        } else m_ExpectValue = false;
        return literal;
    }

    bool reader::enter() {
        m_Depth++;
        if (m_Opts.max_depth != 0 && m_Depth > m_Opts.max_depth) {
            report_error(Error::code::depth_limit_exceeded, "Maximum nesting depth exceeded");
            return false;
        }
        return true;
    }

    void reader::leave() noexcept {
        if (m_Depth > 0) m_Depth--;
        m_ExpectValue = false;
    }

    bool reader::at_value() const noexcept {
        return m_Depth == 0 || m_ExpectValue;
    }

    bool reader::read_array() {
        if (failed() || !skip_ws()) return false;
        if (at_value()) {
            if (!consume('[')) {
                if (!fill()) report_error(Error::code::unexpected_end_of_input, "Expected array");
                else report_error(Error::code::unexpected_character, "Expected '[' to start an array");
                return false;
            }
            if (!enter() || !skip_ws()) return false;
            if (consume(']')) {
                leave();
                return false;
            }
            m_ExpectValue = true;
            return true;
        }

        switch (peek()) {
        case ',':
            get();
            if (!skip_ws()) return false;
            if (peek() == ']') {
                if (!m_Opts.allow_trailing_commas) {
                    report_error(Error::code::trailing_characters, "Trailing commas not allowed");
                    return false;
                }
                get();
                leave();
                return false;
            }
            m_ExpectValue = true;
            return true;
        case ']':
            get();
            leave();
            return false;
        default:
            if (!fill()) report_error(Error::code::unexpected_end_of_input, "Unterminated array, expected ',' or ']'");
            else report_error(Error::code::unexpected_character, "Expected ',' or ']' after array element");
            return false;
        }
    }

    std::optional<std::string> reader::read_field_name() {
        if (!skip_ws()) return std::nullopt;
        if (!fill()) {
            report_error(Error::code::unexpected_end_of_input, "Unterminated object, expected string key");
            return std::nullopt;
        }
        if (peek() != '"') {
            report_error(Error::code::unexpected_character, "Expected \" to start object key");
            return std::nullopt;
        }
        std::string key = read_string();
        if (failed() || !skip_ws()) return std::nullopt;
        if (!fill()) {
            report_error(Error::code::unexpected_end_of_input, "Unterminated object, expected ':' after key");
            return std::nullopt;
        }
        if (!consume(':')) {
            report_error(Error::code::unexpected_character, "Expected ':' after object key");
            return std::nullopt;
        }
        m_ExpectValue = true;
        return key;
    }

    std::optional<std::string> reader::read_object() {
        if (failed() || !skip_ws()) return std::nullopt;
        if (at_value()) {
            if (!consume('{')) {
                if (!fill()) report_error(Error::code::unexpected_end_of_input, "Expected object");
                else report_error(Error::code::unexpected_character, "Expected '{' to start an object");
                return std::nullopt;
            }
            if (!enter() || !skip_ws()) return std::nullopt;
            if (consume('}')) {
                leave();
                return std::nullopt;
            }
            return read_field_name();
        }

        switch (peek()) {
        case ',':
            get();
            if (!skip_ws()) return std::nullopt;
            if (peek() == '}') {
                if (!m_Opts.allow_trailing_commas) {
                    report_error(Error::code::trailing_characters, "Trailing commas not allowed");
                    return std::nullopt;
                }
                get();
                leave();
                return std::nullopt;
            }
            return read_field_name();
        case '}':
            get();
            leave();
            return std::nullopt;
        default:
            if (!fill()) report_error(Error::code::unexpected_end_of_input, "Unterminated object, expected ',' or '}'");
            else report_error(Error::code::unexpected_character, "Expected ',' or '}' after object member");
            return std::nullopt;
        }
    }

    void reader::skip() {
        switch (next_kind()) {
        case value_kind::null: read_null(); return;
        case value_kind::boolean: read_bool(); return;
        case value_kind::number: read_number_literal(); return;
        case value_kind::string: read_string(); return;
        case value_kind::array:
            while (read_array()) skip();
            return;
        case value_kind::object:
            while (read_object()) skip();
            return;
        case value_kind::invalid: return;
        }
    }

    void reader::expect_end() {
        if (failed() || !skip_ws()) return;
        if (fill()) report_error(Error::code::trailing_characters, "Trailing characters after top-level JSON value");
    }
#pragma endregion

} // namespace Stanza
