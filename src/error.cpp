#include "stanza/error.hpp"

namespace Stanza {

    Error Error::make(code c, size_t o, size_t l, size_t col, std::string_view m) {
        Error e;
        e.errc = c;
        e.offset = o;
        e.line = l;
        e.column = col;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    Error Error::make(code c, std::string_view m) {
        return make(c, 0, 0, 0, m);
    }

    Error Error::prefixed(std::string_view prefix) const {
        Error e = *this;
        e.msg.reserve(prefix.size() + 2 + msg.size());
        e.msg.assign(prefix.begin(), prefix.end());
        e.msg += ": ";
        e.msg += msg;
        return e;
    }

    std::string_view to_string(Error::code c) noexcept {
        switch (c) {
        case Error::code::unexpected_character: return "unexpected_character";
        case Error::code::invalid_number: return "invalid_number";
        case Error::code::invalid_string: return "invalid_string";
        case Error::code::invalid_escape: return "invalid_escape";
        case Error::code::invalid_unicode_escape: return "invalid_unicode_escape";
        case Error::code::unexpected_end_of_input: return "unexpected_end_of_input";
        case Error::code::trailing_characters: return "trailing_characters";
        case Error::code::depth_limit_exceeded: return "depth_limit_exceeded";
        case Error::code::io_error: return "io_error";
        case Error::code::invalid_target: return "invalid_target";
        case Error::code::unsupported_type: return "unsupported_type";
        case Error::code::unsupported_key_type: return "unsupported_key_type";
        case Error::code::unexpected_value_kind: return "unexpected_value_kind";
        case Error::code::malformed_number: return "malformed_number";
        case Error::code::type_mismatch: return "type_mismatch";
        }
        return "unknown";
    }

} // namespace Stanza
