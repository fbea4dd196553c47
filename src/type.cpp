#include "stanza/type.hpp"


namespace Stanza {

    bool type_descriptor::is_scalar() const noexcept {
        switch (kind) {
        case type_kind::boolean:
        case type_kind::int8:
        case type_kind::int16:
        case type_kind::int32:
        case type_kind::int64:
        case type_kind::uint8:
        case type_kind::uint16:
        case type_kind::uint32:
        case type_kind::uint64:
        case type_kind::float32:
        case type_kind::float64:
        case type_kind::text:
            return true;
        default:
            return false;
        }
    }

    field_tag parse_tag(std::string_view tag) {
        field_tag out;
        if (tag == "-") {
            out.skip = true;
            return out;
        }

        auto comma = tag.find(',');
        out.name.assign(tag.substr(0, comma));
        while (comma != std::string_view::npos) {
            tag.remove_prefix(comma + 1);
            comma = tag.find(',');
            // Unknown options are ignored
            if (tag.substr(0, comma) == "string") out.string_coerced = true;
        }
        return out;
    }

    namespace detail {

        std::string_view kind_name(type_kind k) noexcept {
            switch (k) {
            case type_kind::boolean: return "bool";
            case type_kind::int8: return "int8";
            case type_kind::int16: return "int16";
            case type_kind::int32: return "int32";
            case type_kind::int64: return "int64";
            case type_kind::uint8: return "uint8";
            case type_kind::uint16: return "uint16";
            case type_kind::uint32: return "uint32";
            case type_kind::uint64: return "uint64";
            case type_kind::float32: return "float32";
            case type_kind::float64: return "float64";
            case type_kind::text: return "string";
            case type_kind::any: return "any";
            case type_kind::sequence: return "sequence";
            case type_kind::map: return "map";
            case type_kind::optional: return "optional";
            case type_kind::pointer: return "pointer";
            case type_kind::structure: return "struct";
            case type_kind::unsupported: return "unsupported";
            }
            return "unsupported";
        }

    } // namespace detail

} // namespace Stanza
