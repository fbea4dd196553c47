#include "stanza/stanza.hpp"

#include <istream>
#include <utility>


namespace Stanza {

    namespace detail {
        ParseResult parse_impl(reader& r) {
            any value = parse_any(r);
            r.expect_end();
            if (r.failed()) return std::unexpected(*r.error());
            return value;
        }
    } // namespace detail

    void decode(const type_descriptor* root, void* dest, reader& r) {
        if (r.failed()) return;
        if (!dest || !root || root->kind != type_kind::pointer || !root->element()) {
            r.report_error(Error::make(Error::code::invalid_target,
                "expect ptr, got " + (root ? root->name : std::string{ "null descriptor" })));
            return;
        }

        const type_descriptor* key = root->element();
        decoder_ptr dec = global_cache().lookup(key);
        if (!dec) {
            auto compiled = compile(root);
            if (!compiled) {
                r.report_error(std::move(compiled.error()));
                return;
            }
            dec = std::move(*compiled);
            global_cache().insert(key, dec);
        }
        dec->decode(dest, r);
    }

    ParseResult parse(std::string_view input, const ReaderOptions& opts) {
        reader r{ input, opts };
        return detail::parse_impl(r);
    }

    ParseResult parse(std::istream& is, const ReaderOptions& opts) {
        reader r{ is, opts };
        return detail::parse_impl(r);
    }

    void register_type_decoder(std::string type_name, decode_fn fn) {
        global_registry().register_type(std::move(type_name), std::move(fn));
    }

    void register_field_decoder(std::string_view type_name, std::string_view field_name, decode_fn fn) {
        global_registry().register_field(type_name, field_name, std::move(fn));
    }

    void register_extension(extension_fn ext) {
        global_registry().register_extension(std::move(ext));
    }

    void clear_decoders() {
        global_registry().reset();
    }

    void clear_decoder_cache() {
        global_cache().clear();
    }

} // namespace Stanza
