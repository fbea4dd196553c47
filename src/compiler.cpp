#include "stanza/stanza.hpp"
#include "detail/decoders.hpp"

#include <unordered_map>
#include <utility>


namespace Stanza {

    namespace detail {

        using expected_decoder = std::expected<decoder_ptr, Error>;

        // Walks a type descriptor and builds its decoder tree. One instance
        // per compile call; it remembers which structs are being compiled
        // so that recursive types close the loop instead of recursing forever.
        class compiler {
        public:
            explicit compiler(const registry& reg) : m_Registry{ reg } {}

            expected_decoder compile_root(const type_descriptor* root) {
                const type_descriptor* pointee = (root && root->kind == type_kind::pointer) ? root->element() : nullptr;
                if (!pointee) {
                    return std::unexpected(Error::make(Error::code::invalid_target,
                        "expect ptr, got " + (root ? root->name : std::string{ "null descriptor" })));
                }
                auto dec = compile_type(*pointee);
                if (!dec) return std::unexpected(dec.error().prefixed("ptr"));
                return dec;
            }

        private:
            const registry& m_Registry;
            std::unordered_map<const type_descriptor*, const struct_decoder*> m_InProgress;

            static std::unexpected<Error> unsupported(const type_descriptor& t) {
                return std::unexpected(Error::make(Error::code::unsupported_type, "unsupported type: " + t.name));
            }

            expected_decoder compile_type(const type_descriptor& t) {
                if (auto dec = m_Registry.type_decoder(t.name)) return dec;

                switch (t.kind) {
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
                    return scalar_decoder_for(t.kind);
                case type_kind::any:
                    return std::make_shared<any_decoder>();
                case type_kind::sequence:
                    return compile_sequence(t);
                case type_kind::map:
                    return compile_map(t);
                case type_kind::optional:
                    return compile_optional(t);
                case type_kind::structure:
                    return compile_struct(t);
                case type_kind::pointer:
                    // A bare pointer owns nothing, so there is nowhere to decode into
                case type_kind::unsupported:
                    break;
                }
                return unsupported(t);
            }

            expected_decoder compile_sequence(const type_descriptor& t) {
                const type_descriptor* elem = t.element();
                if (!elem || !t.sequence) return std::unexpected(unsupported(t).error().prefixed("[slice]"));
                auto dec = compile_type(*elem);
                if (!dec) return std::unexpected(dec.error().prefixed("[slice]"));
                return std::make_shared<sequence_decoder>(*t.sequence, std::move(*dec));
            }

            expected_decoder compile_map(const type_descriptor& t) {
                const type_descriptor* key = t.key();
                if (!key || key->kind != type_kind::text) {
                    return std::unexpected(Error::make(Error::code::unsupported_key_type,
                        "unsupported key type: " + (key ? key->name : t.name)).prefixed("[map]"));
                }
                const type_descriptor* value = t.element();
                if (!value || !t.map || !value->construct || !value->destroy)
                    return std::unexpected(unsupported(t).error().prefixed("[map]"));

                auto dec = compile_type(*value);
                if (!dec) return std::unexpected(dec.error().prefixed("[map]"));
                return std::make_shared<map_decoder>(*t.map, *value, std::move(*dec));
            }

            expected_decoder compile_optional(const type_descriptor& t) {
                const type_descriptor* elem = t.element();
                if (!elem || !t.optional) return std::unexpected(unsupported(t).error().prefixed("[optional]"));
                auto dec = compile_type(*elem);
                if (!dec) return std::unexpected(dec.error().prefixed("[optional]"));
                return std::make_shared<optional_decoder>(*t.optional, std::move(*dec));
            }

            expected_decoder compile_struct(const type_descriptor& t) {
                if (auto it = m_InProgress.find(&t); it != m_InProgress.end())
                    return std::make_shared<deferred_decoder>(it->second);

                auto result = std::make_shared<struct_decoder>(t.name);
                m_InProgress.emplace(&t, result.get());
                auto fields = compile_fields(t);
                m_InProgress.erase(&t);
                if (!fields) return std::unexpected(std::move(fields.error()));

                result->bind(std::move(*fields));
                return result;
            }

            std::expected<std::vector<bound_field>, Error> compile_fields(const type_descriptor& t) {
                std::vector<bound_field> fields;
                fields.reserve(t.fields.size());

                for (const field_descriptor& f : t.fields) {
                    const std::string crumb = t.name + "." + f.name;
                    field_tag tag = parse_tag(f.tag);
                    if (tag.skip) continue;

                    const type_descriptor* ft = f.type ? f.type() : nullptr;
                    if (!ft) return std::unexpected(Error::make(Error::code::unsupported_type, "unsupported type: unknown").prefixed(crumb));
                    if (ft->alignment == 0 || f.offset % ft->alignment != 0 || f.offset + ft->size > t.size) {
                        return std::unexpected(Error::make(Error::code::unsupported_type,
                            "field offset " + std::to_string(f.offset) + " is not valid for " + ft->name).prefixed(crumb));
                    }

                    // Overrides may not write through a const member either
                    if (ft->is_const) return std::unexpected(unsupported(*ft).error().prefixed(crumb));

                    bound_field bound;
                    bound.offset = f.offset;
                    bound.names.push_back(tag.name.empty() ? f.name : tag.name);

                    // An explicit field registration takes precedence; extensions
                    // are only asked when there is none
                    bound.dec = m_Registry.field_decoder(t.name, f.name);
                    if (!bound.dec) {
                        for (const extension_fn& ext : m_Registry.extensions()) {
                            extension_result answer = ext(t, f);
                            if (answer.names.empty() && !answer.fn) continue;
                            if (!answer.names.empty()) bound.names = std::move(answer.names);
                            if (answer.fn) bound.dec = std::make_shared<function_decoder>(std::move(answer.fn));
                            break;
                        }
                    }
                    if (!bound.dec) {
                        auto dec = compile_type(*ft);
                        if (!dec) return std::unexpected(dec.error().prefixed(crumb));
                        bound.dec = std::move(*dec);
                    }

                    if (tag.string_coerced && ft->is_scalar())
                        bound.dec = std::make_shared<string_coerced_decoder>(std::move(bound.dec));

                    fields.push_back(std::move(bound));
                }
                return fields;
            }
        };

    } // namespace detail

    CompileResult compile(const type_descriptor* root, const registry& reg) {
        detail::compiler c{ reg };
        return c.compile_root(root);
    }

    CompileResult compile(const type_descriptor* root) {
        return compile(root, global_registry());
    }

} // namespace Stanza
