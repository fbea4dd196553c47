#include "detail/decoders.hpp"
#include "stanza/any.hpp"

#include <cstdint>
#include <memory>
#include <new>


namespace Stanza::detail {

    namespace {

        // Owns one default-constructed value of a runtime type
        class scratch_value {
        public:
            explicit scratch_value(const type_descriptor& type) : m_Type{ type } {
                std::unique_ptr<void, release> storage{
                    ::operator new(type.size, std::align_val_t{ type.alignment }),
                    release{ type.alignment }
                };
                type.construct(storage.get());
                m_Ptr = storage.release();
            }

            scratch_value(const scratch_value&) = delete;
            scratch_value& operator=(const scratch_value&) = delete;

            ~scratch_value() {
                m_Type.destroy(m_Ptr);
                release{ m_Type.alignment }(m_Ptr);
            }

            [[nodiscard]] void* get() const noexcept { return m_Ptr; }

        private:
            struct release {
                std::size_t alignment;
                void operator()(void* p) const noexcept { ::operator delete(p, std::align_val_t{ alignment }); }
            };

            const type_descriptor& m_Type;
            void* m_Ptr = nullptr;
        };

    } // namespace

#pragma region Primitives
    decoder_ptr scalar_decoder_for(type_kind kind) {
        static const decoder_ptr boolean = std::make_shared<scalar_decoder<bool>>();
        static const decoder_ptr i8 = std::make_shared<scalar_decoder<std::int8_t>>();
        static const decoder_ptr i16 = std::make_shared<scalar_decoder<std::int16_t>>();
        static const decoder_ptr i32 = std::make_shared<scalar_decoder<std::int32_t>>();
        static const decoder_ptr i64 = std::make_shared<scalar_decoder<std::int64_t>>();
        static const decoder_ptr u8 = std::make_shared<scalar_decoder<std::uint8_t>>();
        static const decoder_ptr u16 = std::make_shared<scalar_decoder<std::uint16_t>>();
        static const decoder_ptr u32 = std::make_shared<scalar_decoder<std::uint32_t>>();
        static const decoder_ptr u64 = std::make_shared<scalar_decoder<std::uint64_t>>();
        static const decoder_ptr f32 = std::make_shared<scalar_decoder<float>>();
        static const decoder_ptr f64 = std::make_shared<scalar_decoder<double>>();
        static const decoder_ptr str = std::make_shared<scalar_decoder<std::string>>();

        switch (kind) {
        case type_kind::boolean: return boolean;
        case type_kind::int8: return i8;
        case type_kind::int16: return i16;
        case type_kind::int32: return i32;
        case type_kind::int64: return i64;
        case type_kind::uint8: return u8;
        case type_kind::uint16: return u16;
        case type_kind::uint32: return u32;
        case type_kind::uint64: return u64;
        case type_kind::float32: return f32;
        case type_kind::float64: return f64;
        case type_kind::text: return str;
        default: return nullptr;
        }
    }

    void any_decoder::decode(void* ptr, reader& r) const {
        auto& dest = *static_cast<any*>(ptr);
        any value = parse_any(r, dest.resource());
        if (!r.failed()) dest = std::move(value);
    }
#pragma endregion

#pragma region Composites
    void optional_decoder::decode(void* ptr, reader& r) const {
        if (r.read_null()) {
            m_Ops.reset(ptr);
            return;
        }
        if (r.failed()) return;

        // Engaged slots are decoded in place, keeping their storage
        void* value = m_Ops.get(ptr);
        if (!value) value = m_Ops.emplace(ptr);
        m_Element->decode(value, r);
    }

    void sequence_decoder::decode(void* ptr, reader& r) const {
        if (r.read_null()) {
            m_Ops.clear(ptr);
            return;
        }
        if (r.next_kind() != value_kind::array) {
            r.report_error(Error::code::unexpected_value_kind, "Expected array");
            return;
        }

        m_Ops.clear(ptr);
        while (r.read_array()) {
            m_Element->decode(m_Ops.append(ptr), r);
            if (r.failed()) return;
        }
    }

    void map_decoder::decode(void* ptr, reader& r) const {
        if (r.read_null()) {
            m_Ops.clear(ptr);
            return;
        }
        if (r.next_kind() != value_kind::object) {
            r.report_error(Error::code::unexpected_value_kind, "Expected object");
            return;
        }

        // Entries are merged into the map; a repeated key keeps the last value
        while (auto key = r.read_object()) {
            scratch_value value{ m_ValueType };
            m_Value->decode(value.get(), r);
            if (r.failed()) return;
            m_Ops.insert(ptr, std::move(*key), value.get());
        }
    }

    void struct_decoder::bind(std::vector<bound_field> fields) {
        m_Fields = std::move(fields);
        m_Index.clear();
        for (std::size_t i = 0; i < m_Fields.size(); i++) {
            for (const auto& name : m_Fields[i].names) m_Index.emplace(name, i);
        }
    }

    void struct_decoder::decode(void* ptr, reader& r) const {
        if (r.read_null()) return;
        if (r.next_kind() != value_kind::object) {
            r.report_error(Error::code::unexpected_value_kind, "Expected object for " + m_Name);
            return;
        }

        while (auto key = r.read_object()) {
            auto it = m_Index.find(*key);
            if (it == m_Index.end()) {
                r.skip();
            } else {
                const bound_field& field = m_Fields[it->second];
                field.dec->decode(field_address(ptr, field.offset), r);
            }
            if (r.failed()) return;
        }
    }

    void string_coerced_decoder::decode(void* ptr, reader& r) const {
        if (r.next_kind() != value_kind::string) {
            r.report_error(Error::code::unexpected_value_kind, "Expected quoted scalar");
            return;
        }
        std::string quoted = r.read_string();
        if (r.failed()) return;

        reader inner{ quoted, r.options() };
        m_Inner->decode(ptr, inner);
        inner.expect_end();
        if (inner.failed()) {
            Error e = *inner.error();
            e.offset = r.offset();
            r.report_error(e.prefixed("string"));
        }
    }
#pragma endregion

} // namespace Stanza::detail
