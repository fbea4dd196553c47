#pragma once

#include <cstddef>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "stanza/decoder.hpp"
#include "stanza/reader.hpp"
#include "stanza/type.hpp"


namespace Stanza::detail {

    /// @brief Address of the member at @p offset inside the object at @p base
    ///
    /// @details
    /// The only place the engine does raw address arithmetic. The compiler
    /// checks once per field that `offset` is aligned for the member type
    /// and lies within the owning struct, so no check happens here.
    inline void* field_address(void* base, std::size_t offset) noexcept {
        return static_cast<std::byte*>(base) + offset;
    }

#pragma region Primitives
    template<class T>
    class scalar_decoder final : public decoder {
    public:
        void decode(void* ptr, reader& r) const override {
            T value = read(r);
            if (!r.failed()) *static_cast<T*>(ptr) = std::move(value);
        }

    private:
        static T read(reader& r) {
            if constexpr (std::is_same_v<T, bool>) return r.read_bool();
            else if constexpr (std::is_same_v<T, std::string>) return r.read_string();
            else if constexpr (std::is_floating_point_v<T>) return r.read_float<T>();
            else return r.read_integer<T>();
        }
    };

    /// @brief Shared stateless decoder for a scalar kind, nullptr for other kinds
    decoder_ptr scalar_decoder_for(type_kind kind);

    class any_decoder final : public decoder {
    public:
        void decode(void* ptr, reader& r) const override;
    };
#pragma endregion

#pragma region Composites
    class optional_decoder final : public decoder {
    public:
        optional_decoder(const optional_ops& ops, decoder_ptr element)
            : m_Ops{ ops }, m_Element{ std::move(element) } {}

        void decode(void* ptr, reader& r) const override;

    private:
        const optional_ops& m_Ops;
        decoder_ptr m_Element;
    };

    class sequence_decoder final : public decoder {
    public:
        sequence_decoder(const sequence_ops& ops, decoder_ptr element)
            : m_Ops{ ops }, m_Element{ std::move(element) } {}

        void decode(void* ptr, reader& r) const override;

    private:
        const sequence_ops& m_Ops;
        decoder_ptr m_Element;
    };

    class map_decoder final : public decoder {
    public:
        map_decoder(const map_ops& ops, const type_descriptor& value_type, decoder_ptr value)
            : m_Ops{ ops }, m_ValueType{ value_type }, m_Value{ std::move(value) } {}

        void decode(void* ptr, reader& r) const override;

    private:
        const map_ops& m_Ops;
        const type_descriptor& m_ValueType;
        decoder_ptr m_Value;
    };

    /// @brief One decodable member of a struct
    struct bound_field {
        std::vector<std::string> names; ///< JSON keys matched to this member
        std::size_t offset = 0;
        decoder_ptr dec;
    };

    class struct_decoder final : public decoder {
    public:
        explicit struct_decoder(std::string name) : m_Name{ std::move(name) } {}

        void decode(void* ptr, reader& r) const override;

        /// @brief Installs the compiled fields
        /// @pre Called once by the compiler, before the decoder is shared
        void bind(std::vector<bound_field> fields);

        [[nodiscard]] const std::string& name() const noexcept { return m_Name; }

    private:
        std::string m_Name;
        std::vector<bound_field> m_Fields;
        std::unordered_map<std::string, std::size_t> m_Index;
    };

    /// @brief Unwraps a scalar from a JSON string, e.g. `"100"` for an integer
    class string_coerced_decoder final : public decoder {
    public:
        explicit string_coerced_decoder(decoder_ptr inner) : m_Inner{ std::move(inner) } {}

        void decode(void* ptr, reader& r) const override;

    private:
        decoder_ptr m_Inner;
    };

    /// @brief Back-reference to a struct decoder that encloses this one
    ///
    /// @details
    /// Emitted when a struct reaches itself again while being compiled. The
    /// target owns this decoder through its field tree, so it always
    /// outlives it.
    class deferred_decoder final : public decoder {
    public:
        explicit deferred_decoder(const struct_decoder* target) : m_Target{ target } {}

        void decode(void* ptr, reader& r) const override { m_Target->decode(ptr, r); }

    private:
        const struct_decoder* m_Target;
    };
#pragma endregion

} // namespace Stanza::detail
