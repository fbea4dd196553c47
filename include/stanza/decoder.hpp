#pragma once


/*
    -------------------------------------------
    Stanza::decoder - Compiled decode operation
    -------------------------------------------
    A `decoder` knows how to decode one specific destination shape. It
    writes the decoded value at a raw address, pulling tokens from a
    `reader`, and reports failures through the reader's error slot.

    Decoders are built once by the decoder compiler and shared through
    `decoder_ptr`. They are immutable after construction, so one tree can
    be used by any number of threads at the same time.

    ----------
    Extensions
    ----------
    User code plugs into compilation in two ways:
        - `decode_fn`: a plain decode function registered for a type name
          or for a single field of a struct
        - `extension_fn`: a hook asked about every struct field while a
          struct is compiled; it may rename the field (one or more
          candidate JSON keys) and/or supply a decode function

        Stanza::register_type_decoder("Celsius", [](void* p, Stanza::reader& r) {
            *static_cast<double*>(p) = r.read_float<double>() - 273.15;
        });
*/

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/reader.hpp"

/// @defgroup StanzaDecoder Decoders
/// @ingroup Stanza
/// @brief Compiled decode operations and user hooks

namespace Stanza {

    struct type_descriptor;
    struct field_descriptor;

    /// @ingroup StanzaDecoder
    /// @brief Decodes one value of a fixed shape at a raw address
    class decoder {
    public:
        virtual ~decoder() = default;

        /// @brief Decodes the next value of @p r into the object at @p ptr
        ///
        /// @details
        /// @p ptr must point to a live object of the shape this decoder
        /// was compiled for. Errors are written to the reader's error slot;
        /// the object may be partially written when that happens.
        virtual void decode(void* ptr, reader& r) const = 0;
    };

    /// @ingroup StanzaDecoder
    using decoder_ptr = std::shared_ptr<const decoder>;

    /// @ingroup StanzaDecoder
    /// @brief User-supplied decode function
    using decode_fn = std::function<void(void* ptr, reader& r)>;

    /// @ingroup StanzaDecoder
    /// @brief Decoder wrapping a user `decode_fn`
    class function_decoder final : public decoder {
    public:
        explicit function_decoder(decode_fn fn) : m_Fn{ std::move(fn) } {}

        void decode(void* ptr, reader& r) const override { m_Fn(ptr, r); }

    private:
        decode_fn m_Fn;
    };

    /// @ingroup StanzaDecoder
    /// @brief Answer of an extension hook for one struct field
    ///
    /// An empty `names` keeps the field's resolved name; an empty `fn`
    /// keeps shape-based compilation.
    struct extension_result {
        std::vector<std::string> names;
        decode_fn fn;
    };

    /// @ingroup StanzaDecoder
    /// @brief Hook consulted for every struct field during compilation
    using extension_fn = std::function<extension_result(const type_descriptor& type, const field_descriptor& field)>;

} // namespace Stanza
