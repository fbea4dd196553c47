#pragma once


/*
    -------------------------------------------------------------
    Stanza - Modern C++ JSON decoder with compiled decoder trees
    -------------------------------------------------------------

    This is the main public header for Stanza

    It brings together:
        - Token source:                 `Stanza::reader`
        - Dynamic values:               `Stanza::any`, `Stanza::parse_any(...)`
        - Type descriptors:             `Stanza::descriptor_of<T>()`,
                                        `Stanza::struct_builder<T>`
        - Decoders and hooks:           `Stanza::decoder`, `decode_fn`,
                                        `extension_fn`
        - Cache and registry:           `Stanza::decoder_cache`,
                                        `Stanza::registry`
        - Decoding functions:           `Stanza::decode(...)`,
                                        `Stanza::unmarshal(...)`,
                                        `Stanza::parse(...)`
        - Error reporting and options:  `Stanza::Error`,
                                        `Stanza::ReaderOptions`

    -------------------
    High-Level Overview
    -------------------
    - Compilation:
        * The first time a destination type is decoded, a tree of
          specialized decoders is built from its `type_descriptor` and
          stored in a process-wide cache. Later decodes of the same type
          reuse the tree
        * Compile failures (`invalid_target`, `unsupported_type`,
          `unsupported_key_type`) are never cached
    - Decoding:
        * `void decode(T* dest, reader& r)` writes into `*dest`; the outcome
          is read from `r.failed()` / `r.error()`
        * `std::expected<void, Error> unmarshal(std::string_view, T&, const ReaderOptions& = {})`
        * `std::expected<any, Error> parse(std::string_view, const ReaderOptions& = {})`
    - Structs:
        * Declare `static void describe(Stanza::struct_builder<T>&)` and
          list the members; private members are fine
        * Field tags follow `name,opt1,opt2`: a name renames the key, `-`
          skips the field, the `string` option reads a scalar from a JSON
          string
    - Overrides:
        * `register_type_decoder`, `register_field_decoder` and
          `register_extension` customize compilation; `clear_decoders`
          drops type and field overrides

    -----
    Usage
    -----
        #include <stanza/stanza.hpp>

        struct Point {
            int x = 0;
            int y = 0;
            static void describe(Stanza::struct_builder<Point>& b) {
                b.field("x", &Point::x);
                b.field("y", &Point::y);
            }
        };

        int main() {
            Point p;
            auto res = Stanza::unmarshal(R"({"x":1,"y":2})", p);
            if (!res) {
                std::println("Decode Error: {}", res.error().msg);
                return 1;
            }
            std::println("{} {}", p.x, p.y);
        }

    Include this header if you want the full Stanza API.
*/

/// @defgroup Stanza Stanza JSON Decoder
/// @brief Core types and functions for Stanza

/// @defgroup StanzaAPI Top-level Decoding API
/// @ingroup Stanza
/// @brief Entry points and registration functions

#include <expected>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>

#include "stanza/any.hpp"
#include "stanza/config.hpp"
#include "stanza/decoder.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"
#include "stanza/reader.hpp"
#include "stanza/registry.hpp"
#include "stanza/type.hpp"

namespace Stanza {

    /// @ingroup StanzaAPI
    /// @brief Result of compiling a decoder tree
    using CompileResult = std::expected<decoder_ptr, Error>;

    /// @ingroup StanzaAPI
    /// @brief Result of parsing a document into a Stanza::any
    using ParseResult = std::expected<any, Error>;

    /// @ingroup StanzaAPI
    /// @brief Compiles the decoder tree for the pointee of @p root
    ///
    /// @details
    /// @p root must describe a pointer type (`T*`); the returned decoder
    /// decodes a `T` at the address it is given. Overrides and extensions
    /// of @p reg are consulted; the cache is neither read nor written.
    ///
    /// Failures carry a breadcrumb trail of the nested shapes that led to
    /// them, e.g. `ptr: [slice]: [map]: unsupported type: ...`.
    ///
    /// @param root Descriptor of the destination pointer type
    /// @param reg  Overrides to honor
    /// @return The decoder, or `invalid_target`, `unsupported_type` or
    ///         `unsupported_key_type`
    [[nodiscard]] STANZA_API CompileResult compile(const type_descriptor* root, const registry& reg);

    /// @ingroup StanzaAPI
    /// @brief Compiles against the global registry
    [[nodiscard]] STANZA_API CompileResult compile(const type_descriptor* root);

    /// @ingroup StanzaAPI
    /// @brief Decodes the next value of @p r into @p dest
    ///
    /// @details
    /// Looks the pointee type up in the global cache, compiling and
    /// inserting its decoder on a miss, then runs the decoder at @p dest.
    /// Nothing is thrown: compile and decode errors land in the reader's
    /// error slot, and a reader that has already failed is left untouched.
    /// On failure @p dest may be partially written.
    ///
    /// @param root Descriptor of the pointer type of @p dest
    /// @param dest Address of a live object of the pointee type
    /// @param r    Token source carrying the error slot
    STANZA_API void decode(const type_descriptor* root, void* dest, reader& r);

    /// @ingroup StanzaAPI
    /// @brief Typed form of decode(const type_descriptor*, void*, reader&)
    template<class T>
    void decode(T* dest, reader& r) {
        decode(descriptor_of<T*>(), static_cast<void*>(dest), r);
    }

    /// @ingroup StanzaAPI
    /// @brief Decodes a complete document into @p out
    ///
    /// @details
    /// Only whitespace may follow the decoded value.
    ///
    /// Example:
    /// @code
    /// std::vector<int> v;
    /// if (auto res = Stanza::unmarshal("[1,2,3]", v); !res)
    ///     std::cerr << res.error().msg << '\n';
    /// @endcode
    template<class T>
    [[nodiscard]] std::expected<void, Error> unmarshal(std::string_view input, T& out, const ReaderOptions& opts = {}) {
        reader r{ input, opts };
        decode(std::addressof(out), r);
        r.expect_end();
        if (r.failed()) return std::unexpected(*r.error());
        return {};
    }

    /// @ingroup StanzaAPI
    /// @brief Decodes a complete document read from @p is into @p out
    template<class T>
    [[nodiscard]] std::expected<void, Error> unmarshal(std::istream& is, T& out, const ReaderOptions& opts = {}) {
        reader r{ is, opts };
        decode(std::addressof(out), r);
        r.expect_end();
        if (r.failed()) return std::unexpected(*r.error());
        return {};
    }

    /// @ingroup StanzaAPI
    /// @brief Parses a complete document into a Stanza::any
    ///
    /// Example:
    /// @code
    /// auto res = Stanza::parse(R"({"a":[1,-2,3.5]})");
    /// if (res) std::cout << res->at("a")[1].as_int64();
    /// @endcode
    [[nodiscard]] STANZA_API ParseResult parse(std::string_view input, const ReaderOptions& opts = {});

    /// @ingroup StanzaAPI
    /// @brief Parses a complete document read from @p is into a Stanza::any
    [[nodiscard]] STANZA_API ParseResult parse(std::istream& is, const ReaderOptions& opts = {});

    /// @ingroup StanzaAPI
    /// @brief Registers @p fn for every value of the type named @p type_name
    ///
    /// The name is the descriptor name: `"int32"`, `"vector<string>"`, or
    /// the name a struct gives itself in `describe`.
    STANZA_API void register_type_decoder(std::string type_name, decode_fn fn);

    /// @ingroup StanzaAPI
    /// @brief Registers @p fn for one field of a struct
    STANZA_API void register_field_decoder(std::string_view type_name, std::string_view field_name, decode_fn fn);

    /// @ingroup StanzaAPI
    /// @brief Appends an extension hook to the global registry
    STANZA_API void register_extension(extension_fn ext);

    /// @ingroup StanzaAPI
    /// @brief Drops all type and field overrides; extensions and the cache are kept
    STANZA_API void clear_decoders();

    /// @ingroup StanzaAPI
    /// @brief Empties the global decoder cache
    STANZA_API void clear_decoder_cache();

} // namespace Stanza
