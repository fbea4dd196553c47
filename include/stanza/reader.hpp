#pragma once


/*
    ------------------------------------------
    Stanza::reader - Pull-style JSON tokenizer
    ------------------------------------------
    `Stanza::reader` turns a byte buffer into primitive JSON reads. It is
    the token source every decoder consumes: decoders ask it what kind of
    value comes next, read scalars, and walk arrays and objects one
    element at a time.

    -----
    Input
    -----
    - `std::string_view`: read in place, never copied. The viewed bytes
      must outlive the reader
    - `std::istream&`: read in chunks of `ReaderOptions::buffer_size`
      bytes; `load_more()` refills the buffer when it runs dry

    ----------------
    Iteration Style
    ----------------
    - Arrays: call `read_array()` until it returns false. The first call
      consumes `[`, later calls consume `,` (true) or `]` (false)

            while (r.read_array()) { decode_element(r); }

    - Objects: call `read_object()` until it returns `std::nullopt`. Each
      call yields the next field name with its `:` consumed

            while (auto field = r.read_object()) { decode_field(*field, r); }

    - Where a value is due (top level, after `[`, `,` or `:`) only an
      opening bracket is accepted; after an element only `,` or a closing
      bracket. `[1[2]` is a syntax error, not a nested array

    ----------
    Error Slot
    ----------
    - The reader owns a single error slot. The first reported error is
      kept; later reports are dropped
    - Once an error is set every read becomes a no-op returning a zero
      value, so callers only need to check `failed()` at the points where
      they would otherwise continue iterating
    - `clear_error()` resets the slot

    -------------
    Thread-Safety
    -------------
    - A reader is a single-threaded object. Use one reader per thread
*/

#include <cstddef>
#include <cstdint>
#include <charconv>
#include <concepts>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"

/// @defgroup StanzaReader Token Source
/// @ingroup Stanza
/// @brief Primitive JSON reads consumed by decoders

namespace Stanza {

    /// @ingroup StanzaReader
    /// @brief Kind of the next JSON value, as seen by `reader::next_kind()`
    enum class value_kind : uint8_t {
        invalid, ///< No value can start here (error reported)
        null,    ///< `null`
        boolean, ///< `true` or `false`
        number,  ///< `-` or a digit
        string,  ///< `"`
        array,   ///< `[`
        object,  ///< `{`
    };

    /// @ingroup StanzaReader
    /// @brief Pull-style JSON tokenizer with a shared error slot
    class reader {
    public:
        /// @brief Reads JSON from @p input in place
        /// @param input UTF-8 JSON text; must outlive the reader
        /// @param opts Tokenization options
        STANZA_API explicit reader(std::string_view input, const ReaderOptions& opts = {});

        /// @brief Reads JSON from @p is, `opts.buffer_size` bytes at a time
        STANZA_API explicit reader(std::istream& is, const ReaderOptions& opts = {});

        reader(const reader&) = delete;
        reader& operator=(const reader&) = delete;

        /// @brief Peeks the kind of the next value without consuming it
        ///
        /// @details
        /// Skips whitespace (and comments when allowed). Reports
        /// `unexpected_end_of_input` or `unexpected_character` and returns
        /// `value_kind::invalid` when no value can start here.
        [[nodiscard]] STANZA_API value_kind next_kind();

        /// @brief Consumes `null` if it is next
        /// @return true if `null` was consumed, false (nothing consumed) otherwise
        STANZA_API bool read_null();

        STANZA_API bool read_bool();

        /// @brief Reads a string literal, decoding escapes and validating UTF-8
        STANZA_API std::string read_string();

        /// @brief Advances through an array
        /// @return true if an element follows, false once the array is closed
        STANZA_API bool read_array();

        /// @brief Advances through an object
        /// @return The next field name (its `:` consumed), or `std::nullopt`
        ///         once the object is closed or an error occurred
        STANZA_API std::optional<std::string> read_object();

        /// @brief Reads an integer literal into `I`, range-checked
        template<std::integral I>
            requires (!std::same_as<I, bool>)
        I read_integer() {
            std::string literal = read_number_literal();
            if (failed()) return I{};
            I out{};
            auto [ptr, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), out);
            if (ec == std::errc::result_out_of_range) {
                report_error(Error::code::invalid_number, "Integer literal out of range for destination");
                return I{};
            }
            if (ec != std::errc{} || ptr != literal.data() + literal.size()) {
                report_error(Error::code::invalid_number, "Malformed integer literal");
                return I{};
            }
            return out;
        }

        /// @brief Reads a number literal into `F`
        template<std::floating_point F>
        F read_float() {
            std::string literal = read_number_literal();
            if (failed()) return F{};
            F out{};
            auto [ptr, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), out);
            if (ec == std::errc::result_out_of_range) {
                report_error(Error::code::invalid_number, "Floating-point literal out of range for destination");
                return F{};
            }
            if (ec != std::errc{} || ptr != literal.data() + literal.size()) {
                report_error(Error::code::invalid_number, "Malformed floating-point literal");
                return F{};
            }
            return out;
        }

        /// @brief Consumes the next value of any kind and discards it
        STANZA_API void skip();

        /// @brief Reports `trailing_characters` unless only whitespace remains
        STANZA_API void expect_end();

        // ------------------------------------------------------------
        // Raw buffer access
        // ------------------------------------------------------------

        /// @brief Unread bytes of the current buffer chunk
        [[nodiscard]] std::string_view buffered() const noexcept { return m_Buf.substr(m_Head); }

        /// @brief Consumes @p n bytes of `buffered()`
        /// @pre `n <= buffered().size()`
        STANZA_API void advance(std::size_t n) noexcept;

        /// @brief Refills the buffer from the underlying stream
        ///
        /// @details
        /// Unread bytes are kept at the front of the new chunk. Returns
        /// false when no further input is available (always for
        /// `std::string_view` input). A stream failure reports `io_error`.
        STANZA_API bool load_more();

        // ------------------------------------------------------------
        // Error slot
        // ------------------------------------------------------------

        [[nodiscard]] bool failed() const noexcept { return m_Error.has_value(); }
        [[nodiscard]] const std::optional<Error>& error() const noexcept { return m_Error; }

        /// @brief Records @p e unless an error is already set
        STANZA_API void report_error(Error e);

        /// @brief Records an error of kind @p c at the current position
        STANZA_API void report_error(Error::code c, std::string_view msg);

        void clear_error() noexcept { m_Error.reset(); }

        [[nodiscard]] const ReaderOptions& options() const noexcept { return m_Opts; }

        /// @brief Byte offset of the next unread byte from the start of input
        [[nodiscard]] std::size_t offset() const noexcept { return m_Consumed + m_Head; }

    private:
        std::istream* m_Stream = nullptr;
        std::string m_Chunk;
        std::string_view m_Buf;
        std::size_t m_Head = 0;
        std::size_t m_Consumed = 0;
        std::size_t m_Line = 1;
        std::size_t m_Column = 1;
        std::size_t m_Depth = 0;
        // Inside a container, true until the pending element's first token is read
        bool m_ExpectValue = false;
        ReaderOptions m_Opts;
        std::optional<Error> m_Error;

        bool fill();
        char peek();
        char peek_at(std::size_t ahead);
        char get();
        bool consume(char c);
        bool skip_ws();
        bool read_literal(std::string_view literal, std::string_view fail_msg);
        std::optional<std::string> read_field_name();
        std::string read_number_literal();
        bool enter();
        void leave() noexcept;
        bool at_value() const noexcept;
    };

} // namespace Stanza
