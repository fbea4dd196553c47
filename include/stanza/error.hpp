#pragma once


/*
    -------------------------------------------------------
    Stanza::Error - Structured decode and compile reporting
    -------------------------------------------------------
    `Stanza::Error` describes a failure that occured anywhere in the
    decoding pipeline: while tokenizing JSON, while compiling a decoder
    tree for a destination type, or while reading a `Stanza::any`.

    ------
    Fields
    ------
    - `code errc`:
        * Enumerated error code describing failure category. Codes fall
          in two groups:
            - token source (`reader`) codes: `unexpected_character`,
              `invalid_number`, `invalid_string`, `invalid_escape`,
              `invalid_unicode_escape`, `unexpected_end_of_input`,
              `trailing_characters`, `depth_limit_exceeded`, `io_error`
            - engine codes: `invalid_target`, `unsupported_type`,
              `unsupported_key_type`, `unexpected_value_kind`,
              `malformed_number`, `type_mismatch`
    - `size_t offset`:
        * Byte offset from the start of the input where the error was
          detected. Zero for errors that are not tied to input (compile
          errors, accessor errors)
    - `size_t line`, `size_t column`:
        * 1-based position of the error, zero when not tied to input
    - `std::string msg`:
        * Human-readable description of the error
        * Compile errors carry a breadcrumb trail naming where in a nested
          shape compilation failed, e.g. `ptr: [slice]: [map]: unsupported
          type: ...`
        * Intended for debugging and logging; not stable for programmatic use

    -----
    Usage
    -----
    - Compilation and the convenience entry points return
      `std::expected<T, Error>`
    - Decoding writes the first `Error` into the reader's error slot
    - Typed `Stanza::any` accessors throw `Stanza::bad_any_access`, which
      carries an `Error` with code `type_mismatch`
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "stanza/config.hpp"


/// @defgroup StanzaError Errors
/// @ingroup Stanza
/// @brief Error codes and structures produced by the reader and the decoding engine
namespace Stanza {

    /// @ingroup StanzaError
    /// @brief Structured error information produced while decoding.
    ///
    /// @details
    /// Every failure in Stanza is described by one `Error`:
    ///
    /// - **errc**: a classification of the error
    /// - **offset**: byte offset from the start of input where the error occurred
    /// - **line**: 1-based line number of the error position
    /// - **column**: 1-based column number (UTF-8 byte offset within the line)
    /// - **msg**: human-readable explanation of the error
    ///
    /// Errors not tied to an input position (compile errors, accessor
    /// errors) leave `offset`, `line` and `column` at zero.
    struct Error {
        /// @ingroup StanzaError
        /// @brief Enumeration of possible error categories.
        ///
        /// Members:
        /// - `unexpected_character`
        ///     Encountered a character that is not valid in the current state.
        ///
        /// - `invalid_number`
        ///     A numeric literal did not fit the destination type or was
        ///     not a number at all.
        ///
        /// - `invalid_string`
        ///     String literal violated JSON constraints (e.g. unescaped control
        ///     characters, invalid UTF-8).
        ///
        /// - `invalid_escape`
        ///     Invalid escape sequence inside a string (e.g. `\k`).
        ///
        /// - `invalid_unicode_escape`
        ///     Invalid `\uXXXX` sequence, malformed hex digits, or unpaired surrogate.
        ///
        /// - `unexpected_end_of_input`
        ///     Input ended before a complete JSON value could be read.
        ///
        /// - `trailing_characters`
        ///     A complete JSON value was read but non-whitespace remains,
        ///     or a trailing comma was found while they are disallowed.
        ///
        /// - `depth_limit_exceeded`
        ///     Maximum nesting depth was reached. Off by default.
        ///
        /// - `io_error`
        ///     The underlying stream failed while refilling the buffer.
        ///
        /// - `invalid_target`
        ///     The decode destination is not pointer-shaped (or is null).
        ///
        /// - `unsupported_type`
        ///     No decoder can be derived for a destination shape.
        ///
        /// - `unsupported_key_type`
        ///     An associative container whose key is not `std::string`.
        ///
        /// - `unexpected_value_kind`
        ///     A token kind that cannot be represented where it appeared.
        ///
        /// - `malformed_number`
        ///     The number scanner of `parse_any` produced a literal that the
        ///     64-bit numeric parser rejected.
        ///
        /// - `type_mismatch`
        ///     A typed `Stanza::any` accessor was called on a different variant.
        enum class code : uint8_t {
            unexpected_character,   ///< Invalid or unexpected character.
            invalid_number,         ///< Malformed or out-of-range numeric literal.
            invalid_string,         ///< Malformed string literal.
            invalid_escape,         ///< Invalid escape sequence.
            invalid_unicode_escape, ///< Invalid or malformed Unicode escape.
            unexpected_end_of_input,///< Input ended prematurely.
            trailing_characters,    ///< Extra characters after valid JSON.
            depth_limit_exceeded,   ///< Maximum depth limit exceeded.
            io_error,               ///< Input stream failure.
            invalid_target,         ///< Destination is not a pointer.
            unsupported_type,       ///< No decoder for a destination shape.
            unsupported_key_type,   ///< Map key is not text.
            unexpected_value_kind,  ///< Token kind not representable here.
            malformed_number,       ///< Number scanner literal rejected.
            type_mismatch,          ///< Any accessor on the wrong variant.
        };

        code errc{};          ///< The classification of the error.
        std::size_t offset{}; ///< Byte offset from the beginning of the input.
        std::size_t line{};   ///< Line number where the error occurred (1-based).
        std::size_t column{}; ///< Column number where the error occurred (1-based).
        std::string msg{};    ///< Human-readable diagnostic message.

        /// @ingroup StanzaError
        /// @brief Constructs a fully-populated `Error` instance.
        ///
        /// @details
        /// Used by the reader, which knows the input position. Example:
        /// @code
        /// return Error::make(
        ///     code::invalid_number, offset, line, column, "Integer out of range"
        /// );
        /// @endcode
        ///
        /// @param c    The error code describing the category of failure.
        /// @param o    Byte offset from the start of the input.
        /// @param l    Line number (1-based).
        /// @param col  Column number (1-based).
        /// @param m    Human-readable error message.
        /// @return A fully constructed `Error`.
        STANZA_API static Error make(code c, size_t o, size_t l, size_t col, std::string_view m);

        /// @ingroup StanzaError
        /// @brief Constructs an `Error` that is not tied to an input position.
        STANZA_API static Error make(code c, std::string_view m);

        /// @ingroup StanzaError
        /// @brief Returns a copy whose message is prefixed with `prefix: `.
        ///
        /// @details
        /// The decoder compiler uses this to build the breadcrumb trail of
        /// nested shapes, innermost failure last.
        [[nodiscard]] STANZA_API Error prefixed(std::string_view prefix) const;
    };

    /// @ingroup StanzaError
    /// @brief Returns the stable name of an error code, e.g. `"unsupported_type"`.
    [[nodiscard]] STANZA_API std::string_view to_string(Error::code c) noexcept;

} // namespace Stanza
