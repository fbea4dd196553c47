#pragma once


/*
    ------------------------------------
    Stanza reader options - ReaderOptions
    ------------------------------------
    This header defines the configuration structure that controls how a
    `Stanza::reader` tokenizes JSON input.

    - `bool allow_comments`:
        * When true, the reader accepts line (`// ...`) and block
          (`/ * ... * /`) comments in addition to standard JSON whitespace
        * When false (default, strict JSON), a comment is an unexpected
          character
    - `bool allow_trailing_commas`:
        * When true, the reader accepts trailing commas in arrays and objects
          e.g. `[1,2,]` or `{"a": 1,}`
    - `size_t max_depth`:
        * Optional limit on nesting depth of arrays/objects
        * If exceeded, the reader fails with `depth_limit_exceeded`
        * A value of 0 is treated as no explicit limit
    - `size_t buffer_size`:
        * Number of bytes requested from a `std::istream` per refill
        * Ignored for `std::string_view` input, which is read in place

    -----
    Usage
    -----
        Stanza::reader r{ text, Stanza::ReaderOptions{ .allow_comments = true } };

    The option structure is a plain aggregate suitable for
    brace-initialization.
*/


#include <cstddef>

/// @defgroup StanzaOptions Reader Options
/// @ingroup Stanza
/// @brief Configuration objects controlling tokenization

namespace Stanza {

    /// @ingroup StanzaOptions
    /// @brief Configuration controlling JSON tokenization
    ///
    /// @details
    /// By default, the reader is strict according to RFC 8259.
    ///
    /// Example:
    /// @code
    /// ReaderOptions opts;
    /// opts.allow_comments = true;
    /// opts.max_depth = 32;
    /// auto result = Stanza::parse(text, opts);
    /// @endcode
    struct ReaderOptions {
        bool allow_comments = false; ///< Accept `//` and `/* */` comments if true
        bool allow_trailing_commas = false; ///< Permit trailing commas in arrays/objects if true
        std::size_t max_depth = 0; ///< Maximum allowed nesting depth (0 = unlimited)
        std::size_t buffer_size = 4096; ///< Refill chunk size for stream input
    };

} // namespace Stanza
