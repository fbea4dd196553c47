#pragma once


/*
    --------------------------------------------
    Stanza::any - Dynamic, schema-less JSON value
    --------------------------------------------
    The `Stanza::any` type holds a decoded JSON value when the caller does
    not know the destination type in advance:
        - null
        - boolean
        - signed 64-bit integer
        - unsigned 64-bit integer
        - 64-bit float
        - text
        - sequence of any
        - mapping from text to any

    Numeric classification is decided once, when the literal is read, from
    its lexical shape:
        - contains `.`, `e` or `E`      -> float64
        - otherwise contains `-`        -> int64
        - otherwise                     -> uint64
    The stored variant is never re-inspected or converted afterwards.

    -----------------
    Memory Management
    -----------------
    - `any` is allocator-aware and uses `std::pmr::memory_resource` for all
      internal allocations (text, sequence, mapping)
    - Copy construction/assignment adopts the source's allocator and deep
      copies; moves steal allocator and storage

    ---------
    Accessors
    ---------
    - `as_text()`, `as_int64()`, `as_uint64()`, `as_float64()`,
      `as_bool()`, `as_sequence()`, `as_mapping()`
    - Each throws `Stanza::bad_any_access` (an `Error` with code
      `type_mismatch`) when the stored variant differs

    -------------
    Thread-Safety
    -------------
    - `any` is not inherently thread-safe
    - Concurrent access to the same instance must be externally synchronized

    `any` can also be a field of a decoded struct; the decoder compiler maps
    it to the dynamic decoder.
*/

/// @defgroup StanzaAny Dynamic Value
/// @ingroup Stanza

#include <compare>
#include <cstddef>
#include <cstdint>
#include <concepts>
#include <map>
#include <memory_resource>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/error.hpp"

namespace Stanza {

    class reader;

    /// @brief Enumerates the variants a Stanza::any can hold
    enum class any_kind : uint8_t {
        null,     ///< JSON null
        boolean,  ///< `true` or `false`
        int64,    ///< Literal containing `-` and no `.`/`e`/`E`
        uint64,   ///< Literal of digits only
        float64,  ///< Literal containing `.`, `e` or `E`
        text,     ///< JSON string
        sequence, ///< JSON array
        mapping,  ///< JSON object
    };

    /// @ingroup StanzaAny
    /// @brief Thrown by typed accessors of Stanza::any on a variant mismatch
    class bad_any_access : public std::runtime_error {
    public:
        STANZA_API explicit bad_any_access(Error e);

        [[nodiscard]] const Error& error() const noexcept { return m_Error; }

    private:
        Error m_Error;
    };

    class any;

    /// @ingroup StanzaAny
    /// @brief Text type used by Stanza::any (allocator-aware)
    using text = std::pmr::string;

    /// @ingroup StanzaAny
    /// @brief Sequence type used by Stanza::any (JSON arrays)
    using sequence = std::pmr::vector<any>;

    /// @ingroup StanzaAny
    /// @brief Mapping type used by Stanza::any (JSON objects)
    using mapping = std::pmr::map<text, any, std::less<>>;

    /// @ingroup StanzaAny
    /// @brief Dynamic, schema-less decoded value
    class any {
    public:
        using storage_t = std::variant<
            std::monostate,
            bool,
            std::int64_t,
            std::uint64_t,
            double,
            text,
            sequence,
            mapping
        >;

        // ------------------------------------------------------------
        // Constructors / assignment / destructor
        // ------------------------------------------------------------

        /// @brief Constructs a null value using the default memory resource
        STANZA_API any() noexcept;

        /// @brief Constructs a null value using the given memory resource
        STANZA_API explicit any(std::pmr::memory_resource* res) noexcept;

        STANZA_API any(std::nullptr_t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        STANZA_API any(bool b, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        STANZA_API any(double d, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs an int64 value from any signed integral type
        template<std::signed_integral I>
        explicit any(I i, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept
            : m_MemRes{ res }, m_Storage{ static_cast<std::int64_t>(i) } {}

        /// @brief Constructs a uint64 value from any unsigned integral type
        template<std::unsigned_integral U>
            requires (!std::same_as<U, bool>)
        explicit any(U u, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept
            : m_MemRes{ res }, m_Storage{ static_cast<std::uint64_t>(u) } {}

        STANZA_API any(const char* s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        STANZA_API any(std::string_view sv, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        STANZA_API any(text s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        STANZA_API any(sequence s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        STANZA_API any(mapping m, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Deep copies @p other, adopting its allocator
        STANZA_API any(const any& other);

        STANZA_API any(any&& other) noexcept;

        STANZA_API any& operator=(const any& other);

        STANZA_API any& operator=(any&& other) noexcept;

        // ------------------------------------------------------------
        // Introspection
        // ------------------------------------------------------------

        /// @brief Returns the variant currently stored
        [[nodiscard]] STANZA_API any_kind type() const noexcept;

        [[nodiscard]] bool is_null()     const noexcept { return type() == any_kind::null;     }
        [[nodiscard]] bool is_bool()     const noexcept { return type() == any_kind::boolean;  }
        [[nodiscard]] bool is_int64()    const noexcept { return type() == any_kind::int64;    }
        [[nodiscard]] bool is_uint64()   const noexcept { return type() == any_kind::uint64;   }
        [[nodiscard]] bool is_float64()  const noexcept { return type() == any_kind::float64;  }
        [[nodiscard]] bool is_text()     const noexcept { return type() == any_kind::text;     }
        [[nodiscard]] bool is_sequence() const noexcept { return type() == any_kind::sequence; }
        [[nodiscard]] bool is_mapping()  const noexcept { return type() == any_kind::mapping;  }

        // ------------------------------------------------------------
        // Typed accessors, throwing bad_any_access on mismatch
        // ------------------------------------------------------------

        [[nodiscard]] STANZA_API bool          as_bool() const;
        [[nodiscard]] STANZA_API std::int64_t  as_int64() const;
        [[nodiscard]] STANZA_API std::uint64_t as_uint64() const;
        [[nodiscard]] STANZA_API double        as_float64() const;

        [[nodiscard]] STANZA_API text&       as_text();
        [[nodiscard]] STANZA_API const text& as_text() const;

        [[nodiscard]] STANZA_API sequence&       as_sequence();
        [[nodiscard]] STANZA_API const sequence& as_sequence() const;

        [[nodiscard]] STANZA_API mapping&       as_mapping();
        [[nodiscard]] STANZA_API const mapping& as_mapping() const;

        /// @brief Number of elements of a sequence or entries of a mapping, 0 otherwise
        [[nodiscard]] STANZA_API size_t size() const noexcept;

        /// @brief Sequence element at @p idx
        /// @throws bad_any_access if not a sequence
        /// @throws std::out_of_range if @p idx is past the end
        STANZA_API const any& operator[](size_t idx) const;

        /// @brief Finds the entry for @p key, nullptr if absent or not a mapping
        [[nodiscard]] STANZA_API const any* find(std::string_view key) const;

        /// @brief Mapping entry for @p key
        /// @throws bad_any_access if not a mapping
        /// @throws std::out_of_range if the key does not exist
        STANZA_API const any& at(std::string_view key) const;

        /// @brief Structural equality; allocators are not compared
        friend bool operator==(const any& lhs, const any& rhs);

        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }

        [[nodiscard]] const storage_t& storage() const noexcept { return m_Storage; }

    private:
        std::pmr::memory_resource* m_MemRes{};
        storage_t m_Storage{};

        static storage_t clone_storage(const storage_t& s, std::pmr::memory_resource* res);
        void adopt(storage_t&& s, std::pmr::memory_resource* res) noexcept;
    };

    /// @ingroup StanzaAny
    /// @brief Reads the next JSON value from @p r into an `any`
    ///
    /// @details
    /// Dispatches on `r.next_kind()`. Numbers go through the number scanner,
    /// which classifies the literal by its lexical shape. Arrays and objects
    /// are read recursively and stop at the first element error. Any error is
    /// left in the reader's error slot and a null `any` is returned.
    ///
    /// @param r   Token source
    /// @param res Memory resource for the resulting tree
    STANZA_API any parse_any(reader& r, std::pmr::memory_resource* res = std::pmr::get_default_resource());

} // namespace Stanza
