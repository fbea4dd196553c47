#pragma once


/*
    ---------------------------------------------------------
    Stanza::decoder_cache and Stanza::registry - Shared state
    ---------------------------------------------------------
    Two pieces of process-wide state sit behind `Stanza::decode`:

    - `decoder_cache` maps a `type_descriptor*` to its compiled decoder
      tree. It is read on every decode call and written only the first
      time a type is seen. Writers copy the current snapshot, add their
      entry and swap the new snapshot in with a compare-and-swap,
      retrying if another writer got there first. Readers never see a
      half-built map and never wait for a writer to copy one.

      Lookups are not strictly lock-free: `std::atomic<std::shared_ptr>`
      is not lock-free in libstdc++ or MSVC, where a load briefly spins
      on an internal lock bit held only for the pointer swap or a
      reference count update.

    - `registry` holds user overrides: decoders registered for a type
      name, decoders registered for a single struct field, and the
      ordered list of extension hooks. It is consulted by the compiler
      only. It is NOT synchronized: finish all registration before
      decoding from several threads, or serialize it yourself.

    A registration only affects types compiled after it. Call
    `clear_decoder_cache()` to make already cached types pick it up.
*/

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/decoder.hpp"
#include "stanza/type.hpp"

/// @defgroup StanzaRegistry Cache and Registry
/// @ingroup Stanza
/// @brief Compiled decoder cache and user overrides

namespace Stanza {

    /// @ingroup StanzaRegistry
    /// @brief Copy-on-write map from type descriptor to decoder
    class decoder_cache {
    public:
        using snapshot = std::unordered_map<const type_descriptor*, decoder_ptr>;

        STANZA_API decoder_cache();

        decoder_cache(const decoder_cache&) = delete;
        decoder_cache& operator=(const decoder_cache&) = delete;

        /// @brief Cached decoder for @p type, nullptr if absent
        [[nodiscard]] STANZA_API decoder_ptr lookup(const type_descriptor* type) const;

        /// @brief Publishes @p dec for @p type
        ///
        /// @details
        /// If another thread published a decoder for the same type first,
        /// that one stays and @p dec is dropped from the cache. The caller
        /// may still use @p dec.
        STANZA_API void insert(const type_descriptor* type, decoder_ptr dec);

        /// @brief Replaces the cache with an empty snapshot
        STANZA_API void clear();

        [[nodiscard]] STANZA_API std::size_t size() const;

    private:
        std::atomic<std::shared_ptr<const snapshot>> m_Snapshot;
    };

    /// @ingroup StanzaRegistry
    /// @brief User overrides consulted by the decoder compiler
    class registry {
    public:
        /// @brief Decodes every value whose type is named @p type_name with @p fn
        STANZA_API void register_type(std::string type_name, decode_fn fn);

        /// @brief Decodes field @p field_name (its declared name) of struct @p type_name with @p fn
        STANZA_API void register_field(std::string_view type_name, std::string_view field_name, decode_fn fn);

        /// @brief Appends @p ext to the extension hooks, asked in registration order
        STANZA_API void register_extension(extension_fn ext);

        /// @brief Drops all type and field overrides. Extensions are kept
        STANZA_API void reset();

        [[nodiscard]] STANZA_API decoder_ptr type_decoder(std::string_view type_name) const;

        [[nodiscard]] STANZA_API decoder_ptr field_decoder(std::string_view type_name, std::string_view field_name) const;

        [[nodiscard]] const std::vector<extension_fn>& extensions() const noexcept { return m_Extensions; }

    private:
        std::unordered_map<std::string, decoder_ptr> m_Types;
        std::unordered_map<std::string, decoder_ptr> m_Fields;
        std::vector<extension_fn> m_Extensions;

        static std::string field_key(std::string_view type_name, std::string_view field_name);
    };

    /// @ingroup StanzaRegistry
    /// @brief Process-wide cache used by Stanza::decode
    [[nodiscard]] STANZA_API decoder_cache& global_cache();

    /// @ingroup StanzaRegistry
    /// @brief Process-wide registry used by Stanza::decode and Stanza::compile
    [[nodiscard]] STANZA_API registry& global_registry();

} // namespace Stanza
