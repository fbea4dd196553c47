#pragma once


/*
    -----------------------------------------------------
    Stanza::type_descriptor - Runtime shape of a C++ type
    -----------------------------------------------------
    The decoder compiler never sees C++ types directly. It works on a
    `type_descriptor`, a runtime description of a destination shape that
    carries everything needed to write into raw memory of that type:

    - `kind`:       scalar kind, text, any, sequence, map, optional,
                    pointer, struct or unsupported. Const-qualified types
                    are always unsupported (`is_const` is set)
    - `name`:       human-readable name, also the key of type overrides in
                    the registry (e.g. "int32", "vector<string>", or the
                    name a struct gives itself)
    - `size`, `alignment`, `construct`, `destroy`:
                    enough to create scratch values of the type
    - `element()`, `key()`:
                    nested shapes, resolved lazily so self-referential types
                    such as `struct Node { std::unique_ptr<Node> next; }`
                    can be described
    - shape operations (`sequence_ops`, `map_ops`, `optional_ops`):
                    type-erased functions operating on a raw address
    - `fields`:     for structs, one `field_descriptor` per declared member

    ---------------------
    Describing a struct
    ---------------------
    A class becomes decodable by declaring a static `describe` function.
    Because it is a member, it can name private members too:

        class Account {
            std::string owner_;
            std::int64_t balance_ = 0;
        public:
            static void describe(Stanza::struct_builder<Account>& b) {
                b.name("Account");
                b.field("owner", &Account::owner_);
                b.field("balance", &Account::balance_, "bal,string");
            }
        };

    Field offsets are measured once against a value-initialized prototype,
    so decodable structs must be default constructible.

    --------
    Identity
    --------
    `descriptor_of<T>()` returns the same pointer for every call with the
    same `T`. That pointer is the type's identity in the decoder cache.
*/

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <new>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

#include "stanza/any.hpp"
#include "stanza/config.hpp"

/// @defgroup StanzaType Type Descriptors
/// @ingroup Stanza
/// @brief Runtime descriptions of destination types

namespace Stanza {

    /// @ingroup StanzaType
    /// @brief Shape of a destination type
    enum class type_kind : uint8_t {
        boolean,
        int8,
        int16,
        int32,
        int64,
        uint8,
        uint16,
        uint32,
        uint64,
        float32,
        float64,
        text,        ///< std::string
        any,         ///< Stanza::any
        sequence,    ///< std::vector<E>
        map,         ///< std::map<K, V>, std::unordered_map<K, V>
        optional,    ///< std::unique_ptr<E>, std::optional<E>
        pointer,     ///< E*, only valid as a decode root
        structure,   ///< class with a static describe(struct_builder<T>&)
        unsupported,
    };

    struct type_descriptor;

    /// @brief Lazily resolved reference to a nested descriptor
    using descriptor_ref = const type_descriptor* (*)();

    /// @ingroup StanzaType
    /// @brief Type-erased operations on a growable sequence
    struct sequence_ops {
        void (*clear)(void* seq);
        /// Appends a value-initialized element and returns its address.
        /// The address is valid until the next append.
        void* (*append)(void* seq);
    };

    /// @ingroup StanzaType
    /// @brief Type-erased operations on a text-keyed associative container
    struct map_ops {
        void (*clear)(void* map);
        /// Moves the value at @p value into the map under @p key, replacing
        /// any previous entry.
        void (*insert)(void* map, std::string&& key, void* value);
    };

    /// @ingroup StanzaType
    /// @brief Type-erased operations on an optional/owning pointer slot
    struct optional_ops {
        /// Address of the held value, nullptr when empty
        void* (*get)(void* opt);
        void (*reset)(void* opt);
        /// Allocates a value-initialized pointee, stores it and returns its address
        void* (*emplace)(void* opt);
    };

    /// @ingroup StanzaType
    /// @brief One declared member of a struct
    struct field_descriptor {
        std::string name;       ///< Declared name
        std::string tag;        ///< Annotation `name,opt1,opt2`, empty if absent
        std::size_t offset = 0; ///< Byte offset within the struct
        descriptor_ref type = nullptr;
    };

    /// @ingroup StanzaType
    /// @brief Runtime description of a destination type
    struct type_descriptor {
        type_kind kind = type_kind::unsupported;
        std::string name;
        std::size_t size = 0;
        std::size_t alignment = 1;
        bool is_const = false;

        void (*construct)(void* at) = nullptr;
        void (*destroy)(void* at) noexcept = nullptr;

        descriptor_ref element_ref = nullptr;
        descriptor_ref key_ref = nullptr;

        const sequence_ops* sequence = nullptr;
        const map_ops* map = nullptr;
        const optional_ops* optional = nullptr;

        std::vector<field_descriptor> fields;

        /// @brief Element, mapped value or pointee descriptor; nullptr if none
        [[nodiscard]] const type_descriptor* element() const { return element_ref ? element_ref() : nullptr; }

        /// @brief Key descriptor of a map; nullptr if none
        [[nodiscard]] const type_descriptor* key() const { return key_ref ? key_ref() : nullptr; }

        [[nodiscard]] STANZA_API bool is_scalar() const noexcept;
    };

    template<class T>
    const type_descriptor* descriptor_of();

    /// @ingroup StanzaType
    /// @brief Collects the fields of a struct from inside its describe function
    template<class T>
    class struct_builder {
    public:
        explicit struct_builder(type_descriptor& desc) : m_Desc{ desc } {}

        /// @brief Name under which type and field overrides are registered
        struct_builder& name(std::string n) {
            m_Desc.name = std::move(n);
            return *this;
        }

        /// @brief Records a member
        /// @param declared Declared name; the JSON key unless @p tag renames it
        /// @param member   Pointer to the member, may be private
        /// @param tag      Annotation `name,opt1,opt2` (see parse_tag)
        template<class F>
        struct_builder& field(std::string_view declared, F T::* member, std::string_view tag = {}) {
            const auto* base = reinterpret_cast<const std::byte*>(std::addressof(m_Prototype));
            const auto* at = reinterpret_cast<const std::byte*>(std::addressof(m_Prototype.*member));
            m_Desc.fields.push_back(field_descriptor{
                std::string{ declared },
                std::string{ tag },
                static_cast<std::size_t>(at - base),
                &descriptor_of<F>
            });
            return *this;
        }

    private:
        type_descriptor& m_Desc;
        T m_Prototype{};
    };

    /// @ingroup StanzaType
    /// @brief A class that describes its own fields
    template<class T>
    concept Describable = std::default_initializable<T> && requires(struct_builder<T>& b) {
        { T::describe(b) } -> std::same_as<void>;
    };

    /// @ingroup StanzaType
    /// @brief Parsed field annotation
    struct field_tag {
        std::string name;            ///< Renamed JSON key, empty to keep the declared name
        bool skip = false;           ///< Annotation was exactly `-`
        bool string_coerced = false; ///< `string` option present
    };

    /// @ingroup StanzaType
    /// @brief Parses a field annotation of the form `name,opt1,opt2`
    ///
    /// | Annotation | Effect                                             |
    /// |------------|----------------------------------------------------|
    /// | empty      | declared name is used verbatim                     |
    /// | `name`     | `name` is the JSON key                             |
    /// | `-`        | field is always skipped                            |
    /// | `,string`  | value is unwrapped from a JSON string first        |
    [[nodiscard]] STANZA_API field_tag parse_tag(std::string_view tag);

    namespace detail {

        template<class T> struct is_vector : std::false_type {};
        template<class E, class A> struct is_vector<std::vector<E, A>> : std::true_type {};
        // Packed bits have no element addresses to decode into
        template<class A> struct is_vector<std::vector<bool, A>> : std::false_type {};

        template<class T> struct map_traits { static constexpr bool value = false; };
        template<class K, class V, class C, class A>
        struct map_traits<std::map<K, V, C, A>> {
            static constexpr bool value = true;
            using key_type = K;
            using mapped_type = V;
        };
        template<class K, class V, class H, class E, class A>
        struct map_traits<std::unordered_map<K, V, H, E, A>> {
            static constexpr bool value = true;
            using key_type = K;
            using mapped_type = V;
        };

        template<class T> struct optional_traits { static constexpr bool value = false; };
        template<class E>
        struct optional_traits<std::unique_ptr<E>> {
            static constexpr bool value = true;
            using element_type = E;
            static void* get(void* p) { return static_cast<std::unique_ptr<E>*>(p)->get(); }
            static void reset(void* p) { static_cast<std::unique_ptr<E>*>(p)->reset(); }
            static void* emplace(void* p) {
                auto& slot = *static_cast<std::unique_ptr<E>*>(p);
                slot = std::make_unique<E>();
                return slot.get();
            }
        };
        template<class E>
        struct optional_traits<std::optional<E>> {
            static constexpr bool value = true;
            using element_type = E;
            static void* get(void* p) {
                auto& slot = *static_cast<std::optional<E>*>(p);
                return slot ? std::addressof(*slot) : nullptr;
            }
            static void reset(void* p) { static_cast<std::optional<E>*>(p)->reset(); }
            static void* emplace(void* p) { return std::addressof(static_cast<std::optional<E>*>(p)->emplace()); }
        };

        template<class T>
        constexpr type_kind integer_kind() {
            if constexpr (std::is_signed_v<T>) {
                if constexpr (sizeof(T) == 1) return type_kind::int8;
                else if constexpr (sizeof(T) == 2) return type_kind::int16;
                else if constexpr (sizeof(T) == 4) return type_kind::int32;
                else if constexpr (sizeof(T) == 8) return type_kind::int64;
                else return type_kind::unsupported;
            } else {
                if constexpr (sizeof(T) == 1) return type_kind::uint8;
                else if constexpr (sizeof(T) == 2) return type_kind::uint16;
                else if constexpr (sizeof(T) == 4) return type_kind::uint32;
                else if constexpr (sizeof(T) == 8) return type_kind::uint64;
                else return type_kind::unsupported;
            }
        }

        STANZA_API std::string_view kind_name(type_kind k) noexcept;

        template<class T>
        const type_descriptor* resolve() { return descriptor_of<T>(); }

        template<class T>
        type_descriptor make_descriptor() {
            type_descriptor d;
            d.size = sizeof(T);
            d.alignment = alignof(T);
            if constexpr (std::is_default_constructible_v<T> && std::is_destructible_v<T> && !std::is_array_v<T> && !std::is_const_v<T>) {
                d.construct = [](void* at) { ::new (at) T(); };
                d.destroy = [](void* at) noexcept { static_cast<T*>(at)->~T(); };
            }

            if constexpr (std::is_const_v<T>) {
                // Read-only storage is never a decode target
                d.kind = type_kind::unsupported;
                d.is_const = true;
                d.name = "const " + descriptor_of<std::remove_const_t<T>>()->name;
            } else if constexpr (std::same_as<T, bool>) {
                d.kind = type_kind::boolean;
            } else if constexpr (std::integral<T>) {
                d.kind = integer_kind<T>();
            } else if constexpr (std::same_as<T, float>) {
                d.kind = type_kind::float32;
            } else if constexpr (std::same_as<T, double>) {
                d.kind = type_kind::float64;
            } else if constexpr (std::same_as<T, std::string>) {
                d.kind = type_kind::text;
            } else if constexpr (std::same_as<T, Stanza::any>) {
                d.kind = type_kind::any;
            } else if constexpr (is_vector<T>::value) {
                using E = typename T::value_type;
                d.kind = type_kind::sequence;
                d.element_ref = &resolve<E>;
                if constexpr (std::is_default_constructible_v<E>) {
                    static const sequence_ops ops{
                        [](void* seq) { static_cast<T*>(seq)->clear(); },
                        [](void* seq) -> void* { return std::addressof(static_cast<T*>(seq)->emplace_back()); },
                    };
                    d.sequence = &ops;
                }
                d.name = "vector<" + descriptor_of<E>()->name + ">";
            } else if constexpr (map_traits<T>::value) {
                using K = typename map_traits<T>::key_type;
                using V = typename map_traits<T>::mapped_type;
                d.kind = type_kind::map;
                d.key_ref = &resolve<K>;
                d.element_ref = &resolve<V>;
                if constexpr (std::same_as<K, std::string> && std::is_move_constructible_v<V>) {
                    static const map_ops ops{
                        [](void* m) { static_cast<T*>(m)->clear(); },
                        [](void* m, std::string&& key, void* value) {
                            static_cast<T*>(m)->insert_or_assign(std::move(key), std::move(*static_cast<V*>(value)));
                        },
                    };
                    d.map = &ops;
                }
                d.name = "map<" + descriptor_of<K>()->name + ", " + descriptor_of<V>()->name + ">";
            } else if constexpr (optional_traits<T>::value) {
                using E = typename optional_traits<T>::element_type;
                d.kind = type_kind::optional;
                d.element_ref = &resolve<E>;
                if constexpr (std::is_default_constructible_v<E>) {
                    static const optional_ops ops{
                        &optional_traits<T>::get,
                        &optional_traits<T>::reset,
                        &optional_traits<T>::emplace,
                    };
                    d.optional = &ops;
                }
                d.name = "optional<" + descriptor_of<E>()->name + ">";
            } else if constexpr (std::is_pointer_v<T> && std::is_object_v<std::remove_pointer_t<T>>) {
                using E = std::remove_volatile_t<std::remove_pointer_t<T>>;
                d.kind = type_kind::pointer;
                d.element_ref = &resolve<E>;
                d.name = descriptor_of<E>()->name + "*";
            } else if constexpr (Describable<T>) {
                d.kind = type_kind::structure;
                d.name = typeid(T).name();
                struct_builder<T> builder{ d };
                T::describe(builder);
            } else {
                d.kind = type_kind::unsupported;
                d.name = typeid(T).name();
            }

            if (d.name.empty()) d.name = kind_name(d.kind);
            return d;
        }

    } // namespace detail

    /// @ingroup StanzaType
    /// @brief Returns the unique descriptor of `T`
    ///
    /// @details
    /// Built on first use and kept for the lifetime of the process. Nested
    /// descriptors are only named here, not compiled, so building a
    /// descriptor never recurses into a type currently being built except
    /// through its name.
    template<class T>
    const type_descriptor* descriptor_of() {
        static const type_descriptor desc = detail::make_descriptor<T>();
        return &desc;
    }

} // namespace Stanza
