#include "stanza/registry.hpp"

#include <utility>


namespace Stanza {

#pragma region Cache
    decoder_cache::decoder_cache()
        : m_Snapshot{ std::make_shared<snapshot>() } {}

    decoder_ptr decoder_cache::lookup(const type_descriptor* type) const {
        auto current = m_Snapshot.load(std::memory_order_acquire);
        auto it = current->find(type);
        return it == current->end() ? nullptr : it->second;
    }

    void decoder_cache::insert(const type_descriptor* type, decoder_ptr dec) {
        auto current = m_Snapshot.load(std::memory_order_acquire);
        for (;;) {
            if (current->contains(type)) return;

            auto next = std::make_shared<snapshot>(*current);
            next->emplace(type, dec);
            // On failure `current` is refreshed with the winning snapshot
            if (m_Snapshot.compare_exchange_weak(current, std::shared_ptr<const snapshot>{ std::move(next) },
                                                 std::memory_order_acq_rel, std::memory_order_acquire))
                return;
        }
    }

    void decoder_cache::clear() {
        m_Snapshot.store(std::make_shared<snapshot>(), std::memory_order_release);
    }

    std::size_t decoder_cache::size() const {
        return m_Snapshot.load(std::memory_order_acquire)->size();
    }
#pragma endregion

#pragma region Registry
    void registry::register_type(std::string type_name, decode_fn fn) {
        m_Types.insert_or_assign(std::move(type_name), std::make_shared<function_decoder>(std::move(fn)));
    }

    void registry::register_field(std::string_view type_name, std::string_view field_name, decode_fn fn) {
        m_Fields.insert_or_assign(field_key(type_name, field_name), std::make_shared<function_decoder>(std::move(fn)));
    }

    void registry::register_extension(extension_fn ext) {
        m_Extensions.push_back(std::move(ext));
    }

    void registry::reset() {
        m_Types.clear();
        m_Fields.clear();
    }

    decoder_ptr registry::type_decoder(std::string_view type_name) const {
        auto it = m_Types.find(std::string{ type_name });
        return it == m_Types.end() ? nullptr : it->second;
    }

    decoder_ptr registry::field_decoder(std::string_view type_name, std::string_view field_name) const {
        auto it = m_Fields.find(field_key(type_name, field_name));
        return it == m_Fields.end() ? nullptr : it->second;
    }

    std::string registry::field_key(std::string_view type_name, std::string_view field_name) {
        std::string key{ type_name };
        key += '/';
        key += field_name;
        return key;
    }
#pragma endregion

    decoder_cache& global_cache() {
        static decoder_cache cache;
        return cache;
    }

    registry& global_registry() {
        static registry reg;
        return reg;
    }

} // namespace Stanza
