#include "stanza/any.hpp"
#include "stanza/reader.hpp"

#include <charconv>
#include <stdexcept>
#include <string>
#include <system_error>


namespace Stanza {

    namespace {

        std::string_view kind_name(any_kind k) noexcept {
            switch (k) {
            case any_kind::null: return "null";
            case any_kind::boolean: return "boolean";
            case any_kind::int64: return "int64";
            case any_kind::uint64: return "uint64";
            case any_kind::float64: return "float64";
            case any_kind::text: return "text";
            case any_kind::sequence: return "sequence";
            case any_kind::mapping: return "mapping";
            }
            return "unknown";
        }

        [[noreturn]] void throw_mismatch(any_kind wanted, any_kind held) {
            std::string msg = "Stanza::any: expected ";
            msg += kind_name(wanted);
            msg += ", holds ";
            msg += kind_name(held);
            throw bad_any_access{ Error::make(Error::code::type_mismatch, msg) };
        }

    } // namespace

    bad_any_access::bad_any_access(Error e)
        : std::runtime_error{ e.msg }, m_Error{ std::move(e) } {}

    any::any() noexcept
        : m_MemRes{ std::pmr::get_default_resource() }, m_Storage{ std::monostate{} } {}

    any::any(std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}

    any::any(std::nullptr_t, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}

    any::any(bool b, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ b } {}

    any::any(double d, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ d } {}

    any::any(const char* s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ text{ s, res } } {}

    any::any(std::string_view sv, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ text{ sv.begin(), sv.end(), res } } {}

    any::any(text s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(s) } {}

    any::any(sequence s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(s) } {}

    any::any(mapping m, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(m) } {}

    any::any(const any& other)
        : m_MemRes{ other.m_MemRes }, m_Storage{ clone_storage(other.m_Storage, other.m_MemRes) } {}

    any::any(any&& other) noexcept
        : m_MemRes{ other.m_MemRes }, m_Storage{ std::move(other.m_Storage) } {}

    // Assigning a container alternative over the same alternative would keep
    // this side's allocator, so storage is always rebuilt from scratch. The
    // source is detached first since it may live inside this value.
    void any::adopt(storage_t&& s, std::pmr::memory_resource* res) noexcept {
        storage_t incoming{ std::move(s) };
        m_Storage.emplace<std::monostate>();
        m_Storage = std::move(incoming);
        m_MemRes = res;
    }

    any& any::operator=(const any& other) {
        if (this == &other) return *this;
        adopt(clone_storage(other.m_Storage, other.m_MemRes), other.m_MemRes);
        return *this;
    }

    any& any::operator=(any&& other) noexcept {
        if (this == &other) return *this;
        adopt(std::move(other.m_Storage), other.m_MemRes);
        return *this;
    }

    any_kind any::type() const noexcept {
        switch (m_Storage.index()) {
        case 0: return any_kind::null;
        case 1: return any_kind::boolean;
        case 2: return any_kind::int64;
        case 3: return any_kind::uint64;
        case 4: return any_kind::float64;
        case 5: return any_kind::text;
        case 6: return any_kind::sequence;
        case 7: return any_kind::mapping;
        }
        return any_kind::null;
    }

    bool any::as_bool() const {
        if (auto* v = std::get_if<bool>(&m_Storage)) return *v;
        throw_mismatch(any_kind::boolean, type());
    }

    std::int64_t any::as_int64() const {
        if (auto* v = std::get_if<std::int64_t>(&m_Storage)) return *v;
        throw_mismatch(any_kind::int64, type());
    }

    std::uint64_t any::as_uint64() const {
        if (auto* v = std::get_if<std::uint64_t>(&m_Storage)) return *v;
        throw_mismatch(any_kind::uint64, type());
    }

    double any::as_float64() const {
        if (auto* v = std::get_if<double>(&m_Storage)) return *v;
        throw_mismatch(any_kind::float64, type());
    }

    text& any::as_text() {
        if (auto* v = std::get_if<text>(&m_Storage)) return *v;
        throw_mismatch(any_kind::text, type());
    }

    const text& any::as_text() const {
        if (auto* v = std::get_if<text>(&m_Storage)) return *v;
        throw_mismatch(any_kind::text, type());
    }

    sequence& any::as_sequence() {
        if (auto* v = std::get_if<sequence>(&m_Storage)) return *v;
        throw_mismatch(any_kind::sequence, type());
    }

    const sequence& any::as_sequence() const {
        if (auto* v = std::get_if<sequence>(&m_Storage)) return *v;
        throw_mismatch(any_kind::sequence, type());
    }

    mapping& any::as_mapping() {
        if (auto* v = std::get_if<mapping>(&m_Storage)) return *v;
        throw_mismatch(any_kind::mapping, type());
    }

    const mapping& any::as_mapping() const {
        if (auto* v = std::get_if<mapping>(&m_Storage)) return *v;
        throw_mismatch(any_kind::mapping, type());
    }

    size_t any::size() const noexcept {
        if (is_sequence()) return std::get<sequence>(m_Storage).size();
        if (is_mapping()) return std::get<mapping>(m_Storage).size();
        return 0;
    }

    const any& any::operator[](size_t idx) const {
        return as_sequence().at(idx);
    }

    const any* any::find(std::string_view key) const {
        if (!is_mapping()) return nullptr;
        const auto& obj = std::get<mapping>(m_Storage);
        auto it = obj.find(key);
        if (it == obj.end()) return nullptr;
        return std::addressof(it->second);
    }

    const any& any::at(std::string_view key) const {
        const auto& obj = as_mapping();
        auto it = obj.find(key);
        if (it == obj.end()) throw std::out_of_range{ "Stanza::any::at: key not found" };
        return it->second;
    }

    bool operator==(const any& lhs, const any& rhs) {
        return lhs.m_Storage == rhs.m_Storage;
    }

    any::storage_t any::clone_storage(const storage_t& s, std::pmr::memory_resource* res) {
        switch (s.index()) {
        case 0: return std::monostate{};
        case 1: return std::get<bool>(s);
        case 2: return std::get<std::int64_t>(s);
        case 3: return std::get<std::uint64_t>(s);
        case 4: return std::get<double>(s);
        case 5: return text{ std::get<text>(s), res };
        case 6: {
            const auto& seq = std::get<sequence>(s);
            sequence copy{ std::pmr::polymorphic_allocator<any>{ res } };
            copy.reserve(seq.size());
            for (const auto& v : seq) copy.emplace_back(v);
            return copy;
        }
        case 7: {
            const auto& obj = std::get<mapping>(s);
            mapping copy{ std::less<>{}, res };
            for (const auto& [k, v] : obj) copy.emplace(text{ k, res }, any{ v });
            return copy;
        }
        }
        return std::monostate{};
    }

#pragma region Parser
    namespace detail {

        // Gathers the literal straight out of the reader's buffer, refilling
        // as needed. The first non-numeric byte stays unread.
        any read_number(reader& r, std::pmr::memory_resource* res) {
            std::string literal;
            bool found_float = false;
            bool found_negative = false;

            for (bool more = true; more;) {
                std::string_view chunk = r.buffered();
                std::size_t i = 0;
                for (; i < chunk.size(); i++) {
                    char c = chunk[i];
                    if (c == '-') found_negative = true;
                    else if (c == '.' || c == 'e' || c == 'E') found_float = true;
                    else if (c != '+' && (c < '0' || c > '9')) {
                        more = false;
                        break;
                    }
                }
                literal.append(chunk.substr(0, i));
                r.advance(i);
                if (more && !r.load_more()) break;
            }
            if (r.failed()) return any{ res };

            const char* first = literal.data();
            const char* last = first + literal.size();
            auto malformed = [&]() {
                r.report_error(Error::code::malformed_number, "Malformed number literal '" + literal + "'");
                return any{ res };
            };

            if (found_float) {
                double d = 0.0;
                auto [ptr, ec] = std::from_chars(first, last, d);
                if (ec != std::errc{} || ptr != last) return malformed();
                return any{ d, res };
            }
            if (found_negative) {
                std::int64_t i = 0;
                auto [ptr, ec] = std::from_chars(first, last, i);
                if (ec != std::errc{} || ptr != last) return malformed();
                return any{ i, res };
            }
            std::uint64_t u = 0;
            auto [ptr, ec] = std::from_chars(first, last, u);
            if (ec != std::errc{} || ptr != last) return malformed();
            return any{ u, res };
        }

    } // namespace detail

    any parse_any(reader& r, std::pmr::memory_resource* res) {
        switch (r.next_kind()) {
        case value_kind::string: {
            std::string s = r.read_string();
            if (r.failed()) return any{ res };
            return any{ std::string_view{ s }, res };
        }
        case value_kind::number: return detail::read_number(r, res);
        case value_kind::null:
            r.read_null();
            return any{ nullptr, res };
        case value_kind::boolean: {
            bool b = r.read_bool();
            if (r.failed()) return any{ res };
            return any{ b, res };
        }
        case value_kind::array: {
            sequence seq{ std::pmr::polymorphic_allocator<any>{ res } };
            while (r.read_array()) {
                any element = parse_any(r, res);
                if (r.failed()) return any{ res };
                seq.emplace_back(std::move(element));
            }
            if (r.failed()) return any{ res };
            return any{ std::move(seq), res };
        }
        case value_kind::object: {
            mapping obj{ std::less<>{}, res };
            while (auto field = r.read_object()) {
                any element = parse_any(r, res);
                if (r.failed()) return any{ res };
                obj.insert_or_assign(text{ std::string_view{ *field }, res }, std::move(element));
            }
            if (r.failed()) return any{ res };
            return any{ std::move(obj), res };
        }
        case value_kind::invalid:
            break;
        }
        r.report_error(Error::code::unexpected_value_kind, "parse_any: unexpected value kind");
        return any{ res };
    }
#pragma endregion

} // namespace Stanza
