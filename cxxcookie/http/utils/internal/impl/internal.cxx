#include <cxxcookie.hxx>

namespace cxxcookie::http::internal {
    namespace {
        // views into buffer dangle once it is edited or reallocated
        CXXCOOKIE_INLINE bool points_into(const std::string& buffer, const std::string_view& bytes) {
            if (bytes.empty() || buffer.empty())
                return false;

            const std::less<const char*> less{};

            return !less(bytes.data(), buffer.data()) && less(bytes.data(), buffer.data() + buffer.size());
        }
    }

    void slice_index_t::reset(std::string& buffer, const std::string_view& name, const std::string_view& value) {
        std::string pair{};

        pair.reserve(name.size() + 1u + value.size());

        pair.append(name);
        pair.push_back('=');
        pair.append(value);

        buffer = std::move(pair);

        m_entries.clear();

        const slice_t name_slice{0u, name.size()};
        const slice_t value_slice{name.size() + 1u, value.size()};

        m_entries.push_back({e_field::name, name_slice, name_slice});
        m_entries.push_back({e_field::value, {name.size(), value.size() + 1u}, value_slice});
    }

    std::optional<slice_t> slice_index_t::get(const e_field& field) const {
        const auto it = find(field);

        if (it == m_entries.end())
            return std::nullopt;

        return it->m_value;
    }

    void slice_index_t::set(std::string& buffer, const e_field& field, const std::string_view& input) {
        const std::string owned = points_into(buffer, input) ? std::string(input) : std::string{};

        const auto bytes = owned.empty() ? input : std::string_view{owned};

        const auto attribute = to_attribute(field);
        const auto flag = attribute.has_value() && is_flag(*attribute);

        if (const auto it = find(field); it != m_entries.end()) {
            if (flag)
                return;

            const auto position = static_cast<std::size_t>(std::distance(m_entries.cbegin(), it));

            auto& entry = m_entries[position];

            const auto delta = static_cast<std::ptrdiff_t>(bytes.size()) - static_cast<std::ptrdiff_t>(entry.m_value.m_length);

            buffer.replace(entry.m_value.m_offset, entry.m_value.m_length, bytes);

            entry.m_value.m_length = bytes.size();
            entry.m_segment.m_length = static_cast<std::size_t>(static_cast<std::ptrdiff_t>(entry.m_segment.m_length) + delta);

            shift(position, delta);

            return;
        }

        // name and value are created by reset() and never erased
        if (!attribute.has_value())
            throw exceptions::invalid_operation_t(fmt::format("Field {} is missing from the index", static_cast<std::int16_t>(field)));

        const auto key = attribute_to_str(*attribute);

        entry_t entry{field, {buffer.size(), 0u}, {}};

        buffer.append("; ");
        buffer.append(key);

        if (!flag) {
            buffer.push_back('=');

            entry.m_value = {buffer.size(), bytes.size()};

            buffer.append(bytes);
        }
        else
            entry.m_value = {buffer.size(), 0u};

        entry.m_segment.m_length = buffer.size() - entry.m_segment.m_offset;

        m_entries.push_back(entry);
    }

    bool slice_index_t::remove(std::string& buffer, const e_field& field) {
        if (field == e_field::name || field == e_field::value)
            throw exceptions::invalid_operation_t(
                fmt::format("Cannot remove mandatory field '{}'", field == e_field::name ? "name" : "value")
            );

        const auto it = find(field);

        if (it == m_entries.end())
            return false;

        const auto position = static_cast<std::size_t>(std::distance(m_entries.cbegin(), it));

        const auto segment = it->m_segment;

        buffer.erase(segment.m_offset, segment.m_length);

        shift(position, -static_cast<std::ptrdiff_t>(segment.m_length));

        m_entries.erase(it);

        return true;
    }

    void slice_index_t::shift(std::size_t position, std::ptrdiff_t delta) {
        if (delta == 0)
            return;

        for (auto i = position + 1u; i < m_entries.size(); i++) {
            auto& entry = m_entries[i];

            entry.m_segment.m_offset = static_cast<std::size_t>(static_cast<std::ptrdiff_t>(entry.m_segment.m_offset) + delta);
            entry.m_value.m_offset = static_cast<std::size_t>(static_cast<std::ptrdiff_t>(entry.m_value.m_offset) + delta);
        }
    }
}
