#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace browser_interface {
namespace services {

// A query key or value before it is turned into text
class QueryValue {
public:
    using Storage = std::variant<std::string, std::int64_t, std::uint64_t, double, bool>;

    QueryValue(std::string value) : m_value(std::move(value)) {}
    QueryValue(const char* value) : m_value(std::string(value)) {}
    QueryValue(std::string_view value) : m_value(std::string(value)) {}
    QueryValue(char value) : m_value(std::string(1, value)) {}
    QueryValue(bool value) : m_value(value) {}
    QueryValue(double value) : m_value(value) {}
    QueryValue(float value) : m_value(static_cast<double>(value)) {}

    template<typename T>
        requires std::is_integral_v<T> && std::is_signed_v<T> && (!std::is_same_v<T, char>)
    QueryValue(T value) : m_value(static_cast<std::int64_t>(value)) {}

    template<typename T>
        requires std::is_integral_v<T> && std::is_unsigned_v<T> && (!std::is_same_v<T, bool>) &&
                 (!std::is_same_v<T, char>)
    QueryValue(T value) : m_value(static_cast<std::uint64_t>(value)) {}

    // Textual representation used in the url
    [[nodiscard]] std::string to_text() const;

private:
    Storage m_value;
};

class QueryParameters {
public:
    using Entry = std::pair<QueryValue, QueryValue>;

    QueryParameters() = default;
    QueryParameters(std::initializer_list<Entry> entries) : m_entries(entries) {}

    QueryParameters& add(QueryValue key, QueryValue value) {
        m_entries.emplace_back(std::move(key), std::move(value));
        return *this;
    }

    [[nodiscard]] bool empty() const { return m_entries.empty(); }
    [[nodiscard]] size_t size() const { return m_entries.size(); }

    [[nodiscard]] auto begin() const { return m_entries.begin(); }
    [[nodiscard]] auto end() const { return m_entries.end(); }

private:
    std::vector<Entry> m_entries;
};

} // namespace services
} // namespace browser_interface
