#include "browser_interface/services/query_parameters.hpp"

#include <array>
#include <charconv>

namespace browser_interface {
namespace services {

namespace {
    struct TextVisitor {
        std::string operator()(const std::string& value) const { return value; }

        std::string operator()(std::int64_t value) const { return std::to_string(value); }

        std::string operator()(std::uint64_t value) const { return std::to_string(value); }

        std::string operator()(double value) const {
            std::array<char, 64> buffer{};
            auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
            if (ec != std::errc{}) {
                return std::to_string(value);
            }
            return std::string(buffer.data(), ptr);
        }

        std::string operator()(bool value) const { return value ? "true" : "false"; }
    };
}

std::string QueryValue::to_text() const {
    return std::visit(TextVisitor{}, m_value);
}

} // namespace services
} // namespace browser_interface
