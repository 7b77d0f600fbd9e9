#include "browser_interface/utils/string_filter.hpp"

#include <algorithm>
#include <iterator>

namespace browser_interface::utils {

namespace {
    using namespace std::string_view_literals;

    // cmd.exe metacharacters
    constexpr std::string_view WINDOWS_FORBIDDEN = "\0\n\r&|^<>\""sv;
    // POSIX sh metacharacters that survive inside a url
    constexpr std::string_view POSIX_FORBIDDEN = "\0\n\r&|;\\`$<>\"'"sv;
    // zsh treats ^ as a glob operator
    constexpr std::string_view MACOS_EXTRA = "^"sv;
}

ForbiddenCharacters::ForbiddenCharacters(std::string characters)
    : m_characters(std::move(characters)) {}

bool ForbiddenCharacters::contains(char c) const {
    return m_characters.find(c) != std::string::npos;
}

ForbiddenCharacters ForbiddenCharacters::windows() {
    return ForbiddenCharacters(std::string(WINDOWS_FORBIDDEN));
}

ForbiddenCharacters ForbiddenCharacters::posix() {
    return ForbiddenCharacters(std::string(POSIX_FORBIDDEN));
}

ForbiddenCharacters ForbiddenCharacters::macos() {
    return ForbiddenCharacters(std::string(POSIX_FORBIDDEN) + std::string(MACOS_EXTRA));
}

std::string filter(std::string_view text, const ForbiddenCharacters& forbidden) {
    std::string result;
    result.reserve(text.size());
    std::copy_if(text.begin(), text.end(), std::back_inserter(result),
                 [&forbidden](char c) { return !forbidden.contains(c); });
    return result;
}

bool contains_forbidden(std::string_view text, const ForbiddenCharacters& forbidden) {
    return std::any_of(text.begin(), text.end(),
                       [&forbidden](char c) { return forbidden.contains(c); });
}

} // namespace browser_interface::utils
