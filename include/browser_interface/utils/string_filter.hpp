#pragma once

#include <string>
#include <string_view>

namespace browser_interface::utils {

// Characters that must never reach a launch command line
class ForbiddenCharacters {
public:
    ForbiddenCharacters() = default;
    explicit ForbiddenCharacters(std::string characters);

    [[nodiscard]] bool contains(char c) const;
    [[nodiscard]] const std::string& characters() const { return m_characters; }
    [[nodiscard]] bool empty() const { return m_characters.empty(); }

    static ForbiddenCharacters windows();
    static ForbiddenCharacters posix();
    static ForbiddenCharacters macos();

private:
    std::string m_characters;
};

// Removes every forbidden character; nothing is escaped
std::string filter(std::string_view text, const ForbiddenCharacters& forbidden);

bool contains_forbidden(std::string_view text, const ForbiddenCharacters& forbidden);

} // namespace browser_interface::utils
