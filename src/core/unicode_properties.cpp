#include "puaa/unicode_properties.hpp"

namespace puaa {

namespace {

template<typename Enum, size_t N>
std::optional<Enum> find_name(const std::string_view (&names)[N], std::string_view s) noexcept {
    for (size_t i = 0; i < N; ++i) {
        if (names[i] == s) {
            return static_cast<Enum>(i);
        }
    }
    return std::nullopt;
}

} // namespace

std::string_view UnicodeProperties::name(GeneralCategory gc) noexcept {
    return is_valid(gc) ? general_category_names[static_cast<size_t>(gc)] : std::string_view{};
}

std::string_view UnicodeProperties::name(BidiClass bc) noexcept {
    return is_valid(bc) ? bidi_class_names[static_cast<size_t>(bc)] : std::string_view{};
}

std::string_view UnicodeProperties::name(AliasType type) noexcept {
    return is_valid(type) ? alias_type_names[static_cast<size_t>(type)] : std::string_view{};
}

std::optional<GeneralCategory> UnicodeProperties::parse_general_category(std::string_view s) noexcept {
    return find_name<GeneralCategory>(general_category_names, s);
}

std::optional<BidiClass> UnicodeProperties::parse_bidi_class(std::string_view s) noexcept {
    return find_name<BidiClass>(bidi_class_names, s);
}

std::optional<AliasType> UnicodeProperties::parse_alias_type(std::string_view s) noexcept {
    return find_name<AliasType>(alias_type_names, s);
}

} // namespace puaa
