#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace puaa {

constexpr uint32_t MAX_CODEPOINT = 0x10FFFF;

/**
 * General_Category values (UAX#44 table 12), in the order they are
 * stored in compiled tables. The numeric values are part of the format.
 */
enum class GeneralCategory : uint8_t {
    Lu, Ll, Lt, Lm, Lo,
    Mn, Mc, Me,
    Nd, Nl, No,
    Pc, Pd, Ps, Pe, Pi, Pf, Po,
    Sm, Sc, Sk, So,
    Zs, Zl, Zp,
    Cc, Cf, Cs, Co, Cn
};

constexpr size_t GENERAL_CATEGORY_COUNT = 30;

/**
 * Bidi_Class values (UAX#44 / UAX#9). The numeric values are part of the format.
 */
enum class BidiClass : uint8_t {
    L, R, AL,
    EN, ES, ET, AN, CS, NSM, BN,
    B, S, WS, ON,
    LRE, LRO, RLE, RLO, PDF,
    LRI, RLI, FSI, PDI
};

constexpr size_t BIDI_CLASS_COUNT = 23;

// Alias types of NameAliases.txt
enum class AliasType : uint8_t {
    Correction, Control, Alternate, Figment, Abbreviation
};

constexpr size_t ALIAS_TYPE_COUNT = 5;

/**
 * Name <-> enum conversion for the enumerated properties.
 * Parsing is exact and case-sensitive, like the UCD files themselves.
 */
class UnicodeProperties {
public:
    static std::string_view name(GeneralCategory gc) noexcept;
    static std::string_view name(BidiClass bc) noexcept;
    static std::string_view name(AliasType type) noexcept;

    static std::optional<GeneralCategory> parse_general_category(std::string_view s) noexcept;
    static std::optional<BidiClass> parse_bidi_class(std::string_view s) noexcept;
    static std::optional<AliasType> parse_alias_type(std::string_view s) noexcept;

    static bool is_valid(GeneralCategory gc) noexcept {
        return static_cast<size_t>(gc) < GENERAL_CATEGORY_COUNT;
    }
    static bool is_valid(BidiClass bc) noexcept {
        return static_cast<size_t>(bc) < BIDI_CLASS_COUNT;
    }
    static bool is_valid(AliasType type) noexcept {
        return static_cast<size_t>(type) < ALIAS_TYPE_COUNT;
    }

private:
    static constexpr std::string_view general_category_names[GENERAL_CATEGORY_COUNT] = {
        "Lu", "Ll", "Lt", "Lm", "Lo",
        "Mn", "Mc", "Me",
        "Nd", "Nl", "No",
        "Pc", "Pd", "Ps", "Pe", "Pi", "Pf", "Po",
        "Sm", "Sc", "Sk", "So",
        "Zs", "Zl", "Zp",
        "Cc", "Cf", "Cs", "Co", "Cn",
    };

    static constexpr std::string_view bidi_class_names[BIDI_CLASS_COUNT] = {
        "L", "R", "AL",
        "EN", "ES", "ET", "AN", "CS", "NSM", "BN",
        "B", "S", "WS", "ON",
        "LRE", "LRO", "RLE", "RLO", "PDF",
        "LRI", "RLI", "FSI", "PDI",
    };

    static constexpr std::string_view alias_type_names[ALIAS_TYPE_COUNT] = {
        "correction", "control", "alternate", "figment", "abbreviation",
    };
};

} // namespace puaa
