#include "puaa/ucd/parser.hpp"

#include <algorithm>
#include <charconv>
#include <vector>

#include "puaa/error.hpp"
#include "puaa/logging.hpp"
#include "puaa/util/file_io.hpp"
#include "puaa/util/utf8.hpp"

namespace fs = std::filesystem;

namespace puaa::ucd {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

std::string_view trim(std::string_view s) {
    size_t b = 0;
    while (b < s.size() && is_space(s[b])) ++b;
    size_t e = s.size();
    while (e > b && is_space(s[e - 1])) --e;
    return s.substr(b, e - b);
}

// Split on sep, trimming every field
std::vector<std::string_view> split(std::string_view s, char sep) {
    std::vector<std::string_view> out;
    size_t start = 0;
    for (;;) {
        size_t pos = s.find(sep, start);
        if (pos == std::string_view::npos) {
            out.push_back(trim(s.substr(start)));
            break;
        }
        out.push_back(trim(s.substr(start, pos - start)));
        start = pos + 1;
    }
    return out;
}

// Split on runs of whitespace
std::vector<std::string_view> tokens(std::string_view s) {
    std::vector<std::string_view> out;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && is_space(s[i])) ++i;
        size_t start = i;
        while (i < s.size() && !is_space(s[i])) ++i;
        if (i > start) {
            out.push_back(s.substr(start, i - start));
        }
    }
    return out;
}

std::optional<uint8_t> parse_combining_class(std::string_view s) {
    unsigned value = 0;
    if (s.empty()) return std::nullopt;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value, 10);
    if (ec != std::errc() || ptr != s.data() + s.size() || value > 255) {
        return std::nullopt;
    }
    return static_cast<uint8_t>(value);
}

// "<Label, First>" -> "Label"
bool range_marker(std::string_view name, std::string_view suffix, std::string& label) {
    if (name.size() <= suffix.size() + 1 || name.front() != '<' || !name.ends_with(suffix)) {
        return false;
    }
    label = std::string(name.substr(1, name.size() - 1 - suffix.size()));
    return true;
}

// Active table of an annotated file
enum class Target {
    None,
    Blocks,
    CharacterData,
    Aliases
};

class SourceParser {
public:
    SourceParser(const std::string& path, FileKind kind) {
        file_.path = path;
        file_.kind = kind;
    }

    SourceFile run(std::string_view text) {
        if (auto bad = util::find_invalid_utf8(text)) {
            line_ = 1 + static_cast<size_t>(std::count(text.begin(), text.begin() + *bad, '\n'));
            fail("invalid UTF-8 sequence at byte offset " + std::to_string(*bad));
        }
        text.remove_prefix(util::bom_length(text));

        if (file_.kind == FileKind::Property) {
            file_.section = PropertySection{fs::path(file_.path).filename().string(), {}};
        }

        size_t pos = 0;
        while (pos < text.size()) {
            size_t nl = text.find('\n', pos);
            std::string_view line = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
            pos = nl == std::string_view::npos ? text.size() : nl + 1;
            ++line_;

            size_t hash = line.find('#');
            if (hash != std::string_view::npos) {
                line = line.substr(0, hash);
            }
            line = trim(line);
            if (line.empty()) continue;

            switch (file_.kind) {
                case FileKind::Blocks:      block_line(line); break;
                case FileKind::UnicodeData: character_line(line); break;
                case FileKind::NameAliases: alias_line(line); break;
                case FileKind::Property:    property_line(line); break;
                case FileKind::Annotated:
                    if (line.front() == '@') {
                        directive(line);
                    } else {
                        annotated_line(line);
                    }
                    break;
            }
        }
        close_character_data();

        LOG_DEBUG("Parsed ", file_.path, " (", file_kind_name(file_.kind), "): ",
                  file_.blocks.size(), " blocks, ", file_.characters.size(), " characters, ",
                  file_.aliases.size(), " aliases",
                  file_.section ? ", " + std::to_string(file_.section->records.size()) + " property records" : "");
        return std::move(file_);
    }

private:
    [[noreturn]] void fail(const std::string& message) const {
        throw MalformedSourceError(message, file_.path, line_);
    }

    SourceLocation here() const { return {file_.path, line_}; }

    CodepointRange range_field(std::string_view text) const {
        auto range = parse_range(text);
        if (!range) {
            fail("invalid codepoint or range '" + std::string(text) + "'");
        }
        return *range;
    }

    uint32_t codepoint_field(std::string_view text) const {
        auto cp = parse_codepoint(text);
        if (!cp) {
            fail("invalid codepoint '" + std::string(text) + "'");
        }
        return *cp;
    }

    // =========================================================================
    // Annotated files
    // =========================================================================

    void directive(std::string_view line) {
        auto words = tokens(line);
        const std::string_view name = words[0];

        if (name == "@flag" || name == "@substring") {
            if (words.size() != 2) {
                fail(std::string(name) + " takes exactly one argument");
            }
            auto& list = name == "@flag" ? file_.flags : file_.substrings;
            list.emplace_back(words[1]);
        } else if (name == "@file") {
            if (words.size() != 2) {
                fail("@file takes exactly one argument");
            }
            close_character_data();
            if (words[1] == "Blocks.txt") {
                target_ = Target::Blocks;
            } else if (words[1] == "UnicodeData.txt") {
                target_ = Target::CharacterData;
            } else if (words[1] == "NameAliases.txt") {
                target_ = Target::Aliases;
            } else {
                fail("unknown @file target '" + std::string(words[1]) + "'");
            }
        } else {
            fail("unknown directive '" + std::string(name) + "'");
        }
    }

    void annotated_line(std::string_view line) {
        switch (target_) {
            case Target::None:
                fail("data line before any @file directive");
            case Target::Blocks:
                block_line(line);
                break;
            case Target::CharacterData:
                character_line(line);
                break;
            case Target::Aliases:
                alias_line(line);
                break;
        }
    }

    // =========================================================================
    // Grammars
    // =========================================================================

    void block_line(std::string_view line) {
        auto f = split(line, ';');
        if (f.size() != 2) {
            fail("expected 'START..END; Name', found " + std::to_string(f.size()) + " fields");
        }
        Block block;
        block.range = range_field(f[0]);
        if (f[1].empty()) {
            fail("empty block name");
        }
        block.name = std::string(f[1]);
        block.origin = here();
        file_.blocks.push_back(std::move(block));
    }

    void character_line(std::string_view line) {
        auto f = split(line, ';');
        if (f.size() != 15) {
            fail("expected 15 fields, found " + std::to_string(f.size()));
        }

        CharacterRecord rec;
        rec.origin = here();
        uint32_t cp = codepoint_field(f[0]);
        rec.codepoints = CodepointRange::single(cp);

        if (f[1].empty()) {
            fail("empty character name");
        }
        rec.name = std::string(f[1]);

        auto gc = UnicodeProperties::parse_general_category(f[2]);
        if (!gc) {
            fail("unknown general category '" + std::string(f[2]) + "'");
        }
        rec.general_category = *gc;

        auto ccc = parse_combining_class(f[3]);
        if (!ccc) {
            fail("invalid canonical combining class '" + std::string(f[3]) + "'");
        }
        rec.canonical_combining_class = *ccc;

        auto bidi = UnicodeProperties::parse_bidi_class(f[4]);
        if (!bidi) {
            fail("unknown bidi class '" + std::string(f[4]) + "'");
        }
        rec.bidi_class = *bidi;

        if (!f[5].empty()) {
            rec.decomposition = decomposition_field(f[5]);
        }

        if (!f[6].empty() || !f[7].empty() || !f[8].empty()) {
            rec.numeric_values = NumericValues{std::string(f[6]), std::string(f[7]), std::string(f[8])};
        }

        if (f[9] == "Y") {
            rec.bidi_mirrored = true;
        } else if (f[9] != "N") {
            fail("bidi mirrored must be Y or N, found '" + std::string(f[9]) + "'");
        }

        if (!f[10].empty()) rec.unicode1_name = std::string(f[10]);
        if (!f[11].empty()) rec.iso_comment = std::string(f[11]);
        if (!f[12].empty()) rec.simple_uppercase = codepoint_field(f[12]);
        if (!f[13].empty()) rec.simple_lowercase = codepoint_field(f[13]);
        if (!f[14].empty()) rec.simple_titlecase = codepoint_field(f[14]);

        fold_range(std::move(rec));
    }

    Decomposition decomposition_field(std::string_view text) const {
        Decomposition d;
        if (text.front() == '<') {
            size_t close = text.find('>');
            if (close == std::string_view::npos) {
                fail("unterminated decomposition tag in '" + std::string(text) + "'");
            }
            d.tag = std::string(text.substr(0, close + 1));
            text = text.substr(close + 1);
        }
        for (std::string_view word : tokens(text)) {
            d.mapping.push_back(codepoint_field(word));
        }
        if (d.mapping.empty()) {
            fail("decomposition has no mapping");
        }
        return d;
    }

    // First/Last lines must be adjacent and agree on every field but the name
    void fold_range(CharacterRecord rec) {
        std::string label;
        if (range_marker(rec.name, ", First>", label)) {
            if (pending_first_) {
                fail("<" + pending_label_ + ", First> is not followed by its Last line");
            }
            pending_first_ = std::move(rec);
            pending_label_ = std::move(label);
            pending_line_ = line_;
            return;
        }

        if (range_marker(rec.name, ", Last>", label)) {
            if (!pending_first_) {
                fail("<" + label + ", Last> without a preceding First line");
            }
            if (label != pending_label_) {
                fail("range label mismatch: <" + pending_label_ + ", First> closed by <" + label + ", Last>");
            }
            if (rec.codepoints.start < pending_first_->codepoints.start) {
                fail("<" + label + ", Last> " + format_codepoint(rec.codepoints.start) +
                     " precedes its First " + format_codepoint(pending_first_->codepoints.start));
            }
            rec.name = pending_first_->name;
            if (!rec.same_fields(*pending_first_)) {
                fail("<" + label + ", First> and <" + label + ", Last> have different properties");
            }

            CharacterRecord folded = std::move(*pending_first_);
            pending_first_.reset();
            folded.codepoints.end = rec.codepoints.start;
            folded.name = "<" + label + ">";
            file_.characters.push_back(std::move(folded));
            return;
        }

        if (pending_first_) {
            fail("<" + pending_label_ + ", First> is not followed by its Last line");
        }
        file_.characters.push_back(std::move(rec));
    }

    void close_character_data() {
        if (pending_first_) {
            throw MalformedSourceError("<" + pending_label_ + ", First> has no matching Last line",
                                       file_.path, pending_line_);
        }
    }

    void alias_line(std::string_view line) {
        auto f = split(line, ';');
        if (f.size() != 3) {
            fail("expected 'CODEPOINT; Alias; Type', found " + std::to_string(f.size()) + " fields");
        }
        NameAlias alias;
        alias.codepoint = codepoint_field(f[0]);
        if (f[1].empty()) {
            fail("empty alias");
        }
        alias.alias = std::string(f[1]);
        auto type = UnicodeProperties::parse_alias_type(f[2]);
        if (!type) {
            fail("unknown alias type '" + std::string(f[2]) + "'");
        }
        alias.type = *type;
        alias.origin = here();
        file_.aliases.push_back(std::move(alias));
    }

    void property_line(std::string_view line) {
        PropertyRecord rec;
        rec.origin = here();

        if (line.starts_with("U+") && line.find('\t') != std::string_view::npos) {
            // Unihan: U+XXXX <TAB> kProperty <TAB> value
            auto f = split(line, '\t');
            if (f.size() != 3 || f[1].empty()) {
                fail("expected 'U+XXXX<TAB>kProperty<TAB>value'");
            }
            rec.range = CodepointRange::single(codepoint_field(f[0].substr(2)));
            rec.fields = {std::string(f[1]), std::string(f[2])};
        } else {
            auto f = split(line, ';');
            if (f.size() < 2) {
                fail("expected 'CODEPOINT; field; ...'");
            }
            rec.range = range_field(f[0]);
            for (size_t i = 1; i < f.size(); ++i) {
                rec.fields.emplace_back(f[i]);
            }
        }

        file_.section->records.push_back(std::move(rec));
    }

    SourceFile file_;
    size_t line_ = 0;
    Target target_ = Target::None;
    std::optional<CharacterRecord> pending_first_;
    std::string pending_label_;
    size_t pending_line_ = 0;
};

} // namespace

std::optional<uint32_t> parse_codepoint(std::string_view hex) {
    if (hex.empty() || hex.size() > 8) {
        return std::nullopt;
    }
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), value, 16);
    if (ec != std::errc() || ptr != hex.data() + hex.size() || value > MAX_CODEPOINT) {
        return std::nullopt;
    }
    return value;
}

std::optional<CodepointRange> parse_range(std::string_view text) {
    size_t dots = text.find("..");
    if (dots == std::string_view::npos) {
        auto cp = parse_codepoint(text);
        if (!cp) return std::nullopt;
        return CodepointRange::single(*cp);
    }
    auto start = parse_codepoint(text.substr(0, dots));
    auto end = parse_codepoint(text.substr(dots + 2));
    if (!start || !end || *end < *start) {
        return std::nullopt;
    }
    return CodepointRange{*start, *end};
}

SourceFile parse_text(std::string_view text, const std::string& path, FileKind kind) {
    SourceParser parser(path, kind);
    return parser.run(text);
}

SourceFile parse_file(const fs::path& path, FileKind kind) {
    std::string text = util::read_text_file(path);
    return parse_text(text, path.string(), kind);
}

SourceFile parse_file(const fs::path& path) {
    return parse_file(path, file_kind_for_name(path.filename().string()));
}

} // namespace puaa::ucd
