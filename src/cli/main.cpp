// =============================================================================
// puaa CLI - Unicode character property table compiler
// =============================================================================
//
// Usage:
//   puaa <command> [options]
//
// Commands:
//   compile     Compile UCD text files into a binary property table
//   build       Compile full/min/names tables for every version under a root
//   lookup      Look up codepoints in a table or font
//   decompile   Write a table back out as UCD text files
//   embed       Insert a table into an sfnt font
//   copy        Copy the table from one sfnt font into another
//   strip       Remove the table from an sfnt font
//   validate    Check a table for consistency
//   version     Show version information
//
// Examples:
//   puaa compile -o full-15.1.0.ucd -d ucd/15.1.0
//   puaa compile -o private.ucd -p names -d ucd/15.1.0 -a pua/ --flag conscript
//   puaa build -d ucd -l names-latest.ucd
//   puaa lookup -i private.ucd U+FAB00
//   puaa lookup -i full-15.1.0.ucd -p scripts 4E00
//   puaa embed -i Font.ttf -t private.ucd -o Font-puaa.ttf
//   puaa copy -s Font-puaa.ttf -i Other.ttf
//
// =============================================================================

#include <cctype>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "puaa/build_driver.hpp"
#include "puaa/codec/decoder.hpp"
#include "puaa/compiler.hpp"
#include "puaa/config.hpp"
#include "puaa/error.hpp"
#include "puaa/exporter.hpp"
#include "puaa/logging.hpp"
#include "puaa/sfnt/embedder.hpp"
#include "puaa/ucd/parser.hpp"
#include "puaa/util/utf8.hpp"

namespace fs = std::filesystem;

namespace puaa::cli {
    int cmd_compile(int argc, char* argv[]);
    int cmd_build(int argc, char* argv[]);
    int cmd_lookup(int argc, char* argv[]);
    int cmd_decompile(int argc, char* argv[]);
    int cmd_embed(int argc, char* argv[]);
    int cmd_copy(int argc, char* argv[]);
    int cmd_strip(int argc, char* argv[]);
    int cmd_validate(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define PUAA_VERSION_MAJOR 1
#define PUAA_VERSION_MINOR 0
#define PUAA_VERSION_PATCH 0
#define PUAA_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"compile",   "Compile UCD text files into a binary property table", puaa::cli::cmd_compile},
    {"build",     "Compile full/min/names tables for every version under a root", puaa::cli::cmd_build},
    {"lookup",    "Look up codepoints in a table or font", puaa::cli::cmd_lookup},
    {"decompile", "Write a table back out as UCD text files", puaa::cli::cmd_decompile},
    {"embed",     "Insert a table into an sfnt font", puaa::cli::cmd_embed},
    {"copy",      "Copy the table from one sfnt font into another", puaa::cli::cmd_copy},
    {"strip",     "Remove the table from an sfnt font", puaa::cli::cmd_strip},
    {"validate",  "Check a table for consistency", puaa::cli::cmd_validate},
    {"version",   "Show version information", puaa::cli::cmd_version},
    {"help",      "Show this help message", puaa::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file;
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;

namespace puaa::cli {

namespace {

// Runs a command body and turns library errors into an exit status
template<typename Body>
int run_command(const char* name, Body&& body) {
    try {
        return body();
    } catch (const PuaaException& e) {
        LOG_ERROR(name, " failed: ", e.what());
        return 1;
    } catch (const fs::filesystem_error& e) {
        LOG_ERROR(name, " failed: ", e.what());
        return 1;
    }
}

bool is_hex(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// "FAB00", "U+FAB00" or a single literal character. A one-character
// argument is always taken literally, so "A" is U+0041.
std::optional<uint32_t> parse_codepoint_argument(const std::string& arg) {
    if (arg.size() > 2 && (arg.compare(0, 2, "U+") == 0 || arg.compare(0, 2, "u+") == 0)) {
        return ucd::parse_codepoint(std::string_view(arg).substr(2));
    }
    if (!util::find_invalid_utf8(arg)) {
        std::vector<uint32_t> cps = util::decode_utf8(arg);
        if (cps.size() == 1) {
            return cps[0];
        }
    }
    if (is_hex(arg)) {
        return ucd::parse_codepoint(arg);
    }
    return std::nullopt;
}

void print_lookup(uint32_t cp, const LookupResult& result) {
    std::cout << "U+" << format_codepoint(cp) << "\n";
    if (result.empty()) {
        std::cout << "  (no data)\n";
        return;
    }
    if (result.block) {
        std::cout << "  Block:      " << result.block->name << " (" << format_range(result.block->range) << ")\n";
    }
    if (result.character) {
        const CharacterRecord& c = *result.character;
        std::cout << "  Name:       " << c.name;
        if (c.codepoints.size() > 1) std::cout << " (" << format_range(c.codepoints) << ")";
        std::cout << "\n";
        std::cout << "  Category:   " << UnicodeProperties::name(c.general_category) << "\n";
        std::cout << "  Combining:  " << static_cast<unsigned>(c.canonical_combining_class) << "\n";
        std::cout << "  Bidi:       " << UnicodeProperties::name(c.bidi_class)
                  << (c.bidi_mirrored ? " (mirrored)" : "") << "\n";
        if (c.decomposition) {
            std::cout << "  Decomp:     " << c.decomposition->tag;
            for (uint32_t m : c.decomposition->mapping) std::cout << " " << format_codepoint(m);
            std::cout << "\n";
        }
        if (c.numeric_values) {
            std::cout << "  Numeric:    " << c.numeric_values->decimal << ";" << c.numeric_values->digit
                      << ";" << c.numeric_values->numeric << "\n";
        }
        if (c.unicode1_name) std::cout << "  Unicode 1:  " << *c.unicode1_name << "\n";
        if (c.iso_comment) std::cout << "  Comment:    " << *c.iso_comment << "\n";
        if (c.simple_uppercase) std::cout << "  Uppercase:  " << format_codepoint(*c.simple_uppercase) << "\n";
        if (c.simple_lowercase) std::cout << "  Lowercase:  " << format_codepoint(*c.simple_lowercase) << "\n";
        if (c.simple_titlecase) std::cout << "  Titlecase:  " << format_codepoint(*c.simple_titlecase) << "\n";
    }
    for (const NameAlias& alias : result.aliases) {
        std::cout << "  Alias:      " << alias.alias << " (" << UnicodeProperties::name(alias.type) << ")\n";
    }
    for (const PropertyMatch& match : result.properties) {
        std::cout << "  " << match.section << ":";
        for (const auto& field : match.fields) std::cout << " " << field;
        std::cout << "\n";
    }
}

// Only the selected property sections; nothing else about the codepoint
void print_properties(uint32_t cp, const LookupResult& result, const std::vector<std::string>& properties) {
    std::cout << "U+" << format_codepoint(cp) << "\n";
    for (const PropertyMatch& match : result.properties) {
        bool selected = false;
        for (const auto& name : properties) {
            selected = selected || codec::section_matches(match.section, name);
        }
        if (!selected) continue;
        std::cout << "  " << match.section << ":";
        for (const auto& field : match.fields) std::cout << " " << field;
        std::cout << "\n";
    }
}

// Every segment of one property section
void print_section(const codec::TableReader& reader, size_t section) {
    std::cout << reader.section_name(section) << ":\n";
    for (const codec::Segment& segment : reader.segments(section)) {
        for (const auto& row : segment.rows) {
            std::cout << "  " << format_range(segment.range) << ":";
            for (const auto& field : row) std::cout << " " << field;
            std::cout << "\n";
        }
    }
}

} // namespace

// =============================================================================
// Help Command
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "puaa - Unicode character property table compiler\n";
    std::cout << "Version " << PUAA_VERSION_STRING << "\n\n";
    std::cout << "Usage: puaa <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Only log errors\n";
    std::cout << "  --config <file>         key=value configuration file\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  PUAA_LOG_LEVEL          debug, info, warn, error (default: info)\n";
    std::cout << "  PUAA_LOG_FILE           Append log output to this file\n";
    std::cout << "  PUAA_THREADS            Build driver threads (default: 0 = all cores)\n";
    std::cout << "  PUAA_TABLE_TAG          sfnt table tag (default: PUAA)\n";
    std::cout << "\nExamples:\n";
    std::cout << "  puaa compile -o full.ucd -d ucd/15.1.0\n";
    std::cout << "  puaa compile -o pua.ucd -p names -d ucd/15.1.0 -a pua/ --flag conscript\n";
    std::cout << "  puaa build -d ucd -l names-latest.ucd\n";
    std::cout << "  puaa lookup -i pua.ucd U+FAB00\n";
    std::cout << "  puaa embed -i Font.ttf -t pua.ucd -o Font-puaa.ttf\n";
    std::cout << "  puaa copy -s Font-puaa.ttf -i Other.ttf\n";

    return 0;
}

// =============================================================================
// Version Command
// =============================================================================

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "puaa " << PUAA_VERSION_STRING << "\n";
    std::cout << "Table format: " << codec::FORMAT_VERSION << "\n";
    std::cout << "sfnt tag: " << Config::getInstance().get<std::string>("sfnt.table_tag", "PUAA") << "\n";
    return 0;
}

// =============================================================================
// Compile Command
// =============================================================================

int cmd_compile(int argc, char* argv[]) {
    std::string output;
    std::string profile_arg = "full";
    std::vector<ucd::SourceSpec> sources;
    std::vector<std::string> flags;
    std::vector<std::string> substrings;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            output = argv[++i];
        } else if ((arg == "-p" || arg == "--profile") && i + 1 < argc) {
            profile_arg = argv[++i];
        } else if ((arg == "-d" || arg == "--source") && i + 1 < argc) {
            fs::path path = argv[++i];
            sources.push_back(fs::is_directory(path) ? ucd::SourceSpec::directory(path)
                                                     : ucd::SourceSpec::file(path));
        } else if ((arg == "-a" || arg == "--annotated") && i + 1 < argc) {
            sources.push_back(ucd::SourceSpec::annotated(argv[++i]));
        } else if (arg == "--flag" && i + 1 < argc) {
            flags.push_back(argv[++i]);
        } else if (arg == "--substring" && i + 1 < argc) {
            substrings.push_back(argv[++i]);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }

    auto profile = parse_profile(profile_arg);
    if (output.empty() || sources.empty() || !profile) {
        std::cerr << "Usage: puaa compile -o <output> [-p full|min|names] -d <path>... [-a <path>...]\n";
        std::cerr << "Options:\n";
        std::cerr << "  -o, --output <file>     Output table\n";
        std::cerr << "  -p, --profile <name>    full, min or names (default: full)\n";
        std::cerr << "  -d, --source <path>     UCD directory or single file; later sources override\n";
        std::cerr << "  -a, --annotated <path>  Annotated file, or directory of them\n";
        std::cerr << "  --flag <flag>           Select annotated files by @flag\n";
        std::cerr << "  --substring <text>      Select annotated files by @substring\n";
        return 1;
    }

    // Selection applies to every annotated source
    for (auto& spec : sources) {
        if (spec.type == ucd::SourceSpec::Type::Annotated) {
            spec.flags = flags;
            spec.substrings = substrings;
        }
    }

    return run_command("compile", [&] {
        CompileResult result = Compiler::compile(output, *profile, sources);
        if (!g_options.quiet) {
            std::cout << output << ": " << result.blocks << " blocks, " << result.characters << " characters, "
                      << result.aliases << " aliases, " << result.sections << " property sections, "
                      << result.bytes << " bytes\n";
        }
        return 0;
    });
}

// =============================================================================
// Build Command
// =============================================================================

int cmd_build(int argc, char* argv[]) {
    std::string root;
    std::optional<fs::path> latest;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-d" || arg == "--root") && i + 1 < argc) {
            root = argv[++i];
        } else if ((arg == "-l" || arg == "--latest") && i + 1 < argc) {
            latest = fs::path(argv[++i]);
        } else if (arg[0] != '-' && root.empty()) {
            root = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }

    if (root.empty()) {
        std::cerr << "Usage: puaa build -d <ucd_root> [-l <latest_output>]\n";
        return 1;
    }

    return run_command("build", [&] {
        BuildReport report = BuildDriver::from_config().run(root, latest);
        if (!g_options.quiet) {
            std::cout << report.built.size() << " built, " << report.skipped.size() << " up to date, "
                      << report.failed.size() << " failed\n";
        }
        for (const auto& [path, message] : report.failed) {
            std::cerr << "FAILED " << path.string() << ": " << message << "\n";
        }
        return report.ok() ? 0 : 1;
    });
}

// =============================================================================
// Lookup Command
// =============================================================================

int cmd_lookup(int argc, char* argv[]) {
    std::string input;
    std::vector<std::string> properties;
    std::vector<std::string> codepoints;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-i" || arg == "--input") && i + 1 < argc) {
            input = argv[++i];
        } else if ((arg == "-p" || arg == "--property") && i + 1 < argc) {
            properties.push_back(argv[++i]);
        } else if ((arg == "-c" || arg == "--codepoint") && i + 1 < argc) {
            codepoints.push_back(argv[++i]);
        } else {
            codepoints.push_back(arg);
        }
    }

    if (input.empty()) {
        std::cerr << "Usage: puaa lookup -i <table_or_font> [-p <property>...] [<codepoint>...]\n";
        std::cerr << "Codepoints are hex (FAB00), U+FAB00, or a single literal character.\n";
        std::cerr << "Options:\n";
        std::cerr << "  -p, --property <name>   Only show this property section (e.g. Scripts.txt or scripts)\n";
        std::cerr << "Without codepoints, -p prints the whole section and no -p lists the sections.\n";
        return 1;
    }

    return run_command("lookup", [&] {
        codec::TableReader reader = codec::TableReader::open(input);

        std::vector<size_t> selected = reader.find_sections(properties);
        for (const auto& name : properties) {
            bool found = false;
            for (size_t s : selected) {
                found = found || codec::section_matches(reader.section_name(s), name);
            }
            if (!found) {
                LOG_WARN("No property section named '", name, "' in ", input);
            }
        }

        if (codepoints.empty()) {
            if (properties.empty()) {
                std::cout << "Properties:\n";
                for (const auto& name : reader.section_names()) {
                    std::cout << "  " << name << "\n";
                }
            } else {
                for (size_t s : selected) {
                    print_section(reader, s);
                }
            }
            return 0;
        }

        int status = 0;
        for (const auto& arg : codepoints) {
            auto cp = parse_codepoint_argument(arg);
            if (!cp) {
                LOG_ERROR("Not a codepoint: '", arg, "'");
                status = 1;
                continue;
            }
            if (properties.empty()) {
                print_lookup(*cp, reader.lookup(*cp));
            } else {
                print_properties(*cp, reader.lookup(*cp), properties);
            }
        }
        return status;
    });
}

// =============================================================================
// Decompile Command
// =============================================================================

int cmd_decompile(int argc, char* argv[]) {
    std::string input;
    std::string output;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-i" || arg == "--input") && i + 1 < argc) {
            input = argv[++i];
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            output = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }

    if (input.empty() || output.empty()) {
        std::cerr << "Usage: puaa decompile -i <table_or_font> -o <directory>\n";
        return 1;
    }

    return run_command("decompile", [&] {
        codec::TableReader reader = codec::TableReader::open(input);
        auto files = Exporter::decompile(reader, output);
        if (!g_options.quiet) {
            for (const auto& file : files) {
                std::cout << file.string() << "\n";
            }
        }
        return 0;
    });
}

// =============================================================================
// Embed / Copy / Strip Commands
// =============================================================================

int cmd_embed(int argc, char* argv[]) {
    std::string font_in;
    std::string table;
    std::string font_out;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-i" || arg == "--input") && i + 1 < argc) {
            font_in = argv[++i];
        } else if ((arg == "-t" || arg == "--table") && i + 1 < argc) {
            table = argv[++i];
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            font_out = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }

    if (font_in.empty() || table.empty()) {
        std::cerr << "Usage: puaa embed -i <font> -t <table> [-o <font_out>]\n";
        std::cerr << "Without -o the font is rewritten in place.\n";
        return 1;
    }
    if (font_out.empty()) font_out = font_in;

    return run_command("embed", [&] {
        sfnt::embed(font_in, table, font_out, sfnt::EmbedOptions::from_config());
        return 0;
    });
}

int cmd_copy(int argc, char* argv[]) {
    std::string source;
    std::string font_in;
    std::string font_out;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-s" || arg == "--source") && i + 1 < argc) {
            source = argv[++i];
        } else if ((arg == "-i" || arg == "--input") && i + 1 < argc) {
            font_in = argv[++i];
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            font_out = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }

    if (source.empty() || font_in.empty()) {
        std::cerr << "Usage: puaa copy -s <source_font> -i <font> [-o <font_out>]\n";
        std::cerr << "Without -o the font is rewritten in place.\n";
        return 1;
    }
    if (font_out.empty()) font_out = font_in;

    return run_command("copy", [&] {
        sfnt::copy(source, font_in, font_out, sfnt::EmbedOptions::from_config());
        return 0;
    });
}

int cmd_strip(int argc, char* argv[]) {
    std::string font_in;
    std::string font_out;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-i" || arg == "--input") && i + 1 < argc) {
            font_in = argv[++i];
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            font_out = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }

    if (font_in.empty()) {
        std::cerr << "Usage: puaa strip -i <font> [-o <font_out>]\n";
        return 1;
    }
    if (font_out.empty()) font_out = font_in;

    return run_command("strip", [&] {
        sfnt::strip(font_in, font_out, sfnt::EmbedOptions::from_config());
        return 0;
    });
}

// =============================================================================
// Validate Command
// =============================================================================

int cmd_validate(int argc, char* argv[]) {
    std::string input;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-i" || arg == "--input") && i + 1 < argc) {
            input = argv[++i];
        } else if (arg[0] != '-' && input.empty()) {
            input = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }

    if (input.empty()) {
        std::cerr << "Usage: puaa validate -i <table_or_font>\n";
        return 1;
    }

    return run_command("validate", [&] {
        codec::TableReader reader = codec::TableReader::open(input);
        reader.validate();
        if (!g_options.quiet) {
            std::cout << input << ": OK (" << profile_name(reader.profile()) << " profile, format "
                      << reader.version() << ", " << reader.blocks().size() << " blocks, "
                      << reader.characters().size() << " characters, " << reader.aliases().size()
                      << " aliased codepoints, " << reader.section_count() << " property sections)\n";
        }
        return 0;
    });
}

} // namespace puaa::cli

// =============================================================================
// Main Entry Point
// =============================================================================

static void parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else {
            // First non-option is the command
            break;
        }
        ++i;
    }

    // Shift argv to point to command
    argc -= i;
    argv += i;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (!puaa::init_config(g_options.config_file)) {
        return 1;
    }
    // Command-line verbosity wins over configuration
    if (g_options.verbose) {
        puaa::set_log_level(puaa::LogLevel::DEBUG);
    } else if (g_options.quiet) {
        puaa::set_log_level(puaa::LogLevel::ERROR);
    }

    if (argc < 1) {
        puaa::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            return cmd->handler(argc, argv);
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'puaa help' for usage.\n";
    return 1;
}
