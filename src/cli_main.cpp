#include <cxxopts.hpp>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "toon/Errors.hpp"
#include "toon/Json.hpp"
#include "toon/Loader.hpp"
#include "toon/Options.hpp"
#include "toon/Parser.hpp"
#include "toon/Writer.hpp"

using namespace toon;

namespace {

Options build_options(const cxxopts::ParseResult& result) {
    Options opts;

    if (result.count("delimiter")) {
        const std::string name = result["delimiter"].as<std::string>();
        auto delim = delimiter_from_name(name);
        if (!delim) {
            throw std::invalid_argument("unknown delimiter '" + name + "' (expected comma, tab or pipe)");
        }
        opts = opts.with_delimiter(*delim);
    }

    opts = opts.with_indent(result["indent"].as<std::size_t>());

    if (result.count("length-marker")) {
        const std::string marker = result["length-marker"].as<std::string>();
        if (marker.size() != 1) {
            throw std::invalid_argument("length marker must be a single character, got '" + marker + "'");
        }
        opts = opts.with_length_marker(marker[0]);
    }

    return opts.with_pretty(result.count("pretty") > 0)
               .with_special_floats(result.count("special-floats") > 0);
}

void emit(const cxxopts::ParseResult& result, const std::string& text) {
    if (result.count("out")) {
        const std::string out = result["out"].as<std::string>();
        write_text_file(out, text + "\n");
        if (result.count("verbose")) {
            std::cerr << "Wrote " << text.size() << " chars to " << out << "\n";
        }
    } else {
        std::cout << text << "\n";
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("toon", "Convert between JSON/TOML and TOON (token-oriented object notation)");
        options.positional_help("COMMAND FILE");

        options.add_options()
            ("d,delimiter", "Array delimiter: comma, tab or pipe", cxxopts::value<std::string>())
            ("i,indent", "Spaces per nesting level", cxxopts::value<std::size_t>()->default_value("2"))
            ("m,length-marker", "Character written before array lengths (e.g. '#')", cxxopts::value<std::string>())
            ("pretty", "Space after delimiters in inline arrays and rows")
            ("special-floats", "Write Infinity/-Infinity/NaN instead of null")
            ("json-indent", "Indentation of JSON output for decode", cxxopts::value<int>()->default_value("2"))
            ("o,out", "Write output to FILE instead of stdout", cxxopts::value<std::string>())
            ("v,verbose", "Print sizes to stderr")
            ("h,help", "Show help");

        // Command + file captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: encode FILE | decode FILE | check FILE | stats FILE\n";
            return 0;
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];
        if (cmdv.size() < 2) {
            std::cerr << "Error: missing FILE for command '" << cmd << "'\n";
            return 1;
        }
        const std::string path = cmdv[1];
        const bool verbose = result.count("verbose") > 0;

        // ENCODE: JSON/TOML/TOON -> TOON
        if (cmd == "encode") {
            Options opts = build_options(result);
            Value doc = load_file(path);
            std::string text = serialize(doc, opts);
            if (verbose) {
                std::cerr << "Encoded " << path << " (" << type_name(doc) << "), "
                          << text.size() << " chars\n";
            }
            emit(result, text);
            return 0;
        }

        // DECODE: TOON -> JSON
        if (cmd == "decode") {
            std::string input = read_text_file(path);
            Value doc = parse(input);
            std::string text = to_json(doc).dump(result["json-indent"].as<int>());
            if (verbose) {
                std::cerr << "Decoded " << input.size() << " chars into " << text.size()
                          << " chars of JSON\n";
            }
            emit(result, text);
            return 0;
        }

        // CHECK: parse only
        if (cmd == "check") {
            Value doc = parse(read_text_file(path));
            if (verbose) {
                std::cerr << "Root is " << type_name(doc) << " with " << doc.size() << " entries\n";
            }
            std::cout << "ok\n";
            return 0;
        }

        // STATS: compact JSON vs TOON size
        if (cmd == "stats") {
            Options opts = build_options(result);
            Value doc = load_file(path);
            const std::size_t json_chars = to_json(doc).dump().size();
            const std::size_t toon_chars = serialize(doc, opts).size();
            const double savings = json_chars == 0
                ? 0.0
                : 100.0 * (static_cast<double>(json_chars) - static_cast<double>(toon_chars)) /
                      static_cast<double>(json_chars);

            std::ostringstream report;
            report << "JSON: " << json_chars << " chars\n"
                   << "TOON: " << toon_chars << " chars\n"
                   << "Savings: " << std::fixed << std::setprecision(1) << savings << "%";
            emit(result, report.str());
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
