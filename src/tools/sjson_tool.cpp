/*
 * sjson
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#include <sjson/sjson.hpp>

#include <charconv>
#include <exception>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

    struct Options {
        std::string command;
        std::optional<std::string> file;
        sjson::Position extract_pos {1};
        std::size_t chunk {sjson::kDefaultChunkSize};
        sjson::DecodeOptions decode {};
    };

    void usage(std::ostream& out) {
        out << "usage: sjson <command> [options] [file]\n"
               "\n"
               "commands:\n"
               "  check          validate the document\n"
               "  format         re-encode compactly\n"
               "  pretty         re-encode with indentation\n"
               "  paths          list every element with its kind and position\n"
               "  extract <pos>  decode the element starting at byte <pos> (1-based)\n"
               "\n"
               "options:\n"
               "  --strict         accept RFC 8259 JSON only\n"
               "  --chunk <bytes>  read size for streamed input (default 4096)\n"
               "\n"
               "Without a file the document is read from stdin.\n";
    }

    bool parse_size(const std::string_view s, std::size_t& out) {
        const auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
        return ec == std::errc {} && p == s.data() + s.size() && out > 0;
    }

    bool parse_args(const int argc, char** argv, Options& opt) {
        std::vector<std::string_view> positional;

        for (int i = 1; i < argc; ++i) {
            const std::string_view arg = argv[i];

            if (arg == "--strict") {
                opt.decode.strict = true;
            } else if (arg == "--chunk") {
                if (i + 1 >= argc || !parse_size(argv[++i], opt.chunk)) {
                    std::cerr << "sjson: --chunk expects a positive byte count\n";
                    return false;
                }
            } else if (arg == "-h" || arg == "--help") {
                return false;
            } else {
                positional.push_back(arg);
            }
        }

        if (positional.empty())
            return false;

        opt.command = positional.front();
        std::size_t next = 1;

        if (opt.command == "extract") {
            if (positional.size() < 2 || !parse_size(positional[1], opt.extract_pos)) {
                std::cerr << "sjson: extract expects a 1-based position\n";
                return false;
            }
            next = 2;
        } else if (opt.command != "check" && opt.command != "format" && opt.command != "pretty" && opt.command != "paths") {
            std::cerr << "sjson: unknown command '" << opt.command << "'\n";
            return false;
        }

        if (positional.size() > next + 1) {
            std::cerr << "sjson: too many arguments\n";
            return false;
        }
        if (positional.size() == next + 1)
            opt.file = std::string {positional[next]};

        return true;
    }

    std::string render_path(const sjson::Path& path) {
        std::string out = "$";
        for (const auto& item : path) {
            if (const auto* key = std::get_if<std::string>(&item)) {
                out.push_back('.');
                out += *key;
            } else {
                out.push_back('[');
                out += std::to_string(std::get<std::size_t>(item));
                out.push_back(']');
            }
        }
        return out;
    }

    int report(const sjson::ParseError& err) {
        std::cerr << err.format<sjson::ErrorFormat::Pretty>();
        return 1;
    }

    int run(const Options& opt, std::istream& in) {
        auto loader = sjson::stream_loader(in, opt.chunk);

        if (opt.command == "paths") {
            auto print = [](const sjson::Visit& v) {
                std::cout << render_path(v.path) << '\t' << sjson::kind_name(v.kind) << '\t' << v.pos;
                if (v.phase == sjson::Phase::Scalar)
                    std::cout << '-' << v.pos_last;
                std::cout << '\n';
                return sjson::Action::Continue;
            };

            const auto r = sjson::traverse(loader, print, 1, opt.decode);
            return r ? 0 : report(r.err);
        }

        const sjson::Position start = opt.command == "extract" ? opt.extract_pos : 1;
        const auto r = sjson::decode(loader, start, opt.decode);
        if (!r)
            return report(r.err);

        if (opt.command == "check")
            return 0;

        sjson::ParseError err;
        const std::string text = sjson::encode(r.value, opt.command == "pretty", &err);
        if (!err)
            return report(err);

        std::cout << text << '\n';
        return 0;
    }

} // namespace

int main(const int argc, char** argv) {
    Options opt;
    if (!parse_args(argc, argv, opt)) {
        usage(std::cerr);
        return 2;
    }

    try {
        if (opt.file) {
            std::ifstream in(*opt.file, std::ios::binary);
            if (!in) {
                std::cerr << "sjson: cannot open '" << *opt.file << "'\n";
                return 2;
            }
            return run(opt, in);
        }
        return run(opt, std::cin);
    } catch (const std::exception& e) {
        std::cerr << "sjson: " << e.what() << '\n';
        return 2;
    }
}
