#include "commands/render.hpp"

#include "config/Config.hpp"
#include "doc/AdfReader.hpp"
#include "doc/MarkdownRenderer.hpp"
#include "io/JiraJson.hpp"
#include "vault/BoardGenerator.hpp"

#include <exception>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

static bool read_file(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

int cmd_render(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage:\n  issue-vault render <adf.json>\n";
        return 1;
    }

    std::string text;
    if (!read_file(argv[1], text)) {
        std::cerr << "[error] failed to open: " << argv[1] << "\n";
        return 1;
    }

    doc::RenderReport report;
    std::cout << doc::render_markdown(doc::read_adf_string(text), &report);

    for (const auto& kind : report.unknown_kinds) {
        std::cerr << "[warn] unsupported node: " << kind << "\n";
    }
    return 0;
}

int cmd_board(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage:\n  issue-vault board <export.json> [--host <host>]\n";
        return 1;
    }

    const std::vector<std::string> args(argv + 2, argv + argc);
    const std::string host = config::get_arg(args, "--host", "");

    try {
        const io::SearchPage page = io::load_search_response(argv[1], host);
        std::cout << vault::generate_board(page.issues);
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
