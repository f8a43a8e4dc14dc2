/*

dump_tree.cpp
-------------

Parses a message file and prints its MIME tree: one line per part with the content type, disposition, file name and size of the decoded
content. Pass `-v` to also log the boundaries as they are walked.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <mimetree/mimetree.hpp>
#include "example_util.hpp"


using std::cout;
using std::string;
using mimetree::parser;
using mimetree::part;


int main(int argc, char* argv[])
{
    bool verbose = false;
    string path;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "-v")
            verbose = true;
        else
            path = arg;
    }
    if (path.empty())
    {
        std::cerr << "Usage: " << argv[0] << " [-v] <message.eml>\n";
        return EXIT_FAILURE;
    }

    if (verbose)
    {
        mimetree::log::logger::instance().set_level(mimetree::log::level::trace);
        mimetree::log::logger::instance().set_trace_enabled(true);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file)
    {
        std::cerr << "Cannot open " << path << '\n';
        return EXIT_FAILURE;
    }

    parser mime_parser(mimetree::parser_config::lenient());
    auto tree = mime_parser.parse(file);
    if (!tree)
    {
        print_error(tree.error());
        return EXIT_FAILURE;
    }

    tree->walk([](const part& p)
    {
        cout << string(p.depth() * 2, ' ') << p.content_type();
        if (!p.disposition().empty())
            cout << " [" << p.disposition() << "]";
        if (!p.file_name().empty())
            cout << " \"" << p.file_name() << "\"";
        if (p.is_leaf())
            cout << " (" << p.content().size() << " bytes)";
        cout << '\n';
        return true;
    });

    return EXIT_SUCCESS;
}
