// SPDX-License-Identifier: Apache-2.0
#include <ansitok/Parser.h>
#include <ansitok/Token.h>

#include <crispy/escape.h>
#include <crispy/logstore.h>

#include <fmt/format.h>

#include <range/v3/view/enumerate.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>

using namespace std;
using ranges::views::enumerate;

namespace
{

string readAll(istream& in)
{
    return string(istreambuf_iterator<char>(in), istreambuf_iterator<char>());
}

void inspect(string_view text)
{
    auto const tokens = ansitok::parseAll(text);

    for (auto const&& [index, token]: enumerate(tokens))
        fmt::print("{:>4}: {:<12} len:{:<3} fg:{:<16} bg:{:<16} \"{}\"\n",
                   index,
                   token.kind,
                   ansitok::printLength(token),
                   token.foreground,
                   token.background,
                   crispy::escape(token.content));

    fmt::print("{} tokens, print length {}\n", tokens.size(), ansitok::printLength(tokens));
}

} // namespace

int main(int argc, char const* argv[])
{
    if (char const* logFilterString = getenv("LOG"); logFilterString)
        logstore::configure(logFilterString);

    if (argc > 1 && (argv[1] == "-h"sv || argv[1] == "--help"sv))
    {
        cout << "Usage: " << argv[0] << " [FILE]\n"
             << "\n"
             << "Tokenizes FILE (or standard input) and prints one line per token.\n"
             << "Set LOG=ansitok.* to trace the tokenizer.\n";
        return EXIT_SUCCESS;
    }

    if (argc > 1)
    {
        auto in = ifstream(argv[1], ios::binary);
        if (!in.good())
        {
            errorlog()("Could not open file: {}", argv[1]);
            return EXIT_FAILURE;
        }
        inspect(readAll(in));
    }
    else
        inspect(readAll(cin));

    return EXIT_SUCCESS;
}
