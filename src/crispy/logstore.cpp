// SPDX-License-Identifier: Apache-2.0
#include <crispy/logstore.h>

namespace logstore
{

sink::sink(bool enabled, writer wr): _enabled { enabled }, _writer { std::move(wr) }
{
}

sink::sink(bool enabled, std::ostream& output):
    sink(enabled, [out = &output](std::string_view text) {
        *out << text;
        out->flush();
    })
{
}

// Diagnostics go to stderr so that tools can keep stdout for their actual output.
sink& sink::console()
{
    static auto instance = sink(true, std::cerr);
    return instance;
}

} // namespace logstore
