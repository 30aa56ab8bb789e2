// SPDX-License-Identifier: Apache-2.0
#include <crispy/logstore.h>

#include <catch2/catch.hpp>

#include <string>
#include <vector>

namespace
{
auto testLog = logstore::category("test.logstore");
auto otherLog = logstore::category("test.other");

// Restores enabled state, formatter and sink of every category, so that a test
// reconfiguring the store does not override the LOG filter for later tests.
class SavedLogState
{
  public:
    SavedLogState()
    {
        for (auto& cat: logstore::get())
            _saved.push_back({ cat, cat.get().is_enabled(), cat.get().get_formatter(), cat.get().sink() });
    }

    ~SavedLogState()
    {
        for (auto& entry: _saved)
        {
            entry.cat.get().enable(entry.enabled);
            entry.cat.get().set_formatter(entry.formatter);
            entry.cat.get().set_sink(entry.sink.get());
        }
    }

    SavedLogState(SavedLogState const&) = delete;
    SavedLogState& operator=(SavedLogState const&) = delete;

  private:
    struct Entry
    {
        std::reference_wrapper<logstore::category> cat;
        bool enabled;
        logstore::category::formatter formatter;
        std::reference_wrapper<logstore::sink> sink;
    };
    std::vector<Entry> _saved;
};
} // namespace

TEST_CASE("logstore.configure", "[logstore]")
{
    auto const saved = SavedLogState {};

    logstore::configure("test.logstore");
    CHECK(testLog.is_enabled());
    CHECK(!otherLog.is_enabled());

    logstore::configure("test.*");
    CHECK(testLog.is_enabled());
    CHECK(otherLog.is_enabled());

    logstore::configure("nothing,");
    CHECK(!testLog.is_enabled());
    CHECK(!otherLog.is_enabled());
    CHECK(!logstore::ErrorLog.is_enabled());

    logstore::configure("all");
    CHECK(testLog.is_enabled());

    logstore::configure("error");
    CHECK(logstore::ErrorLog.is_enabled());
    CHECK(!testLog.is_enabled());
}

TEST_CASE("logstore.configure_is_restored", "[logstore]")
{
    auto const errorEnabled = logstore::ErrorLog.is_enabled();
    auto const otherEnabled = otherLog.is_enabled();
    {
        auto const saved = SavedLogState {};
        logstore::configure(errorEnabled ? "test.other" : "error");
        CHECK(logstore::ErrorLog.is_enabled() != errorEnabled);
    }
    CHECK(logstore::ErrorLog.is_enabled() == errorEnabled);
    CHECK(otherLog.is_enabled() == otherEnabled);
}

TEST_CASE("logstore.sink", "[logstore]")
{
    auto const saved = SavedLogState {};
    auto output = std::string {};
    auto sink = logstore::sink(true, [&](std::string_view text) { output += text; });
    testLog.set_sink(sink);
    testLog.set_formatter({});

    testLog.enable();
    testLog()("value {}", 42);
    CHECK(output == "value 42\n");

    testLog.disable();
    testLog()("dropped");
    CHECK(output == "value 42\n");
}

TEST_CASE("logstore.default_formatter", "[logstore]")
{
    auto const saved = SavedLogState {};
    auto output = std::string {};
    auto sink = logstore::sink(true, [&](std::string_view text) { output += text; });
    testLog.set_sink(sink);
    testLog.set_formatter(logstore::category::defaultFormatter);
    testLog.enable();

    testLog()("hello");
    CHECK(output.starts_with("[test.logstore:"));
    CHECK(output.ends_with("]: hello\n"));
}
