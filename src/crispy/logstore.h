// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <crispy/utils.h>

#include <fmt/format.h>

#include <algorithm>
#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace logstore
{

class category;
class sink;

using source_location = std::source_location;

/// Collects a single log message and hands it to the category's sink on destruction.
class message_builder
{
  private:
    category const& _category;
    source_location _location;
    std::string _buffer;

  public:
    explicit message_builder(category const& cat, source_location loc = source_location::current());

    [[nodiscard]] category const& get_category() const noexcept { return _category; }
    [[nodiscard]] source_location const& location() const noexcept { return _location; }

    [[nodiscard]] std::string const& text() const noexcept { return _buffer; }

    message_builder& operator()(std::string_view msg)
    {
        _buffer += msg;
        return *this;
    }

    template <typename... T>
    message_builder& operator()(fmt::format_string<T...> fmt, T&&... args)
    {
        _buffer += fmt::vformat(fmt, fmt::make_format_args(args...));
        return *this;
    }

    [[nodiscard]] std::string message() const;

    ~message_builder();
};

/// Defines a logging category, such as: error, ansitok.tokenizer, or ansitok.sgr.
///
/// All categories write to the console sink unless told otherwise.
class category
{
  public:
    using formatter = std::function<std::string(message_builder const&)>;
    enum class state
    {
        Enabled,
        Disabled
    };

    explicit category(std::string_view name, state state = state::Disabled) noexcept;
    ~category();

    category(category const&) = delete;
    category& operator=(category const&) = delete;

    [[nodiscard]] std::string_view name() const noexcept { return _name; }

    [[nodiscard]] bool is_enabled() const noexcept { return _state == state::Enabled; }
    void enable(bool enabled = true) noexcept { _state = enabled ? state::Enabled : state::Disabled; }
    void disable() noexcept { _state = state::Disabled; }

    operator bool() const noexcept { return is_enabled(); }

    [[nodiscard]] formatter const& get_formatter() const { return _formatter; }
    void set_formatter(formatter formatter) { _formatter = std::move(formatter); }

    void set_sink(logstore::sink& s) { _sink = s; }
    [[nodiscard]] logstore::sink& sink() const noexcept { return _sink.get(); }

    [[nodiscard]] message_builder operator()(source_location location = source_location::current()) const
    {
        return message_builder(*this, location);
    }

    static std::string defaultFormatter(message_builder const& message);

  private:
    std::string_view _name;
    state _state;
    formatter _formatter;
    std::reference_wrapper<logstore::sink> _sink;
};

/// Logging sink API, such as the console or a log file.
class sink
{
  public:
    using writer = std::function<void(std::string_view)>;

    sink(bool enabled, writer writer);
    sink(bool enabled, std::ostream& output);

    /// Writes given built message to this sink.
    void write(message_builder const& message);

    static sink& console();

  private:
    bool _enabled;
    writer _writer;
};

std::vector<std::reference_wrapper<category>>& get();
void set_formatter(category::formatter const& f);
void configure(std::string_view filterString);

// {{{ implementation
inline std::string message_builder::message() const
{
    if (_category.get_formatter())
        return _category.get_formatter()(*this);
    else if (!_buffer.empty() && _buffer.back() == '\n')
        return _buffer;
    else if (!_buffer.empty())
        return _buffer + '\n';
    else
        return "";
}

inline std::vector<std::reference_wrapper<category>>& get()
{
    static std::vector<std::reference_wrapper<category>> logStore;
    return logStore;
}

inline void set_formatter(category::formatter const& f)
{
    for (auto const& cat: get())
        cat.get().set_formatter(f);
}

/// Enables exactly the categories matched by @p filterString.
///
/// The filter is either "all" or a comma separated list of category names,
/// where a trailing '*' matches by prefix (e.g. "ansitok.*").
inline void configure(std::string_view filterString)
{
    if (filterString == "all")
    {
        for (auto& category: logstore::get())
            category.get().enable();
        return;
    }

    auto const filters = crispy::split(filterString, ',');
    for (auto& category: logstore::get())
    {
        auto const name = category.get().name();
        category.get().enable(std::any_of(filters.begin(), filters.end(), [&](std::string_view pattern) {
            if (pattern.empty())
                return false;
            if (pattern.back() != '*')
                return name == pattern;
            pattern.remove_suffix(1);
            return name.starts_with(pattern);
        }));
    }
}

inline message_builder::message_builder(logstore::category const& cat, source_location location):
    _category { cat }, _location { location }
{
}

inline message_builder::~message_builder()
{
    _category.sink().write(*this);
}

inline category::category(std::string_view name, state state) noexcept:
    _name { name }, _state { state }, _sink { logstore::sink::console() }
{
    assert(std::none_of(get().begin(), get().end(), [&](category const& x) { return x.name() == _name; }));
    get().emplace_back(*this);
}

inline category::~category()
{
    auto& store = get();
    auto const i = std::find_if(store.begin(), store.end(), [this](auto const& x) { return &x.get() == this; });
    if (i != store.end())
        store.erase(i);
}

inline std::string category::defaultFormatter(message_builder const& message)
{
    return fmt::format("[{}:{}:{}]: {}\n",
                       message.get_category().name(),
                       message.location().file_name(),
                       message.location().line(),
                       message.text());
}

inline void sink::write(message_builder const& message)
{
    if (_enabled && message.get_category().is_enabled())
        _writer(message.message());
}
// }}}

auto inline ErrorLog = logstore::category("error", category::state::Enabled);

#define errorlog() (::logstore::ErrorLog())

} // namespace logstore
