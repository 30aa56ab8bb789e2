// SPDX-License-Identifier: Apache-2.0
#include <ansitok/SgrResolver.h>
#include <ansitok/logging.h>

#include <optional>

using std::nullopt;
using std::optional;
using std::string_view;

namespace ansitok
{

namespace
{
    /// Walks the semicolon separated fields of an SGR parameter string.
    class FieldReader
    {
      public:
        explicit FieldReader(string_view text) noexcept: _text { text } {}

        [[nodiscard]] bool atEnd() const noexcept { return _pos >= _text.size(); }
        [[nodiscard]] size_t position() const noexcept { return _pos; }

        /// End offset (exclusive) of the most recently read field.
        [[nodiscard]] size_t fieldEnd() const noexcept { return _fieldEnd; }

        /// Returns the next field and moves past its trailing ';', if any.
        string_view next() noexcept
        {
            auto const start = _pos;
            while (_pos < _text.size() && _text[_pos] != ';')
                ++_pos;
            auto const field = _text.substr(start, _pos - start);
            _fieldEnd = _pos;
            if (_pos < _text.size())
                ++_pos;
            return field;
        }

        /// Like next(), but fails on end-of-input or an empty field.
        optional<string_view> nextNonEmpty() noexcept
        {
            if (atEnd())
                return nullopt;
            auto const field = next();
            if (field.empty())
                return nullopt;
            return field;
        }

        [[nodiscard]] string_view slice(size_t start, size_t end) const noexcept
        {
            return _text.substr(start, end - start);
        }

      private:
        string_view _text;
        size_t _pos = 0;
        size_t _fieldEnd = 0;
    };

    /// Reads the remainder of an extended color (38 or 48) whose introducing
    /// field started at @p start and has already been consumed.
    ///
    /// Returns the full color tag, e.g. "38;5;208" or "48;2;255;90;0",
    /// as a slice of the original parameter text.
    optional<string_view> readExtendedColor(FieldReader& fields, size_t start) noexcept
    {
        auto const selector = fields.nextNonEmpty();
        if (!selector)
            return nullopt;

        auto componentCount = 0;
        if (*selector == "5")
            componentCount = 1; // 256-color palette index
        else if (*selector == "2")
            componentCount = 3; // R, G, B
        else
            return nullopt;

        for (auto i = 0; i < componentCount; ++i)
            if (!fields.nextNonEmpty())
                return nullopt;

        return fields.slice(start, fields.fieldEnd());
    }

    constexpr bool isBrightForeground(string_view field) noexcept
    {
        return field.size() == 2 && field[0] == '9' && field[1] >= '0' && field[1] <= '7';
    }

    constexpr bool isBrightBackground(string_view field) noexcept
    {
        return field.size() == 3 && field[0] == '1' && field[1] == '0' && field[2] >= '0' && field[2] <= '7';
    }
} // namespace

ColorState resolveSGR(string_view parameters, ColorState colors)
{
    if (parameters.empty())
        return ColorState {};

    auto fields = FieldReader { parameters };
    while (!fields.atEnd())
    {
        auto const start = fields.position();
        auto const field = fields.next();

        if (field == "0" || field == "1")
            colors = ColorState {};
        else if (field == "39")
            colors.foreground = {};
        else if (field == "49")
            colors.background = {};
        else if (field == "38" || field == "48")
        {
            auto const color = readExtendedColor(fields, start);
            if (!color)
            {
                if (sgrLog)
                    sgrLog()("Ignoring malformed extended color in SGR \"{}\".", parameters);
                continue;
            }
            if (field[0] == '3')
                colors.foreground = *color;
            else
                colors.background = *color;
        }
        else if ((field.size() == 2 && field[0] == '3') || isBrightForeground(field))
            colors.foreground = field;
        else if ((field.size() == 2 && field[0] == '4') || isBrightBackground(field))
            colors.background = field;
        else if (sgrLog)
            sgrLog()("Ignoring SGR parameter \"{}\".", field);
    }

    return colors;
}

} // namespace ansitok
