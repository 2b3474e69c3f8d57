#ifndef PLASMA_BACKUP_STR_UTIL_HPP_INCLUDED
#define PLASMA_BACKUP_STR_UTIL_HPP_INCLUDED
//
// str-util.hpp
//
#include <algorithm>
#include <codecvt>
#include <locale>
#include <string>
#include <string_view>

namespace strutil
{

    // std::wstring_convert is deprecated but there is still no standard replacement
    [[nodiscard]] inline std::wstring toWideString(std::string_view str)
    {
        std::wstring result;

        if (!str.empty())
        {
            std::wstring_convert<std::codecvt_utf8<wchar_t>, wchar_t> converter(
                "(invalid_utf8)", L"(invalid_utf8)");

            result = converter.from_bytes(str.data(), (str.data() + str.size()));
        }

        return result;
    }

    [[nodiscard]] inline std::string toNarrowString(std::wstring_view str)
    {
        std::string result;

        if (!str.empty())
        {
            std::wstring_convert<std::codecvt_utf8<wchar_t>, wchar_t> converter(
                "(invalid_wide)", L"(invalid_wide)");

            result = converter.to_bytes(str.data(), (str.data() + str.size()));
        }

        return result;
    }

    [[nodiscard]] constexpr bool isWhitespace(const char ch) noexcept
    {
        return ((ch == ' ') || (ch == '\t') || (ch == '\r') || (ch == '\n'));
    }

    [[nodiscard]] inline bool startsWith(std::string_view str, std::string_view prefix) noexcept
    {
        return ((str.size() >= prefix.size()) && (str.compare(0, prefix.size(), prefix) == 0));
    }

    template <typename WillTrimDetectorLambda_t>
    void trimIf(std::string & str, WillTrimDetectorLambda_t willTrimDetectorLambda)
    {
        str.erase(
            std::begin(str),
            std::find_if_not(std::cbegin(str), std::cend(str), willTrimDetectorLambda));

        str.erase(
            std::find_if_not(std::crbegin(str), std::crend(str), willTrimDetectorLambda).base(),
            std::end(str));
    }

    template <typename WillTrimDetectorLambda_t>
    [[nodiscard]] std::string
        trimIfCopy(const std::string & orig, WillTrimDetectorLambda_t willTrimDetectorLambda)
    {
        std::string copy{ orig };
        trimIf(copy, willTrimDetectorLambda);
        return copy;
    }

    inline void trimWhitespace(std::string & str) { trimIf(str, isWhitespace); }

    [[nodiscard]] inline std::string trimWhitespaceCopy(const std::string & orig)
    {
        return trimIfCopy(orig, isWhitespace);
    }

    // replaces every occurrence, and returns how many were replaced
    inline std::size_t
        replaceAll(std::string & str, std::string_view from, std::string_view to)
    {
        if (from.empty())
        {
            return 0;
        }

        std::size_t count{ 0 };
        std::size_t pos{ str.find(from) };
        while (pos != std::string::npos)
        {
            str.replace(pos, from.size(), to);
            pos = str.find(from, (pos + to.size()));
            ++count;
        }

        return count;
    }

} // namespace strutil

#endif // PLASMA_BACKUP_STR_UTIL_HPP_INCLUDED
