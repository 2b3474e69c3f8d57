#ifndef PLASMA_BACKUP_UTIL_HPP_INCLUDED
#define PLASMA_BACKUP_UTIL_HPP_INCLUDED
//
// util.hpp
//
#include <chrono>
#include <cstddef>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>

//

constexpr std::size_t operator"" _st(unsigned long long number)
{
    return static_cast<std::size_t>(number);
}

//

namespace plasma_backup
{

    // need this because the code that throws will already have printed the error message in color
    struct silent_runtime_error : public std::runtime_error
    {
        silent_runtime_error()
            : runtime_error("")
        {}
    };

    // time stuff

    using Clock_t = std::chrono::steady_clock;

    [[nodiscard]] inline std::wstring prettyTimeDurationString(const Clock_t::duration & dur)
    {
        using namespace std::chrono;

        if (const auto ms{ duration_cast<milliseconds>(dur).count() }; ms < 1000)
        {
            return (std::to_wstring(ms) + L"ms");
        }

        if (const auto secf{ duration<double>(dur).count() }; secf < 10.0)
        {
            std::wostringstream ss;
            ss << std::fixed << std::setprecision(1) << secf << L"s";
            return ss.str();
        }

        if (const auto sec{ duration_cast<seconds>(dur).count() }; sec < 60)
        {
            return (std::to_wstring(sec) + L"s");
        }

        const auto sec{ duration_cast<seconds>(dur).count() % 60 };
        const auto min{ duration_cast<minutes>(dur).count() % 60 };
        const auto hrs{ duration_cast<hours>(dur).count() };

        std::wostringstream ss;

        if (hrs > 0)
        {
            ss << hrs << L':' << std::setw(2) << std::setfill(L'0');
        }

        ss << min << L':' << std::setw(2) << std::setfill(L'0') << sec;
        return ss.str();
    }

    [[nodiscard]] inline std::wstring prettyTimeDurationString(const Clock_t::time_point & from)
    {
        return prettyTimeDurationString(Clock_t::now() - from);
    }

    // formats the local wall clock time with std::put_time() rules, i.e. "%Y%m%d_%H%M%S"
    [[nodiscard]] inline std::string makeLocalTimeString(const char * const format)
    {
        const std::time_t nowCTime{ std::chrono::system_clock::to_time_t(
            std::chrono::system_clock::now()) };

        std::tm localTm{};
        localtime_r(&nowCTime, &localTm);

        std::ostringstream ss;
        ss << std::put_time(&localTm, format);
        return ss.str();
    }

    // percent stuff

    template <typename T, typename U = T, typename Return_t = T>
    [[nodiscard]] Return_t calcPercent(const T numerator, const U denominator)
    {
        static_assert(std::is_integral_v<T>);
        static_assert(!std::is_same_v<std::remove_cv_t<T>, bool>);

        static_assert(std::is_integral_v<U>);
        static_assert(!std::is_same_v<std::remove_cv_t<U>, bool>);

        Return_t result{ 0 };

        if (denominator > 0)
        {
            result = static_cast<Return_t>(
                (static_cast<long double>(numerator) / static_cast<long double>(denominator)) *
                100.0L);
        }

        return result;
    }

    template <typename T, typename U = T, typename Return_t = T>
    [[nodiscard]] std::wstring calcPercentString(const T numerator, const U denominator)
    {
        return (std::to_wstring(calcPercent<T, U, Return_t>(numerator, denominator)) + L"%");
    }

} // namespace plasma_backup

#endif // PLASMA_BACKUP_UTIL_HPP_INCLUDED
