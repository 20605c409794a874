#pragma once

#include "pathtracer/pch.hpp"

#ifndef DISABLE_IASSERT
#define iassert(expr, ...)	\
    if (!(expr)) throw assertion(#expr, std::source_location::current() __VA_OPT__(, ) __VA_ARGS__)
#else
#define iassert(expr, ...)	\
    if (!(expr)) {}
#endif

// Thrown on a broken precondition, after the failure has been printed to stderr
class assertion : public std::exception
{
public:
    template <class... Args>
	assertion(const char* expr, std::source_location where, Args&&... args)
	{
        m_what = std::format("{}:{}: {}: Assertion `{}` failed",
				where.file_name(), where.line(), where.function_name(),
				expr);

        if constexpr (sizeof...(args) > 0)
            _assert_args(args...);

        std::println(stderr, "{}", m_what);
	}

	const char* what() const noexcept override
	{
		return m_what.c_str();
	}

private:
    template <class Format, class... Args>
    void _assert_args(Format&& format, Args&&... args)
    {
        m_what += ": ";
        m_what += std::vformat(format, std::make_format_args(args...));
    }

	std::string m_what;
};
