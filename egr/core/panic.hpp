#pragma once

#include "log.hpp"

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>


namespace egr::fail {


namespace detail {


	inline constexpr size_t frame_width = 72;

	inline void print_rule(char fill)
	{
		std::fputc('+', stderr);

		for (size_t i = 0; i < frame_width - 2; ++i)
			std::fputc(fill, stderr);

		std::fputc('+',  stderr);
		std::fputc('\n', stderr);
	}

	inline void print_boxed_line(const char* text)
	{
		if (!text || text[0] == '\0')
			return;

		size_t len = std::strlen(text);
		const size_t max_len = frame_width - 4;
		if (len > max_len)
			len = max_len;

		std::fprintf(stderr, "| %.*s%*s |\n",
			static_cast<int>(len), text,
			static_cast<int>(max_len - len), ""
		);
	}

} // detail


[[noreturn]] inline void panic(const char* message, const char* file, int line)
{
	EGR_FATAL(log::LogCategory::core, "%s [%s:%d]", message, file, line);

	thread_local char location_buffer[256];
	std::snprintf(location_buffer, sizeof(location_buffer), "at %s:%d", file, line);

	std::fprintf(stderr, "\n");

	detail::print_rule('=');
	detail::print_boxed_line("editgrid panic");
	detail::print_rule('-');
	detail::print_boxed_line(message);
	detail::print_boxed_line(location_buffer);
	detail::print_rule('=');

	std::fprintf(stderr, "\n");
	std::fflush(stderr);

	log::shutdown();

	std::abort();
}


[[noreturn]] inline void panic_fmt(const char* file, int line, const char* fmt, ...)
{
	thread_local char msg_buffer[1024];

	va_list args;
	va_start(args, fmt);
	std::vsnprintf(msg_buffer, sizeof(msg_buffer), fmt, args);
	va_end(args);

	panic(msg_buffer, file, line);
}


} // egr::fail


#define EGR_PANIC(message) \
	::egr::fail::panic(message, __FILE__, __LINE__)

#define EGR_PANIC_FMT(fmt, ...) \
	::egr::fail::panic_fmt(__FILE__, __LINE__, fmt, ##__VA_ARGS__)


#ifndef NDEBUG

#define EGR_ASSERT(expr) \
	do { \
		if (!(expr)) { \
			::egr::fail::panic("assertion failed: " #expr, __FILE__, __LINE__); \
		} \
	} while (0)

#define EGR_ASSERT_MSG(expr, message) \
	do { \
		if (!(expr)) { \
			::egr::fail::panic(message, __FILE__, __LINE__); \
		} \
	} while (0)

#else

#define EGR_ASSERT(expr) ((void)0)
#define EGR_ASSERT_MSG(expr, message) ((void)0)

#endif
