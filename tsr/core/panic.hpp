#pragma once

#include "log.hpp"

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>


namespace tsr::fail {


namespace detail {

	inline constexpr size_t banner_width = 72;

	inline void print_rule()
	{
		std::fputc('=', stderr);
		for (size_t i = 0; i < banner_width - 2; ++i)
			std::fputc('-', stderr);
		std::fputs("=\n", stderr);
	}

	inline void print_row(const char* text)
	{
		if (!text)
			text = "";

		size_t len = std::strlen(text);
		const size_t max_len = banner_width - 4;
		if (len > max_len)
			len = max_len;

		std::fprintf(stderr, "| %.*s%*s |\n",
			static_cast<int>(len), text,
			static_cast<int>(max_len - len), ""
		);
	}

	inline constexpr size_t tail_lines = 8;

	// the last lines logged before the panic, oldest first
	inline void print_log_tail()
	{
		thread_local log::LogEntry tail[log::ring_capacity];

		const size_t count = log::copy_ring_entries(tail, log::ring_capacity);
		const size_t first = count > tail_lines ? count - tail_lines : 0;

		for (size_t i = first; i < count; ++i)
			std::fprintf(stderr, "  %s\n", tail[i].text);
	}

} // tsr::fail::detail


[[noreturn]] inline void panic(const char* message, const char* file, int line)
{
	TSR_FATAL(log::LogCategory::core, "%s [%s:%d]", message, file, line);

	thread_local char location_buffer[256];
	std::snprintf(location_buffer, sizeof(location_buffer), "at %s:%d", file, line);

	std::fputc('\n', stderr);

	detail::print_rule();
	detail::print_row("TESSERA PANIC");
	detail::print_row("");
	detail::print_row(message);
	detail::print_row(location_buffer);
	detail::print_rule();

	std::fputs("recent log:\n", stderr);
	detail::print_log_tail();

	std::fputc('\n', stderr);
	std::fflush(stderr);
	log::close_file();

	std::abort();
}


[[noreturn]] inline void panic_fmt(const char* file, int line, const char* fmt, ...)
{
	thread_local char msg_buffer[512];

	va_list args;
	va_start(args, fmt);
	std::vsnprintf(msg_buffer, sizeof(msg_buffer), fmt, args);
	va_end(args);

	panic(msg_buffer, file, line);
}


} // tsr::fail


#define TSR_PANIC(message) \
	::tsr::fail::panic(message, __FILE__, __LINE__)

#define TSR_PANIC_FMT(fmt, ...) \
	::tsr::fail::panic_fmt(__FILE__, __LINE__, fmt, ##__VA_ARGS__)


#ifndef NDEBUG

#define TSR_ASSERT(expr) \
	do { \
		if (!(expr)) { \
			::tsr::fail::panic("assertion failed: " #expr, __FILE__, __LINE__); \
		} \
	} while (0)

#define TSR_ASSERT_MSG(expr, message) \
	do { \
		if (!(expr)) { \
			::tsr::fail::panic(message, __FILE__, __LINE__); \
		} \
	} while (0)

#else

#define TSR_ASSERT(expr) ((void)0)
#define TSR_ASSERT_MSG(expr, message) ((void)0)

#endif
