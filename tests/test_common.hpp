#pragma once

#include <cstdio>
#include <cstring>

#include "log.hpp"
#include "mtp_memory.hpp"


#define EXPECT(cond, msg) do { \
	if (!(cond)) { \
		std::fprintf(stderr, "FAIL: %s (%s:%d)\n", msg, __FILE__, __LINE__); \
		return 1; \
	} \
} while (0)


#define RUN_TEST(fn) do { \
	if (fn() != 0) { \
		std::fprintf(stderr, "  in %s\n", #fn); \
		return 1; \
	} \
} while (0)


namespace tsr::test {


// per-thread pools and a quiet logger; the ring still records everything
inline void init(log::LogLevel level = log::LogLevel::trace)
{
	mtp::init_tls<mtp::default_set>();

	log::set_level(level);
	log::enable_stderr(false);
	log::clear_ring();
}


inline bool ring_contains(log::LogLevel level, const char* needle)
{
	static log::LogEntry entries[log::ring_capacity];

	const size_t count = log::copy_ring_entries(entries, log::ring_capacity);
	for (size_t i = 0; i < count; ++i) {
		if (entries[i].level == level && std::strstr(entries[i].text, needle) != nullptr)
			return true;
	}
	return false;
}


} // tsr::test
