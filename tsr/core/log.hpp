#pragma once

#include <array>
#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <mutex>


namespace tsr::log {


inline constexpr size_t ring_capacity = 256;
inline constexpr size_t line_capacity = 512;


enum class LogLevel : uint8_t
{
	fatal = 0,
	error,
	warn,
	info,
	debug,
	trace
};


enum class LogCategory : uint8_t
{
	core = 0,
	tile,
	chunk,
	sync,
	config,
	count
};

inline constexpr size_t category_count = static_cast<size_t>(LogCategory::count);


struct LogEntry
{
	LogLevel    level    {LogLevel::info};
	LogCategory category {LogCategory::core};
	char        text[line_capacity] {};
};


// fixed ring of the most recent lines; callers lock mutex() around it
class LogRing
{
public:

	void push(LogLevel level, LogCategory category, const char* text)
	{
		LogEntry& entry = m_entries[m_head];

		entry.level    = level;
		entry.category = category;
		std::snprintf(entry.text, sizeof(entry.text), "%s", text);

		m_head = (m_head + 1) % ring_capacity;
		if (m_count < ring_capacity)
			++m_count;
	}

	void clear()
	{
		m_head  = 0;
		m_count = 0;
	}

	// oldest first
	size_t copy_to(LogEntry* destination, size_t max_entries) const
	{
		const size_t copy_count = m_count < max_entries ? m_count : max_entries;
		const size_t oldest     = (m_head + ring_capacity - m_count) % ring_capacity;

		for (size_t i = 0; i < copy_count; ++i)
			destination[i] = m_entries[(oldest + i) % ring_capacity];

		return copy_count;
	}

private:

	std::array<LogEntry, ring_capacity> m_entries {};

	size_t m_head  {0};
	size_t m_count {0};
};


struct LogState
{
	std::array<LogLevel, category_count> levels;

	FILE*   file      {nullptr};
	bool    is_stderr {true};
	LogRing ring;
};


inline const char* category_name(LogCategory category)
{
	switch (category) {
	case LogCategory::core:   return "core";
	case LogCategory::tile:   return "tile";
	case LogCategory::chunk:  return "chunk";
	case LogCategory::sync:   return "sync";
	case LogCategory::config: return "config";
	case LogCategory::count:  break;
	}
	return "core";
}


inline const char* level_name(LogLevel level)
{
	switch (level) {
	case LogLevel::fatal: return "FATAL";
	case LogLevel::error: return "ERROR";
	case LogLevel::warn:  return "WARN";
	case LogLevel::info:  return "INFO";
	case LogLevel::debug: return "DEBUG";
	case LogLevel::trace: return "TRACE";
	}
	return "UNKNOWN";
}


inline LogState& state()
{
	static LogState log_state = [] {
		LogState initial {};
		initial.levels.fill(LogLevel::info);
		return initial;
	}();

	return log_state;
}


inline std::mutex& mutex()
{
	static std::mutex mut;
	return mut;
}


// sets every category at once
inline void set_level(LogLevel level)
{
	state().levels.fill(level);
}


inline void set_level(LogCategory category, LogLevel level)
{
	state().levels[static_cast<size_t>(category)] = level;
}


// the core category stands for the global level
inline LogLevel get_level(LogCategory category = LogCategory::core)
{
	return state().levels[static_cast<size_t>(category)];
}


inline void enable_stderr(bool enabled)
{
	state().is_stderr = enabled;
}


inline bool is_enabled(LogLevel level, LogCategory category = LogCategory::core)
{
	return static_cast<int>(level) <= static_cast<int>(get_level(category));
}


inline void close_file()
{
	std::lock_guard<std::mutex> lock(mutex());

	FILE*& file = state().file;
	if (!file)
		return;

	std::fflush(file);
	std::fclose(file);
	file = nullptr;
}


inline bool open_file(const char* path)
{
	close_file();

	std::lock_guard<std::mutex> lock(mutex());

	state().file = std::fopen(path, "w");
	return state().file != nullptr;
}


inline void clear_ring()
{
	std::lock_guard<std::mutex> lock(mutex());
	state().ring.clear();
}


inline size_t copy_ring_entries(LogEntry* destination, size_t max_entries)
{
	if (!destination || max_entries == 0)
		return 0;

	std::lock_guard<std::mutex> lock(mutex());
	return state().ring.copy_to(destination, max_entries);
}


inline void write(LogLevel level, LogCategory category, const char* fmt, ...)
{
	if (!is_enabled(level, category))
		return;

	thread_local char message[line_capacity];
	thread_local char line[line_capacity + 32];

	va_list args;
	va_start(args, fmt);
	std::vsnprintf(message, sizeof(message), fmt, args);
	va_end(args);

	std::snprintf(line, sizeof(line), "[%s][%s]%s", level_name(level), category_name(category), message);

	std::lock_guard<std::mutex> lock(mutex());

	LogState& log_state = state();
	log_state.ring.push(level, category, line);

	if (log_state.is_stderr)
		std::fprintf(stderr, "%s\n", line);
	if (log_state.file)
		std::fprintf(log_state.file, "%s\n", line);
}

} // tsr::log


#define TSR_LOG_AT(level, category, fmt, ...) \
	do { \
		::tsr::log::write(::tsr::log::LogLevel::level, category, fmt, ##__VA_ARGS__); \
	} while (0)

#define TSR_FATAL(category, fmt, ...) TSR_LOG_AT(fatal, category, fmt, ##__VA_ARGS__)
#define TSR_ERROR(category, fmt, ...) TSR_LOG_AT(error, category, fmt, ##__VA_ARGS__)
#define TSR_WARN(category, fmt, ...)  TSR_LOG_AT(warn,  category, fmt, ##__VA_ARGS__)
#define TSR_INFO(category, fmt, ...)  TSR_LOG_AT(info,  category, fmt, ##__VA_ARGS__)
#define TSR_DEBUG(category, fmt, ...) TSR_LOG_AT(debug, category, fmt, ##__VA_ARGS__)
#define TSR_TRACE(category, fmt, ...) TSR_LOG_AT(trace, category, fmt, ##__VA_ARGS__)
