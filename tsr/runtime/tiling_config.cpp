#include "tiling_config.hpp"

#include <cstdio>
#include <optional>

#define TOML_HEADER_ONLY 1
#define TOML_EXCEPTIONS 0

#include <toml++/toml.hpp>

#include "panic.hpp"


namespace tsr::config {


namespace {


std::optional<std::string> read_stdio_file(const char* file_path)
{
	FILE* file_handle = std::fopen(file_path, "rb");
	if (!file_handle) {
		TSR_ERROR(log::LogCategory::config,
			"[config][read_stdio_file] fopen fail [path %s]",
			file_path
		);
		return std::nullopt;
	}

	std::string data;
	char chunk[4096];

	size_t bytes_read = 0;
	while ((bytes_read = std::fread(chunk, 1, sizeof(chunk), file_handle)) > 0)
		data.append(chunk, bytes_read);

	const bool is_read_error = std::ferror(file_handle) != 0;
	std::fclose(file_handle);

	if (is_read_error) {
		TSR_ERROR(log::LogCategory::config,
			"[config][read_stdio_file] fread fail [path %s][bytes_read %zu]",
			file_path,
			data.size()
		);
		return std::nullopt;
	}

	return data;
}


std::optional<log::LogLevel> parse_log_level(std::string_view name)
{
	if (name == "fatal") return log::LogLevel::fatal;
	if (name == "error") return log::LogLevel::error;
	if (name == "warn")  return log::LogLevel::warn;
	if (name == "info")  return log::LogLevel::info;
	if (name == "debug") return log::LogLevel::debug;
	if (name == "trace") return log::LogLevel::trace;
	return std::nullopt;
}


std::optional<log::LogCategory> parse_log_category(std::string_view name)
{
	for (size_t i = 0; i < log::category_count; ++i) {
		const auto category = static_cast<log::LogCategory>(i);
		if (name == log::category_name(category))
			return category;
	}
	return std::nullopt;
}


std::optional<rdr::SyncStrategy> parse_sync_strategy(std::string_view name)
{
	if (name == "immediate") return rdr::SyncStrategy::immediate;
	if (name == "retained")  return rdr::SyncStrategy::retained;
	return std::nullopt;
}


std::optional<rdr::ForgeBackend> parse_forge_backend(std::string_view name)
{
	if (name == "host")  return rdr::ForgeBackend::host;
	if (name == "sokol") return rdr::ForgeBackend::sokol;
	return std::nullopt;
}


template <typename Enum, typename ParseFn>
void read_enum(const toml::table& table, const char* key, const char* source_name, ParseFn&& parse, Enum& out_value)
{
	if (!table.contains(key))
		return;

	const auto name_opt = table[key].value<std::string>();
	if (!name_opt) {
		TSR_WARN(log::LogCategory::config,
			"[config][read] %s not a string [source %s]",
			key, source_name
		);
		return;
	}

	const auto parsed = parse(*name_opt);
	if (!parsed) {
		TSR_WARN(log::LogCategory::config,
			"[config][read] %s unknown value [source %s][value %s]",
			key, source_name, name_opt->c_str()
		);
		return;
	}

	out_value = *parsed;
}


void read_category_levels(const toml::table& root_table, const char* source_name, CategoryLevels& out_levels)
{
	if (!root_table.contains("log_levels"))
		return;

	const toml::table* levels_table = root_table["log_levels"].as_table();
	if (!levels_table) {
		TSR_WARN(log::LogCategory::config,
			"[config][read] log_levels not a table [source %s]",
			source_name
		);
		return;
	}

	for (const auto& [key, node] : *levels_table) {
		const auto category = parse_log_category(key.str());
		if (!category) {
			TSR_WARN(log::LogCategory::config,
				"[config][read] log_levels unknown category [source %s][category %.*s]",
				source_name,
				static_cast<int>(key.str().size()),
				key.str().data()
			);
			continue;
		}

		const auto level_name = node.value<std::string>();
		const auto level = level_name ? parse_log_level(*level_name) : std::nullopt;
		if (!level) {
			TSR_WARN(log::LogCategory::config,
				"[config][read] log_levels bad level [source %s][category %s]",
				source_name,
				log::category_name(*category)
			);
			continue;
		}

		out_levels[static_cast<size_t>(*category)] = *level;
	}
}


} // anonymous


bool read_string(std::string_view text, TilingConfig& out_config, const char* source_name)
{
	TSR_ASSERT_MSG(source_name, "source_name == null");

	auto parse_result = toml::parse(text, std::string_view {source_name});
	if (!parse_result) {
		const auto error_description = parse_result.error().description();
		const auto error_line = parse_result.error().source().begin.line;
		TSR_ERROR(log::LogCategory::config,
			"[config][read] toml parse fail [source %s][line %u][err %.*s]",
			source_name,
			static_cast<unsigned>(error_line),
			static_cast<int>(error_description.size()),
			error_description.data()
		);
		return false;
	}

	const toml::table& root_table = parse_result.table();

	read_enum(root_table, "log_level",     source_name, parse_log_level,     out_config.log_level);
	read_enum(root_table, "sync_strategy", source_name, parse_sync_strategy, out_config.sync_strategy);
	read_enum(root_table, "forge_backend", source_name, parse_forge_backend, out_config.forge_backend);

	read_category_levels(root_table, source_name, out_config.category_levels);

	if (auto log_file_opt = root_table["log_file"].value<std::string>()) {
		out_config.log_file = *log_file_opt;
	}

	if (root_table.contains("evict_empty_chunks")) {
		if (auto evict_opt = root_table["evict_empty_chunks"].value<bool>()) {
			out_config.evict_empty_chunks = *evict_opt;
		}
		else {
			TSR_WARN(log::LogCategory::config,
				"[config][read] evict_empty_chunks not a bool [source %s]",
				source_name
			);
		}
	}

	if (root_table.contains("tile_size")) {
		const auto tile_size_opt = root_table["tile_size"].value<double>();
		if (tile_size_opt && *tile_size_opt > 0.0) {
			out_config.tile_size = static_cast<float>(*tile_size_opt);
		}
		else {
			TSR_WARN(log::LogCategory::config,
				"[config][read] tile_size must be a positive number [source %s]",
				source_name
			);
		}
	}

	TSR_INFO(log::LogCategory::config,
		"[config][read] ok [source %s][sync %s][forge %s][evict %d][tile_size %.3f]",
		source_name,
		rdr::sync_strategy_name(out_config.sync_strategy),
		rdr::forge_backend_name(out_config.forge_backend),
		out_config.evict_empty_chunks ? 1 : 0,
		static_cast<double>(out_config.tile_size)
	);

	return true;
}


bool read_file(const char* file_path, TilingConfig& out_config)
{
	TSR_ASSERT_MSG(file_path, "file_path == null");

	auto text_opt = read_stdio_file(file_path);
	if (!text_opt)
		return false;

	return read_string(*text_opt, out_config, file_path);
}


bool apply_logging(const TilingConfig& config)
{
	log::set_level(config.log_level);

	for (size_t i = 0; i < log::category_count; ++i) {
		if (config.category_levels[i])
			log::set_level(static_cast<log::LogCategory>(i), *config.category_levels[i]);
	}

	if (config.log_file.empty())
		return true;

	if (!log::open_file(config.log_file.c_str())) {
		TSR_ERROR(log::LogCategory::config,
			"[config][apply_logging] log file open fail [path %s]",
			config.log_file.c_str()
		);
		return false;
	}

	return true;
}


} // tsr::config
