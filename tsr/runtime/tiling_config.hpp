#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

#include "log.hpp"
#include "tile_sync.hpp"
#include "resource_forge.hpp"


namespace tsr::config {


using CategoryLevels = std::array<std::optional<log::LogLevel>, log::category_count>;


struct TilingConfig
{
	log::LogLevel     log_level          {log::LogLevel::info};
	CategoryLevels    category_levels    {};
	std::string       log_file           {};
	rdr::SyncStrategy sync_strategy      {rdr::SyncStrategy::immediate};
	rdr::ForgeBackend forge_backend      {rdr::ForgeBackend::host};
	bool              evict_empty_chunks {false};
	float             tile_size          {1.0f};
};


/*
	Reads a TOML document over the defaults already in out_config. Keys that
	are missing keep their value; keys with a bad value are reported and kept.
	Returns false only when the text cannot be read or parsed.
*/
bool read_string(std::string_view text, TilingConfig& out_config, const char* source_name = "<memory>");

bool read_file(const char* file_path, TilingConfig& out_config);


// applies log_level, the [log_levels] overrides and log_file to the global logger
bool apply_logging(const TilingConfig& config);


} // tsr::config
