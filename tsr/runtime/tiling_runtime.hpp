#pragma once

#include <cstdint>
#include <functional>

#include "mtp_memory.hpp"

#include "tile_map.hpp"
#include "tile_updates.hpp"
#include "tile_access.hpp"

#include "chunk_sync.hpp"
#include "chunk_components.hpp"
#include "chunk_handle_map.hpp"

#include "tile_sync.hpp"
#include "sync_cache.hpp"
#include "render_world.hpp"
#include "resource_forge.hpp"

#include "tiling_config.hpp"


namespace tsr {


struct CycleReport
{
	uint64_t cycle   {0};
	uint32_t evicted {0};
	uint32_t cached  {0};

	chunk::ChunkSyncStats chunks  {};
	rdr::ExtractStats     extract {};
};


/*
	Runs one cycle in a fixed order:
	  clear dirty -> update systems -> eviction -> chunk entities -> extract
	  -> render systems -> cache phase
	The forge must outlive the runtime; call shutdown() before destroying it.
*/
class TilingRuntime
{
public:

	using UpdateFn = std::function<void(tile::TileWriter& writer)>;
	using RenderFn = std::function<void(rdr::RenderWorld& world, rdr::ResourceForge& forge)>;

public:

	TilingRuntime(const config::TilingConfig& config, rdr::ResourceForge& forge);
	~TilingRuntime();

	TilingRuntime(const TilingRuntime&) = delete;
	TilingRuntime& operator=(const TilingRuntime&) = delete;

	void add_update_system(UpdateFn system);
	void add_render_system(RenderFn system);

	CycleReport run_cycle();

	void shutdown();

	[[nodiscard]] uint64_t cycle_index() const { return m_cycle; }

	[[nodiscard]] tile::TileWriter writer() { return tile::TileWriter {m_tiles, m_updates}; }
	[[nodiscard]] tile::TileReader reader() const { return tile::TileReader {m_tiles, m_updates}; }

	[[nodiscard]] const tile::TileMap&         tiles() const    { return m_tiles; }
	[[nodiscard]] const tile::UpdateTracker&   updates() const  { return m_updates; }
	[[nodiscard]] const chunk::ChunkHandleMap& handles() const  { return m_handles; }
	[[nodiscard]] const ecs::SimRegistry&      registry() const { return m_registry; }
	[[nodiscard]] const rdr::RenderWorld&      world() const    { return m_world; }
	[[nodiscard]] const rdr::SyncCache&        cache() const    { return m_cache; }

	[[nodiscard]] rdr::RenderWorld&   world() { return m_world; }
	[[nodiscard]] rdr::ResourceForge& forge() { return m_forge; }

	[[nodiscard]] const config::TilingConfig& config() const { return m_config; }

private:

	config::TilingConfig m_config;
	rdr::ResourceForge&  m_forge;

	tile::TileMap         m_tiles;
	tile::UpdateTracker   m_updates;
	chunk::ChunkHandleMap m_handles;
	ecs::SimRegistry      m_registry;

	rdr::RenderWorld m_world;
	rdr::SyncCache   m_cache;

	mtp::vault<UpdateFn, mtp::default_set> m_update_systems;
	mtp::vault<RenderFn, mtp::default_set> m_render_systems;

	uint64_t m_cycle    {0};
	bool     m_shutdown {false};
};


} // tsr
