#pragma once

#include <cstdint>

#include "entity.hpp"
#include "tile_access.hpp"
#include "chunk_components.hpp"
#include "chunk_handle_map.hpp"

#include "render_world.hpp"
#include "sync_cache.hpp"
#include "resource_forge.hpp"


namespace tsr::rdr {


// how the presentation world lives between cycles
enum class SyncStrategy : uint8_t
{
	immediate = 0,	// world is rebuilt every cycle, records survive only through the cache
	retained		// world persists, the cache only drives reconciliation
};


[[nodiscard]] const char* sync_strategy_name(SyncStrategy strategy);


struct ExtractContext
{
	tile::TileWriter&             writer;
	const chunk::ChunkHandleMap&  handles;
	ecs::SimRegistry&             registry;
	RenderWorld&                  world;
	SyncCache&                    cache;
	ResourceForge&                forge;

	uint64_t cycle {0};
};


struct ExtractStats
{
	uint32_t replayed    {0};
	uint32_t dropped     {0};
	uint32_t forced      {0};
	uint32_t regenerated {0};
	uint32_t unmapped    {0};
	uint32_t failed      {0};
};


/*
	End of cycle: snapshot every render record into the cache. Under
	SyncStrategy::immediate the world is then emptied. The cache must be empty
	on entry; a leftover means extract was skipped and the cycle is broken.
*/
uint32_t cache_phase(RenderWorld& world, SyncCache& cache, SyncStrategy strategy);


/*
	Start of cycle, after every writer and after the presentation rebuild:
	  1. drop cached records whose chunk is gone or whose binding changed,
	  2. force unloaded records of clean chunks dirty,
	  3. replay the survivors into the world,
	  4. regenerate a raw resource for every dirty chunk and overwrite its record.
	Dropped and overwritten resources are destroyed through the forge.
*/
ExtractStats extract(const ExtractContext& context);


// frees the record's resources; the next extract regenerates it
bool unload(RenderWorld& world, ResourceForge& forge, ecs::Entity handle);


// hands a mesh resource to an unmeshed or meshed record; false leaves ownership with the caller
bool attach_mesh(RenderWorld& world, ResourceForge& forge, ecs::Entity handle, ResourceHandle mesh);


// destroys every resource held by the world and the cache, then empties both
void release_all(RenderWorld& world, SyncCache& cache, ResourceForge& forge);


} // tsr::rdr
