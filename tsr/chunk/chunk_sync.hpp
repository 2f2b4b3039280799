#pragma once

#include <cstdint>

#include "tile_map.hpp"
#include "tile_updates.hpp"

#include "chunk_components.hpp"
#include "chunk_handle_map.hpp"


namespace tsr::chunk {


struct ChunkSyncContext
{
	const tile::TileMap&       tiles;
	const tile::UpdateTracker& updates;
	ChunkHandleMap&            handles;
	ecs::SimRegistry&          registry;

	float    tile_size {1.0f};
	uint64_t cycle     {0};
};


struct ChunkSyncStats
{
	uint32_t spawned {0};
	uint32_t retired {0};
	uint32_t linked  {0};
};


/*
	Keeps chunk entities in step with the tile map, once per cycle after the
	update systems and before extract:
	  - entities whose chunk left the map lose their mapping and are destroyed,
	  - dirty chunks without an entity get one,
	  - chunk entities without a render link get one.
*/
ChunkSyncStats update(const ChunkSyncContext& context);


} // tsr::chunk
