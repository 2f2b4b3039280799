#pragma once

#include <cstdint>

#include "math.hpp"
#include "entity.hpp"
#include "ecs_registry.hpp"
#include "tile_data.hpp"


namespace tsr::ecs {


// marks an entity as the simulation-side owner of one tile chunk
struct ChunkComponent
{
	tile::ChunkCoord coord;
};


// chunk takes part in extraction; filled in by the extract pass
struct RenderLinkComponent
{
	uint64_t linked_cycle    {0};
	uint64_t extracted_cycle {0};
	uint32_t regenerations   {0};
};


struct ChunkTransformComponent
{
	mat4 world {1.0f};
};


using SimRegistry = Registry <
	ChunkComponent,
	RenderLinkComponent,
	ChunkTransformComponent
>;


} // tsr::ecs
