#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

#include "math.hpp"


namespace tsr::tile {


namespace cfg {

	inline constexpr int32_t  chunk_extent = 16;
	inline constexpr uint32_t chunk_slots  = 256;

	static_assert(static_cast<uint32_t>(chunk_extent * chunk_extent) == chunk_slots);

	// chunk x/z range whose every tile has an int32 world position
	inline constexpr int32_t  chunk_min    = INT32_MIN / chunk_extent;
	inline constexpr int32_t  chunk_max    = INT32_MAX / chunk_extent;

} // tsr::tile::cfg


struct Tile
{
	uint16_t sheet {0};
	uint16_t index {0};

	constexpr bool operator==(const Tile& other) const noexcept
	{
		return sheet == other.sheet && index == other.index;
	}

	constexpr bool operator!=(const Tile& other) const noexcept
	{
		return !(*this == other);
	}
};

static_assert(sizeof(Tile) == 4, "tile must stay a packed 4 byte value");


struct ChunkCoord
{
	int32_t x {0};
	int32_t y {0};
	int32_t z {0};

	constexpr bool operator==(const ChunkCoord& other) const noexcept
	{
		return x == other.x && y == other.y && z == other.z;
	}

	constexpr bool operator!=(const ChunkCoord& other) const noexcept
	{
		return !(*this == other);
	}

	[[nodiscard]] ivec3 as_ivec3() const
	{
		return ivec3 {x, y, z};
	}
};


struct TileCoord
{
	ChunkCoord chunk;
	uint8_t    slot {0};

	constexpr bool operator==(const TileCoord& other) const noexcept
	{
		return chunk == other.chunk && slot == other.slot;
	}

	constexpr bool operator!=(const TileCoord& other) const noexcept
	{
		return !(*this == other);
	}
};


[[nodiscard]] constexpr uint8_t slot_index(int32_t local_x, int32_t local_z) noexcept
{
	return static_cast<uint8_t>(local_x + local_z * cfg::chunk_extent);
}

[[nodiscard]] constexpr int32_t slot_x(uint8_t slot) noexcept
{
	return static_cast<int32_t>(slot) % cfg::chunk_extent;
}

[[nodiscard]] constexpr int32_t slot_z(uint8_t slot) noexcept
{
	return static_cast<int32_t>(slot) / cfg::chunk_extent;
}


// world tile position -> owning chunk and slot; y is the layer and maps 1:1
[[nodiscard]] inline TileCoord tile_coord_from_world(ivec3 world)
{
	const int32_t local_x = math::floor_mod(world.x, cfg::chunk_extent);
	const int32_t local_z = math::floor_mod(world.z, cfg::chunk_extent);

	return TileCoord {
		.chunk = ChunkCoord {
			.x = math::floor_div(world.x, cfg::chunk_extent),
			.y = world.y,
			.z = math::floor_div(world.z, cfg::chunk_extent)
		},
		.slot = slot_index(local_x, local_z)
	};
}


// chunk x/z must lie in cfg::chunk_min..cfg::chunk_max
[[nodiscard]] inline ivec3 world_from_tile_coord(TileCoord coord)
{
	const int64_t world_x = int64_t {coord.chunk.x} * cfg::chunk_extent + slot_x(coord.slot);
	const int64_t world_z = int64_t {coord.chunk.z} * cfg::chunk_extent + slot_z(coord.slot);

	TSR_ASSERT_MSG(world_x >= INT32_MIN && world_x <= INT32_MAX, "[tile coord] world x out of range");
	TSR_ASSERT_MSG(world_z >= INT32_MIN && world_z <= INT32_MAX, "[tile coord] world z out of range");

	return ivec3 {
		static_cast<int32_t>(world_x),
		coord.chunk.y,
		static_cast<int32_t>(world_z)
	};
}


static inline constexpr uint64_t k_fnv_offset = 14695981039346656037ULL;
static inline constexpr uint64_t k_fnv_prime  = 1099511628211ULL;


[[nodiscard]] inline uint64_t chunk_coord_hash(ChunkCoord coord)
{
	uint64_t fnv1a_hash = k_fnv_offset;

	fnv1a_hash ^= static_cast<uint32_t>(coord.x); fnv1a_hash *= k_fnv_prime;
	fnv1a_hash ^= static_cast<uint32_t>(coord.y); fnv1a_hash *= k_fnv_prime;
	fnv1a_hash ^= static_cast<uint32_t>(coord.z); fnv1a_hash *= k_fnv_prime;

	return fnv1a_hash;
}


} // tsr::tile


namespace std {


template<>
struct hash<tsr::tile::ChunkCoord>
{
	size_t operator()(const tsr::tile::ChunkCoord& coord) const noexcept
	{
		return static_cast<size_t>(tsr::tile::chunk_coord_hash(coord));
	}
};

} // std
