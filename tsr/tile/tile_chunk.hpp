#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <type_traits>

#include "panic.hpp"

#include "tile_data.hpp"


namespace tsr::tile {


/*
	Chunk is uploaded as-is: 256 tiles followed directly by 256 validity flags.
	A slot whose flag is false holds a stale tile value that is never read.
*/
struct Chunk
{
	std::array<Tile, cfg::chunk_slots> tiles {};
	std::array<bool, cfg::chunk_slots> valid {};


	[[nodiscard]] const Tile* get(uint8_t slot) const
	{
		if (!valid[slot])
			return nullptr;
		return &tiles[slot];
	}


	[[nodiscard]] Tile* get_mut(uint8_t slot)
	{
		if (!valid[slot])
			return nullptr;
		return &tiles[slot];
	}


	std::optional<Tile> set(uint8_t slot, std::optional<Tile> tile)
	{
		std::optional<Tile> previous;
		if (valid[slot])
			previous = tiles[slot];

		if (tile) {
			tiles[slot] = *tile;
			valid[slot] = true;
		}
		else {
			valid[slot] = false;
		}

		return previous;
	}


	[[nodiscard]] uint32_t valid_count() const
	{
		uint32_t count = 0;
		for (const bool is_valid : valid)
			count += is_valid ? 1U : 0U;
		return count;
	}


	[[nodiscard]] bool empty() const
	{
		for (const bool is_valid : valid) {
			if (is_valid)
				return false;
		}
		return true;
	}


	[[nodiscard]] std::span<const std::byte, sizeof(Tile) * cfg::chunk_slots + sizeof(bool) * cfg::chunk_slots> as_bytes() const
	{
		return std::span<const std::byte, sizeof(Tile) * cfg::chunk_slots + sizeof(bool) * cfg::chunk_slots> {
			reinterpret_cast<const std::byte*>(this),
			sizeof(Tile) * cfg::chunk_slots + sizeof(bool) * cfg::chunk_slots
		};
	}
};


inline constexpr size_t chunk_tiles_bytes = sizeof(Tile) * cfg::chunk_slots;
inline constexpr size_t chunk_valid_bytes = sizeof(bool) * cfg::chunk_slots;
inline constexpr size_t chunk_byte_size   = chunk_tiles_bytes + chunk_valid_bytes;


static_assert(std::is_standard_layout_v<Chunk>, "chunk must be standard layout to be viewed as bytes");
static_assert(std::is_trivially_copyable_v<Chunk>, "chunk must be trivially copyable to be viewed as bytes");
static_assert(offsetof(Chunk, tiles) == 0, "tile region must start the chunk");
static_assert(offsetof(Chunk, valid) == chunk_tiles_bytes, "validity region must follow the tiles with no gap");
static_assert(sizeof(Chunk) == chunk_byte_size, "chunk must not carry trailing padding");


} // tsr::tile
