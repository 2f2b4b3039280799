#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include "log.hpp"
#include "mtp_memory.hpp"

#include "tile_data.hpp"
#include "tile_chunk.hpp"
#include "tile_map.hpp"
#include "tile_updates.hpp"


namespace tsr::tile {


struct TileWrite
{
	TileCoord           coord;
	std::optional<Tile> tile;
};


enum class EditResult : uint8_t
{
	ok = 0,
	duplicate_coord
};


struct EditOutcome
{
	EditResult result  {EditResult::ok};
	uint32_t   changed {0};
};


class TileReader
{
public:

	TileReader(const TileMap& map, const UpdateTracker& updates)
		: m_map     {map}
		, m_updates {updates}
	{}

	[[nodiscard]] const Tile* get_tile(TileCoord coord) const
	{
		return m_map.get_tile(coord);
	}

	[[nodiscard]] const Chunk* get_chunk(ChunkCoord coord) const
	{
		return m_map.get_chunk(coord);
	}

	[[nodiscard]] bool is_chunk_dirty(ChunkCoord coord) const
	{
		return m_updates.is_dirty(coord);
	}

	[[nodiscard]] UpdateTracker::CoordView dirty_coords() const
	{
		return m_updates.dirty_coords();
	}

private:

	const TileMap&       m_map;
	const UpdateTracker& m_updates;
};


class TileWriter
{
public:

	TileWriter(TileMap& map, UpdateTracker& updates)
		: m_map     {map}
		, m_updates {updates}
	{}

	[[nodiscard]] TileReader reader() const
	{
		return TileReader {m_map, m_updates};
	}

	[[nodiscard]] const Tile* get_tile(TileCoord coord) const
	{
		return m_map.get_tile(coord);
	}

	[[nodiscard]] const Chunk* get_chunk(ChunkCoord coord) const
	{
		return m_map.get_chunk(coord);
	}

	[[nodiscard]] bool is_chunk_dirty(ChunkCoord coord) const
	{
		return m_updates.is_dirty(coord);
	}

	[[nodiscard]] UpdateTracker::CoordView dirty_coords() const
	{
		return m_updates.dirty_coords();
	}


	// marks the slot only when the stored value actually changes
	std::optional<Tile> set_tile(TileCoord coord, std::optional<Tile> tile)
	{
		const std::optional<Tile> previous = m_map.set_tile(coord, tile);
		if (previous != tile)
			m_updates.mark(coord);
		return previous;
	}


	std::optional<Tile> set_tile_silent(TileCoord coord, std::optional<Tile> tile)
	{
		return m_map.set_tile(coord, tile);
	}


	void mark_chunk_dirty(ChunkCoord coord)
	{
		m_updates.mark_chunk(coord);
	}


	// checked mutable access, never marks dirty
	[[nodiscard]] Tile* get_tile_mut(TileCoord coord)
	{
		Chunk* chunk = m_map.get_chunk_mut(coord.chunk);
		if (!chunk)
			return nullptr;
		return chunk->get_mut(coord.slot);
	}

	[[nodiscard]] Chunk* get_chunk_mut(ChunkCoord coord)
	{
		return m_map.get_chunk_mut(coord);
	}


	/*
		Unchecked mutable access through a shared writer.

		Preconditions, not verified:
		  - no two pointers to the same slot are live at once,
		  - no reader observes the slot while it is being written,
		  - no chunk is created or removed while the pointer is held
		    (the chunk arena may move).

		Writes through these pointers never mark dirty. Prefer apply_disjoint.
	*/
	[[nodiscard]] Tile* get_tile_mut_unchecked(TileCoord coord) const
	{
		Chunk* chunk = m_map.get_chunk_mut(coord.chunk);
		if (!chunk)
			return nullptr;
		return chunk->get_mut(coord.slot);
	}

	[[nodiscard]] Chunk* get_chunk_mut_unchecked(ChunkCoord coord) const
	{
		return m_map.get_chunk_mut(coord);
	}


	/*
		Applies a batch of writes to pairwise distinct slots. The whole batch is
		rejected before any write if a coordinate repeats. Each write follows the
		set_tile debounce rule.
	*/
	EditOutcome apply_disjoint(std::span<const TileWrite> writes)
	{
		auto seen = mtp::make_unordered_map<ChunkCoord, SlotSet, mtp::default_set>();

		for (const TileWrite& write : writes) {
			SlotSet& slots = seen[write.coord.chunk];
			if (slots.contains(write.coord.slot)) {
				TSR_WARN(log::LogCategory::tile,
					"[writer][apply_disjoint] duplicate coord [chunk %d %d %d][slot %u][writes %zu]",
					write.coord.chunk.x, write.coord.chunk.y, write.coord.chunk.z,
					static_cast<unsigned>(write.coord.slot),
					writes.size()
				);
				return EditOutcome {EditResult::duplicate_coord, 0};
			}
			slots.insert(write.coord.slot);
		}

		EditOutcome outcome {};

		for (const TileWrite& write : writes) {
			const std::optional<Tile> previous = set_tile(write.coord, write.tile);
			if (previous != write.tile)
				++outcome.changed;
		}

		return outcome;
	}


	// drops the chunk and its dirty mark for this cycle
	bool remove_chunk(ChunkCoord coord)
	{
		if (!m_map.remove_chunk(coord))
			return false;

		m_updates.forget_chunk(coord);
		return true;
	}

private:

	TileMap&       m_map;
	UpdateTracker& m_updates;
};


} // tsr::tile
