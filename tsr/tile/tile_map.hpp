#pragma once

#include <cstdint>
#include <optional>

#include "log.hpp"
#include "panic.hpp"
#include "mtp_memory.hpp"

#include "tile_data.hpp"
#include "tile_chunk.hpp"


namespace tsr::tile {


class TileMap
{
public:

	using IndexMap = decltype(mtp::make_unordered_map<ChunkCoord, uint32_t, mtp::default_set>());

public:

	void clear()
	{
		m_chunks.clear();
		m_coords.clear();
		m_index.clear();
	}


	[[nodiscard]] bool empty() const
	{
		return m_chunks.empty();
	}


	[[nodiscard]] uint32_t chunk_count() const
	{
		return static_cast<uint32_t>(m_chunks.size());
	}


	[[nodiscard]] bool contains(ChunkCoord coord) const
	{
		return m_index.find(coord) != m_index.end();
	}


	[[nodiscard]] const Chunk* get_chunk(ChunkCoord coord) const
	{
		auto it = m_index.find(coord);
		if (it == m_index.end())
			return nullptr;

		TSR_ASSERT_MSG(it->second < m_chunks.size(), "[tilemap] index map out of range");
		return &m_chunks[it->second];
	}


	[[nodiscard]] Chunk* get_chunk_mut(ChunkCoord coord)
	{
		auto it = m_index.find(coord);
		if (it == m_index.end())
			return nullptr;

		TSR_ASSERT_MSG(it->second < m_chunks.size(), "[tilemap] index map out of range");
		return &m_chunks[it->second];
	}


	[[nodiscard]] const Tile* get_tile(TileCoord coord) const
	{
		const Chunk* chunk = get_chunk(coord.chunk);
		if (!chunk)
			return nullptr;
		return chunk->get(coord.slot);
	}


	std::optional<Tile> set_tile(TileCoord coord, std::optional<Tile> tile)
	{
		if (Chunk* chunk = get_chunk_mut(coord.chunk))
			return chunk->set(coord.slot, tile);

		// removing from a missing chunk must not allocate one
		if (!tile)
			return std::nullopt;

		return ensure_chunk(coord.chunk).set(coord.slot, tile);
	}


	Chunk& ensure_chunk(ChunkCoord coord)
	{
		if (Chunk* existing = get_chunk_mut(coord))
			return *existing;

		const uint32_t new_index = static_cast<uint32_t>(m_chunks.size());

		m_chunks.emplace_back();
		m_coords.emplace_back(coord);
		m_index[coord] = new_index;

		TSR_TRACE(log::LogCategory::tile,
			"[tilemap][ensure_chunk] created [chunk %d %d %d][index %u]",
			coord.x, coord.y, coord.z, new_index
		);

		return m_chunks.back();
	}


	bool remove_chunk(ChunkCoord coord)
	{
		auto it = m_index.find(coord);
		if (it == m_index.end())
			return false;

		const uint32_t index = it->second;
		const uint32_t last  = static_cast<uint32_t>(m_chunks.size() - 1U);

		m_index.erase(it);

		if (index != last) {
			m_chunks[index] = m_chunks[last];
			m_coords[index] = m_coords[last];
			m_index[m_coords[index]] = index;
		}

		m_chunks.pop_back();
		m_coords.pop_back();

		TSR_TRACE(log::LogCategory::tile,
			"[tilemap][remove_chunk] removed [chunk %d %d %d]",
			coord.x, coord.y, coord.z
		);

		return true;
	}


	uint32_t evict_empty_chunks()
	{
		uint32_t evicted = 0;

		// walk backwards so swap-removal never skips an unvisited chunk
		for (uint32_t i = static_cast<uint32_t>(m_chunks.size()); i > 0; --i) {
			const uint32_t index = i - 1U;
			if (!m_chunks[index].empty())
				continue;

			const ChunkCoord coord = m_coords[index];
			remove_chunk(coord);
			++evicted;
		}

		if (evicted > 0) {
			TSR_DEBUG(log::LogCategory::tile,
				"[tilemap][evict_empty_chunks] [evicted %u][remaining %u]",
				evicted, chunk_count()
			);
		}

		return evicted;
	}


	template <typename Func>
	void each_chunk(Func&& func) const
	{
		const uint32_t count = static_cast<uint32_t>(m_chunks.size());
		for (uint32_t i = 0; i < count; ++i) {
			func(m_coords[i], m_chunks[i]);
		}
	}

private:

	mtp::vault<Chunk,      mtp::default_set> m_chunks;
	mtp::vault<ChunkCoord, mtp::default_set> m_coords;

	IndexMap m_index {mtp::make_unordered_map<ChunkCoord, uint32_t, mtp::default_set>()};
};


} // tsr::tile
