#pragma once

#include <optional>
#include <utility>

#include "bijection.hpp"
#include "entity.hpp"
#include "tile_data.hpp"


namespace tsr::chunk {


/*
	Chunk coordinate <-> chunk entity. Both directions change in one call, so a
	coordinate never points at an entity that points somewhere else.
*/
class ChunkHandleMap
{
public:

	using Mapping = Bijection<tile::ChunkCoord, ecs::Entity>;
	using Evicted = Mapping::Evicted;

public:

	// returns whatever pairing the new one displaced, on either side
	Evicted insert(tile::ChunkCoord coord, ecs::Entity handle)
	{
		return m_mapping.insert(coord, handle);
	}

	std::optional<ecs::Entity> remove_by_coord(tile::ChunkCoord coord)
	{
		return m_mapping.remove_left(coord);
	}

	std::optional<tile::ChunkCoord> remove_by_handle(ecs::Entity handle)
	{
		return m_mapping.remove_right(handle);
	}

	[[nodiscard]] std::optional<ecs::Entity> find_handle(tile::ChunkCoord coord) const
	{
		if (const ecs::Entity* handle = m_mapping.find_right(coord))
			return *handle;
		return std::nullopt;
	}

	[[nodiscard]] std::optional<tile::ChunkCoord> find_coord(ecs::Entity handle) const
	{
		if (const tile::ChunkCoord* coord = m_mapping.find_left(handle))
			return *coord;
		return std::nullopt;
	}

	[[nodiscard]] size_t size() const
	{
		return m_mapping.size();
	}

	void clear()
	{
		m_mapping.clear();
	}

	template <typename Func>
	void each(Func&& func) const
	{
		m_mapping.each(std::forward<Func>(func));
	}

	[[nodiscard]] bool is_consistent() const
	{
		return m_mapping.is_consistent();
	}

	void check_invariant() const
	{
		m_mapping.check_invariant();
	}

private:

	Mapping m_mapping;
};


} // tsr::chunk
