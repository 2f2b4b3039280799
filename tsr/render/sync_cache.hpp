#pragma once

#include <cstdint>
#include <utility>

#include "math.hpp"
#include "mtp_memory.hpp"

#include "entity.hpp"
#include "tile_data.hpp"
#include "render_world.hpp"


namespace tsr::rdr {


struct SyncCacheEntry
{
	ecs::Entity      handle {ecs::invalid_entity};
	TilingBuffer     buffer;
	tile::ChunkCoord coord;
	mat4             mtx_M {1.0f};
};


/*
	Carries render records across the presentation rebuild between two cycles.
	Filled by the cache phase, drained by the next extract. Entries are never
	kept longer than one cycle.
*/
class SyncCache
{
public:

	using Entries = mtp::vault<SyncCacheEntry, mtp::default_set>;

public:

	void push(const SyncCacheEntry& entry)
	{
		m_entries.emplace_back(entry);
	}

	[[nodiscard]] Entries take()
	{
		Entries taken = std::move(m_entries);
		m_entries.clear();
		return taken;
	}

	[[nodiscard]] const Entries& entries() const
	{
		return m_entries;
	}

	[[nodiscard]] uint32_t size() const
	{
		return static_cast<uint32_t>(m_entries.size());
	}

	[[nodiscard]] bool empty() const
	{
		return m_entries.empty();
	}

	void clear()
	{
		m_entries.clear();
	}

private:

	Entries m_entries;
};


} // tsr::rdr
