#pragma once

#include <cstdint>
#include <optional>
#include <utility>

#include "math.hpp"
#include "mtp_memory.hpp"

#include "entity.hpp"
#include "tile_data.hpp"
#include "resource_forge.hpp"


namespace tsr::rdr {


enum class BufferState : uint8_t
{
	unloaded = 0,
	unmeshed,
	meshed
};


struct TilingBuffer
{
	BufferState    state {BufferState::unloaded};
	ResourceHandle raw;
	ResourceHandle mesh;

	[[nodiscard]] static TilingBuffer unmeshed(ResourceHandle raw_resource)
	{
		TilingBuffer buffer {};
		buffer.state = BufferState::unmeshed;
		buffer.raw   = raw_resource;
		return buffer;
	}
};


inline void release_buffer(TilingBuffer& buffer, ResourceForge& forge)
{
	if (buffer.raw.is_valid())
		forge.destroy_resource(buffer.raw);
	if (buffer.mesh.is_valid())
		forge.destroy_resource(buffer.mesh);

	buffer = TilingBuffer {};
}


struct RenderChunk
{
	tile::ChunkCoord key;
	TilingBuffer     buffer;
	mat4             mtx_M {1.0f};
};


/*
	Presentation-side chunk records keyed by the simulation chunk entity.
	The world owns no resources itself: whoever removes or replaces a record
	is responsible for its buffer.
*/
class RenderWorld
{
public:

	using ChunkMap = decltype(mtp::make_unordered_map<ecs::Entity, RenderChunk, mtp::default_set>());

public:

	// returns the record it replaced, if any
	std::optional<RenderChunk> upsert(ecs::Entity handle, const RenderChunk& chunk)
	{
		auto it = m_chunks.find(handle);
		if (it == m_chunks.end()) {
			m_chunks.emplace(handle, chunk);
			return std::nullopt;
		}

		RenderChunk previous = it->second;
		it->second = chunk;
		return previous;
	}


	std::optional<RenderChunk> remove(ecs::Entity handle)
	{
		auto it = m_chunks.find(handle);
		if (it == m_chunks.end())
			return std::nullopt;

		RenderChunk removed = it->second;
		m_chunks.erase(it);
		return removed;
	}


	[[nodiscard]] RenderChunk* find(ecs::Entity handle)
	{
		auto it = m_chunks.find(handle);
		if (it == m_chunks.end())
			return nullptr;
		return &it->second;
	}


	[[nodiscard]] const RenderChunk* find(ecs::Entity handle) const
	{
		auto it = m_chunks.find(handle);
		if (it == m_chunks.end())
			return nullptr;
		return &it->second;
	}


	// linear; meant for inspection and tests
	[[nodiscard]] uint32_t count_key(tile::ChunkCoord key) const
	{
		uint32_t count = 0;
		for (const auto& [handle, chunk] : m_chunks) {
			if (chunk.key == key)
				++count;
		}
		return count;
	}


	template <typename Func>
	void each(Func&& func)
	{
		for (auto& [handle, chunk] : m_chunks)
			func(handle, chunk);
	}


	template <typename Func>
	void each(Func&& func) const
	{
		for (const auto& [handle, chunk] : m_chunks)
			func(handle, chunk);
	}


	[[nodiscard]] uint32_t size() const
	{
		return static_cast<uint32_t>(m_chunks.size());
	}


	[[nodiscard]] bool empty() const
	{
		return m_chunks.empty();
	}


	void clear()
	{
		m_chunks.clear();
	}

private:

	ChunkMap m_chunks {mtp::make_unordered_map<ecs::Entity, RenderChunk, mtp::default_set>()};
};


} // tsr::rdr
