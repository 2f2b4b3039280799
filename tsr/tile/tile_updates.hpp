#pragma once

#include <array>
#include <bit>
#include <cstdint>

#include "mtp_memory.hpp"

#include "tile_data.hpp"


namespace tsr::tile {


// 256-bit set of slot indices within one chunk
class SlotSet
{
public:

	void insert(uint8_t slot)
	{
		m_words[slot >> 6] |= (1ULL << (slot & 63U));
	}

	[[nodiscard]] bool contains(uint8_t slot) const
	{
		return (m_words[slot >> 6] & (1ULL << (slot & 63U))) != 0ULL;
	}

	[[nodiscard]] uint32_t count() const
	{
		uint32_t total = 0;
		for (const uint64_t word : m_words)
			total += static_cast<uint32_t>(std::popcount(word));
		return total;
	}

	[[nodiscard]] bool empty() const
	{
		for (const uint64_t word : m_words) {
			if (word != 0ULL)
				return false;
		}
		return true;
	}

	template <typename Func>
	void each(Func&& func) const
	{
		for (uint32_t word_index = 0; word_index < m_words.size(); ++word_index) {
			uint64_t word = m_words[word_index];
			while (word != 0ULL) {
				const uint32_t bit = static_cast<uint32_t>(std::countr_zero(word));
				func(static_cast<uint8_t>(word_index * 64U + bit));
				word &= word - 1ULL;
			}
		}
	}

private:

	std::array<uint64_t, cfg::chunk_slots / 64U> m_words {};
};


/*
	Per-cycle record of changed slots. A key with an empty SlotSet still means
	the chunk is dirty. The host clears the whole tracker once per cycle before
	any writer runs.
*/
class UpdateTracker
{
public:

	using UpdateMap = decltype(mtp::make_unordered_map<ChunkCoord, SlotSet, mtp::default_set>());


	class CoordView
	{
	public:

		class iterator
		{
		public:

			explicit iterator(UpdateMap::const_iterator it)
				: m_it {it}
			{}

			ChunkCoord operator*() const
			{
				return m_it->first;
			}

			iterator& operator++()
			{
				++m_it;
				return *this;
			}

			bool operator==(const iterator& other) const
			{
				return m_it == other.m_it;
			}

			bool operator!=(const iterator& other) const
			{
				return m_it != other.m_it;
			}

		private:

			UpdateMap::const_iterator m_it;
		};

		explicit CoordView(const UpdateMap& updates)
			: m_updates {updates}
		{}

		iterator begin() const { return iterator {m_updates.begin()}; }
		iterator end() const   { return iterator {m_updates.end()}; }

		size_t size() const { return m_updates.size(); }
		bool empty() const  { return m_updates.empty(); }

	private:

		const UpdateMap& m_updates;
	};

public:

	void mark(TileCoord coord)
	{
		m_updates[coord.chunk].insert(coord.slot);
	}


	void mark_chunk(ChunkCoord coord)
	{
		if (m_updates.find(coord) == m_updates.end())
			m_updates.emplace(coord, SlotSet {});
	}


	void forget_chunk(ChunkCoord coord)
	{
		m_updates.erase(coord);
	}


	[[nodiscard]] bool is_dirty(ChunkCoord coord) const
	{
		return m_updates.find(coord) != m_updates.end();
	}


	[[nodiscard]] bool is_slot_dirty(TileCoord coord) const
	{
		auto it = m_updates.find(coord.chunk);
		if (it == m_updates.end())
			return false;
		return it->second.contains(coord.slot);
	}


	[[nodiscard]] const SlotSet* dirty_slots(ChunkCoord coord) const
	{
		auto it = m_updates.find(coord);
		if (it == m_updates.end())
			return nullptr;
		return &it->second;
	}


	// valid until the next mark or clear
	[[nodiscard]] CoordView dirty_coords() const
	{
		return CoordView {m_updates};
	}


	[[nodiscard]] uint32_t dirty_count() const
	{
		return static_cast<uint32_t>(m_updates.size());
	}


	void clear_all()
	{
		m_updates.clear();
	}

private:

	UpdateMap m_updates {mtp::make_unordered_map<ChunkCoord, SlotSet, mtp::default_set>()};
};


} // tsr::tile
