#pragma once

#include <tuple>
#include <utility>
#include <type_traits>

#include "mtp_memory.hpp"

#include "handle.hpp"
#include "entity.hpp"


namespace tsr::ecs {


inline constexpr uint32_t k_no_slot {0xFFFFFFFFU};


/*
	Sparse-set registry with a fixed component list. Entities are recycled
	indices; EntityHandle adds the generation so stale ids are rejected.
*/
template <typename... Components>
class Registry
{
public:

	Entity create_entity()
	{
		if (!m_free.empty()) {
			const Entity entity = m_free.back();
			m_free.pop_back();
			m_alive[entity] = 1U;
			++m_live_count;
			return entity;
		}

		const Entity entity = static_cast<Entity>(m_generation.size());

		m_generation.emplace_back(1U);
		m_alive.emplace_back(1U);
		++m_live_count;

		return entity;
	}


	[[nodiscard]] EntityHandle handle_of(Entity entity) const
	{
		if (!alive(entity))
			return EntityHandle::null();
		return { entity, m_generation[entity] };
	}


	void destroy_entity(Entity entity)
	{
		if (!alive(entity))
			return;

		for_each_column([entity](auto& column) {
			column.erase(entity);
		});

		m_alive[entity] = 0U;
		++m_generation[entity];
		m_free.emplace_back(entity);
		--m_live_count;
	}


	void destroy_entity(EntityHandle handle)
	{
		if (is_valid(handle))
			destroy_entity(handle.index);
	}


	template <typename T>
	[[nodiscard]] bool has(Entity entity) const
	{
		const auto& column = get_column<T>();
		return entity < column.sparse.size() && column.sparse[entity] != k_no_slot;
	}


	template <typename T, typename... Types>
	T& add(Entity entity, Types&&... args)
	{
		auto& column = get_column<T>();

		if (entity >= column.sparse.size())
			column.sparse.resize(static_cast<size_t>(entity) + 1U, k_no_slot);

		const uint32_t slot = column.sparse[entity];
		if (slot != k_no_slot) {
			column.values[slot] = T {std::forward<Types>(args)...};
			return column.values[slot];
		}

		column.sparse[entity] = static_cast<uint32_t>(column.values.size());
		column.entities.emplace_back(entity);
		return column.values.emplace_back(T {std::forward<Types>(args)...});
	}


	template <typename T>
	void remove(Entity entity)
	{
		get_column<T>().erase(entity);
	}


	template <typename T>
	[[nodiscard]] T* get(Entity entity)
	{
		auto& column = get_column<T>();
		if (entity >= column.sparse.size() || column.sparse[entity] == k_no_slot)
			return nullptr;
		return &column.values[column.sparse[entity]];
	}


	template <typename T>
	[[nodiscard]] const T* get(Entity entity) const
	{
		const auto& column = get_column<T>();
		if (entity >= column.sparse.size() || column.sparse[entity] == k_no_slot)
			return nullptr;
		return &column.values[column.sparse[entity]];
	}


	template <typename T, typename Func>
	void each(Func&& func)
	{
		auto& column = get_column<T>();
		for (size_t i = 0; i < column.values.size(); ++i)
			func(column.entities[i], column.values[i]);
	}


	template <typename T, typename Func>
	void each(Func&& func) const
	{
		const auto& column = get_column<T>();
		for (size_t i = 0; i < column.values.size(); ++i)
			func(column.entities[i], column.values[i]);
	}


	// visits entities holding Primary and every Secondary; Primary drives the order
	template <typename Primary, typename... Secondary, typename Func>
	void scan(Func&& func)
	{
		auto& primary = get_column<Primary>();
		for (size_t i = 0; i < primary.values.size(); ++i) {
			const Entity entity = primary.entities[i];
			if (!(has<Secondary>(entity) && ...))
				continue;
			func(entity, primary.values[i], *get<Secondary>(entity)...);
		}
	}


	template <typename T>
	[[nodiscard]] size_t size() const
	{
		return get_column<T>().values.size();
	}


	[[nodiscard]] bool alive(Entity entity) const
	{
		return entity < m_alive.size() && m_alive[entity] != 0U;
	}


	[[nodiscard]] bool is_valid(EntityHandle handle) const
	{
		return alive(handle.index) && m_generation[handle.index] == handle.magic;
	}


	[[nodiscard]] size_t entity_count() const
	{
		return m_live_count;
	}


	void clear()
	{
		for_each_column([](auto& column) {
			column.clear();
		});

		m_free.clear();
		m_generation.clear();
		m_alive.clear();
		m_live_count = 0;
	}

private:

	template <typename T>
	struct Column
	{
		mtp::vault<Entity,   mtp::default_set> entities;
		mtp::vault<T,        mtp::default_set> values;
		mtp::vault<uint32_t, mtp::default_set> sparse;

		void erase(Entity entity)
		{
			if (entity >= sparse.size() || sparse[entity] == k_no_slot)
				return;

			const uint32_t slot = sparse[entity];
			const uint32_t last = static_cast<uint32_t>(values.size() - 1U);

			if (slot != last) {
				values[slot]   = std::move(values[last]);
				entities[slot] = entities[last];
				sparse[entities[slot]] = slot;
			}

			values.pop_back();
			entities.pop_back();
			sparse[entity] = k_no_slot;
		}

		void clear()
		{
			entities.clear();
			values.clear();
			sparse.clear();
		}
	};


	template <typename T>
	static constexpr bool is_registered_v = (std::is_same_v<T, Components> || ...);


	template <typename T>
	Column<T>& get_column()
	{
		static_assert(is_registered_v<T>, "[registry] component T is not registered");
		return std::get<Column<T>>(m_columns);
	}


	template <typename T>
	const Column<T>& get_column() const
	{
		static_assert(is_registered_v<T>, "[registry] component T is not registered");
		return std::get<Column<T>>(m_columns);
	}


	template <typename Func>
	void for_each_column(Func&& func)
	{
		std::apply([&func](auto&... column) { (func(column), ...); }, m_columns);
	}

private:

	std::tuple<Column<Components>...> m_columns;

	mtp::vault<Entity,   mtp::default_set> m_free;
	mtp::vault<uint32_t, mtp::default_set> m_generation;
	mtp::vault<uint8_t,  mtp::default_set> m_alive;

	size_t m_live_count {0};
};

} // tsr::ecs
