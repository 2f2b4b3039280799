#pragma once

#include <cstdint>
#include <optional>
#include <utility>

#include "mtp_memory.hpp"

#include "handle.hpp"


namespace tsr::res {


/*
	Slot pool addressed by generational handles. Destroyed slots are reused;
	bumping magic on every create and destroy invalidates older handles.
*/
template<typename T>
class HandleStore
{
public:

	explicit HandleStore(uint32_t capacity = 0)
	{
		m_slots.reserve(capacity);
		m_freed.reserve(capacity);
	}

	HandleStore(const HandleStore&) = delete;
	HandleStore& operator=(const HandleStore&) = delete;

	HandleStore(HandleStore&&) noexcept = default;
	HandleStore& operator=(HandleStore&&) noexcept = default;


	template<typename... Types>
	[[nodiscard]] Handle<T> create(Types&&... args)
	{
		uint32_t index;

		if (!m_freed.empty()) {
			index = m_freed.back();
			m_freed.pop_back();
		}
		else {
			index = static_cast<uint32_t>(m_slots.size());
			m_slots.emplace_back();
		}

		Slot& slot = m_slots[index];
		slot.value.emplace(std::forward<Types>(args)...);
		++slot.magic;

		++m_active_count;

		return Handle<T> {index, slot.magic};
	}


	// returns false for null, stale or already destroyed handles
	bool destroy(Handle<T> handle)
	{
		Slot* slot = find_slot(handle);
		if (!slot)
			return false;

		slot->value.reset();
		++slot->magic;

		m_freed.emplace_back(handle.index);
		--m_active_count;

		return true;
	}


	[[nodiscard]] T* get(Handle<T> handle)
	{
		Slot* slot = find_slot(handle);
		return slot ? &*slot->value : nullptr;
	}


	[[nodiscard]] const T* get(Handle<T> handle) const
	{
		const Slot* slot = find_slot(handle);
		return slot ? &*slot->value : nullptr;
	}


	template<typename Func>
	void each(Func&& func)
	{
		for (uint32_t i = 0; i < m_slots.size(); ++i) {
			Slot& slot = m_slots[i];
			if (slot.value)
				func(Handle<T> {i, slot.magic}, *slot.value);
		}
	}


	[[nodiscard]] uint32_t size() const
	{
		return m_active_count;
	}


	[[nodiscard]] uint32_t capacity() const
	{
		return static_cast<uint32_t>(m_slots.size());
	}

private:

	struct Slot
	{
		std::optional<T> value;
		uint32_t         magic {0};
	};


	Slot* find_slot(Handle<T> handle)
	{
		if (handle.index >= m_slots.size())
			return nullptr;

		Slot& slot = m_slots[handle.index];
		if (!slot.value || slot.magic != handle.magic)
			return nullptr;

		return &slot;
	}


	const Slot* find_slot(Handle<T> handle) const
	{
		if (handle.index >= m_slots.size())
			return nullptr;

		const Slot& slot = m_slots[handle.index];
		if (!slot.value || slot.magic != handle.magic)
			return nullptr;

		return &slot;
	}

private:

	mtp::vault<Slot,     mtp::default_set> m_slots;
	mtp::vault<uint32_t, mtp::default_set> m_freed;

	uint32_t m_active_count {0};
};

} // tsr::res
