#pragma once

#include <cstdint>


namespace tsr {


inline constexpr uint32_t k_null_index {0xFFFFFFFFU};


/*
	Generational slot reference. T only tags the handle; the slot's magic
	changes on every reuse, so a handle outliving its value never resolves.
*/
template<typename T>
struct Handle
{
	uint32_t index {k_null_index};
	uint32_t magic {0};

	constexpr Handle() noexcept = default;

	constexpr Handle(uint32_t slot_index, uint32_t slot_magic) noexcept
		: index {slot_index}
		, magic {slot_magic}
	{}

	[[nodiscard]] static constexpr Handle null() noexcept
	{
		return Handle {};
	}

	[[nodiscard]] constexpr bool is_valid() const noexcept
	{
		return index != k_null_index;
	}

	constexpr bool operator==(const Handle& other) const noexcept
	{
		return index == other.index && magic == other.magic;
	}

	constexpr bool operator!=(const Handle& other) const noexcept
	{
		return !(*this == other);
	}
};


// retags a handle; used where a store's value type differs from the public tag
template<typename To, typename From>
[[nodiscard]] constexpr Handle<To> handle_cast(Handle<From> handle) noexcept
{
	return Handle<To> {handle.index, handle.magic};
}


} // tsr

