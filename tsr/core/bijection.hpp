#pragma once

#include <cstdint>
#include <optional>
#include <utility>

#include "panic.hpp"
#include "mtp_memory.hpp"


namespace tsr {


/*
	One-to-one map kept as two hash maps that are only ever changed together.
	Left and right need std::hash and operator==.
*/
template <typename Left, typename Right>
class Bijection
{
public:

	using Pair      = std::pair<Left, Right>;
	using LeftMap   = decltype(mtp::make_unordered_map<Left, Right, mtp::default_set>());
	using RightMap  = decltype(mtp::make_unordered_map<Right, Left, mtp::default_set>());


	struct Evicted
	{
		std::optional<Pair> by_left;
		std::optional<Pair> by_right;

		[[nodiscard]] bool any() const
		{
			return by_left.has_value() || by_right.has_value();
		}
	};

public:

	Evicted insert(Left left, Right right)
	{
		Evicted evicted {};

		auto left_it = m_left.find(left);
		if (left_it != m_left.end()) {
			if (left_it->second == right)
				return evicted;

			evicted.by_left = Pair {left, left_it->second};
			m_right.erase(left_it->second);
			m_left.erase(left_it);
		}

		auto right_it = m_right.find(right);
		if (right_it != m_right.end()) {
			evicted.by_right = Pair {right_it->second, right};
			m_left.erase(right_it->second);
			m_right.erase(right_it);
		}

		m_left.emplace(left, right);
		m_right.emplace(right, left);

		TSR_ASSERT_MSG(m_left.size() == m_right.size(), "[bijection][insert] sides diverged");
		return evicted;
	}


	std::optional<Right> remove_left(const Left& left)
	{
		auto left_it = m_left.find(left);
		if (left_it == m_left.end())
			return std::nullopt;

		const Right right = left_it->second;
		m_left.erase(left_it);

		const size_t erased = m_right.erase(right);
		TSR_ASSERT_MSG(erased == 1, "[bijection][remove_left] right side missing pair");
		(void) erased;

		return right;
	}


	std::optional<Left> remove_right(const Right& right)
	{
		auto right_it = m_right.find(right);
		if (right_it == m_right.end())
			return std::nullopt;

		const Left left = right_it->second;
		m_right.erase(right_it);

		const size_t erased = m_left.erase(left);
		TSR_ASSERT_MSG(erased == 1, "[bijection][remove_right] left side missing pair");
		(void) erased;

		return left;
	}


	[[nodiscard]] const Right* find_right(const Left& left) const
	{
		auto it = m_left.find(left);
		if (it == m_left.end())
			return nullptr;
		return &it->second;
	}


	[[nodiscard]] const Left* find_left(const Right& right) const
	{
		auto it = m_right.find(right);
		if (it == m_right.end())
			return nullptr;
		return &it->second;
	}


	[[nodiscard]] size_t size() const
	{
		return m_left.size();
	}


	[[nodiscard]] bool empty() const
	{
		return m_left.empty();
	}


	void clear()
	{
		m_left.clear();
		m_right.clear();
	}


	template <typename Func>
	void each(Func&& func) const
	{
		for (const auto& [left, right] : m_left)
			func(left, right);
	}


	[[nodiscard]] bool is_consistent() const
	{
		if (m_left.size() != m_right.size())
			return false;

		for (const auto& [left, right] : m_left) {
			auto right_it = m_right.find(right);
			if (right_it == m_right.end() || !(right_it->second == left))
				return false;
		}

		return true;
	}


	// asymmetry is a caller bug, never a recoverable state
	void check_invariant() const
	{
		if (!is_consistent())
			TSR_PANIC("[bijection] left and right maps disagree");
	}

private:

	LeftMap  m_left  {mtp::make_unordered_map<Left, Right, mtp::default_set>()};
	RightMap m_right {mtp::make_unordered_map<Right, Left, mtp::default_set>()};
};


} // tsr
