#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>

#include "log.hpp"
#include "mtp_memory.hpp"

#include "handle_store.hpp"
#include "resource_forge.hpp"


namespace tsr::rdr {


// keeps a byte copy per resource; used headless and for inspection
class HostForge final : public ResourceForge
{
public:

	using Bytes = mtp::vault<std::byte, mtp::default_set>;

	explicit HostForge(uint32_t capacity = 256)
		: m_buffers {capacity}
	{}

	[[nodiscard]] ResourceHandle create_resource(std::span<const std::byte> bytes) override
	{
		Bytes copy;
		copy.reserve(bytes.size());
		for (const std::byte value : bytes)
			copy.emplace_back(value);

		const Handle<Bytes> handle = m_buffers.create(std::move(copy));
		++m_created;

		return handle_cast<TileResource>(handle);
	}

	void destroy_resource(ResourceHandle handle) override
	{
		if (!m_buffers.destroy(handle_cast<Bytes>(handle))) {
			TSR_WARN(log::LogCategory::sync,
				"[host_forge][destroy] unknown handle [index %u][magic %u]",
				handle.index, handle.magic
			);
		}
	}

	[[nodiscard]] uint32_t live_count() const override
	{
		return m_buffers.size();
	}

	[[nodiscard]] uint64_t created_count() const override
	{
		return m_created;
	}

	[[nodiscard]] std::span<const std::byte> bytes(ResourceHandle handle) const
	{
		const Bytes* buffer = m_buffers.get(handle_cast<Bytes>(handle));
		if (!buffer)
			return {};
		return std::span<const std::byte> {buffer->data(), buffer->size()};
	}

	[[nodiscard]] bool is_live(ResourceHandle handle) const
	{
		return m_buffers.get(handle_cast<Bytes>(handle)) != nullptr;
	}

private:

	res::HandleStore<Bytes> m_buffers;

	uint64_t m_created {0};
};


} // tsr::rdr
