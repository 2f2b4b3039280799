#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "sokol_gfx.h"

#include "handle_store.hpp"
#include "resource_forge.hpp"


namespace tsr::rdr {


/*
	One immutable storage buffer per chunk upload. sg_setup must have run on the
	calling thread before the first create_resource.
*/
class SokolForge final : public ResourceForge
{
public:

	explicit SokolForge(uint32_t capacity = 256)
		: m_buffers {capacity}
	{}

	~SokolForge() override;

	SokolForge(const SokolForge&) = delete;
	SokolForge& operator=(const SokolForge&) = delete;

	[[nodiscard]] ResourceHandle create_resource(std::span<const std::byte> bytes) override;

	void destroy_resource(ResourceHandle handle) override;

	[[nodiscard]] uint32_t live_count() const override
	{
		return m_buffers.size();
	}

	[[nodiscard]] uint64_t created_count() const override
	{
		return m_created;
	}

	[[nodiscard]] sg_buffer buffer(ResourceHandle handle) const;

private:

	res::HandleStore<sg_buffer> m_buffers;

	uint64_t m_created {0};
};


} // tsr::rdr
