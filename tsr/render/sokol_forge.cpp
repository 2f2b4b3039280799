#include "sokol_forge.hpp"

#include "log.hpp"
#include "panic.hpp"


namespace tsr::rdr {


SokolForge::~SokolForge()
{
	if (m_buffers.size() == 0)
		return;

	TSR_WARN(log::LogCategory::sync,
		"[sokol_forge][shutdown] releasing leftover buffers [count %u]",
		m_buffers.size()
	);

	if (!sg_isvalid())
		return;

	m_buffers.each([](Handle<sg_buffer>, sg_buffer& buffer) {
		sg_destroy_buffer(buffer);
	});
}


ResourceHandle SokolForge::create_resource(std::span<const std::byte> bytes)
{
	TSR_ASSERT_MSG(!bytes.empty(), "[sokol_forge] empty upload");
	TSR_ASSERT_MSG(bytes.size() % 4U == 0U, "[sokol_forge] storage buffer size must be a multiple of 4");

	sg_buffer_desc buffer_desc {};
	buffer_desc.usage.storage_buffer = true;
	buffer_desc.usage.immutable      = true;
	buffer_desc.data.ptr             = bytes.data();
	buffer_desc.data.size            = bytes.size();
	buffer_desc.label                = "tile_chunk_buf";

	const sg_buffer buffer = sg_make_buffer(&buffer_desc);

	if (sg_query_buffer_state(buffer) != SG_RESOURCESTATE_VALID) {
		TSR_ERROR(log::LogCategory::sync,
			"[sokol_forge][create] sg_make_buffer fail [bytes %zu]",
			bytes.size()
		);
		sg_destroy_buffer(buffer);
		return ResourceHandle::null();
	}

	const Handle<sg_buffer> handle = m_buffers.create(buffer);
	++m_created;

	return handle_cast<TileResource>(handle);
}


void SokolForge::destroy_resource(ResourceHandle handle)
{
	const Handle<sg_buffer> buffer_handle = handle_cast<sg_buffer>(handle);

	const sg_buffer* buffer = m_buffers.get(buffer_handle);
	if (!buffer) {
		TSR_WARN(log::LogCategory::sync,
			"[sokol_forge][destroy] unknown handle [index %u][magic %u]",
			handle.index, handle.magic
		);
		return;
	}

	sg_destroy_buffer(*buffer);
	m_buffers.destroy(buffer_handle);
}


sg_buffer SokolForge::buffer(ResourceHandle handle) const
{
	const sg_buffer* buffer = m_buffers.get(handle_cast<sg_buffer>(handle));
	if (!buffer)
		return {};
	return *buffer;
}


} // tsr::rdr
