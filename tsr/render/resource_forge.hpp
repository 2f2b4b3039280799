#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

#include "handle.hpp"


namespace tsr::rdr {


// opaque tag; the forge decides what a resource is
struct TileResource;

using ResourceHandle = Handle<TileResource>;


enum class ForgeBackend : uint8_t
{
	host = 0,
	sokol
};


/*
	Creates presentation resources from raw chunk bytes. Every handle returned by
	create_resource must eventually be passed to destroy_resource exactly once.
*/
class ResourceForge
{
public:

	virtual ~ResourceForge() = default;

	[[nodiscard]] virtual ResourceHandle create_resource(std::span<const std::byte> bytes) = 0;

	virtual void destroy_resource(ResourceHandle handle) = 0;

	[[nodiscard]] virtual uint32_t live_count() const = 0;

	[[nodiscard]] virtual uint64_t created_count() const = 0;
};


[[nodiscard]] std::unique_ptr<ResourceForge> make_forge(ForgeBackend backend);


[[nodiscard]] const char* forge_backend_name(ForgeBackend backend);


} // tsr::rdr
