#include "chunk_sync.hpp"

#include "log.hpp"
#include "mtp_memory.hpp"


namespace tsr::chunk {


namespace {


uint32_t retire_orphans(const ChunkSyncContext& context)
{
	mtp::vault<ecs::Entity, mtp::default_set> orphans;

	context.handles.each([&context, &orphans](tile::ChunkCoord coord, ecs::Entity handle) {
		if (!context.tiles.contains(coord))
			orphans.emplace_back(handle);
	});

	for (const ecs::Entity handle : orphans) {
		const auto coord = context.handles.remove_by_handle(handle);
		context.registry.destroy_entity(handle);

		TSR_DEBUG(log::LogCategory::chunk,
			"[chunk_sync][retire] [entity %u][chunk %d %d %d]",
			handle, coord->x, coord->y, coord->z
		);
	}

	return static_cast<uint32_t>(orphans.size());
}


uint32_t spawn_missing(const ChunkSyncContext& context)
{
	uint32_t spawned = 0;

	for (const tile::ChunkCoord coord : context.updates.dirty_coords()) {

		if (!context.tiles.contains(coord))
			continue;

		if (context.handles.find_handle(coord))
			continue;

		const ecs::Entity entity = context.registry.create_entity();

		context.registry.add<ecs::ChunkComponent>(entity, coord);
		context.registry.add<ecs::ChunkTransformComponent>(entity,
			math::chunk_model_matrix(coord.as_ivec3(), tile::cfg::chunk_extent, context.tile_size)
		);

		const ChunkHandleMap::Evicted evicted = context.handles.insert(coord, entity);
		if (evicted.any()) {
			// a recycled entity id was still mapped: someone destroyed it behind our back
			TSR_ERROR(log::LogCategory::chunk,
				"[chunk_sync][spawn] stale mapping evicted [entity %u][chunk %d %d %d]",
				entity, coord.x, coord.y, coord.z
			);
		}

		++spawned;
	}

	return spawned;
}


uint32_t link_unlinked(const ChunkSyncContext& context)
{
	mtp::vault<ecs::Entity, mtp::default_set> unlinked;

	context.registry.each<ecs::ChunkComponent>(
		[&context, &unlinked](ecs::Entity entity, const ecs::ChunkComponent&) {
			if (!context.registry.has<ecs::RenderLinkComponent>(entity))
				unlinked.emplace_back(entity);
		}
	);

	for (const ecs::Entity entity : unlinked) {
		ecs::RenderLinkComponent link {};
		link.linked_cycle = context.cycle;
		context.registry.add<ecs::RenderLinkComponent>(entity, link);
	}

	return static_cast<uint32_t>(unlinked.size());
}


} // anonymous


ChunkSyncStats update(const ChunkSyncContext& context)
{
	ChunkSyncStats stats {};

	stats.retired = retire_orphans(context);
	stats.spawned = spawn_missing(context);
	stats.linked  = link_unlinked(context);

	if (stats.retired != 0 || stats.spawned != 0) {
		TSR_DEBUG(log::LogCategory::chunk,
			"[chunk_sync][update] [cycle %llu][spawned %u][retired %u][linked %u][mapped %zu]",
			static_cast<unsigned long long>(context.cycle),
			stats.spawned, stats.retired, stats.linked,
			context.handles.size()
		);
	}

	return stats;
}


} // tsr::chunk
