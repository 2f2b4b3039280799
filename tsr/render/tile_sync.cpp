#include "tile_sync.hpp"

#include "log.hpp"
#include "panic.hpp"


namespace tsr::rdr {


namespace {


bool is_stale(const ExtractContext& context, const SyncCacheEntry& entry)
{
	if (!context.writer.get_chunk(entry.coord))
		return true;

	const auto bound = context.handles.find_handle(entry.coord);
	return !bound || *bound != entry.handle;
}


void replay_cached(const ExtractContext& context, ExtractStats& stats)
{
	SyncCache::Entries entries = context.cache.take();

	for (SyncCacheEntry& entry : entries) {

		// a record still in the world (retained sync) is authoritative over its snapshot:
		// it may have been unloaded or meshed since the cache phase
		RenderChunk* live = context.world.find(entry.handle);

		if (is_stale(context, entry)) {
			TSR_TRACE(log::LogCategory::sync,
				"[sync][extract] drop [entity %u][chunk %d %d %d]",
				entry.handle, entry.coord.x, entry.coord.y, entry.coord.z
			);

			release_buffer(live ? live->buffer : entry.buffer, context.forge);
			context.world.remove(entry.handle);
			++stats.dropped;
			continue;
		}

		const BufferState state = live ? live->buffer.state : entry.buffer.state;

		if (state == BufferState::unloaded && !context.writer.is_chunk_dirty(entry.coord)) {
			// TODO: limit this to chunks entering the view once visibility is known here
			context.writer.mark_chunk_dirty(entry.coord);
			++stats.forced;
		}

		if (!live) {
			context.world.upsert(entry.handle, RenderChunk {
				.key    = entry.coord,
				.buffer = entry.buffer,
				.mtx_M  = entry.mtx_M
			});
		}
		++stats.replayed;
	}
}


void regenerate_dirty(const ExtractContext& context, ExtractStats& stats)
{
	for (const tile::ChunkCoord coord : context.writer.dirty_coords()) {

		const tile::Chunk* chunk = context.writer.get_chunk(coord);
		if (!chunk)
			continue;

		const auto handle = context.handles.find_handle(coord);
		if (!handle) {
			TSR_ERROR(log::LogCategory::sync,
				"[sync][extract] dirty chunk has no entity, skipped [chunk %d %d %d]",
				coord.x, coord.y, coord.z
			);
			++stats.unmapped;
			continue;
		}

		const ResourceHandle raw = context.forge.create_resource(chunk->as_bytes());
		if (!raw.is_valid()) {
			TSR_ERROR(log::LogCategory::sync,
				"[sync][extract] resource creation fail [entity %u][chunk %d %d %d]",
				*handle, coord.x, coord.y, coord.z
			);
			++stats.failed;
			continue;
		}

		mat4 mtx_M {1.0f};
		if (const auto* transform = context.registry.get<ecs::ChunkTransformComponent>(*handle))
			mtx_M = transform->world;

		auto replaced = context.world.upsert(*handle, RenderChunk {
			.key    = coord,
			.buffer = TilingBuffer::unmeshed(raw),
			.mtx_M  = mtx_M
		});

		if (replaced)
			release_buffer(replaced->buffer, context.forge);

		if (auto* link = context.registry.get<ecs::RenderLinkComponent>(*handle)) {
			link->extracted_cycle = context.cycle;
			++link->regenerations;
		}

		++stats.regenerated;
	}
}


} // anonymous


const char* sync_strategy_name(SyncStrategy strategy)
{
	switch (strategy) {
	case SyncStrategy::immediate: return "immediate";
	case SyncStrategy::retained:  return "retained";
	}
	return "unknown";
}


uint32_t cache_phase(RenderWorld& world, SyncCache& cache, SyncStrategy strategy)
{
	if (!cache.empty()) {
		TSR_PANIC_FMT("[sync][cache_phase] cache still holds %u entries, extract did not run",
			cache.size()
		);
	}

	world.each([&cache](ecs::Entity handle, const RenderChunk& chunk) {
		cache.push(SyncCacheEntry {
			.handle = handle,
			.buffer = chunk.buffer,
			.coord  = chunk.key,
			.mtx_M  = chunk.mtx_M
		});
	});

	if (strategy == SyncStrategy::immediate)
		world.clear();

	return cache.size();
}


ExtractStats extract(const ExtractContext& context)
{
	ExtractStats stats {};

	replay_cached(context, stats);
	regenerate_dirty(context, stats);

	TSR_DEBUG(log::LogCategory::sync,
		"[sync][extract] [cycle %llu][replayed %u][dropped %u][forced %u][regenerated %u][world %u]",
		static_cast<unsigned long long>(context.cycle),
		stats.replayed, stats.dropped, stats.forced, stats.regenerated,
		context.world.size()
	);

	return stats;
}


bool unload(RenderWorld& world, ResourceForge& forge, ecs::Entity handle)
{
	RenderChunk* chunk = world.find(handle);
	if (!chunk)
		return false;

	release_buffer(chunk->buffer, forge);
	return true;
}


bool attach_mesh(RenderWorld& world, ResourceForge& forge, ecs::Entity handle, ResourceHandle mesh)
{
	RenderChunk* chunk = world.find(handle);
	if (!chunk || chunk->buffer.state == BufferState::unloaded)
		return false;

	if (chunk->buffer.mesh.is_valid() && chunk->buffer.mesh != mesh)
		forge.destroy_resource(chunk->buffer.mesh);

	chunk->buffer.mesh  = mesh;
	chunk->buffer.state = BufferState::meshed;
	return true;
}


void release_all(RenderWorld& world, SyncCache& cache, ResourceForge& forge)
{
	SyncCache::Entries entries = cache.take();

	// under retained sync a live record owns whatever its snapshot still points at
	for (SyncCacheEntry& entry : entries) {
		if (world.find(entry.handle))
			continue;
		release_buffer(entry.buffer, forge);
	}

	world.each([&forge](ecs::Entity, RenderChunk& chunk) {
		release_buffer(chunk.buffer, forge);
	});

	world.clear();
}


} // tsr::rdr
