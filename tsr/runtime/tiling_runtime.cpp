#include "tiling_runtime.hpp"

#include <utility>

#include "log.hpp"
#include "panic.hpp"


namespace tsr {


TilingRuntime::TilingRuntime(const config::TilingConfig& config, rdr::ResourceForge& forge)
	: m_config {config}
	, m_forge  {forge}
{
	TSR_INFO(log::LogCategory::core,
		"[runtime][init] [sync %s][evict %d][tile_size %.3f]",
		rdr::sync_strategy_name(m_config.sync_strategy),
		m_config.evict_empty_chunks ? 1 : 0,
		static_cast<double>(m_config.tile_size)
	);
}


TilingRuntime::~TilingRuntime()
{
	shutdown();
}


void TilingRuntime::add_update_system(UpdateFn system)
{
	TSR_ASSERT_MSG(system, "[runtime] empty update system");
	m_update_systems.emplace_back(std::move(system));
}


void TilingRuntime::add_render_system(RenderFn system)
{
	TSR_ASSERT_MSG(system, "[runtime] empty render system");
	m_render_systems.emplace_back(std::move(system));
}


CycleReport TilingRuntime::run_cycle()
{
	TSR_ASSERT_MSG(!m_shutdown, "[runtime] run_cycle after shutdown");

	++m_cycle;

	CycleReport report {};
	report.cycle = m_cycle;

	/* dirty marks live for exactly one cycle */

	m_updates.clear_all();

	tile::TileWriter tile_writer {m_tiles, m_updates};

	for (UpdateFn& system : m_update_systems)
		system(tile_writer);

	if (m_config.evict_empty_chunks)
		report.evicted = m_tiles.evict_empty_chunks();

	report.chunks = chunk::update(chunk::ChunkSyncContext {
		.tiles     = m_tiles,
		.updates   = m_updates,
		.handles   = m_handles,
		.registry  = m_registry,
		.tile_size = m_config.tile_size,
		.cycle     = m_cycle
	});

#ifndef NDEBUG
	m_handles.check_invariant();
#endif

	report.extract = rdr::extract(rdr::ExtractContext {
		.writer   = tile_writer,
		.handles  = m_handles,
		.registry = m_registry,
		.world    = m_world,
		.cache    = m_cache,
		.forge    = m_forge,
		.cycle    = m_cycle
	});

	for (RenderFn& system : m_render_systems)
		system(m_world, m_forge);

	report.cached = rdr::cache_phase(m_world, m_cache, m_config.sync_strategy);

	TSR_TRACE(log::LogCategory::core,
		"[runtime][cycle] [cycle %llu][chunks %u][dirty %u][cached %u][live %u]",
		static_cast<unsigned long long>(m_cycle),
		m_tiles.chunk_count(),
		m_updates.dirty_count(),
		report.cached,
		m_forge.live_count()
	);

	return report;
}


void TilingRuntime::shutdown()
{
	if (m_shutdown)
		return;

	rdr::release_all(m_world, m_cache, m_forge);
	m_shutdown = true;

	TSR_INFO(log::LogCategory::core,
		"[runtime][shutdown] [cycles %llu][chunks %u][live resources %u]",
		static_cast<unsigned long long>(m_cycle),
		m_tiles.chunk_count(),
		m_forge.live_count()
	);
}


} // tsr
