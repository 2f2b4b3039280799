#include <cstdio>
#include <cstdlib>
#include <memory>

#include "mtp_memory.hpp"

#include "log.hpp"
#include "tiling_config.hpp"
#include "tiling_runtime.hpp"


namespace {


constexpr uint32_t k_demo_cycles = 8;


// sweeps a 3x3 brush along x, clearing the tiles it leaves behind
void paint_brush(tsr::tile::TileWriter& writer, uint64_t cycle)
{
	const int32_t head = static_cast<int32_t>(cycle) * 3;

	for (int32_t dz = -1; dz <= 1; ++dz) {
		for (int32_t dx = -1; dx <= 1; ++dx) {
			const tsr::tile::TileCoord coord = tsr::tile::tile_coord_from_world(tsr::ivec3 {head + dx, 0, dz});
			writer.set_tile(coord, tsr::tile::Tile {0, static_cast<uint16_t>(cycle)});
		}
	}

	for (int32_t dz = -1; dz <= 1; ++dz) {
		const tsr::tile::TileCoord trail = tsr::tile::tile_coord_from_world(tsr::ivec3 {head - 6, 0, dz});
		writer.set_tile(trail, std::nullopt);
	}
}


} // anonymous


int main(int argc, char** argv)
{
	mtp::init_tls<mtp::default_set>();

	tsr::config::TilingConfig config {};

	if (argc > 1 && !tsr::config::read_file(argv[1], config))
		return EXIT_FAILURE;

	if (!tsr::config::apply_logging(config))
		return EXIT_FAILURE;

	if (config.forge_backend != tsr::rdr::ForgeBackend::host) {
		TSR_ERROR(tsr::log::LogCategory::core,
			"[demo] headless run needs forge_backend = \"host\" [requested %s]",
			tsr::rdr::forge_backend_name(config.forge_backend)
		);
		return EXIT_FAILURE;
	}

	std::unique_ptr<tsr::rdr::ResourceForge> forge = tsr::rdr::make_forge(config.forge_backend);

	{
		tsr::TilingRuntime runtime {config, *forge};

		runtime.add_update_system([&runtime](tsr::tile::TileWriter& writer) {
			paint_brush(writer, runtime.cycle_index());
		});

		for (uint32_t i = 0; i < k_demo_cycles; ++i) {
			const tsr::CycleReport report = runtime.run_cycle();

			std::printf("cycle %2llu: chunks %u mapped %zu | spawned %u retired %u | replayed %u regenerated %u dropped %u | live %u\n",
				static_cast<unsigned long long>(report.cycle),
				runtime.tiles().chunk_count(),
				runtime.handles().size(),
				report.chunks.spawned,
				report.chunks.retired,
				report.extract.replayed,
				report.extract.regenerated,
				report.extract.dropped,
				forge->live_count()
			);
		}

		runtime.shutdown();
	}

	const uint32_t leaked = forge->live_count();
	forge.reset();

	tsr::log::close_file();
	mtp::get_tls_allocator<mtp::default_set>().reset();

	return leaked == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
