/*
Chunk handle tests: bijection, registry, chunk entity sync.
*/
#include <random>

#include "test_common.hpp"

#include "bijection.hpp"
#include "handle_store.hpp"
#include "ecs_registry.hpp"
#include "tile_map.hpp"
#include "tile_updates.hpp"
#include "chunk_components.hpp"
#include "chunk_handle_map.hpp"
#include "chunk_sync.hpp"


using namespace tsr;
using namespace tsr::tile;


static int test_bijection_insert_evicts()
{
	Bijection<uint32_t, uint32_t> mapping;

	EXPECT(!mapping.insert(1, 10).any(), "fresh pair evicts nothing");
	EXPECT(!mapping.insert(1, 10).any(), "identical pair is a no-op");
	EXPECT(mapping.size() == 1, "one pair");

	auto evicted = mapping.insert(1, 11);
	EXPECT(evicted.by_left && evicted.by_left->second == 10, "rebinding left evicts old right");
	EXPECT(!evicted.by_right, "new right was unbound");
	EXPECT(mapping.find_left(10) == nullptr, "old right unbound");

	mapping.insert(2, 20);
	evicted = mapping.insert(3, 20);
	EXPECT(evicted.by_right && evicted.by_right->first == 2, "rebinding right evicts old left");
	EXPECT(mapping.find_right(2) == nullptr, "old left unbound");

	evicted = mapping.insert(1, 20);
	EXPECT(evicted.by_left && evicted.by_right, "insert may evict on both sides");
	EXPECT(mapping.size() == 1, "both displaced pairs removed");
	EXPECT(mapping.is_consistent(), "consistent after evictions");

	return 0;
}


static int test_bijection_random_sequence()
{
	Bijection<uint32_t, uint32_t> mapping;

	std::mt19937 rng {1234U};
	std::uniform_int_distribution<uint32_t> key {0U, 31U};
	std::uniform_int_distribution<uint32_t> op  {0U, 3U};

	for (uint32_t step = 0; step < 4000; ++step) {
		const uint32_t left  = key(rng);
		const uint32_t right = key(rng);

		switch (op(rng)) {
		case 0:
		case 1:
			mapping.insert(left, right);
			EXPECT(*mapping.find_right(left) == right, "inserted pair visible from left");
			EXPECT(*mapping.find_left(right) == left, "inserted pair visible from right");
			break;
		case 2:
			mapping.remove_left(left);
			EXPECT(mapping.find_right(left) == nullptr, "removed left unbound");
			break;
		default:
			mapping.remove_right(right);
			EXPECT(mapping.find_left(right) == nullptr, "removed right unbound");
			break;
		}

		EXPECT(mapping.is_consistent(), "bijection stays consistent");
		EXPECT(mapping.size() <= 32, "never more pairs than keys");
	}

	size_t visited = 0;
	bool mirrored = true;
	mapping.each([&](uint32_t left, uint32_t right) {
		const uint32_t* back = mapping.find_left(right);
		mirrored = mirrored && back && *back == left;
		++visited;
	});
	EXPECT(visited == mapping.size() && mirrored, "each visits every pair once");

	mapping.clear();
	EXPECT(mapping.empty(), "clear empties both sides");

	return 0;
}


static int test_handle_map()
{
	chunk::ChunkHandleMap handles;

	const ChunkCoord a {0, 0, 0};
	const ChunkCoord b {1, 0, 0};

	handles.insert(a, 4);
	handles.insert(b, 5);

	EXPECT(handles.find_handle(a) == 4U, "coord to handle");
	EXPECT(handles.find_coord(5) == b, "handle to coord");

	EXPECT(handles.remove_by_handle(4) == a, "remove by handle returns coord");
	EXPECT(!handles.find_handle(a), "coord unbound after handle removal");
	EXPECT(handles.remove_by_coord(b) == 5U, "remove by coord returns handle");
	EXPECT(!handles.find_coord(5), "handle unbound after coord removal");
	EXPECT(handles.size() == 0, "empty");

	EXPECT(!handles.remove_by_coord(a), "removing unbound coord");

	return 0;
}


static int test_handle_store_generations()
{
	res::HandleStore<int> store;

	const Handle<int> first = store.create(7);
	EXPECT(store.get(first) && *store.get(first) == 7, "value stored");

	EXPECT(store.destroy(first), "destroy live handle");
	EXPECT(!store.destroy(first), "double destroy rejected");
	EXPECT(store.get(first) == nullptr, "stale handle rejected");

	const Handle<int> second = store.create(8);
	EXPECT(second.index == first.index, "slot reused");
	EXPECT(second != first, "reused slot carries a new magic");
	EXPECT(store.get(first) == nullptr, "old handle stays stale after reuse");
	EXPECT(!store.destroy(Handle<int>::null()), "null handle rejected");
	EXPECT(store.size() == 1, "one live value");

	return 0;
}


static int test_registry_recycles()
{
	ecs::SimRegistry registry;

	const ecs::Entity a = registry.create_entity();
	const ecs::Entity b = registry.create_entity();

	registry.add<ecs::ChunkComponent>(a, ChunkCoord {1, 2, 3});
	registry.add<ecs::ChunkComponent>(b, ChunkCoord {4, 5, 6});
	registry.add<ecs::RenderLinkComponent>(b);

	const ecs::EntityHandle handle_a = registry.handle_of(a);

	registry.destroy_entity(a);
	EXPECT(!registry.alive(a), "destroyed entity dead");
	EXPECT(!registry.is_valid(handle_a), "handle to destroyed entity invalid");
	EXPECT(registry.get<ecs::ChunkComponent>(b)->coord == (ChunkCoord {4, 5, 6}), "swap-erase keeps other entity");

	const ecs::Entity c = registry.create_entity();
	EXPECT(c == a, "entity id recycled");
	EXPECT(!registry.has<ecs::ChunkComponent>(c), "recycled entity starts clean");
	EXPECT(!registry.is_valid(handle_a), "old handle still invalid after recycling");

	uint32_t both = 0;
	registry.scan<ecs::ChunkComponent, ecs::RenderLinkComponent>(
		[&both](ecs::Entity, ecs::ChunkComponent&, ecs::RenderLinkComponent&) { ++both; }
	);
	EXPECT(both == 1, "scan visits only entities with every component");

	return 0;
}


static int test_chunk_sync_lifecycle()
{
	TileMap tiles;
	UpdateTracker updates;
	chunk::ChunkHandleMap handles;
	ecs::SimRegistry registry;

	auto run = [&](uint64_t cycle) {
		return chunk::update(chunk::ChunkSyncContext {
			.tiles     = tiles,
			.updates   = updates,
			.handles   = handles,
			.registry  = registry,
			.tile_size = 2.0f,
			.cycle     = cycle
		});
	};

	for (int32_t x = 0; x < 3; ++x) {
		const TileCoord coord {ChunkCoord {x, 0, 0}, 0};
		tiles.set_tile(coord, Tile {1, 1});
		updates.mark(coord);
	}

	// a silently written chunk stays without an entity until it is dirty
	tiles.set_tile(TileCoord {ChunkCoord {9, 0, 9}, 0}, Tile {1, 1});

	chunk::ChunkSyncStats stats = run(1);
	EXPECT(stats.spawned == 3 && stats.linked == 3 && stats.retired == 0, "dirty chunks spawned and linked");
	EXPECT(handles.size() == 3, "one mapping per dirty chunk");
	EXPECT(!handles.find_handle(ChunkCoord {9, 0, 9}), "clean chunk not spawned");

	const ecs::Entity first = *handles.find_handle(ChunkCoord {1, 0, 0});
	const auto* transform = registry.get<ecs::ChunkTransformComponent>(first);
	EXPECT(transform && transform->world[3][0] == 32.0f, "transform places chunk by extent and tile size");
	EXPECT(registry.get<ecs::RenderLinkComponent>(first)->linked_cycle == 1, "link records cycle");

	updates.clear_all();
	stats = run(2);
	EXPECT(stats.spawned == 0 && stats.linked == 0 && stats.retired == 0, "steady state does nothing");

	tiles.remove_chunk(ChunkCoord {1, 0, 0});
	stats = run(3);
	EXPECT(stats.retired == 1, "orphan retired");
	EXPECT(!handles.find_coord(first), "orphan mapping removed");
	EXPECT(!registry.alive(first), "orphan entity destroyed");
	EXPECT(handles.is_consistent(), "mapping consistent");

	const TileCoord respawn {ChunkCoord {1, 0, 0}, 7};
	tiles.set_tile(respawn, Tile {2, 2});
	updates.mark(respawn);
	stats = run(4);
	EXPECT(stats.spawned == 1, "re-added chunk gets a new entity");
	EXPECT(handles.size() == 3, "three mappings again");
	EXPECT(handles.is_consistent(), "mapping consistent after recycling");

	return 0;
}


int main()
{
	test::init();

	RUN_TEST(test_bijection_insert_evicts);
	RUN_TEST(test_bijection_random_sequence);
	RUN_TEST(test_handle_map);
	RUN_TEST(test_handle_store_generations);
	RUN_TEST(test_registry_recycles);
	RUN_TEST(test_chunk_sync_lifecycle);

	std::printf("chunk_handle_tests [OK]\n");
	return 0;
}
