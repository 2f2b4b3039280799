/*
Tile access tests: update tracking, writer debounce, batch edits.
*/
#include <array>

#include "test_common.hpp"

#include "tile_map.hpp"
#include "tile_updates.hpp"
#include "tile_access.hpp"


using namespace tsr;
using namespace tsr::tile;


static int test_slot_set()
{
	SlotSet slots;

	EXPECT(slots.empty(), "fresh slot set empty");

	slots.insert(0);
	slots.insert(63);
	slots.insert(64);
	slots.insert(255);
	slots.insert(64);

	EXPECT(slots.count() == 4, "duplicate insert counted once");
	EXPECT(slots.contains(63) && slots.contains(64), "word boundary");
	EXPECT(!slots.contains(1), "unset slot");

	uint32_t sum = 0;
	uint32_t visited = 0;
	slots.each([&](uint8_t slot) { sum += slot; ++visited; });
	EXPECT(visited == 4 && sum == 0 + 63 + 64 + 255, "each visits every slot once");

	return 0;
}


static int test_tracker_marks()
{
	UpdateTracker updates;

	const ChunkCoord a {0, 0, 0};
	const ChunkCoord b {1, 0, 0};

	updates.mark(TileCoord {a, 5});
	updates.mark(TileCoord {a, 5});
	updates.mark(TileCoord {a, 9});
	updates.mark_chunk(b);

	EXPECT(updates.dirty_count() == 2, "two dirty chunks");
	EXPECT(updates.is_slot_dirty(TileCoord {a, 9}), "slot dirty");
	EXPECT(!updates.is_slot_dirty(TileCoord {b, 9}), "whole-chunk mark has no slots");
	EXPECT(updates.is_dirty(b), "whole-chunk mark counts as dirty");

	const SlotSet* slots = updates.dirty_slots(a);
	EXPECT(slots && slots->count() == 2, "repeated mark stored once");

	updates.mark_chunk(a);
	EXPECT(updates.dirty_slots(a)->count() == 2, "mark_chunk keeps existing slots");

	uint32_t seen = 0;
	for (const ChunkCoord coord : updates.dirty_coords()) {
		EXPECT(coord == a || coord == b, "dirty coord is one of the marked chunks");
		++seen;
	}
	EXPECT(seen == 2, "dirty_coords yields each chunk once");

	updates.clear_all();
	EXPECT(updates.dirty_count() == 0 && updates.dirty_coords().empty(), "clear_all empties tracker");

	return 0;
}


static int test_writer_debounce()
{
	TileMap map;
	UpdateTracker updates;
	TileWriter writer {map, updates};

	const TileCoord coord {ChunkCoord {0, 0, 0}, 17};

	writer.set_tile(coord, Tile {1, 1});
	EXPECT(updates.is_slot_dirty(coord), "new tile marks slot");

	updates.clear_all();

	writer.set_tile(coord, Tile {1, 1});
	EXPECT(!updates.is_dirty(coord.chunk), "identical write does not mark");

	writer.set_tile(coord, Tile {1, 2});
	EXPECT(updates.is_slot_dirty(coord), "changed write marks");

	updates.clear_all();

	writer.set_tile(coord, std::nullopt);
	EXPECT(updates.is_slot_dirty(coord), "clearing a tile marks");

	updates.clear_all();

	writer.set_tile(coord, std::nullopt);
	EXPECT(!updates.is_dirty(coord.chunk), "clearing an absent tile does not mark");

	writer.set_tile(TileCoord {ChunkCoord {9, 0, 9}, 0}, std::nullopt);
	EXPECT(map.chunk_count() == 1 && updates.dirty_count() == 0, "clearing in a missing chunk is a no-op");

	return 0;
}


static int test_writer_silent_paths()
{
	TileMap map;
	UpdateTracker updates;
	TileWriter writer {map, updates};

	const TileCoord coord {ChunkCoord {3, 1, 3}, 200};

	writer.set_tile_silent(coord, Tile {4, 4});
	EXPECT(map.get_tile(coord) != nullptr, "silent write stored");
	EXPECT(updates.dirty_count() == 0, "silent write not tracked");

	Tile* tile = writer.get_tile_mut(coord);
	EXPECT(tile != nullptr, "checked mutable access");
	tile->index = 8;
	EXPECT(updates.dirty_count() == 0, "mutable access does not mark");

	writer.mark_chunk_dirty(coord.chunk);
	EXPECT(updates.is_dirty(coord.chunk), "explicit mark");

	EXPECT(writer.get_tile_mut(TileCoord {coord.chunk, 0}) == nullptr, "absent slot has no mutable tile");
	EXPECT(writer.get_chunk_mut(ChunkCoord {8, 8, 8}) == nullptr, "missing chunk has no mutable chunk");

	const TileReader reader = writer.reader();
	EXPECT(reader.get_tile(coord)->index == 8, "reader sees in-place edit");
	EXPECT(reader.is_chunk_dirty(coord.chunk), "reader sees dirty mark");

	return 0;
}


static int test_writer_unchecked_access()
{
	TileMap map;
	UpdateTracker updates;
	TileWriter writer {map, updates};

	const ChunkCoord chunk_coord {0, 0, 0};
	writer.set_tile(TileCoord {chunk_coord, 1}, Tile {1, 0});
	writer.set_tile(TileCoord {chunk_coord, 2}, Tile {2, 0});
	updates.clear_all();

	const TileWriter& shared = writer;

	// two distinct slots through the same shared writer
	Tile* first  = shared.get_tile_mut_unchecked(TileCoord {chunk_coord, 1});
	Tile* second = shared.get_tile_mut_unchecked(TileCoord {chunk_coord, 2});
	EXPECT(first && second && first != second, "distinct slots give distinct pointers");

	first->index  = 11;
	second->index = 22;

	EXPECT(map.get_tile(TileCoord {chunk_coord, 1})->index == 11, "first write landed");
	EXPECT(map.get_tile(TileCoord {chunk_coord, 2})->index == 22, "second write landed");
	EXPECT(updates.dirty_count() == 0, "unchecked writes never mark");

	Chunk* chunk = shared.get_chunk_mut_unchecked(chunk_coord);
	EXPECT(chunk && chunk->valid_count() == 2, "unchecked chunk access");

	return 0;
}


static int test_apply_disjoint()
{
	TileMap map;
	UpdateTracker updates;
	TileWriter writer {map, updates};

	const ChunkCoord a {0, 0, 0};
	const ChunkCoord b {0, 0, 1};

	writer.set_tile(TileCoord {a, 0}, Tile {1, 1});
	updates.clear_all();

	const std::array<TileWrite, 3> batch {
		TileWrite {TileCoord {a, 0}, Tile {1, 1}},
		TileWrite {TileCoord {a, 1}, Tile {2, 2}},
		TileWrite {TileCoord {b, 0}, Tile {3, 3}}
	};

	const EditOutcome outcome = writer.apply_disjoint(batch);
	EXPECT(outcome.result == EditResult::ok, "disjoint batch accepted");
	EXPECT(outcome.changed == 2, "unchanged write not counted");
	EXPECT(!updates.is_slot_dirty(TileCoord {a, 0}), "unchanged slot not marked");
	EXPECT(updates.is_slot_dirty(TileCoord {a, 1}) && updates.is_slot_dirty(TileCoord {b, 0}), "changed slots marked");

	updates.clear_all();

	const std::array<TileWrite, 3> overlapping {
		TileWrite {TileCoord {b, 5}, Tile {9, 9}},
		TileWrite {TileCoord {a, 1}, Tile {8, 8}},
		TileWrite {TileCoord {a, 1}, Tile {7, 7}}
	};

	const EditOutcome rejected = writer.apply_disjoint(overlapping);
	EXPECT(rejected.result == EditResult::duplicate_coord, "overlapping batch rejected");
	EXPECT(rejected.changed == 0, "rejected batch changes nothing");
	EXPECT(map.get_tile(TileCoord {b, 5}) == nullptr, "no write applied before rejection");
	EXPECT(map.get_tile(TileCoord {a, 1})->sheet == 2, "overlapping slot untouched");
	EXPECT(updates.dirty_count() == 0, "rejected batch marks nothing");
	EXPECT(test::ring_contains(log::LogLevel::warn, "duplicate coord"), "rejection logged");

	return 0;
}


static int test_writer_remove_chunk()
{
	TileMap map;
	UpdateTracker updates;
	TileWriter writer {map, updates};

	const ChunkCoord coord {2, 0, 2};
	writer.set_tile(TileCoord {coord, 4}, Tile {1, 1});

	EXPECT(writer.remove_chunk(coord), "chunk removed");
	EXPECT(!updates.is_dirty(coord), "dirty mark dropped with the chunk");
	EXPECT(writer.get_chunk(coord) == nullptr, "chunk gone");
	EXPECT(!writer.remove_chunk(coord), "second removal fails");

	return 0;
}


int main()
{
	test::init();

	RUN_TEST(test_slot_set);
	RUN_TEST(test_tracker_marks);
	RUN_TEST(test_writer_debounce);
	RUN_TEST(test_writer_silent_paths);
	RUN_TEST(test_writer_unchecked_access);
	RUN_TEST(test_apply_disjoint);
	RUN_TEST(test_writer_remove_chunk);

	std::printf("tile_access_tests [OK]\n");
	return 0;
}
