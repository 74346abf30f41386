/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE CacheRegistryTests
#include <boost/test/unit_test.hpp>

#include "cache/CacheBindings.hpp"
#include "cache/SpatialCache.hpp"
#include "managers/CacheRegistry.hpp"
#include "managers/InvalidationBus.hpp"
#include "spatial/SpatialIndex.hpp"

#include <string>

using namespace Lattice;

struct RegistryFixture {
    CacheRegistry registry;
    SpatialCache<BlockPos, int> blocks{"block_properties", 1024};
    SpatialCache<ChunkPos, std::string> biomes{"biomes", 256};
    SpatialIndex entities{"entities"};

    RegistryFixture() {
        registry.registerCache(&blocks);
        registry.registerCache(&biomes);
        registry.registerCache(&entities);
    }

    ~RegistryFixture() {
        registry.unregisterCache("block_properties");
        registry.unregisterCache("biomes");
        registry.unregisterCache("entities");
    }

    void populate() {
        for (int x = -8; x < 40; ++x) {
            blocks.put(BlockPos{x, 64, 0}, x);
        }
        biomes.put(ChunkPos{0, 0}, "plains");
        biomes.put(ChunkPos{2, 0}, "desert");
        entities.insert(1, Vector3D(4.0f, 64.0f, 4.0f));
        entities.insert(2, Vector3D(36.0f, 64.0f, 4.0f));
    }
};

BOOST_FIXTURE_TEST_SUITE(CacheRegistryTestSuite, RegistryFixture)

BOOST_AUTO_TEST_CASE(TestRegisterAndFind) {
    BOOST_CHECK_EQUAL(registry.size(), 3u);
    BOOST_CHECK(registry.find("biomes") == &biomes);
    BOOST_CHECK(registry.find("missing") == nullptr);
}

BOOST_AUTO_TEST_CASE(TestDuplicateNamesRejected) {
    SpatialCache<BlockPos, int> impostor("block_properties", 8);
    BOOST_CHECK(!registry.registerCache(&impostor));
    BOOST_CHECK(!registry.registerCache(nullptr));
    BOOST_CHECK_EQUAL(registry.size(), 3u);
    BOOST_CHECK(registry.find("block_properties") == &blocks);
}

BOOST_AUTO_TEST_CASE(TestUnregister) {
    BOOST_CHECK(registry.unregisterCache("biomes"));
    BOOST_CHECK(!registry.unregisterCache("biomes"));
    BOOST_CHECK_EQUAL(registry.size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestClearAllEmptiesEveryCache) {
    populate();
    registry.clearAll();
    BOOST_CHECK_EQUAL(blocks.size(), 0u);
    BOOST_CHECK_EQUAL(biomes.size(), 0u);
    BOOST_CHECK_EQUAL(entities.size(), 0u);
}

BOOST_AUTO_TEST_CASE(TestInvalidateRegionAcrossCaches) {
    populate();
    const size_t removed = registry.invalidateRegion(RegionBounds::forChunk(ChunkPos{0, 0}));

    // 16 blocks, one biome chunk and one entity sit in chunk (0, 0)
    BOOST_CHECK_EQUAL(removed, 18u);
    BOOST_CHECK(!blocks.contains(BlockPos{0, 64, 0}));
    BOOST_CHECK(blocks.contains(BlockPos{16, 64, 0}));
    BOOST_CHECK(!biomes.contains(ChunkPos{0, 0}));
    BOOST_CHECK(biomes.contains(ChunkPos{2, 0}));
    BOOST_CHECK(!entities.contains(1));
    BOOST_CHECK(entities.contains(2));
}

BOOST_AUTO_TEST_CASE(TestInvalidateKey) {
    populate();
    BOOST_CHECK_EQUAL(registry.invalidate(KeySpace::Block, SpatialKeys::packBlock(3, 64, 0)), 1u);
    BOOST_CHECK(!blocks.contains(BlockPos{3, 64, 0}));
    BOOST_CHECK_EQUAL(registry.invalidate(KeySpace::Block, SpatialKeys::packBlock(3, 64, 0)), 0u);

    BOOST_CHECK_EQUAL(registry.invalidate(KeySpace::Object, 2), 1u);
    BOOST_CHECK(!entities.contains(2));
}

BOOST_AUTO_TEST_CASE(TestInvalidateKeyLeavesOtherKeySpacesAlone) {
    // The same raw value names a block, a chunk and an entity
    const SpatialKey raw = SpatialKeys::packBlock(0, 5, 0);
    BOOST_REQUIRE_EQUAL(raw, SpatialKeys::packChunk(0, 5));
    BOOST_REQUIRE_EQUAL(raw, 5u);

    blocks.put(BlockPos{0, 5, 0}, 42);
    biomes.put(ChunkPos{0, 5}, "forest");
    entities.insert(5, Vector3D(100.0f, 70.0f, 100.0f));

    BOOST_CHECK_EQUAL(registry.invalidate(KeySpace::Block, raw), 1u);
    BOOST_CHECK(!blocks.contains(BlockPos{0, 5, 0}));
    BOOST_CHECK(biomes.contains(ChunkPos{0, 5}));
    BOOST_CHECK(entities.contains(5));

    BOOST_CHECK_EQUAL(registry.invalidate(KeySpace::Chunk, raw), 1u);
    BOOST_CHECK(!biomes.contains(ChunkPos{0, 5}));
    BOOST_CHECK(entities.contains(5));

    BOOST_CHECK_EQUAL(registry.invalidate(KeySpace::Section, raw), 0u);
    BOOST_CHECK(entities.contains(5));
}

BOOST_AUTO_TEST_CASE(TestStats) {
    populate();
    blocks.getOrCompute(BlockPos{0, 64, 0}, [] { return -1; });

    const auto all = registry.stats();
    BOOST_REQUIRE_EQUAL(all.size(), 3u);
    BOOST_CHECK_EQUAL(all[0].name, "block_properties");
    BOOST_CHECK_EQUAL(all[0].size, 48u);
    BOOST_CHECK_EQUAL(all[0].hits, 1u);
    BOOST_CHECK_EQUAL(all[1].name, "biomes");
    BOOST_CHECK_EQUAL(all[2].name, "entities");
    BOOST_CHECK_EQUAL(all[2].size, 2u);

    registry.logStats();
}

BOOST_AUTO_TEST_CASE(TestBusBindingForChunkUnloadAndBorder) {
    InvalidationBus bus;
    registry.bindToBus(bus);
    populate();

    BOOST_CHECK_EQUAL(bus.publish(InvalidationEvent::chunkUnloaded(ChunkPos{2, 0})), InvalidationResult::SUCCESS);
    BOOST_CHECK(!biomes.contains(ChunkPos{2, 0}));
    BOOST_CHECK(!blocks.contains(BlockPos{32, 64, 0}));
    BOOST_CHECK(!entities.contains(2));
    BOOST_CHECK(blocks.contains(BlockPos{0, 64, 0}));

    BOOST_CHECK_EQUAL(bus.publish(InvalidationEvent::worldBorderChanged()), InvalidationResult::SUCCESS);
    BOOST_CHECK_EQUAL(blocks.size(), 0u);
    BOOST_CHECK_EQUAL(entities.size(), 0u);

    registry.unbindFromBus();
    BOOST_CHECK_EQUAL(bus.getHandlerCount(InvalidationEventKind::ChunkUnloaded), 0u);
    BOOST_CHECK_EQUAL(bus.getHandlerCount(InvalidationEventKind::WorldBorderChanged), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(CacheBindingTests, RegistryFixture)

BOOST_AUTO_TEST_CASE(TestBlockBindingDropsChangedBlock) {
    InvalidationBus bus;
    auto tokens = bindBlockInvalidation(bus, blocks);
    populate();

    BOOST_CHECK_EQUAL(bus.publish(InvalidationEvent::blockChanged(BlockPos{5, 64, 0})), InvalidationResult::SUCCESS);
    BOOST_CHECK(!blocks.contains(BlockPos{5, 64, 0}));
    BOOST_CHECK(blocks.contains(BlockPos{6, 64, 0}));

    unbindAll(bus, tokens);
    BOOST_CHECK(tokens.empty());
    BOOST_CHECK_EQUAL(bus.getHandlerCount(InvalidationEventKind::BlockChanged), 0u);
}

BOOST_AUTO_TEST_CASE(TestBlockBindingOnChunkKeyedCache) {
    InvalidationBus bus;
    auto tokens = bindBlockInvalidation(bus, biomes);
    populate();

    BOOST_CHECK_EQUAL(bus.publish(InvalidationEvent::blockChanged(BlockPos{40, 10, 3})), InvalidationResult::SUCCESS);
    BOOST_CHECK(!biomes.contains(ChunkPos{2, 0}));
    BOOST_CHECK(biomes.contains(ChunkPos{0, 0}));
    unbindAll(bus, tokens);
}

BOOST_AUTO_TEST_CASE(TestNeighbourhoodBinding) {
    InvalidationBus bus;
    auto tokens = bindBlockNeighbourhoodInvalidation(bus, blocks, 2);
    populate();

    BOOST_CHECK_EQUAL(bus.publish(InvalidationEvent::blockChanged(BlockPos{10, 64, 0})), InvalidationResult::SUCCESS);
    for (int x = 8; x <= 12; ++x) {
        BOOST_CHECK(!blocks.contains(BlockPos{x, 64, 0}));
    }
    BOOST_CHECK(blocks.contains(BlockPos{7, 64, 0}));
    BOOST_CHECK(blocks.contains(BlockPos{13, 64, 0}));
    unbindAll(bus, tokens);
}

BOOST_AUTO_TEST_CASE(TestChunkBindingHandlesLoadAndUnload) {
    InvalidationBus bus;
    auto tokens = bindChunkInvalidation(bus, biomes);
    BOOST_CHECK_EQUAL(tokens.size(), 2u);

    biomes.put(ChunkPos{0, 0}, "missing");
    BOOST_CHECK_EQUAL(bus.publish(InvalidationEvent::chunkLoaded(ChunkPos{0, 0})), InvalidationResult::SUCCESS);
    BOOST_CHECK(!biomes.contains(ChunkPos{0, 0}));

    biomes.put(ChunkPos{0, 0}, "plains");
    BOOST_CHECK_EQUAL(bus.publish(InvalidationEvent::chunkUnloaded(ChunkPos{0, 0})), InvalidationResult::SUCCESS);
    BOOST_CHECK(!biomes.contains(ChunkPos{0, 0}));
    unbindAll(bus, tokens);
}

BOOST_AUTO_TEST_CASE(TestEntityRemovalBinding) {
    InvalidationBus bus;
    auto tokens = bindEntityRemoval(bus, entities);
    populate();

    BOOST_CHECK_EQUAL(bus.publish(InvalidationEvent::entityRemoved(1)), InvalidationResult::SUCCESS);
    BOOST_CHECK(!entities.contains(1));
    BOOST_CHECK(entities.contains(2));
    // Removing twice is harmless
    BOOST_CHECK_EQUAL(bus.publish(InvalidationEvent::entityRemoved(1)), InvalidationResult::SUCCESS);
    unbindAll(bus, tokens);
}

BOOST_AUTO_TEST_SUITE_END()
