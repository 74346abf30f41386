/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE CacheInvalidationIntegrationTests
#include <boost/test/unit_test.hpp>

#include "cache/CacheBindings.hpp"
#include "cache/CacheConfig.hpp"
#include "cache/SpatialCache.hpp"
#include "core/TickClock.hpp"
#include "managers/CacheRegistry.hpp"
#include "managers/InvalidationBus.hpp"
#include "managers/SettingsManager.hpp"
#include "spatial/SpatialIndex.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

using namespace Lattice;

namespace {

// Minimal authoritative world: block ids by packed position, default 0 (air)
class MockWorld {
public:
    explicit MockWorld(InvalidationBus& bus) : m_bus(bus) {}

    int getBlock(const BlockPos& pos) const {
        ++m_reads;
        auto it = m_blocks.find(SpatialKeys::packBlock(pos));
        return it == m_blocks.end() ? 0 : it->second;
    }

    // Mutations publish synchronously, before anything else can read
    InvalidationResult setBlock(const BlockPos& pos, int id) {
        m_blocks[SpatialKeys::packBlock(pos)] = id;
        return m_bus.publish(InvalidationEvent::blockChanged(pos));
    }

    InvalidationResult unloadChunk(const ChunkPos& chunk) {
        return m_bus.publish(InvalidationEvent::chunkUnloaded(chunk));
    }

    int reads() const { return m_reads; }

private:
    InvalidationBus& m_bus;
    std::unordered_map<SpatialKey, int> m_blocks;
    mutable int m_reads{0};
};

} // namespace

struct WorldFixture {
    SettingsManager settings;
    TickClock clock;
    InvalidationBus bus;
    CacheRegistry registry;
    MockWorld world{bus};

    std::unique_ptr<SpatialCache<BlockPos, int>> blockCache;
    std::unique_ptr<SpatialCache<BlockPos, int>> lightCache;
    std::unique_ptr<SpatialCache<ChunkPos, int>> chunkSummary;
    std::unique_ptr<SpatialIndex> entities;
    std::vector<BindingTokens> bindings;

    WorldFixture() {
        BOOST_REQUIRE(settings.loadFromString(R"({
            "block_properties": { "capacity": 4096, "eviction": "clear_all", "staleness": "never" },
            "light": { "capacity": 1024, "eviction": "lru", "staleness": "version" },
            "chunk_summary": { "capacity": 64, "staleness": "ttl", "ttl_ticks": 10 },
            "spatial_index": { "cell_size": 16 }
        })"));

        blockCache = std::make_unique<SpatialCache<BlockPos, int>>(
            "block_properties", CacheConfig::fromSettings(settings, "block_properties", CacheConfig{}),
            &clock, &bus.epochCounter());
        lightCache = std::make_unique<SpatialCache<BlockPos, int>>(
            "light", CacheConfig::fromSettings(settings, "light", CacheConfig{}),
            &clock, &bus.epochCounter());
        chunkSummary = std::make_unique<SpatialCache<ChunkPos, int>>(
            "chunk_summary", CacheConfig::fromSettings(settings, "chunk_summary", CacheConfig{}),
            &clock, &bus.epochCounter());
        entities = std::make_unique<SpatialIndex>("entities", SpatialIndex::cellSizeFromSettings(settings));

        registry.registerCache(blockCache.get());
        registry.registerCache(lightCache.get());
        registry.registerCache(chunkSummary.get());
        registry.registerCache(entities.get());
        registry.bindToBus(bus);

        bindings.push_back(bindBlockInvalidation(bus, *blockCache));
        bindings.push_back(bindBlockInvalidation(bus, *chunkSummary));
        bindings.push_back(bindEntityRemoval(bus, *entities));
    }

    ~WorldFixture() {
        for (auto& tokens : bindings) {
            unbindAll(bus, tokens);
        }
        registry.unbindFromBus();
        registry.unregisterCache("block_properties");
        registry.unregisterCache("light");
        registry.unregisterCache("chunk_summary");
        registry.unregisterCache("entities");
    }

    int cachedBlock(const BlockPos& pos) {
        return blockCache->getOrCompute(pos, [this, pos] { return world.getBlock(pos); });
    }

    int cachedLight(const BlockPos& pos) {
        // Light depends on the block and its neighbour above
        return lightCache->getOrCompute(pos, [this, pos] {
            const int above = world.getBlock(BlockPos{pos.x, pos.y + 1, pos.z});
            return above == 0 ? 15 : 0;
        });
    }

    int cachedChunkSummary(const ChunkPos& chunk) {
        return chunkSummary->getOrCompute(chunk, [this, chunk] {
            int solid = 0;
            for (int x = 0; x < 16; ++x) {
                solid += world.getBlock(BlockPos{chunk.x * 16 + x, 64, chunk.z * 16}) != 0 ? 1 : 0;
            }
            return solid;
        });
    }
};

BOOST_FIXTURE_TEST_SUITE(CacheInvalidationIntegrationTestSuite, WorldFixture)

BOOST_AUTO_TEST_CASE(TestConfigurationApplied) {
    BOOST_CHECK_EQUAL(blockCache->getCapacity(), 4096u);
    BOOST_CHECK_EQUAL(lightCache->getEvictionStrategy(), EvictionStrategy::LRU);
    BOOST_CHECK_EQUAL(lightCache->getPolicy().getKind(), StalenessKind::VERSION_GATED);
    BOOST_CHECK_EQUAL(chunkSummary->getPolicy().getKind(), StalenessKind::TIME_TO_LIVE);
    BOOST_CHECK_CLOSE(entities->getCellSize(), 16.0f, 0.001f);
    BOOST_CHECK_EQUAL(registry.size(), 4u);
}

BOOST_AUTO_TEST_CASE(TestBlockChangeIsVisibleToNextRead) {
    const BlockPos pos{3, 64, 3};
    BOOST_CHECK_EQUAL(cachedBlock(pos), 0);
    BOOST_CHECK_EQUAL(cachedBlock(pos), 0);
    const int readsBefore = world.reads();

    BOOST_CHECK_EQUAL(world.setBlock(pos, 7), InvalidationResult::SUCCESS);
    BOOST_CHECK_EQUAL(cachedBlock(pos), 7);
    BOOST_CHECK_EQUAL(world.reads(), readsBefore + 1);
}

BOOST_AUTO_TEST_CASE(TestVersionGatedLightFollowsAnyMutation) {
    const BlockPos floor{0, 64, 0};
    BOOST_CHECK_EQUAL(cachedLight(floor), 15);

    // The light cache has no direct binding: the epoch bump stales it
    BOOST_CHECK_EQUAL(world.setBlock(BlockPos{0, 65, 0}, 1), InvalidationResult::SUCCESS);
    BOOST_CHECK_EQUAL(cachedLight(floor), 0);
}

BOOST_AUTO_TEST_CASE(TestChunkSummaryTtlAndBlockBinding) {
    const ChunkPos chunk{1, 0};
    BOOST_CHECK_EQUAL(cachedChunkSummary(chunk), 0);

    // The block binding maps the block to its chunk; (20, 16) is in chunk (1, 1)
    BOOST_CHECK_EQUAL(world.setBlock(BlockPos{20, 64, 16}, 3), InvalidationResult::SUCCESS);
    BOOST_CHECK(chunkSummary->contains(chunk));

    BOOST_CHECK_EQUAL(world.setBlock(BlockPos{20, 64, 0}, 3), InvalidationResult::SUCCESS);
    BOOST_CHECK_EQUAL(cachedChunkSummary(chunk), 1);

    clock.advanceBy(11);
    BOOST_CHECK(!chunkSummary->contains(chunk));
}

BOOST_AUTO_TEST_CASE(TestChunkUnloadDropsEverythingInColumn) {
    for (int x = 0; x < 32; ++x) {
        cachedBlock(BlockPos{x, 64, 0});
    }
    cachedChunkSummary(ChunkPos{0, 0});
    entities->insert(1, Vector3D(5.0f, 64.0f, 5.0f));
    entities->insert(2, Vector3D(20.0f, 64.0f, 5.0f));

    BOOST_CHECK_EQUAL(world.unloadChunk(ChunkPos{0, 0}), InvalidationResult::SUCCESS);

    BOOST_CHECK(!blockCache->contains(BlockPos{0, 64, 0}));
    BOOST_CHECK(!blockCache->contains(BlockPos{15, 64, 0}));
    BOOST_CHECK(blockCache->contains(BlockPos{16, 64, 0}));
    BOOST_CHECK(!chunkSummary->contains(ChunkPos{0, 0}));
    BOOST_CHECK(!entities->contains(1));
    BOOST_CHECK(entities->contains(2));
}

BOOST_AUTO_TEST_CASE(TestEntityRemovalEvent) {
    entities->insert(10, Vector3D(1.0f, 64.0f, 1.0f));
    entities->insert(11, Vector3D(2.0f, 64.0f, 1.0f));

    BOOST_CHECK_EQUAL(bus.publish(InvalidationEvent::entityRemoved(10)), InvalidationResult::SUCCESS);
    const auto nearby = entities->queryRadius(Vector3D(1.0f, 64.0f, 1.0f), 4.0f);
    BOOST_REQUIRE_EQUAL(nearby.size(), 1u);
    BOOST_CHECK_EQUAL(nearby[0], 11u);
}

BOOST_AUTO_TEST_CASE(TestWorldBorderClearsAll) {
    cachedBlock(BlockPos{1, 64, 1});
    cachedLight(BlockPos{1, 64, 1});
    entities->insert(1, Vector3D());

    BOOST_CHECK_EQUAL(bus.publish(InvalidationEvent::worldBorderChanged()), InvalidationResult::SUCCESS);
    for (const auto& stats : registry.stats()) {
        BOOST_CHECK_EQUAL(stats.size, 0u);
    }
}

BOOST_AUTO_TEST_CASE(TestMisWiredHandlerSurfacesRecursion) {
    // A subsystem that reacts to a block change by changing the same block
    auto token = bus.subscribe(InvalidationEventKind::BlockChanged, [this](const InvalidationEvent& event) {
        const auto* changed = event.getIf<InvalidationEvent::BlockChanged>();
        (void)world.setBlock(changed->pos, 99);
    });

    BOOST_CHECK_EQUAL(world.setBlock(BlockPos{0, 64, 0}, 1), InvalidationResult::RECURSIVE_INVALIDATION);
    BOOST_CHECK_EQUAL(bus.getStats().rejectedRecursive, 1u);
    bus.unsubscribe(token);

    // Caches still end up coherent with the world
    BOOST_CHECK_EQUAL(cachedBlock(BlockPos{0, 64, 0}), world.getBlock(BlockPos{0, 64, 0}));
}

BOOST_AUTO_TEST_SUITE_END()
