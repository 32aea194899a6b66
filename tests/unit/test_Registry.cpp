#include <gtest/gtest.h>
#include "fs/cache/Registry.hpp"

#include <atomic>
#include <boost/uuid/uuid_generators.hpp>
#include <thread>

using namespace folio::fs::cache;
using namespace folio::fs::model;

namespace {

ItemPtr makeItem(const std::string& name, const Parent& parent = Parent::root(), const bool pinned = false,
                 const Item::Kind kind = Item::Kind::Directory) {
    Item item;
    item.id = boost::uuids::random_generator()();
    item.name = name;
    item.parent = parent;
    item.pinned = pinned;
    item.kind = kind;
    if (kind == Item::Kind::Document) item.format = Format::Pdf;
    return std::make_shared<const Item>(std::move(item));
}

ItemPtr renamed(const ItemPtr& item, const std::string& name) {
    auto copy = *item;
    copy.name = name;
    return std::make_shared<const Item>(std::move(copy));
}

}

class RegistryTest : public ::testing::Test {
protected:
    Registry registry{4};
};

TEST_F(RegistryTest, UpsertGetEvict) {
    const auto item = makeItem("Books");
    registry.upsert(item);

    EXPECT_TRUE(registry.contains(item->id));
    EXPECT_EQ(registry.get(item->id), item);
    EXPECT_EQ(registry.size(), 1u);

    EXPECT_TRUE(registry.evict(item->id));
    EXPECT_FALSE(registry.evict(item->id));
    EXPECT_EQ(registry.get(item->id), nullptr);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(RegistryTest, UpsertOverwritesWholeItem) {
    const auto item = makeItem("Old");
    registry.upsert(item);
    registry.upsert(renamed(item, "New"));

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.get(item->id)->name, "New");
    EXPECT_EQ(item->name, "Old");
}

TEST_F(RegistryTest, RejectsNullItemsAndZeroShards) {
    EXPECT_THROW(registry.upsert(nullptr), std::invalid_argument);
    EXPECT_THROW(Registry(0), std::invalid_argument);
}

TEST_F(RegistryTest, ReplaceAllDropsPreviousGeneration) {
    const auto stale = makeItem("Stale");
    registry.upsert(stale);

    const auto a = makeItem("A");
    const auto b = makeItem("B");
    registry.replaceAll({a, b});

    EXPECT_EQ(registry.size(), 2u);
    EXPECT_FALSE(registry.contains(stale->id));
    EXPECT_TRUE(registry.contains(a->id));
    EXPECT_TRUE(registry.contains(b->id));
}

TEST_F(RegistryTest, Queries) {
    const auto books = makeItem("Books");
    const auto alice = makeItem("Alice", Parent::directory(books->id), true, Item::Kind::Document);
    const auto old = makeItem("Old", Parent::trash());
    const auto notes1 = makeItem("Notes");
    const auto notes2 = makeItem("Notes", Parent::directory(books->id));
    registry.replaceAll({books, alice, old, notes1, notes2});

    EXPECT_EQ(registry.children(Parent::root()).size(), 2u);
    EXPECT_EQ(registry.children(Parent::directory(books->id)).size(), 2u);
    ASSERT_EQ(registry.children(Parent::trash()).size(), 1u);
    EXPECT_EQ(registry.children(Parent::trash()).front(), old);
    ASSERT_EQ(registry.pinned().size(), 1u);
    EXPECT_EQ(registry.pinned().front(), alice);
    EXPECT_EQ(registry.named("Notes").size(), 2u);
    EXPECT_TRUE(registry.named("Missing").empty());
    EXPECT_EQ(registry.snapshot().size(), 5u);
}

TEST_F(RegistryTest, ConcurrentWritersAndReaders) {
    constexpr int writers = 8;
    constexpr int perWriter = 250;

    std::atomic<bool> done{false};
    std::thread reader([&] {
        while (!done.load()) {
            for (const auto& item : registry.snapshot()) ASSERT_NE(item, nullptr);
            (void)registry.size();
        }
    });

    std::vector<std::thread> threads;
    for (int w = 0; w < writers; ++w)
        threads.emplace_back([&] {
            for (int i = 0; i < perWriter; ++i) {
                const auto item = makeItem("Item");
                registry.upsert(item);
                if (i % 2 == 0) registry.evict(item->id);
            }
        });

    for (auto& t : threads) t.join();
    done = true;
    reader.join();

    EXPECT_EQ(registry.size(), static_cast<std::size_t>(writers * perWriter / 2));
}

TEST_F(RegistryTest, ReplaceAllRacesWithUpserts) {
    std::vector<ItemPtr> generation;
    for (int i = 0; i < 100; ++i) generation.push_back(makeItem("Gen"));

    std::thread writer([&] {
        for (int i = 0; i < 200; ++i) registry.upsert(makeItem("Live"));
    });
    for (int i = 0; i < 20; ++i) registry.replaceAll(generation);
    writer.join();

    for (const auto& item : generation) EXPECT_TRUE(registry.contains(item->id));
    EXPECT_GE(registry.size(), generation.size());
}
