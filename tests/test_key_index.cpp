#include <catch2/catch.hpp>

#include "engine/key_index.hpp"
#include "vecshard/errors.hpp"
#include "tests/common/test_utils.hpp"

namespace
{
    using namespace vecshard;
    using namespace vecshard::engine;
    using namespace vecshard::test;
}

TEST_CASE("KeyIndex resolves in both directions", "[keyindex]")
{
    TempDir dir;
    KeyIndex index(dir.path() / "map.db");
    index.open();

    index.add(0, "P69905");
    index.add(1, "P68871");
    index.add(2, "Q9Y6K9");

    for (const auto &key : {"P69905", "P68871", "Q9Y6K9"})
    {
        EntryId id = index.resolve_by_key(key);
        REQUIRE(index.resolve_by_id(id) == key);
    }
    REQUIRE(index.resolve_by_key("P68871") == 1);
    REQUIRE(index.size() == 3);
    REQUIRE(index.contains_key("Q9Y6K9"));
    REQUIRE_FALSE(index.contains_key("nope"));
    REQUIRE(index.contains_id(2));
    REQUIRE_FALSE(index.contains_id(3));
}

TEST_CASE("KeyIndex lists keys in insertion order and can be re-iterated", "[keyindex]")
{
    TempDir dir;
    KeyIndex index(dir.path() / "map.db");
    index.open();
    index.add(0, "zeta");
    index.add(1, "alpha");
    index.add(2, "mid");

    std::vector<std::string> expected{"zeta", "alpha", "mid"};
    REQUIRE(index.keys() == expected);
    REQUIRE(index.keys() == expected);

    std::vector<EntryId> ids;
    index.for_each_key([&](EntryId id, const std::string &) { ids.push_back(id); });
    REQUIRE(ids == std::vector<EntryId>{0, 1, 2});
}

TEST_CASE("KeyIndex rejects duplicates without partial writes", "[keyindex]")
{
    TempDir dir;
    KeyIndex index(dir.path() / "map.db");
    index.open();
    index.add(0, "a");

    REQUIRE_THROWS_AS(index.add(1, "a"), DuplicateKeyError);
    REQUIRE_FALSE(index.contains_id(1));

    REQUIRE_THROWS_AS(index.add(0, "b"), DuplicateIdError);
    REQUIRE_FALSE(index.contains_key("b"));
    REQUIRE(index.resolve_by_id(0) == "a");
    REQUIRE(index.size() == 1);

    // Still usable afterwards
    index.add(1, "b");
    REQUIRE(index.resolve_by_key("b") == 1);
}

TEST_CASE("KeyIndex lookups of absent entries throw NotFoundError", "[keyindex]")
{
    TempDir dir;
    KeyIndex index(dir.path() / "map.db");
    index.open();
    index.add(0, "a");

    REQUIRE_THROWS_AS(index.resolve_by_key("b"), NotFoundError);
    REQUIRE_THROWS_AS(index.resolve_by_id(7), NotFoundError);
}

TEST_CASE("KeyIndex reads its own uncommitted writes and persists them on close", "[keyindex]")
{
    TempDir dir;
    auto path = dir.path() / "map.db";
    {
        KeyIndex index(path);
        index.open();
        index.add(0, "first");
        index.add(1, "second");
        REQUIRE(index.resolve_by_key("second") == 1);
        index.close();
    }

    KeyIndex reopened(path, true);
    reopened.open();
    REQUIRE(reopened.size() == 2);
    REQUIRE(reopened.resolve_by_id(0) == "first");
}

TEST_CASE("KeyIndex commit flag makes an add durable immediately", "[keyindex]")
{
    TempDir dir;
    auto path = dir.path() / "map.db";
    KeyIndex writer(path);
    writer.open();
    writer.add(0, "committed", true);

    // A second connection only sees committed data.
    KeyIndex reader(path, true);
    reader.open();
    REQUIRE(reader.resolve_by_key("committed") == 0);
}

TEST_CASE("Read-only KeyIndex rejects mutation", "[keyindex]")
{
    TempDir dir;
    auto path = dir.path() / "map.db";
    {
        KeyIndex index(path);
        index.open();
        index.add(0, "a");
    }

    KeyIndex index(path, true);
    index.open();
    REQUIRE(index.read_only());
    REQUIRE_THROWS_AS(index.add(1, "b"), ReadOnlyError);
    REQUIRE_THROWS_AS(index.truncate(0), ReadOnlyError);
    REQUIRE(index.size() == 1);

    index.toggle_read_only();
    REQUIRE_FALSE(index.read_only());
    REQUIRE(index.is_open());
    index.add(1, "b");
    REQUIRE(index.resolve_by_id(1) == "b");
}

TEST_CASE("Read-only KeyIndex does not create a missing database", "[keyindex]")
{
    TempDir dir;
    auto path = dir.path() / "map.db";
    KeyIndex index(path, true);
    REQUIRE_THROWS_AS(index.open(), IoError);
    REQUIRE_FALSE(std::filesystem::exists(path));
}

TEST_CASE("Closed KeyIndex throws ClosedError", "[keyindex]")
{
    TempDir dir;
    KeyIndex index(dir.path() / "map.db");
    REQUIRE_THROWS_AS(index.add(0, "a"), ClosedError);
    REQUIRE_THROWS_AS(index.resolve_by_key("a"), ClosedError);

    index.open();
    index.close();
    index.close();
    REQUIRE_THROWS_AS(index.keys(), ClosedError);
}

TEST_CASE("KeyIndex truncate drops the tail in both directions", "[keyindex]")
{
    TempDir dir;
    KeyIndex index(dir.path() / "map.db");
    index.open();
    for (EntryId i = 0; i < 5; ++i)
        index.add(i, key_for(static_cast<size_t>(i)));

    REQUIRE(index.truncate(3) == 2);
    REQUIRE(index.size() == 3);
    REQUIRE_FALSE(index.contains_key(key_for(3)));
    REQUIRE_FALSE(index.contains_id(4));

    // Removed keys can be registered again.
    index.add(3, key_for(4));
    REQUIRE(index.resolve_by_key(key_for(4)) == 3);
}
