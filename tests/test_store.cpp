#include <catch2/catch.hpp>

#include "engine/manifest.hpp"
#include "engine/reader.hpp"
#include "engine/writer.hpp"
#include "vecshard/errors.hpp"
#include "tests/common/test_utils.hpp"

#include <algorithm>
#include <thread>
#include <sqlite3.h>
#include <sys/wait.h>
#include <unistd.h>

namespace
{
    using namespace vecshard;
    using namespace vecshard::engine;
    using namespace vecshard::test;

    std::size_t count_shard_files(const std::filesystem::path &root)
    {
        std::size_t n = 0;
        for (const auto &entry : std::filesystem::directory_iterator(StoreLayout::shards(root)))
            if (entry.path().extension() == ".shrd")
                ++n;
        return n;
    }

    // Holds a read transaction on map.db so that the writer's next COMMIT gets SQLITE_BUSY.
    class KeyIndexReadLock
    {
    public:
        explicit KeyIndexReadLock(const std::filesystem::path &root)
        {
            if (sqlite3_open_v2(StoreLayout::keys(root).c_str(), &m_db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK)
                throw std::runtime_error("cannot open map.db");
            if (sqlite3_exec(m_db, "BEGIN; SELECT COUNT(*) FROM forward;", nullptr, nullptr, nullptr) != SQLITE_OK)
                throw std::runtime_error(sqlite3_errmsg(m_db));
        }
        ~KeyIndexReadLock() { release(); }

        void release()
        {
            if (m_db)
            {
                sqlite3_exec(m_db, "COMMIT;", nullptr, nullptr, nullptr);
                sqlite3_close(m_db);
                m_db = nullptr;
            }
        }

    private:
        sqlite3 *m_db = nullptr;
    };
}

TEST_CASE("Every written vector reads back by key after reopen", "[store]")
{
    TempDir dir;
    const std::size_t dim = 16;
    write_store(dir.path(), 37, dim, 8);

    Reader reader(dir.path());
    reader.open();
    REQUIRE(reader.size() == 37);
    REQUIRE(reader.dimension() == dim);

    for (std::size_t i = 0; i < 37; ++i)
    {
        REQUIRE(reader.get_by_key(key_for(i)) == make_vector(dim, static_cast<float>(i)));
        REQUIRE(reader.get_by_id(static_cast<EntryId>(i)) == make_vector(dim, static_cast<float>(i)));
    }
}

TEST_CASE("Nine vectors with capacity four make shards of 4, 4 and 1", "[store]")
{
    TempDir dir;
    Writer writer(dir.path(), 3, 4);
    writer.open();

    std::vector<bool> rollovers;
    for (std::size_t i = 0; i < 9; ++i)
        rollovers.push_back(writer.set(key_for(i), make_vector(3, static_cast<float>(i))));
    writer.close();

    std::vector<bool> expected{false, false, false, false, true, false, false, false, true};
    REQUIRE(rollovers == expected);
    REQUIRE(writer.shard_count() == 3);
    REQUIRE(count_shard_files(dir.path()) == 3);

    Reader reader(dir.path());
    reader.open();
    std::vector<std::size_t> occupancy;
    for (const auto &s : reader.shards())
        occupancy.push_back(s.n);
    REQUIRE(occupancy == std::vector<std::size_t>{4, 4, 1});

    auto matrix = reader.embedding_matrix();
    REQUIRE(matrix.rows == 9);
    REQUIRE(matrix.cols == 3);
    REQUIRE(reader.shape() == std::make_pair<std::size_t, std::size_t>(9, 3));

    auto last = make_vector(3, 8.0f);
    REQUIRE(std::equal(last.begin(), last.end(), matrix.row(8)));
}

TEST_CASE("Duplicate key leaves the writer untouched", "[store]")
{
    TempDir dir;
    Writer writer(dir.path(), 4, 2);
    writer.open();
    writer.set("a", make_vector(4, 1.0f));
    writer.set("b", make_vector(4, 2.0f));

    // The shard is full, so a successful set would roll over first.
    REQUIRE_THROWS_AS(writer.set("a", make_vector(4, 9.0f)), DuplicateKeyError);
    REQUIRE(writer.size() == 2);
    REQUIRE(writer.shard_count() == 0);

    writer.set("c", make_vector(4, 3.0f));
    writer.close();

    Reader reader(dir.path());
    reader.open();
    REQUIRE(reader.size() == 3);
    REQUIRE(reader.get_by_key("a") == make_vector(4, 1.0f));
    REQUIRE(reader.id_of("c") == 2);
}

TEST_CASE("Wrong vector length is rejected", "[store]")
{
    TempDir dir;
    Writer writer(dir.path(), 4, 2);
    writer.open();
    REQUIRE_THROWS_AS(writer.set("short", make_vector(3, 0.0f)), DimensionMismatchError);
    REQUIRE(writer.size() == 0);
}

TEST_CASE("Writer lifecycle", "[store]")
{
    TempDir dir;

    REQUIRE_THROWS_AS(Writer(dir.path(), 0, 4), ValidationError);
    REQUIRE_THROWS_AS(Writer(dir.path(), 4, 0), ValidationError);

    Writer writer(dir.path(), 2, 4);
    REQUIRE_THROWS_AS(writer.set("a", make_vector(2, 0.0f)), ClosedError);

    writer.open();
    writer.open();
    REQUIRE(writer.is_open());
    REQUIRE(std::filesystem::is_directory(StoreLayout::shards(dir.path())));
    REQUIRE(std::filesystem::exists(StoreLayout::keys(dir.path())));
    REQUIRE(std::filesystem::exists(StoreLayout::metadata(dir.path())));

    writer.set("a", make_vector(2, 0.0f));
    writer.close();
    writer.close();
    REQUIRE_FALSE(writer.is_open());
    REQUIRE_THROWS_AS(writer.set("b", make_vector(2, 1.0f)), ClosedError);
}

TEST_CASE("Closing an empty writer produces a readable empty store", "[store]")
{
    TempDir dir;
    {
        Writer writer(dir.path(), 8, 4);
        writer.open();
    }

    REQUIRE(count_shard_files(dir.path()) == 0);
    Reader reader(dir.path());
    reader.open();
    REQUIRE(reader.size() == 0);
    REQUIRE(reader.ids().empty());
    REQUIRE(reader.embedding_matrix().empty());
}

TEST_CASE("Key and id resolution round-trips", "[store]")
{
    TempDir dir;
    write_store(dir.path(), 10, 4, 3);

    Reader reader(dir.path());
    reader.open();
    auto keys = reader.ids();
    REQUIRE(keys.size() == 10);
    for (const auto &key : keys)
        REQUIRE(reader.key_of(reader.id_of(key)) == key);
    REQUIRE(keys.front() == key_for(0));
    REQUIRE(keys.back() == key_for(9));

    std::size_t visited = 0;
    reader.for_each_id([&](EntryId id, const std::string &key) {
        REQUIRE(key == key_for(static_cast<std::size_t>(id)));
        ++visited;
    });
    REQUIRE(visited == 10);
}

TEST_CASE("get dispatches on argument type", "[store]")
{
    TempDir dir;
    {
        Writer writer(dir.path(), 2, 8);
        writer.open();
        // id 0 is stored under the key "42", and the key at id 42 is something else.
        writer.set("42", {42.0f, 42.0f});
        for (int i = 1; i <= 42; ++i)
            writer.set("item" + std::to_string(i), {static_cast<float>(i), 0.0f});
        writer.close();
    }

    Reader reader(dir.path());
    reader.open();

    auto by_key = reader.get("42");
    auto by_id = reader.get(42);
    REQUIRE(by_key == std::vector<float>{42.0f, 42.0f});
    REQUIRE(by_id == std::vector<float>{42.0f, 0.0f});
    REQUIRE(reader.get(std::string("item3")) == reader.get(EntryId{3}));
}

TEST_CASE("Lookups that miss throw NotFoundError", "[store]")
{
    TempDir dir;
    write_store(dir.path(), 5, 2, 4);

    Reader reader(dir.path());
    reader.open();
    REQUIRE_THROWS_AS(reader.get_by_key("missing"), NotFoundError);
    REQUIRE_THROWS_AS(reader.get_by_id(5), NotFoundError);
    REQUIRE_THROWS_AS(reader.get_by_id(-1), NotFoundError);
    REQUIRE_THROWS_AS(reader.key_of(99), NotFoundError);
}

TEST_CASE("Closed reader throws ClosedError", "[store]")
{
    TempDir dir;
    write_store(dir.path(), 3, 2, 4);

    Reader reader(dir.path());
    REQUIRE_THROWS_AS(reader.get_by_id(0), ClosedError);

    reader.open();
    REQUIRE(reader.get_by_id(0).size() == 2);
    reader.close();
    reader.close();
    REQUIRE_FALSE(reader.is_open());
    REQUIRE_THROWS_AS(reader.get_by_key(key_for(0)), ClosedError);
    REQUIRE_THROWS_AS(reader.embedding_matrix(), ClosedError);
    REQUIRE_THROWS_AS(reader.ids(), ClosedError);
}

TEST_CASE("Reader refuses incomplete or inconsistent stores", "[store]")
{
    TempDir dir;

    SECTION("empty directory")
    {
        Reader reader(dir.path());
        REQUIRE_FALSE(reader.validate());
        REQUIRE_THROWS_AS(reader.open(), ValidationError);
    }
    SECTION("missing key database")
    {
        write_store(dir.path(), 4, 2, 2);
        std::filesystem::remove(StoreLayout::keys(dir.path()));
        Reader reader(dir.path());
        REQUIRE_THROWS_AS(reader.open(), ValidationError);
    }
    SECTION("missing shard file")
    {
        write_store(dir.path(), 4, 2, 2);
        std::filesystem::remove(StoreLayout::shards(dir.path()) / "shards_000001.shrd");
        Reader reader(dir.path());
        REQUIRE_THROWS_AS(reader.open(), ValidationError);
    }
    SECTION("truncated shard file")
    {
        write_store(dir.path(), 4, 2, 2);
        std::filesystem::resize_file(StoreLayout::shards(dir.path()) / "shards_000000.shrd", 3);
        Reader reader(dir.path());
        REQUIRE_THROWS_AS(reader.open(), ValidationError);
        REQUIRE_FALSE(reader.is_open());
    }
}

TEST_CASE("Writer killed between shard flushes leaves the flushed shards readable", "[store][crash]")
{
    TempDir dir;
    const std::size_t dim = 4;

    pid_t pid = ::fork();
    REQUIRE(pid >= 0);
    if (pid == 0)
    {
        int code = 0;
        try
        {
            Writer writer(dir.path(), dim, 4);
            writer.open();
            // The ninth set flushes shard 1 and leaves its own vector in memory.
            for (std::size_t i = 0; i < 9; ++i)
                writer.set(key_for(i), make_vector(dim, static_cast<float>(i)));
            ::_exit(0);
        }
        catch (const std::exception &)
        {
            code = 2;
        }
        ::_exit(code);
    }

    int status = 0;
    REQUIRE(::waitpid(pid, &status, 0) == pid);
    REQUIRE(WIFEXITED(status));
    REQUIRE(WEXITSTATUS(status) == 0);

    Reader reader(dir.path());
    reader.open();
    REQUIRE(reader.size() == 8);
    REQUIRE(reader.shards().size() == 2);
    for (std::size_t i = 0; i < 8; ++i)
        REQUIRE(reader.get_by_key(key_for(i)) == make_vector(dim, static_cast<float>(i)));
    REQUIRE_THROWS_AS(reader.get_by_key(key_for(8)), NotFoundError);
    REQUIRE(reader.ids().size() == 8);
}

TEST_CASE("Reopening a writer appends after the existing shards", "[store]")
{
    TempDir dir;
    write_store(dir.path(), 5, 3, 4);

    {
        Writer writer(dir.path(), 3, 4);
        writer.open();
        REQUIRE(writer.size() == 5);
        REQUIRE(writer.shard_count() == 2);
        REQUIRE_THROWS_AS(writer.set(key_for(0), make_vector(3, 0.0f)), DuplicateKeyError);
        writer.set("extra", make_vector(3, 100.0f));
        writer.close();
    }

    Reader reader(dir.path());
    reader.open();
    REQUIRE(reader.size() == 6);
    REQUIRE(reader.shards().size() == 3);
    REQUIRE(reader.id_of("extra") == 5);
    REQUIRE(reader.get(std::string("extra")) == make_vector(3, 100.0f));
    REQUIRE(reader.get_by_key(key_for(4)) == make_vector(3, 4.0f));
}

TEST_CASE("Reopening with a different dimension fails", "[store]")
{
    TempDir dir;
    write_store(dir.path(), 2, 3, 4);

    Writer writer(dir.path(), 5, 4);
    REQUIRE_THROWS_AS(writer.open(), ValidationError);
    REQUIRE_FALSE(writer.is_open());
}

TEST_CASE("Keys committed ahead of their shard are dropped on resume", "[store][crash]")
{
    TempDir dir;

    pid_t pid = ::fork();
    REQUIRE(pid >= 0);
    if (pid == 0)
    {
        int code = 0;
        try
        {
            Writer writer(dir.path(), 2, 4);
            writer.open();
            for (std::size_t i = 0; i < 6; ++i)
                writer.set(key_for(i), make_vector(2, static_cast<float>(i)), true);
            ::_exit(0);
        }
        catch (const std::exception &)
        {
            code = 2;
        }
        ::_exit(code);
    }

    int status = 0;
    REQUIRE(::waitpid(pid, &status, 0) == pid);
    REQUIRE(WEXITSTATUS(status) == 0);

    {
        // Keys 4 and 5 were committed but their shard never reached disk.
        Reader reader(dir.path());
        reader.open();
        REQUIRE(reader.size() == 4);
        REQUIRE(reader.id_of(key_for(5)) == 5);
        REQUIRE_THROWS_AS(reader.get_by_key(key_for(5)), NotFoundError);
    }

    Writer writer(dir.path(), 2, 4);
    writer.open();
    REQUIRE(writer.size() == 4);
    writer.set(key_for(5), make_vector(2, 55.0f));
    writer.close();

    Reader reader(dir.path());
    reader.open();
    REQUIRE(reader.size() == 5);
    REQUIRE(reader.get_by_key(key_for(5)) == make_vector(2, 55.0f));
    REQUIRE_THROWS_AS(reader.id_of(key_for(4)), NotFoundError);
}

TEST_CASE("Readers share a store across threads", "[store][concurrency]")
{
    TempDir dir;
    const std::size_t dim = 8;
    write_store(dir.path(), 64, dim, 16);

    Reader reader(dir.path());
    reader.open();
    Reader second(dir.path());
    second.open();

    std::vector<int> mismatches(4, 0);
    std::vector<std::thread> threads;
    for (std::size_t t = 0; t < mismatches.size(); ++t)
    {
        threads.emplace_back([&, t]() {
            const Reader &r = (t % 2 == 0) ? reader : second;
            for (std::size_t i = 0; i < 64; ++i)
            {
                if (r.get_by_key(key_for(i)) != make_vector(dim, static_cast<float>(i)))
                    ++mismatches[t];
            }
        });
    }
    for (auto &th : threads)
        th.join();

    for (int m : mismatches)
        REQUIRE(m == 0);
}

TEST_CASE("Anonymous scratch backing serves the same table", "[store]")
{
    TempDir dir;
    write_store(dir.path(), 6, 3, 4);

    ScratchOptions scratch;
    scratch.backing = ScratchMappedArray::Backing::Anonymous;
    Reader reader(dir.path(), scratch);
    reader.open();
    REQUIRE(reader.get_by_id(5) == make_vector(3, 5.0f));
}

TEST_CASE("Rollover retried after a failed key commit writes its manifest row once", "[store]")
{
    TempDir dir;
    Writer writer(dir.path(), 2, 2);
    writer.open();
    writer.set("a", {1.0f, 1.0f});
    writer.set("b", {2.0f, 2.0f});

    KeyIndexReadLock lock(dir.path());
    REQUIRE_THROWS_AS(writer.set("c", {3.0f, 3.0f}), IoError);
    REQUIRE(writer.size() == 2);
    REQUIRE(writer.shard_count() == 0);
    lock.release();

    REQUIRE(writer.set("c", {3.0f, 3.0f}));
    REQUIRE(writer.shard_count() == 1);
    writer.close();

    auto rows = Manifest::read(StoreLayout::metadata(dir.path()));
    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0].shard_id == 0);
    REQUIRE(rows[1].shard_id == 1);

    Reader reader(dir.path());
    reader.open();
    REQUIRE(reader.size() == 3);
    REQUIRE(reader.get_by_key("a") == std::vector<float>{1.0f, 1.0f});
    REQUIRE(reader.get_by_key("c") == std::vector<float>{3.0f, 3.0f});
}

TEST_CASE("Close retried after a failed key commit finishes the partial shard", "[store]")
{
    TempDir dir;
    Writer writer(dir.path(), 2, 4);
    writer.open();
    writer.set("a", {1.0f, 1.0f});

    {
        KeyIndexReadLock lock(dir.path());
        REQUIRE_THROWS_AS(writer.close(), IoError);
        REQUIRE(writer.is_open());
    }

    SECTION("closing again")
    {
        writer.close();
    }
    SECTION("appending first")
    {
        // The partial shard already has its row, so the next vector starts a new shard.
        REQUIRE(writer.set("b", {2.0f, 2.0f}));
        writer.close();
    }

    Reader reader(dir.path());
    reader.open();
    REQUIRE(reader.shards().front().n == 1);
    REQUIRE(reader.size() == reader.shards().size());
    REQUIRE(reader.get_by_key("a") == std::vector<float>{1.0f, 1.0f});
}
