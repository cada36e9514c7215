#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <buildlog/utils/iterators/chunk_iterator.h>
#include <buildlog/utils/iterators/line_iterator.h>
#include <buildlog/utils/reader/error.h>
#include <buildlog/utils/reader/file_source.h>
#include <doctest/doctest.h>

#include <chrono>
#include <string>
#include <vector>

#include "testing_utilities.h"

using namespace buildlog::utils;
using namespace buildlog_test;

namespace {
std::vector<std::string> collect(Iterator<std::string> &iterator) {
    std::vector<std::string> items;
    std::string item;
    while (iterator.next(item)) {
        items.push_back(item);
    }
    return items;
}

std::string join(const std::vector<std::string> &items) {
    std::string joined;
    for (const auto &item : items) {
        joined += item;
    }
    return joined;
}
}  // namespace

TEST_CASE("ChunkIterator - Reproduces the source") {
    TestEnvironment env(300);
    REQUIRE(env.is_valid());
    std::string content = env.log_content();
    std::string file = env.create_test_log_file();
    REQUIRE(!file.empty());

    for (std::size_t chunk_size : {1, 7, 64, 1000, 4096, 1 << 20}) {
        CAPTURE(chunk_size);
        TextFileSource source(file);
        ChunkIterator chunks(source, chunk_size);
        auto items = collect(chunks);
        CHECK(join(items) == content);
        for (const auto &chunk : items) {
            CHECK(!chunk.empty());
            CHECK(chunk.back() == '\n');
        }
    }
}

TEST_CASE("ChunkIterator - Line boundaries") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    SUBCASE("Unterminated tail is returned as-is") {
        std::string file = env.create_file("tail.log", "aa\nbb\ncc");
        TextFileSource source(file);
        ChunkIterator chunks(source, 4);
        auto items = collect(chunks);
        REQUIRE(items.size() == 3);
        CHECK(items[0] == "aa\n");
        CHECK(items[1] == "bb\n");
        CHECK(items[2] == "cc");
    }

    SUBCASE("Oversized line is not split") {
        std::string long_line(100, 'x');
        std::string file =
            env.create_file("long.log", "a\n" + long_line + "\nb\n");
        TextFileSource source(file);
        ChunkIterator chunks(source, 8);
        auto items = collect(chunks);
        REQUIRE(items.size() == 3);
        CHECK(items[0] == "a\n");
        CHECK(items[1] == long_line + "\n");
        CHECK(items[2] == "b\n");
    }

    SUBCASE("Several lines per chunk") {
        std::string file = env.create_file("short.log", "1\n2\n3\n4\n5\n");
        TextFileSource source(file);
        ChunkIterator chunks(source, 5);
        auto items = collect(chunks);
        // "1\n2\n3" then "\n4\n5\n"
        REQUIRE(items.size() == 2);
        CHECK(items[0] == "1\n2\n");
        CHECK(items[1] == "3\n4\n5\n");
    }

    SUBCASE("Empty file") {
        std::string file = env.create_file("empty.log", "");
        TextFileSource source(file);
        ChunkIterator chunks(source, 16);
        std::string chunk;
        CHECK_FALSE(chunks.next(chunk));
        CHECK_FALSE(chunks.next(chunk));
    }
}

TEST_CASE("ChunkIterator - Automatic chunk size") {
    CHECK(ChunkIterator::auto_chunk_size(0) == 64 * 1024);
    CHECK(ChunkIterator::auto_chunk_size(100 * 1024 * 1024) ==
          100 * 1024 * 1024 / 1000);
    CHECK(ChunkIterator::auto_chunk_size(10ULL * 1024 * 1024 * 1024) ==
          256 * 1024);

    TestEnvironment env;
    REQUIRE(env.is_valid());
    TextFileSource source(env.create_test_log_file());
    ChunkIterator chunks(source);
    CHECK(chunks.chunk_size() == 64 * 1024);
}

TEST_CASE("ChunkIterator - Reset, seek and tell") {
    TestEnvironment env(200);
    REQUIRE(env.is_valid());
    std::string content = env.log_content();
    TextFileSource source(env.create_test_log_file());
    ChunkIterator chunks(source, 128);

    auto first = collect(chunks);
    CHECK(chunks.tell() == content.size());

    chunks.reset();
    auto second = collect(chunks);
    CHECK(first == second);

    std::size_t offset = content.find('\n', 500) + 1;
    chunks.seek(offset);
    CHECK(join(collect(chunks)) == content.substr(offset));

    SUBCASE("Reset reopens a closed source") {
        chunks.close();
        CHECK_FALSE(source.is_open());
        chunks.reset();
        CHECK(join(collect(chunks)) == content);
    }
}

TEST_CASE("ChunkIterator - Gzip source") {
    TestEnvironment env(400);
    REQUIRE(env.is_valid());
    GzipFileSource source(env.create_test_gzip_file());
    ChunkIterator chunks(source, 512);
    auto items = collect(chunks);
    CHECK(join(items) == env.log_content());

    chunks.reset();
    CHECK(collect(chunks) == items);
}

TEST_CASE("ChunkIterator - Failures surface as read errors") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    TextFileSource source(env.create_test_log_file());
    ChunkIterator chunks(source, 64);
    source.close();

    std::string chunk;
    try {
        chunks.next(chunk);
        FAIL("expected ReaderError");
    } catch (const ReaderError &e) {
        CHECK(e.get_type() == ReaderError::READ_ERROR);
    }
}

TEST_CASE("LineIterator - Basic functionality") {
    TestEnvironment env(250);
    REQUIRE(env.is_valid());
    std::string content = env.log_content();
    TextFileSource source(env.create_test_log_file());

    SUBCASE("Counts lines") {
        LineIterator lines(source, 64);
        std::string line;
        std::size_t k = 0;
        while (lines.next(line)) {
            ++k;
            CHECK(lines.line_number() == k);
            CHECK(line.back() == '\n');
        }
        CHECK(k == 250);
        CHECK(lines.line_number() == 250);
    }

    SUBCASE("Concatenation reproduces the source") {
        for (std::size_t buffer_size : {1, 3, 100, 4096}) {
            CAPTURE(buffer_size);
            LineIterator lines(source, buffer_size);
            lines.reset();
            CHECK(join(collect(lines)) == content);
        }
    }

    SUBCASE("Reset") {
        LineIterator lines(source);
        auto first = collect(lines);
        lines.reset();
        CHECK(lines.line_number() == 0);
        auto second = collect(lines);
        CHECK(first == second);
        CHECK(lines.line_number() == 250);
    }

    SUBCASE("Seek restarts the counter") {
        LineIterator lines(source);
        std::string line;
        REQUIRE(lines.next(line));
        REQUIRE(lines.next(line));
        CHECK(lines.line_number() == 2);

        std::size_t offset = content.find('\n') + 1;
        lines.seek(offset);
        CHECK(lines.line_number() == 0);
        REQUIRE(lines.next(line));
        CHECK(line == content.substr(offset, content.find('\n', offset) -
                                                 offset + 1));
        CHECK(lines.line_number() == 1);
    }
}

TEST_CASE("LineIterator - Line length limit") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    SUBCASE("Forced split at exactly max_line_length") {
        std::string file = env.create_file("long.log",
                                           std::string(25, 'a') + "\nok\n");
        TextFileSource source(file);
        LineIterator lines(source, 4, 10);
        auto items = collect(lines);
        REQUIRE(items.size() == 4);
        CHECK(items[0] == std::string(10, 'a'));
        CHECK(items[1] == std::string(10, 'a'));
        CHECK(items[2] == std::string(5, 'a') + "\n");
        CHECK(items[3] == "ok\n");
        CHECK(lines.line_number() == 4);
    }

    SUBCASE("Terminator at the limit stays with its line") {
        std::string file =
            env.create_file("edge.log", std::string(9, 'b') + "\nc\n");
        TextFileSource source(file);
        LineIterator lines(source, 3, 10);
        auto items = collect(lines);
        REQUIRE(items.size() == 2);
        CHECK(items[0] == std::string(9, 'b') + "\n");
        CHECK(items[1] == "c\n");
    }

    SUBCASE("Final line without terminator") {
        std::string file = env.create_file("final.log", "one\ntwo");
        TextFileSource source(file);
        LineIterator lines(source);
        auto items = collect(lines);
        REQUIRE(items.size() == 2);
        CHECK(items[0] == "one\n");
        CHECK(items[1] == "two");
    }

    SUBCASE("Split fragment at end of source gets no terminator") {
        std::string body(23, 'z');
        std::string file = env.create_file("split_end.log", body);
        TextFileSource source(file);
        LineIterator lines(source, 5, 10);
        auto items = collect(lines);
        REQUIRE(items.size() == 3);
        CHECK(items[2] == std::string(3, 'z'));
        CHECK(join(items) == body);
    }

    SUBCASE("Invalid parameters") {
        TextFileSource source(env.create_test_log_file());
        CHECK_THROWS_AS(LineIterator(source, 0), ReaderError);
        CHECK_THROWS_AS(LineIterator(source, 16, 0), ReaderError);
    }
}

TEST_CASE("LineIterator - Buffer larger than the file") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    std::string body;
    const std::size_t line_count = 52428;
    for (std::size_t i = 0; i < line_count; ++i) {
        body += std::string(79, static_cast<char>('a' + i % 26)) + "\n";
    }
    TextFileSource source(env.create_file("wide.log", body));

    for (std::size_t buffer_size : {std::size_t(4096), mb_to_b(4) + 1}) {
        CAPTURE(buffer_size);
        LineIterator lines(source, buffer_size);
        lines.reset();
        auto start = std::chrono::steady_clock::now();
        auto items = collect(lines);
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(items.size() == line_count);
        CHECK(items.front() == std::string(79, 'a') + "\n");
        CHECK(items.back().size() == 80);
        CHECK(join(items) == body);
        // Emitting a line must not shift the rest of the buffer
        CHECK(elapsed < std::chrono::seconds(2));
    }
}

TEST_CASE("LineIterator - Gzip source") {
    TestEnvironment env(300);
    REQUIRE(env.is_valid());
    GzipFileSource source(env.create_test_gzip_file());
    LineIterator lines(source, 256);
    auto items = collect(lines);
    CHECK(items.size() == 300);
    CHECK(join(items) == env.log_content());
}
