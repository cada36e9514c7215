#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <buildlog/utils/reader/error.h>
#include <buildlog/utils/reader/file_source.h>
#include <buildlog/utils/reader/file_source_factory.h>
#include <buildlog/utils/utils/filesystem.h>
#include <doctest/doctest.h>
#include <sys/stat.h>
#include <unistd.h>
#include <zlib.h>

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include "buildlog/utils/reader/inflater.h"
#include "testing_utilities.h"

using namespace buildlog::utils;
using namespace buildlog_test;

TEST_CASE("ReaderError - Message formatting") {
    ReaderError error(ReaderError::NOT_FOUND, "missing.log");
    CHECK(error.get_type() == ReaderError::NOT_FOUND);
    CHECK(error.get_message() == "missing.log");
    CHECK(std::string(error.what()) == "[NOT_FOUND] missing.log");

    ReaderError format(ReaderError::FORMAT_ERROR, "bad header");
    CHECK(std::string(format.what()) == "[FORMAT] bad header");
    CHECK(std::string(ReaderError::type_name(ReaderError::TASK_ERROR)) ==
          "TASK");
}

TEST_CASE("TextFileSource - Basic functionality") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    std::string content = "first line\nsecond line\nthird\n";
    std::string file = env.create_file("plain.txt", content);
    REQUIRE(!file.empty());

    TextFileSource source(file);
    CHECK_FALSE(source.is_open());
    CHECK(source.get_path() == file);
    CHECK(source.size() == content.size());
    CHECK(std::string(source.kind()) == "text");

    source.open();
    REQUIRE(source.is_open());

    SUBCASE("Sequential reads") {
        CHECK(source.read(5) == "first");
        CHECK(source.tell() == 5);
        CHECK(source.read(6) == " line\n");
        CHECK(source.read_all() == "second line\nthird\n");
        CHECK(source.read(10).empty());
    }

    SUBCASE("Zero-size read") { CHECK(source.read(0).empty()); }

    SUBCASE("Seek") {
        CHECK(source.seek(11) == 11);
        CHECK(source.read(6) == "second");
        CHECK(source.seek(-6, SEEK_CUR) == 11);
        CHECK(source.seek(-6, SEEK_END) == content.size() - 6);
        CHECK(source.read_all() == "third\n");
    }

    SUBCASE("Negative read size") {
        try {
            source.read(-1);
            FAIL("expected ReaderError");
        } catch (const ReaderError &e) {
            CHECK(e.get_type() == ReaderError::VALIDATION_ERROR);
        }
    }

    SUBCASE("Invalid whence") {
        try {
            source.seek(0, 42);
            FAIL("expected ReaderError");
        } catch (const ReaderError &e) {
            CHECK(e.get_type() == ReaderError::VALIDATION_ERROR);
        }
    }

    SUBCASE("Operations after close") {
        source.close();
        CHECK_FALSE(source.is_open());
        try {
            source.read(1);
            FAIL("expected ReaderError");
        } catch (const ReaderError &e) {
            CHECK(e.get_type() == ReaderError::READ_ERROR);
        }
        CHECK_THROWS_AS(source.seek(0), ReaderError);
        CHECK_THROWS_AS(source.tell(), ReaderError);

        // Reopening starts over
        source.open();
        CHECK(source.read(5) == "first");
    }
}

TEST_CASE("TextFileSource - Construction errors") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    SUBCASE("Missing file") {
        try {
            TextFileSource source(env.path("does_not_exist.log"));
            FAIL("expected ReaderError");
        } catch (const ReaderError &e) {
            CHECK(e.get_type() == ReaderError::NOT_FOUND);
        }
    }

    SUBCASE("Directory") {
        try {
            TextFileSource source(env.get_dir());
            FAIL("expected ReaderError");
        } catch (const ReaderError &e) {
            CHECK(e.get_type() == ReaderError::FORMAT_ERROR);
        }
    }

    SUBCASE("Permission denied") {
        std::string file = env.create_file("secret.log", "hidden\n");
        REQUIRE(!file.empty());
        ::chmod(file.c_str(), 0);
        if (::geteuid() == 0) {
            MESSAGE("running as root, permission checks do not apply");
        } else {
            TextFileSource source(file);
            try {
                source.open();
                FAIL("expected ReaderError");
            } catch (const ReaderError &e) {
                CHECK(e.get_type() == ReaderError::PERMISSION_DENIED);
            }
        }
        ::chmod(file.c_str(), 0644);
    }
}

TEST_CASE("GzipFileSource - Basic functionality") {
    TestEnvironment env(500);
    REQUIRE(env.is_valid());
    std::string gz_file = env.create_test_gzip_file();
    REQUIRE(!gz_file.empty());
    std::string expected = env.log_content();

    GzipFileSource source(gz_file);
    CHECK(std::string(source.kind()) == "gzip");
    CHECK(source.size() == fs::file_size(gz_file));
    source.open();

    SUBCASE("Read everything") {
        CHECK(source.read_all() == expected);
        CHECK(source.tell() == expected.size());
        CHECK(source.read(100).empty());
    }

    SUBCASE("Reads in small pieces") {
        std::string collected;
        std::string piece;
        while (!(piece = source.read(333)).empty()) {
            collected += piece;
        }
        CHECK(collected == expected);
    }

    SUBCASE("Forward and backward seek") {
        CHECK(source.seek(1000) == 1000);
        CHECK(source.read(50) == expected.substr(1000, 50));
        CHECK(source.seek(10) == 10);
        CHECK(source.tell() == 10);
        CHECK(source.read(20) == expected.substr(10, 20));
        CHECK(source.seek(5, SEEK_CUR) == 35);
        CHECK(source.read(5) == expected.substr(35, 5));
    }

    SUBCASE("Seek past the end stops at the end") {
        CHECK(source.seek(static_cast<std::int64_t>(expected.size()) + 100) ==
              expected.size());
        CHECK(source.read(10).empty());
    }

    SUBCASE("SEEK_END is rejected") {
        try {
            source.seek(0, SEEK_END);
            FAIL("expected ReaderError");
        } catch (const ReaderError &e) {
            CHECK(e.get_type() == ReaderError::VALIDATION_ERROR);
        }
    }
}

TEST_CASE("Inflater - Output fed in bounded windows") {
    TestEnvironment env(200);
    REQUIRE(env.is_valid());
    std::string gz_file = env.create_test_gzip_file();
    const std::string expected = env.log_content();

    for (std::size_t window : {std::size_t(1), std::size_t(7),
                               std::size_t(4096), std::size_t(0)}) {
        CAPTURE(window);
        Inflater inflater(window);
        CHECK(inflater.max_window() >= 1);

        FILE *file = std::fopen(gz_file.c_str(), "rb");
        REQUIRE(file != nullptr);
        REQUIRE(inflater.initialize(file));

        // One request far larger than any window
        std::vector<unsigned char> buffer(expected.size() + 100);
        std::size_t bytes_out = 0;
        bool ok = inflater.read(file, buffer.data(), buffer.size(), bytes_out);
        std::fclose(file);

        REQUIRE(ok);
        CHECK(bytes_out == expected.size());
        CHECK(std::string(buffer.begin(), buffer.begin() + bytes_out) ==
              expected);
    }
}

TEST_CASE("GzipFileSource - Multiple members") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    std::string file = env.path("multi.gz");

    gzFile out = gzopen(file.c_str(), "wb");
    REQUIRE(out != nullptr);
    gzputs(out, "member one\n");
    gzclose(out);
    out = gzopen(file.c_str(), "ab");
    REQUIRE(out != nullptr);
    gzputs(out, "member two\n");
    gzclose(out);

    GzipFileSource source(file);
    source.open();
    CHECK(source.read_all() == "member one\nmember two\n");
}

TEST_CASE("GzipFileSource - Format errors") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    SUBCASE("Plain text is not gzip") {
        std::string file = env.create_file("plain.gz", "not compressed\n");
        try {
            GzipFileSource source(file);
            FAIL("expected ReaderError");
        } catch (const ReaderError &e) {
            CHECK(e.get_type() == ReaderError::FORMAT_ERROR);
        }
    }

    SUBCASE("Corrupt stream") {
        std::string gz_file = env.create_test_gzip_file("corrupt.gz");
        REQUIRE(!gz_file.empty());
        std::string data = read_file(gz_file);
        REQUIRE(data.size() > 40);
        for (std::size_t i = 20; i < data.size() - 8; ++i) {
            data[i] = static_cast<char>(0xff);
        }
        std::string broken = env.create_file("broken.gz", data);

        GzipFileSource source(broken);
        source.open();
        try {
            source.read_all();
            FAIL("expected ReaderError");
        } catch (const ReaderError &e) {
            CHECK(e.get_type() == ReaderError::FORMAT_ERROR);
        }
    }

    SUBCASE("Truncated stream") {
        std::string gz_file = env.create_test_gzip_file("whole.gz");
        REQUIRE(!gz_file.empty());
        std::string data = read_file(gz_file);
        std::string truncated =
            env.create_file("truncated.gz", data.substr(0, data.size() / 2));

        GzipFileSource source(truncated);
        source.open();
        CHECK_THROWS_AS(source.read_all(), ReaderError);
    }
}

TEST_CASE("FileSourceFactory - Handler selection") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    FileSourceFactory factory;

    SUBCASE("By extension") {
        std::string log_file = env.create_test_log_file("build.log");
        std::string txt_file = env.create_file("notes.TXT", "abc\n");
        std::string gz_file = env.create_test_gzip_file("build.log.gz");

        CHECK(std::string(factory.create(log_file)->kind()) == "text");
        CHECK(std::string(factory.create(txt_file)->kind()) == "text");
        CHECK(std::string(factory.create(gz_file)->kind()) == "gzip");
    }

    SUBCASE("Gzip content without extension") {
        std::string gz_file = env.create_test_gzip_file("archive.bin");
        auto source = factory.create(gz_file);
        CHECK(std::string(source->kind()) == "gzip");
        source->open();
        CHECK(source->read_all() == env.log_content());
    }

    SUBCASE("Unsupported type") {
        std::string file = env.create_file("image.png", "PNG data");
        try {
            factory.create(file);
            FAIL("expected ReaderError");
        } catch (const ReaderError &e) {
            CHECK(e.get_type() == ReaderError::FORMAT_ERROR);
        }
    }

    SUBCASE("Missing file") {
        try {
            factory.create(env.path("missing.log"));
            FAIL("expected ReaderError");
        } catch (const ReaderError &e) {
            CHECK(e.get_type() == ReaderError::NOT_FOUND);
        }
    }

    SUBCASE("Custom handler") {
        std::string file = env.create_file("ninja.out", "[1/2] CXX a.o\n");
        CHECK_FALSE(factory.has_handler(".out"));
        factory.register_handler("out", [](const std::string &path) {
            return std::make_unique<TextFileSource>(path);
        });
        CHECK(factory.has_handler(".OUT"));
        auto source = factory.create(file);
        source->open();
        CHECK(source->read_all() == "[1/2] CXX a.o\n");
    }
}
