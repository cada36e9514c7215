#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <buildlog/utils/config/reader_config.h>
#include <buildlog/utils/reader/error.h>
#include <buildlog/utils/utils/logger.h>
#include <doctest/doctest.h>

#include <string>

using namespace buildlog::utils;

namespace {
ReaderError::Type validation_failure(const ReaderConfigManager &config) {
    try {
        config.validate();
    } catch (const ReaderError &e) {
        return e.get_type();
    }
    return ReaderError::TASK_ERROR;
}
}  // namespace

TEST_CASE("ReaderConfigManager - Defaults") {
    ReaderConfigManager config = ReaderConfigManager::Default();
    CHECK(config.chunk_size() == 8 * 1024 * 1024);
    CHECK(config.buffer_size() == 4096);
    CHECK(config.max_line_length() == 1024 * 1024);
    CHECK(config.cache_size() == 100 * 1024 * 1024);
    CHECK(config.cache_ttl() == doctest::Approx(300.0));
    CHECK(config.enable_caching());
    CHECK(config.max_workers() == 4);
    CHECK(config.max_retries() == 3);
    CHECK(config.retry_delay() == doctest::Approx(1.0));
    CHECK(config.prefetch_size() == 3);
    CHECK(config.prefetch_timeout() == doctest::Approx(0.1));
    CHECK_NOTHROW(config.validate());
}

TEST_CASE("ReaderConfigManager - Fluent setters") {
    ReaderConfigManager config;
    config.set_chunk_size(1024)
        .set_buffer_size(64)
        .set_max_line_length(128)
        .set_cache_size(2048)
        .set_cache_ttl(5.0)
        .set_enable_caching(false)
        .set_max_workers(2)
        .set_max_retries(0)
        .set_retry_delay(0.0)
        .set_prefetch_size(10)
        .set_prefetch_timeout(0.5);

    CHECK(config.chunk_size() == 1024);
    CHECK(config.buffer_size() == 64);
    CHECK(config.max_line_length() == 128);
    CHECK(config.cache_size() == 2048);
    CHECK(config.cache_ttl() == doctest::Approx(5.0));
    CHECK_FALSE(config.enable_caching());
    CHECK(config.max_workers() == 2);
    CHECK(config.max_retries() == 0);
    CHECK(config.retry_delay() == doctest::Approx(0.0));
    CHECK(config.prefetch_size() == 10);
    CHECK(config.prefetch_timeout() == doctest::Approx(0.5));
    CHECK_NOTHROW(config.validate());

    ReaderConfigManager created = ReaderConfigManager::create(4096, 1, 5, 0.25);
    CHECK(created.chunk_size() == 4096);
    CHECK(created.max_workers() == 1);
    CHECK(created.max_retries() == 5);
    CHECK(created.retry_delay() == doctest::Approx(0.25));
}

TEST_CASE("ReaderConfigManager - Validation") {
    ReaderConfigManager config;

    SUBCASE("Zero sizes") {
        CHECK(validation_failure(ReaderConfigManager(config).set_chunk_size(
                  0)) == ReaderError::VALIDATION_ERROR);
        CHECK(validation_failure(ReaderConfigManager(config).set_buffer_size(
                  0)) == ReaderError::VALIDATION_ERROR);
        CHECK(validation_failure(
                  ReaderConfigManager(config).set_max_line_length(0)) ==
              ReaderError::VALIDATION_ERROR);
        CHECK(validation_failure(ReaderConfigManager(config).set_cache_size(
                  0)) == ReaderError::VALIDATION_ERROR);
        CHECK(validation_failure(
                  ReaderConfigManager(config).set_prefetch_size(0)) ==
              ReaderError::VALIDATION_ERROR);
    }

    SUBCASE("Worker bounds") {
        CHECK(validation_failure(ReaderConfigManager(config).set_max_workers(
                  0)) == ReaderError::VALIDATION_ERROR);
        CHECK(validation_failure(ReaderConfigManager(config).set_max_workers(
                  5)) == ReaderError::VALIDATION_ERROR);
        CHECK_NOTHROW(
            ReaderConfigManager(config).set_max_workers(1).validate());
        CHECK_NOTHROW(
            ReaderConfigManager(config).set_max_workers(4).validate());
    }

    SUBCASE("Negative retries and delays") {
        CHECK(validation_failure(ReaderConfigManager(config).set_max_retries(
                  -1)) == ReaderError::VALIDATION_ERROR);
        CHECK(validation_failure(ReaderConfigManager(config).set_retry_delay(
                  -0.5)) == ReaderError::VALIDATION_ERROR);
    }

    SUBCASE("Constructor validates") {
        CHECK_THROWS_AS(ReaderConfigManager(0), ReaderError);
        CHECK_THROWS_AS(ReaderConfigManager::create(1024, 9), ReaderError);
    }
}

TEST_CASE("Logger - Level control") {
    CHECK(logger::set_log_level("debug") == 0);
    CHECK(logger::get_log_level_string() == "debug");
    CHECK(logger::get_log_level_int() == 1);
    CHECK(logger::set_log_level_int(3) == 0);
    CHECK(logger::get_log_level_string() == "warn");
    CHECK(logger::set_log_level_int(9) == -1);
    CHECK(logger::set_log_level("") == -1);

    CHECK(buildlog_utils_set_log_level("error") == 0);
    CHECK(std::string(buildlog_utils_get_log_level_string()) == "error");
    CHECK(buildlog_utils_get_log_level_int() == 4);
    CHECK(buildlog_utils_set_log_level(nullptr) == -1);
    CHECK(logger::set_log_level("info") == 0);
}
