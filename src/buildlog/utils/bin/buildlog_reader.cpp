#include <buildlog/utils/config.h>
#include <buildlog/utils/config/reader_config.h>
#include <buildlog/utils/iterators/chunk_iterator.h>
#include <buildlog/utils/iterators/line_iterator.h>
#include <buildlog/utils/iterators/prefetch_iterator.h>
#include <buildlog/utils/monitoring/memory_monitor.h>
#include <buildlog/utils/monitoring/stats_collector.h>
#include <buildlog/utils/parallel/parallel_reader.h>
#include <buildlog/utils/reader/error.h>
#include <buildlog/utils/reader/file_source_factory.h>
#include <buildlog/utils/utils/logger.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <argparse/argparse.hpp>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>

using namespace buildlog::utils;

namespace {

std::size_t drain(Iterator<std::string> &iterator, StatsCollector &stats,
                  std::size_t &count) {
  std::size_t total_bytes = 0;
  std::string item;
  auto start = std::chrono::steady_clock::now();
  while (iterator.next(item)) {
    fwrite(item.data(), 1, item.size(), stdout);
    total_bytes += item.size();
    ++count;
  }
  double elapsed = std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - start)
                       .count();
  stats.collect_io_stats(total_bytes, elapsed);
  return total_bytes;
}

std::size_t drain_with_prefetch(Iterator<std::string> &iterator,
                                const ReaderConfigManager &config,
                                bool prefetch, StatsCollector &stats,
                                std::size_t &count) {
  if (!prefetch) {
    return drain(iterator, stats, count);
  }
  PrefetchIterator<std::string> prefetcher(iterator, config.prefetch_size(),
                                           config.prefetch_timeout());
  return drain(prefetcher, stats, count);
}

void print_stats(const StatsCollector &stats,
                 const ParallelReader *parallel_reader) {
  StatsCollector::Snapshot snapshot = stats.get_statistics();
  std::fprintf(stderr, "bytes_read_total: %llu\n",
               static_cast<unsigned long long>(snapshot.io.bytes_read_total));
  std::fprintf(stderr, "read_operations: %zu\n", snapshot.io.read_operations);
  std::fprintf(stderr, "read_speed_mbps: %.2f\n", snapshot.io.read_speed_mbps);
  std::fprintf(stderr, "avg_read_latency: %.6f\n",
               snapshot.io.avg_read_latency());
  for (const auto &op : snapshot.operations) {
    std::fprintf(stderr, "%s: count=%zu avg=%.6f min=%.6f max=%.6f\n",
                 op.first.c_str(), op.second.count, op.second.average(),
                 op.second.min, op.second.max);
  }
  if (parallel_reader) {
    auto workers = parallel_reader->worker_stats();
    std::fprintf(stderr, "optimal_chunk_size: %zu\n",
                 workers.optimal_chunk_size);
    std::fprintf(stderr, "unhealthy_workers: %zu\n",
                 workers.unhealthy_workers.size());
    for (const auto &worker : workers.workers) {
      std::fprintf(stderr,
                   "worker %d: tasks=%zu bytes=%llu throughput=%.0f B/s "
                   "error_rate=%.2f\n",
                   worker.first, worker.second.total_tasks,
                   static_cast<unsigned long long>(
                       worker.second.processed_bytes),
                   worker.second.throughput, worker.second.error_rate);
    }
    for (const auto &thread :
         parallel_reader->thread_monitor().all_stats()) {
      std::fprintf(stderr,
                   "thread %d: completed=%zu failed=%zu avg_task_time=%.6f\n",
                   thread.first, thread.second.completed_tasks,
                   thread.second.failed_tasks, thread.second.avg_task_time);
    }
  }
}

void print_memory(MemoryMonitor &memory) {
  memory.stop_monitoring();
  try {
    memory.take_snapshot();
  } catch (const ReaderError &e) {
    spdlog::warn("Memory sample failed: {}", e.what());
  }
  auto trend = memory.memory_trend();
  if (trend.empty()) {
    return;
  }
  auto peak = std::max_element(
      trend.begin(), trend.end(),
      [](const MemorySnapshot &a, const MemorySnapshot &b) {
        return a.used_bytes < b.used_bytes;
      });
  std::fprintf(stderr, "memory_samples: %zu\n", trend.size());
  std::fprintf(stderr, "peak_rss_mb: %.2f\n", peak->used_mb());
  std::fprintf(stderr, "memory_growing: %s\n",
               memory.detect_memory_leak(std::min<std::size_t>(
                   trend.size(), constants::monitoring::DEFAULT_LEAK_WINDOW))
                   ? "yes"
                   : "no");
}

}  // namespace

int main(int argc, char **argv) {
  argparse::ArgumentParser program("buildlog_reader",
                                   BUILDLOG_UTILS_PACKAGE_VERSION);
  program.add_description(
      "Read a plain or gzipped build log by lines, by line-aligned chunks or "
      "in parallel byte ranges");
  program.add_argument("file").help("Log file to read").required();
  program.add_argument("--mode")
      .help("Reading mode (lines, chunks, parallel)")
      .default_value<std::string>("lines")
      .choices("lines", "chunks", "parallel");
  program.add_argument("-c", "--chunk-size")
      .help("Chunk size in bytes; 0 picks a size from the file size in "
            "chunks mode (default: 0, parallel default: 8MB)")
      .default_value<size_t>(0)
      .scan<'d', size_t>();
  program.add_argument("--buffer-size")
      .help("Read buffer size in bytes for lines mode (default: 4096)")
      .default_value<size_t>(constants::reader::DEFAULT_BUFFER_SIZE)
      .scan<'d', size_t>();
  program.add_argument("--max-line-length")
      .help("Split lines longer than this many bytes (default: 1MB)")
      .default_value<size_t>(constants::reader::DEFAULT_MAX_LINE_LENGTH)
      .scan<'d', size_t>();
  program.add_argument("-w", "--workers")
      .help("Worker threads for parallel mode (1-4)")
      .default_value<size_t>(constants::parallel::MAX_WORKERS)
      .scan<'d', size_t>();
  program.add_argument("--retries")
      .help("Retries per chunk in parallel mode")
      .default_value<int>(
          static_cast<int>(constants::parallel::DEFAULT_MAX_RETRIES))
      .scan<'d', int>();
  program.add_argument("--retry-delay")
      .help("Base retry delay in seconds")
      .default_value<double>(constants::parallel::DEFAULT_RETRY_DELAY)
      .scan<'g', double>();
  program.add_argument("--prefetch")
      .help("Prefetch this many items on a background thread (0 disables)")
      .default_value<size_t>(0)
      .scan<'d', size_t>();
  program.add_argument("--log-level")
      .help(
          "Set logging level (trace, debug, info, warn, error, critical, off)")
      .default_value<std::string>("warn");
  program.add_argument("--stats")
      .help("Print read statistics to stderr when done")
      .flag();
  program.add_argument("--memory-interval")
      .help("Seconds between memory samples taken with --stats")
      .default_value<double>(0.5)
      .scan<'g', double>();

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception &err) {
    spdlog::error("Error occurred: {}", err.what());
    std::cerr << program;
    return 1;
  }

  std::string path = program.get<std::string>("file");
  std::string mode = program.get<std::string>("--mode");
  size_t chunk_size = program.get<size_t>("--chunk-size");
  size_t buffer_size = program.get<size_t>("--buffer-size");
  size_t max_line_length = program.get<size_t>("--max-line-length");
  size_t workers = program.get<size_t>("--workers");
  int retries = program.get<int>("--retries");
  double retry_delay = program.get<double>("--retry-delay");
  size_t prefetch = program.get<size_t>("--prefetch");
  bool show_stats = program.get<bool>("--stats");
  double memory_interval = program.get<double>("--memory-interval");
  std::string log_level_str = program.get<std::string>("--log-level");

  // stderr-based logger to ensure logs don't interfere with data output
  logger::init_stderr_logger(log_level_str);

  spdlog::debug("Processing file: {}", path);
  spdlog::debug("Mode: {}", mode);

  auto stats = std::make_shared<StatsCollector>();
  std::size_t count = 0;
  std::size_t total_bytes = 0;

  try {
    size_t prefetch_size =
        prefetch == 0 ? constants::iterators::DEFAULT_PREFETCH_SIZE : prefetch;
    ReaderConfigManager config;
    config.set_buffer_size(buffer_size)
        .set_max_line_length(max_line_length)
        .set_max_workers(workers)
        .set_max_retries(retries)
        .set_retry_delay(retry_delay)
        .set_prefetch_size(prefetch_size);
    if (mode == "parallel" && chunk_size > 0) {
      config.set_chunk_size(chunk_size);
    }
    config.validate();

    MemoryMonitor memory(constants::monitoring::DEFAULT_MEMORY_THRESHOLD,
                         memory_interval);
    if (show_stats) {
      memory.start_monitoring();
    }

    if (mode == "parallel") {
      ParallelReader reader(path, config, stats);
      reader.initialize();
      auto results = reader.read_chunks();
      for (const auto &result : results) {
        fwrite(result.content.data(), 1, result.content.size(), stdout);
        total_bytes += result.size;
      }
      count = results.size();
      fflush(stdout);
      if (show_stats) {
        print_stats(*stats, &reader);
        print_memory(memory);
      }
      reader.close();
    } else {
      FileSourceFactory factory;
      std::unique_ptr<FileSource> source = factory.create(path);
      source->open();
      if (mode == "lines") {
        LineIterator lines(*source, config.buffer_size(),
                           config.max_line_length());
        total_bytes =
            drain_with_prefetch(lines, config, prefetch > 0, *stats, count);
      } else {
        ChunkIterator chunks(*source, chunk_size);
        total_bytes =
            drain_with_prefetch(chunks, config, prefetch > 0, *stats, count);
      }
      source->close();
      fflush(stdout);
      if (show_stats) {
        print_stats(*stats, nullptr);
        print_memory(memory);
      }
    }
  } catch (const ReaderError &e) {
    spdlog::error("Reader error: {}", e.what());
    return 1;
  }

  spdlog::debug("Read {} items, {} bytes", count, total_bytes);
  return 0;
}
