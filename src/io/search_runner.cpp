#include "search_runner.hpp"
#include "core/logger.hpp"
#include "io/rune_readers/lowercase_rune_reader.hpp"
#include "io/rune_readers/utf8_rune_reader.hpp"
#include "utils/thread_safe_queue.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

SearchRunner::SearchRunner(const search::ISearcher &searcher,
                           const Config::AppConfig &config, MatchWriter &writer)
    : searcher_(searcher), config_(config), writer_(writer) {}

std::unique_ptr<IRuneReader>
SearchRunner::prepare_reader(std::unique_ptr<IRuneReader> reader) const {
  if (reader && config_.search.case_insensitive)
    return std::make_unique<LowercaseRuneReader>(std::move(reader));
  return reader;
}

RunSummary SearchRunner::run(std::unique_ptr<IRuneReader> default_input) {
  const std::string &search_path = config_.search.search_path;
  if (search_path.empty()) {
    LOG(LogLevel::INFO, LogComponent::CORE, "Searching standard input");
    return search_reader(std::move(default_input));
  }

  std::error_code ec;
  auto status = fs::status(search_path, ec);
  if (!fs::exists(status)) {
    if (ec && ec != std::errc::no_such_file_or_directory)
      throw std::runtime_error("search file \"" + search_path +
                               "\": " + ec.message());
    throw std::runtime_error("search file \"" + search_path +
                             "\" does not exist");
  }

  if (fs::is_directory(status))
    return search_directory(search_path);

  LOG(LogLevel::INFO, LogComponent::CORE, "Searching file " << search_path);
  return search_reader(std::make_unique<FileRuneReader>(search_path));
}

RunSummary SearchRunner::search_reader(std::unique_ptr<IRuneReader> reader) {
  RunSummary summary;
  summary.files_searched = 1;

  std::string header = writer_.header();
  if (!header.empty())
    writer_.write(header);

  for (const auto &match : searcher_.search(prepare_reader(std::move(reader)))) {
    writer_.write(writer_.format_line(match));
    summary.matches++;
  }
  writer_.flush();
  return summary;
}

std::vector<fs::path> SearchRunner::collect_files(const fs::path &directory,
                                                  RunSummary &summary) {
  std::vector<fs::path> files;
  std::error_code ec;

  auto visit = [&](const fs::directory_entry &entry) {
    std::error_code entry_ec;
    if (entry.is_regular_file(entry_ec)) {
      files.push_back(entry.path());
    } else if (entry_ec) {
      LOG(LogLevel::ERROR, LogComponent::IO_WALKER,
          "\"" << entry.path().string() << "\": " << entry_ec.message());
      summary.files_failed++;
    }
  };

  if (config_.search.recursive) {
    fs::recursive_directory_iterator it(directory, ec), end;
    for (; !ec && it != end; it.increment(ec))
      visit(*it);
  } else {
    fs::directory_iterator it(directory, ec), end;
    for (; !ec && it != end; it.increment(ec))
      visit(*it);
  }

  if (ec) {
    LOG(LogLevel::ERROR, LogComponent::IO_WALKER,
        "\"" << directory.string() << "\": " << ec.message());
    summary.files_failed++;
  }

  // Directory iteration order is unspecified
  std::sort(files.begin(), files.end());
  LOG(LogLevel::INFO, LogComponent::IO_WALKER,
      "Found " << files.size() << " files under " << directory.string());
  return files;
}

RunSummary SearchRunner::search_directory(const fs::path &directory) {
  RunSummary summary;
  std::vector<fs::path> files = collect_files(directory, summary);

  ThreadSafeQueue<fs::path> jobs;
  for (auto &file : files)
    jobs.push(std::move(file));
  jobs.shutdown();

  ThreadSafeQueue<std::string> lines(OUTPUT_QUEUE_CAPACITY);
  std::atomic<uint64_t> searched{0};
  std::atomic<uint64_t> failed{0};
  std::atomic<uint64_t> matches{0};

  // --- Writer thread ---
  std::thread writer_thread([this, &lines] {
    while (auto line = lines.wait_and_pop())
      writer_.write(*line);
    writer_.flush();
  });

  // --- Worker threads ---
  auto worker = [&](size_t worker_id) {
    LOG(LogLevel::DEBUG, LogComponent::IO_WALKER,
        "Search worker " << worker_id << " started.");
    while (auto file = jobs.wait_and_pop()) {
      const std::string path = file->string();
      try {
        auto stream = searcher_.search(
            prepare_reader(std::make_unique<FileRuneReader>(path)));
        for (const auto &match : stream) {
          if (!lines.push(writer_.format_line(match, path)))
            break;
          matches++;
        }
        searched++;
      } catch (const std::exception &e) {
        LOG(LogLevel::ERROR, LogComponent::IO_WALKER,
            "Skipping \"" << path << "\": " << e.what());
        failed++;
      }
    }
    LOG(LogLevel::DEBUG, LogComponent::IO_WALKER,
        "Search worker " << worker_id << " finished.");
  };

  size_t worker_count =
      std::max<size_t>(1, std::min(config_.search.worker_threads, files.size()));
  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  for (size_t i = 0; i < worker_count; ++i)
    workers.emplace_back(worker, i);
  for (auto &t : workers)
    if (t.joinable())
      t.join();

  lines.shutdown();
  writer_thread.join();

  summary.files_searched = searched;
  summary.files_failed += failed;
  summary.matches = matches;
  return summary;
}
