#include "fetch/content_fetcher.hpp"

#include "core/fs_utils.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <optional>
#include <thread>

namespace permitpack::fetch {

FileSystemContentSource::FileSystemContentSource(std::filesystem::path base_dir)
    : base_dir_(std::move(base_dir)) {}

bool FileSystemContentSource::Fetch(const documents::DocumentRecord& record, std::string& bytes,
                                    std::string& error) {
  if (record.source_path.empty()) {
    error = "document '" + record.id + "' has no source path";
    return false;
  }
  const std::filesystem::path resolved =
      record.source_path.is_relative() ? base_dir_ / record.source_path : record.source_path;
  return core::ReadFileBytes(resolved, bytes, error);
}

FetchReport FetchDocumentContents(std::vector<documents::DocumentRecord> snapshot,
                                  IContentSource& source, int concurrency,
                                  core::logging::Logger* logger) {
  std::vector<std::size_t> pending;
  for (std::size_t i = 0; i < snapshot.size(); ++i) {
    if (!snapshot[i].content.has_value()) {
      pending.push_back(i);
    }
  }

  // One slot per pending record; each slot is touched by exactly one worker.
  std::vector<std::optional<std::string>> fetched(pending.size());
  std::vector<std::string> errors(pending.size());
  std::atomic<std::size_t> next{0};

  const auto worker = [&]() {
    while (true) {
      const std::size_t slot = next.fetch_add(1U, std::memory_order_relaxed);
      if (slot >= pending.size()) {
        return;
      }
      std::string bytes;
      try {
        if (source.Fetch(snapshot[pending[slot]], bytes, errors[slot])) {
          fetched[slot] = std::move(bytes);
        }
      } catch (const std::exception& ex) {
        errors[slot] = std::string("content source threw: ") + ex.what();
      }
    }
  };

  const int workers = pending.empty()
                          ? 0
                          : static_cast<int>(std::min<std::size_t>(
                                static_cast<std::size_t>(std::max(concurrency, 1)),
                                pending.size()));
  if (workers == 1) {
    worker();
  } else if (workers > 1) {
    std::vector<std::thread> pool;
    pool.reserve(static_cast<std::size_t>(workers));
    for (int i = 0; i < workers; ++i) {
      pool.emplace_back(worker);
    }
    for (auto& thread : pool) {
      thread.join();
    }
  }

  FetchReport report;
  report.workers_used = workers;
  for (std::size_t slot = 0; slot < pending.size(); ++slot) {
    auto& record = snapshot[pending[slot]];
    if (fetched[slot].has_value()) {
      record.content = std::move(fetched[slot]);
    } else {
      report.failures.push_back({record.id, record.file_name, errors[slot]});
    }
  }
  report.documents = std::move(snapshot);

  if (logger != nullptr) {
    logger->Debug("document contents fetched",
                  {{"requested", std::to_string(pending.size())},
                   {"workers", std::to_string(workers)},
                   {"failed", std::to_string(report.failures.size())}});
    for (const auto& failure : report.failures) {
      logger->Debug("document fetch failed",
                    {{"id", failure.id}, {"file", failure.file_name}, {"error", failure.error}});
    }
  }
  return report;
}

} // namespace permitpack::fetch
