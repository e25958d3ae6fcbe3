#pragma once

#include "core/logging/logger.hpp"
#include "documents/document_model.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace permitpack::fetch {

inline constexpr int kDefaultFetchConcurrency = 6;

// Storage read capability. Implementations must tolerate concurrent Fetch
// calls for different records. Failures are reported through the return
// value; a std::exception escaping Fetch is recorded as a failure of that
// record.
class IContentSource {
public:
  virtual ~IContentSource() = default;

  virtual bool Fetch(const documents::DocumentRecord& record, std::string& bytes,
                     std::string& error) = 0;
};

// Reads `record.source_path`, resolved against `base_dir` when relative.
class FileSystemContentSource final : public IContentSource {
public:
  explicit FileSystemContentSource(std::filesystem::path base_dir = {});

  bool Fetch(const documents::DocumentRecord& record, std::string& bytes,
             std::string& error) override;

private:
  std::filesystem::path base_dir_;
};

struct FetchFailure {
  std::string id;
  std::string file_name;
  std::string error;
};

struct FetchReport {
  // Same order as the input snapshot; failed records keep content == nullopt.
  std::vector<documents::DocumentRecord> documents;
  std::vector<FetchFailure> failures;
  int workers_used = 0;
};

// Fills in document bytes with at most `concurrency` fetches in flight.
//
// Contract:
// - works on its own copy of the records, so later changes to the caller's
//   list never reach this export.
// - records that already carry content are not fetched again.
// - output order equals input order whatever order fetches complete in; a
//   concurrency below 1 is treated as 1.
// - a failed fetch is not an error for the batch: it is reported in
//   `failures` (logged at debug level) and the record stays content-less.
FetchReport FetchDocumentContents(std::vector<documents::DocumentRecord> snapshot,
                                  IContentSource& source,
                                  int concurrency = kDefaultFetchConcurrency,
                                  core::logging::Logger* logger = nullptr);

} // namespace permitpack::fetch
