#include "permitpack/cli/router.hpp"

#include "archive/archive_backend.hpp"
#include "archive/notifier.hpp"
#include "archive/persist_strategy.hpp"
#include "archive/pickers.hpp"
#include "archive/preference_store.hpp"
#include "config/app_config.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/text_utils.hpp"
#include "core/time_utils.hpp"
#include "documents/document_model.hpp"
#include "fetch/content_fetcher.hpp"
#include "narrative/line_classifier.hpp"
#include "narrative/placeholder_filler.hpp"
#include "narrative/structured_narrative.hpp"
#include "narrative/template_narrative.hpp"
#include "package/package_assembler.hpp"
#include "progress/progress_calculator.hpp"
#include "project/project_loader.hpp"
#include "render/cover_letter.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace permitpack::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitInputInvalid = core::errors::ToInt(core::errors::ExitCode::kInputInvalid);
constexpr int kExitNotEligible = core::errors::ToInt(core::errors::ExitCode::kNotEligible);
constexpr int kExitCancelled = core::errors::ToInt(core::errors::ExitCode::kCancelled);
constexpr int kExitAssemblyFailed = core::errors::ToInt(core::errors::ExitCode::kAssemblyFailed);

constexpr const char* kLogLevelUsage = "[--log-level <debug|info|warn|error>]";

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  permitpack progress <project.json> [--json]\n"
      << "  permitpack classify <narrative.txt> [--config <file>]\n"
      << "  permitpack render <narrative> [--structured] [--format <docx|pdf|txt>] [--out <file>] "
         "[--config <file>]\n"
      << "  permitpack cover-letter <project.json> [--out <file>] [--date <text>] "
         "[--config <file>]\n"
      << "  permitpack package <project.json> [--narrative <file> | --structured-narrative "
         "<file>] [--output <file.zip>] [--output-dir <dir>] [--manifest-dir <dir>] "
         "[--interactive] [--no-download] [--force] [--date <text>] [--config <file>] "
      << kLogLevelUsage << "\n"
      << "  permitpack validate <project.json> [--config <file>]\n"
      << "  permitpack version\n";
}

// Reads the value following `args[i]` for a flag that takes one.
bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string& value,
               std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(args[i]);
    return false;
  }
  value = std::string(args[i + 1]);
  ++i;
  return true;
}

bool TakePositional(std::string_view token, std::string_view command, std::string& slot,
                    std::string& error) {
  if (!token.empty() && token.front() == '-') {
    error = "unknown option: " + std::string(token);
    return false;
  }
  if (!slot.empty()) {
    error = std::string(command) + " accepts exactly 1 input path";
    return false;
  }
  slot = std::string(token);
  return true;
}

void PrintIssues(std::string_view what, const fs::path& path,
                 const std::vector<core::ValidationIssue>& issues) {
  std::cerr << "invalid " << what << ": " << path.string() << '\n';
  for (const auto& issue : issues) {
    std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
  }
}

// Defaults, then the config file when one is given. Returns an exit code;
// kExitSuccess means `app_config` is ready.
int LoadAppConfig(const fs::path& config_path, config::AppConfig& app_config) {
  app_config.downloads_dir = config::DefaultDownloadsDir();
  if (config_path.empty()) {
    return kExitSuccess;
  }
  std::vector<core::ValidationIssue> issues;
  std::string error;
  if (!config::LoadConfigFile(config_path, app_config, issues, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitInputInvalid;
  }
  if (!issues.empty()) {
    PrintIssues("config", config_path, issues);
    return kExitInputInvalid;
  }
  return kExitSuccess;
}

int LoadProject(const fs::path& project_path, project::Project& project) {
  std::vector<core::ValidationIssue> issues;
  std::string error;
  if (!project::LoadProjectFile(project_path, project, issues, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitInputInvalid;
  }
  if (!issues.empty()) {
    PrintIssues("project", project_path, issues);
    return kExitInputInvalid;
  }
  return kExitSuccess;
}

render::CoverLetterOptions CoverLetterOptionsFrom(const config::AppConfig& app_config) {
  render::CoverLetterOptions options;
  options.profile = app_config.classifier;
  options.format = app_config.cover_letter_format;
  options.zip.deflate = app_config.compression_enabled;
  options.zip.level = app_config.compression_level;
  return options;
}

std::string StatusCell(const progress::CategoryProgress& row) {
  if (!row.current_status.has_value()) {
    return "missing";
  }
  return std::string(documents::ToString(*row.current_status)) + " (v" +
         std::to_string(row.current_version) + ")";
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "permitpack 0.1.0\n";
  return kExitSuccess;
}

int CommandValidate(const std::vector<std::string_view>& args) {
  std::string project_path;
  std::string config_path;
  std::string error;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const bool ok = args[i] == "--config" ? TakeValue(args, i, config_path, error)
                                          : TakePositional(args[i], "validate", project_path, error);
    if (!ok) {
      std::cerr << "error: " << error << '\n';
      return kExitUsage;
    }
  }
  if (project_path.empty()) {
    std::cerr << "error: validate requires exactly 1 argument: <project.json>\n";
    return kExitUsage;
  }

  config::AppConfig app_config;
  if (const int code = LoadAppConfig(config_path, app_config); code != kExitSuccess) {
    return code;
  }
  project::Project project;
  if (const int code = LoadProject(project_path, project); code != kExitSuccess) {
    return code;
  }

  std::cout << "valid: " << project_path << " (" << project.documents.size() << " documents)\n";
  return kExitSuccess;
}

int CommandProgress(const std::vector<std::string_view>& args) {
  std::string project_path;
  bool as_json = false;
  std::string error;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--json") {
      as_json = true;
      continue;
    }
    if (!TakePositional(args[i], "progress", project_path, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitUsage;
    }
  }
  if (project_path.empty()) {
    std::cerr << "error: progress requires exactly 1 argument: <project.json>\n";
    return kExitUsage;
  }

  project::Project project;
  if (const int code = LoadProject(project_path, project); code != kExitSuccess) {
    return code;
  }
  const progress::ProgressReport report = progress::ComputeProgress(project.documents);

  if (as_json) {
    std::cout << "{\"project\":" << core::QuoteJson(project.info.name)
              << ",\"percent\":" << report.percent
              << ",\"eligible\":" << (report.eligible ? "true" : "false")
              << ",\"approved_required\":" << report.approved_required
              << ",\"has_cover_letter\":" << (report.has_cover_letter ? "true" : "false")
              << ",\"blocking\":[";
    for (std::size_t i = 0; i < report.blocking.size(); ++i) {
      std::cout << (i == 0U ? "" : ",") << core::QuoteJson(documents::ToString(report.blocking[i]));
    }
    std::cout << "]}\n";
    return kExitSuccess;
  }

  std::cout << "project: " << project.info.name << '\n'
            << "progress: " << report.percent << "%\n"
            << "eligible: " << (report.eligible ? "yes" : "no") << '\n'
            << "cover_letter: " << (report.has_cover_letter ? "present" : "missing") << '\n';
  for (const auto& row : report.categories) {
    std::cout << "  " << std::left << std::setw(20) << documents::DisplayName(row.category)
              << StatusCell(row) << '\n';
  }
  return kExitSuccess;
}

int CommandClassify(const std::vector<std::string_view>& args) {
  std::string narrative_path;
  std::string config_path;
  std::string error;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const bool ok = args[i] == "--config"
                        ? TakeValue(args, i, config_path, error)
                        : TakePositional(args[i], "classify", narrative_path, error);
    if (!ok) {
      std::cerr << "error: " << error << '\n';
      return kExitUsage;
    }
  }
  if (narrative_path.empty()) {
    std::cerr << "error: classify requires exactly 1 argument: <narrative.txt>\n";
    return kExitUsage;
  }

  config::AppConfig app_config;
  if (const int code = LoadAppConfig(config_path, app_config); code != kExitSuccess) {
    return code;
  }
  std::string text;
  if (!core::ReadFileBytes(narrative_path, text, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  core::logging::Logger logger(app_config.log_level);
  const auto lines =
      narrative::ClassifyLines(core::SplitLines(text), app_config.classifier, &logger);
  for (const auto& line : lines) {
    std::cout << line.raw_index << '\t' << narrative::ToString(line.role) << '\t' << line.text
              << '\n';
  }
  return kExitSuccess;
}

int CommandRender(const std::vector<std::string_view>& args) {
  std::string narrative_path;
  std::string config_path;
  std::string output_path;
  std::string format_name;
  bool structured = false;
  std::string error;
  for (std::size_t i = 0; i < args.size(); ++i) {
    bool ok = true;
    if (args[i] == "--structured") {
      structured = true;
    } else if (args[i] == "--config") {
      ok = TakeValue(args, i, config_path, error);
    } else if (args[i] == "--out") {
      ok = TakeValue(args, i, output_path, error);
    } else if (args[i] == "--format") {
      ok = TakeValue(args, i, format_name, error);
    } else {
      ok = TakePositional(args[i], "render", narrative_path, error);
    }
    if (!ok) {
      std::cerr << "error: " << error << '\n';
      return kExitUsage;
    }
  }
  if (narrative_path.empty()) {
    std::cerr << "error: render requires exactly 1 argument: <narrative>\n";
    return kExitUsage;
  }

  config::AppConfig app_config;
  if (const int code = LoadAppConfig(config_path, app_config); code != kExitSuccess) {
    return code;
  }
  render::CoverLetterOptions options = CoverLetterOptionsFrom(app_config);
  if (!format_name.empty() && !render::ParseCoverLetterFormat(format_name, options.format)) {
    std::cerr << "error: invalid --format '" << format_name << "' (expected docx|pdf|txt)\n";
    return kExitUsage;
  }
  if (options.format != render::CoverLetterFormat::kText && output_path.empty()) {
    std::cerr << "error: " << render::ToString(options.format)
              << " output requires --out <file>\n";
    return kExitUsage;
  }

  std::string text;
  if (!core::ReadFileBytes(narrative_path, text, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  core::logging::Logger logger(app_config.log_level);
  render::CoverLetter cover_letter;
  bool rendered = false;
  if (structured) {
    std::vector<narrative::ClassifiedLine> lines;
    std::vector<std::string> unknown_roles;
    if (!narrative::ParseStructuredNarrative(text, lines, unknown_roles, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitInputInvalid;
    }
    for (const auto& role : unknown_roles) {
      logger.Warn("unknown narrative role rendered as body", {{"role", role}});
    }
    rendered = render::RenderClassifiedCoverLetter(std::move(lines), options, cover_letter, error);
  } else {
    rendered = render::RenderCoverLetter(text, options, cover_letter, error, &logger);
  }
  if (!rendered) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  if (output_path.empty()) {
    std::cout << cover_letter.bytes;
    return kExitSuccess;
  }
  if (!core::WriteFileAtomic(output_path, cover_letter.bytes, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  std::cout << "rendered: " << output_path << " (" << cover_letter.paragraphs.size()
            << " paragraphs)\n";
  return kExitSuccess;
}

int CommandCoverLetter(const std::vector<std::string_view>& args) {
  std::string project_path;
  std::string config_path;
  std::string output_path;
  std::string letter_date;
  std::string error;
  for (std::size_t i = 0; i < args.size(); ++i) {
    bool ok = true;
    if (args[i] == "--config") {
      ok = TakeValue(args, i, config_path, error);
    } else if (args[i] == "--out") {
      ok = TakeValue(args, i, output_path, error);
    } else if (args[i] == "--date") {
      ok = TakeValue(args, i, letter_date, error);
    } else {
      ok = TakePositional(args[i], "cover-letter", project_path, error);
    }
    if (!ok) {
      std::cerr << "error: " << error << '\n';
      return kExitUsage;
    }
  }
  if (project_path.empty()) {
    std::cerr << "error: cover-letter requires exactly 1 argument: <project.json>\n";
    return kExitUsage;
  }

  config::AppConfig app_config;
  if (const int code = LoadAppConfig(config_path, app_config); code != kExitSuccess) {
    return code;
  }
  project::Project project;
  if (const int code = LoadProject(project_path, project); code != kExitSuccess) {
    return code;
  }

  narrative::TemplateInputs inputs;
  inputs.project = project.info;
  inputs.documents = package::SelectSubmissionDocuments(project.documents);
  inputs.letter_date =
      letter_date.empty() ? core::FormatLetterDate(std::chrono::system_clock::now()) : letter_date;
  const std::string text =
      core::JoinLines(narrative::BuildTemplateNarrative(inputs, app_config.classifier)) + "\n";

  if (output_path.empty()) {
    std::cout << text;
    return kExitSuccess;
  }
  if (!core::WriteFileAtomic(output_path, text, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  std::cout << "cover letter: " << output_path << '\n';
  return kExitSuccess;
}

bool ParsePackageOptions(const std::vector<std::string_view>& args, PackageOptions& options,
                         std::string& error) {
  std::string project_path;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--interactive") {
      options.interactive = true;
      continue;
    }
    if (token == "--no-download") {
      options.allow_download = false;
      continue;
    }
    if (token == "--force") {
      options.force = true;
      continue;
    }
    if (token == "--log-level") {
      std::string raw;
      if (!TakeValue(args, i, raw, error)) {
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(raw, parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      continue;
    }
    if (token == "--date") {
      std::string value;
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.letter_date = value;
      continue;
    }

    fs::path* path_flag = nullptr;
    if (token == "--config") {
      path_flag = &options.config_path;
    } else if (token == "--narrative") {
      path_flag = &options.narrative_path;
    } else if (token == "--structured-narrative") {
      path_flag = &options.structured_narrative_path;
    } else if (token == "--output") {
      path_flag = &options.output_path;
    } else if (token == "--output-dir") {
      path_flag = &options.output_dir;
    } else if (token == "--manifest-dir") {
      path_flag = &options.manifest_dir;
    }
    if (path_flag != nullptr) {
      std::string value;
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      *path_flag = value;
      continue;
    }

    if (!TakePositional(token, "package", project_path, error)) {
      return false;
    }
  }

  if (project_path.empty()) {
    error = "package requires exactly 1 argument: <project.json>";
    return false;
  }
  if (!options.narrative_path.empty() && !options.structured_narrative_path.empty()) {
    error = "--narrative and --structured-narrative are mutually exclusive";
    return false;
  }
  options.project_path = project_path;
  return true;
}

// Builds the cover letter from whichever narrative source the options name.
bool BuildCoverLetter(const PackageOptions& options, const config::AppConfig& app_config,
                      const project::Project& project,
                      const std::vector<documents::DocumentRecord>& documents,
                      const std::string& letter_date, core::logging::Logger& logger,
                      render::CoverLetter& cover_letter, std::string& error) {
  const render::CoverLetterOptions cover_options = CoverLetterOptionsFrom(app_config);

  if (!options.structured_narrative_path.empty()) {
    std::string text;
    if (!core::ReadFileBytes(options.structured_narrative_path, text, error)) {
      return false;
    }
    std::vector<narrative::ClassifiedLine> lines;
    std::vector<std::string> unknown_roles;
    if (!narrative::ParseStructuredNarrative(text, lines, unknown_roles, error)) {
      return false;
    }
    for (const auto& role : unknown_roles) {
      logger.Warn("unknown narrative role rendered as body", {{"role", role}});
    }
    return render::RenderClassifiedCoverLetter(std::move(lines), cover_options, cover_letter,
                                               error);
  }

  std::string text;
  if (!options.narrative_path.empty()) {
    if (!core::ReadFileBytes(options.narrative_path, text, error)) {
      return false;
    }
    narrative::ContactDefaults contact = app_config.contact;
    contact.letter_date = letter_date;
    text = narrative::FillPlaceholders(text, contact);
    logger.Debug("narrative loaded", {{"source", options.narrative_path.string()}});
  } else {
    narrative::TemplateInputs inputs;
    inputs.project = project.info;
    inputs.documents = documents;
    inputs.letter_date = letter_date;
    text = core::JoinLines(narrative::BuildTemplateNarrative(inputs, app_config.classifier));
    logger.Debug("template narrative generated");
  }
  return render::RenderCoverLetter(text, cover_options, cover_letter, error, &logger);
}

int CommandPackage(const std::vector<std::string_view>& args) {
  PackageOptions options;
  std::string error;
  if (!ParsePackageOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  return ExecutePackage(options, nullptr);
}

} // namespace

int ExecutePackage(const PackageOptions& options, PackageRunResult* run_result) {
  if (run_result != nullptr) {
    *run_result = PackageRunResult{};
  }

  config::AppConfig app_config;
  if (const int code = LoadAppConfig(options.config_path, app_config); code != kExitSuccess) {
    return code;
  }

  const auto now = std::chrono::system_clock::now();
  core::logging::Logger logger(options.log_level.value_or(app_config.log_level));
  logger.SetExportId(core::MakeExportId(now));

  project::Project project;
  if (const int code = LoadProject(options.project_path, project); code != kExitSuccess) {
    logger.Error("project failed to load", {{"project_path", options.project_path.string()}});
    return code;
  }
  logger.SetContext("project", project.info.name);
  logger.Info("export requested", {{"project_path", options.project_path.string()},
                                   {"documents", std::to_string(project.documents.size())}});

  const progress::ProgressReport report = progress::ComputeProgress(project.documents);
  if (!report.eligible) {
    if (!options.force) {
      logger.Warn("project not eligible for submission",
                  {{"percent", std::to_string(report.percent)},
                   {"cover_letter", report.has_cover_letter ? "present" : "missing"}});
      std::cerr << "error: project is not eligible for submission (" << report.percent
                << "% of required categories approved"
                << (report.has_cover_letter ? "" : ", no cover letter") << ")\n";
      for (const auto category : report.blocking) {
        std::cerr << "  - " << documents::DisplayName(category) << '\n';
      }
      return kExitNotEligible;
    }
    logger.Warn("exporting ineligible project", {{"percent", std::to_string(report.percent)}});
  }

  fetch::FileSystemContentSource source(project.base_dir);
  fetch::FetchReport fetched =
      fetch::FetchDocumentContents(package::SelectSubmissionDocuments(project.documents), source,
                                   app_config.fetch_concurrency, &logger);

  const std::string letter_date = options.letter_date.value_or(core::FormatLetterDate(now));
  std::vector<documents::DocumentRecord> listed;
  for (const auto& document : fetched.documents) {
    if (document.content.has_value()) {
      listed.push_back(document);
    }
  }

  std::string error;
  render::CoverLetter cover_letter;
  if (!BuildCoverLetter(options, app_config, project, listed, letter_date, logger, cover_letter,
                        error)) {
    logger.Error("cover letter could not be built", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitAssemblyFailed;
  }

  const package::PackageManifest manifest = package::AssembleWithCoverLetter(
      std::move(cover_letter), fetched.documents, project.info.name, &logger);

  archive::ZipOptions zip_options;
  zip_options.deflate = app_config.compression_enabled;
  zip_options.level = app_config.compression_level;

  std::unique_ptr<archive::ISaveTargetPicker> save_picker;
  std::unique_ptr<archive::IDirectoryPicker> directory_picker;
  if (!options.output_path.empty()) {
    save_picker = std::make_unique<archive::PresetSaveTargetPicker>(options.output_path);
  } else if (options.interactive) {
    save_picker = std::make_unique<archive::PromptSaveTargetPicker>(std::cin, std::cout);
  }
  if (!options.output_dir.empty()) {
    directory_picker = std::make_unique<archive::PresetDirectoryPicker>(options.output_dir);
  } else if (options.interactive) {
    directory_picker = std::make_unique<archive::PromptDirectoryPicker>(std::cin, std::cout);
  }

  std::unique_ptr<archive::IPreferenceStore> preferences;
  if (!app_config.preferences_path.empty()) {
    auto file_store = std::make_unique<archive::JsonFilePreferenceStore>(
        app_config.preferences_path);
    if (!file_store->Load(error)) {
      logger.Warn("preferences ignored", {{"error", error}});
      preferences = std::make_unique<archive::InMemoryPreferenceStore>();
    } else {
      preferences = std::move(file_store);
    }
  } else {
    preferences = std::make_unique<archive::InMemoryPreferenceStore>();
  }

  archive::ConsoleNotifier notifier(std::cout);
  archive::ArchiveBackend backend(&notifier, &logger);
  backend.AddStrategy(std::make_unique<archive::NativeSaveStrategy>(save_picker.get(), zip_options));
  backend.AddStrategy(
      std::make_unique<archive::DirectoryWriteStrategy>(directory_picker.get(), preferences.get()));
  backend.AddStrategy(std::make_unique<archive::DownloadStrategy>(
      options.allow_download ? app_config.downloads_dir : fs::path(), zip_options));
  backend.AddStrategy(std::make_unique<archive::TextManifestStrategy>(options.manifest_dir));

  const archive::PersistResult result = backend.PersistPackage(manifest, manifest.archive_name);
  switch (result.kind) {
  case archive::PersistKind::kSaved:
  case archive::PersistKind::kFellBackTo:
    break;
  case archive::PersistKind::kCancelled:
    std::cerr << "export cancelled\n";
    return kExitCancelled;
  case archive::PersistKind::kFailed:
    std::cerr << "error: " << result.error << '\n';
    return kExitAssemblyFailed;
  }

  if (run_result != nullptr) {
    run_result->method = result.method;
    run_result->location = result.location;
    run_result->entry_count = manifest.entries.size();
    run_result->skipped_count = manifest.skipped.size();
  }
  std::cout << "package: " << result.location.string() << '\n'
            << "method: " << result.method
            << (result.kind == archive::PersistKind::kFellBackTo ? " (fallback)" : "") << '\n'
            << "entries: " << manifest.entries.size() << '\n';
  if (!manifest.skipped.empty()) {
    std::cout << "skipped: " << manifest.skipped.size() << '\n';
  }
  return kExitSuccess;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "validate") {
    return CommandValidate(args);
  }
  if (command == "progress") {
    return CommandProgress(args);
  }
  if (command == "classify") {
    return CommandClassify(args);
  }
  if (command == "render") {
    return CommandRender(args);
  }
  if (command == "cover-letter") {
    return CommandCoverLetter(args);
  }
  if (command == "package") {
    return CommandPackage(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace permitpack::cli
