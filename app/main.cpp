#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "CLI/App.hpp"
#include "CLI/Config.hpp"
#include "CLI/Formatter.hpp"
#include "mtz/mtz.hpp"

namespace fs = std::filesystem;

namespace {

struct EntryOptions {
  mtz::CompressionLevel level;
  mtz::CompressionType type;
  bool recursive;
};

void add_source(mtz::ZipArchive& archive, const fs::path& source,
                const std::string& archive_name, const EntryOptions& options) {
  if (fs::is_directory(source)) {
    if (!options.recursive) {
      mtz::log::warn("'", source.string(), "' is a directory, use -r");
      return;
    }
    archive.add_directory_from_fs_metadata(source.string(), archive_name);
    for (const auto& child : fs::directory_iterator(source)) {
      add_source(archive, child.path(),
                 archive_name + "/" + child.path().filename().generic_string(),
                 options);
    }
    return;
  }
  archive.add_file_from_fs(source.string(), archive_name, options.level,
                           options.type);
}

}  // namespace

int main(int argc, char** argv) {
  CLI::App app{"mtzip"};

  std::string target_filename;
  app.add_option("target", target_filename, "The filename of the result.")
      ->required();

  std::vector<std::string> source_filenames;
  app.add_option<std::vector<std::string>>("source", source_filenames,
                                           "The source files to be archived.")
      ->required();

  app.add_flag("-v,--verbose", mtz::log_info_switch, "Verbose mode");

  std::string arg_compress_method;
  app.add_option("-m,--method", arg_compress_method, "store | deflate");

  int level = mtz::CompressionLevel::best().get();
  app.add_option<int>("-l,--level", level, "Deflate level (0..9)")
      ->check(CLI::Range(mtz::CompressionLevel::min_value,
                         mtz::CompressionLevel::max_value));

  size_t thread_cnt = mtz::ZipArchive::default_thread_count();
  app.add_option<size_t>("-t,--thread", thread_cnt,
                         "number of compression threads");

  bool recursive = false;
  app.add_flag("-r,--recursive", recursive, "Add directories recursively");

  bool skip_unreadable = false;
  app.add_flag("--skip-unreadable", skip_unreadable,
               "Leave out files that cannot be read instead of failing");

  CLI11_PARSE(app, argc, argv)

  mtz::CompressionType compress_method = mtz::CompressionType::deflate;
  try {
    if (arg_compress_method.empty() || arg_compress_method == "deflate") {
      compress_method = mtz::CompressionType::deflate;
    } else if (arg_compress_method == "store") {
      compress_method = mtz::CompressionType::stored;
    } else {
      throw CLI::ParseError(
          "unrecognized compress method: " + arg_compress_method, 1);
    }
  } catch (const CLI::ParseError& e) {
    mtz::log::panic(e.what());
  }

  auto start = std::chrono::system_clock::now();

  mtz::ZipArchive archive;
  try {
    const EntryOptions options{mtz::CompressionLevel::create(level),
                               compress_method, recursive};
    for (auto&& source_filename : source_filenames) {
      const fs::path source = fs::path(source_filename).lexically_normal();
      std::string name = source.filename().generic_string();
      if (name.empty()) {
        name = source.parent_path().filename().generic_string();
      }
      add_source(archive, source, name, options);
    }

    mtz::log::log(archive.n_pending_jobs(), " file(s) queued, using ",
                  thread_cnt, " thread(s)");
    archive.compress(thread_cnt, skip_unreadable
                                     ? mtz::FailurePolicy::skip_entry
                                     : mtz::FailurePolicy::abort_pass);
  } catch (const std::exception& e) {
    mtz::log::panic(e.what());
  }

  auto end = std::chrono::system_clock::now();
  std::chrono::duration<double> elapsed_seconds = end - start;
  mtz::log::log("Time used: ", std::fixed, std::setprecision(2),
                elapsed_seconds.count());

  std::cerr << "writing zip ... ";
  try {
    archive.write(target_filename, thread_cnt);
  } catch (const std::exception& e) {
    std::cerr << "fail" << std::endl;
    mtz::log::panic(e.what());
  }
  std::cerr << "success" << std::endl;

  return 0;
}
