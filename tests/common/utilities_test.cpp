#include "utilities_test.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <stdexcept>

namespace docqa_tests {

std::filesystem::path TestUtilities::create_temp_test_dir() {
  static std::atomic<int> counter{0};

  // Generate unique directory name using timestamp and a counter
  auto now = std::chrono::system_clock::now();
  auto timestamp =
      std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();

  auto dir = std::filesystem::temp_directory_path() / "docqa_tests" /
             ("test_" + std::to_string(timestamp) + "_" + std::to_string(counter++));
  std::filesystem::create_directories(dir);
  return dir;
}

void TestUtilities::cleanup_temp_dir(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);

  // Also cleanup the parent directory if it's empty
  auto parent_dir = dir.parent_path();
  if (std::filesystem::exists(parent_dir, ec) && std::filesystem::is_empty(parent_dir, ec)) {
    std::filesystem::remove(parent_dir, ec);
  }
}

std::filesystem::path TestUtilities::write_test_file(const std::filesystem::path& dir,
                                                     const std::string& filename,
                                                     const std::string& contents) {
  auto path = dir / filename;
  std::ofstream out(path, std::ios::binary);
  if (!out.is_open()) {
    throw std::runtime_error("Failed to create test file: " + path.string());
  }
  out << contents;
  return path;
}

std::string TestUtilities::create_test_document(int sentence_count, int words_per_sentence) {
  std::string text;
  for (int s = 0; s < sentence_count; ++s) {
    if (!text.empty()) {
      text += " ";
    }
    for (int w = 0; w < words_per_sentence; ++w) {
      if (w > 0) {
        text += " ";
      }
      text += "w" + std::to_string(s) + "x" + std::to_string(w);
    }
    text += ".";
  }
  return text;
}

}  // namespace docqa_tests
