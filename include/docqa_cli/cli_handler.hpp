#pragma once

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "docqa_cli/config.hpp"
#include "docqa_core/chunking/text_chunker.hpp"
#include "docqa_core/services/document_ingest_service.hpp"
#include "docqa_core/services/question_service.hpp"

namespace docqa_cli {

enum class Command { Ask, Search, Chunk, Help };

struct CliOptions {
  Command command = Command::Help;
  std::vector<std::string> files;
  std::string query;
  int top_k = 0;  // 0 uses search_top_k from the config
  bool json = false;
};

class CliError : public std::exception {
 public:
  explicit CliError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class CliHandler {
 public:
  explicit CliHandler(const Config &config);

  // Disable copy constructor and assignment
  CliHandler(const CliHandler &) = delete;
  CliHandler &operator=(const CliHandler &) = delete;

  // Throws CliError on unknown commands, unknown flags or missing values
  static CliOptions parse_arguments(int argc, char *argv[]);

  void execute_command(const CliOptions &options);

 private:
  Config config_;
  std::shared_ptr<const docqa_core::Tokenizer> tokenizer_;
  std::shared_ptr<docqa_core::TextChunker> text_chunker_;
  std::shared_ptr<docqa_core::DocumentIngestService> ingest_service_;
  std::shared_ptr<docqa_core::QuestionService> question_service_;

  // Connects to the model server and wires the retrieval pipeline
  void build_pipeline();
  void ingest_files(const std::vector<std::string> &files, bool quiet);

  // Command handlers
  void handle_ask_command(const CliOptions &options);
  void handle_search_command(const CliOptions &options);
  void handle_chunk_command(const CliOptions &options);

  // Printing
  void print_answer(const docqa_core::AnswerRecord &record);
  void print_search_results(const std::vector<docqa_core::FusedResult> &results);
  void print_chunks(const std::string &filename, const std::vector<docqa_core::Chunk> &chunks);
  void print_help();
};

}  // namespace docqa_cli
