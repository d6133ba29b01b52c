#include "docqa_cli/cli_handler.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>

#include "docqa_core/answer/answer_generator.hpp"
#include "docqa_core/answer/context_builder.hpp"
#include "docqa_core/extractors/content_extractor_factory.hpp"
#include "docqa_core/index/keyword_index.hpp"
#include "docqa_core/llm/ollama_client.hpp"
#include "docqa_core/search/hybrid_search_engine.hpp"
#include "docqa_core/store/document_store.hpp"
#include "docqa_core/utils/text_utils.hpp"
#include "docqa_core/vector/faiss_vector_store.hpp"

namespace docqa_cli {

namespace {

int parse_top_k(const std::string &value) {
  try {
    size_t consumed = 0;
    int top_k = std::stoi(value, &consumed);
    if (consumed != value.size() || top_k <= 0) {
      throw CliError("--top-k must be a positive integer, got '" + value + "'");
    }
    return top_k;
  } catch (const std::logic_error &) {
    throw CliError("--top-k must be a positive integer, got '" + value + "'");
  }
}

std::string preview(const std::string &text, size_t max_bytes = 80) {
  std::string single_line = docqa_core::text_utils::trim(text);
  if (single_line.size() <= max_bytes) {
    return single_line;
  }
  // Cut on a code point boundary
  size_t cut = max_bytes;
  while (cut > 0 && (static_cast<unsigned char>(single_line[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return single_line.substr(0, cut) + "...";
}

}  // namespace

CliHandler::CliHandler(const Config &config)
    : config_(config), tokenizer_(std::make_shared<docqa_core::HeuristicTokenizer>()) {
  text_chunker_ = std::make_shared<docqa_core::TextChunker>(
      tokenizer_, static_cast<size_t>(config_.chunk_size),
      static_cast<size_t>(config_.chunk_overlap));
}

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) {
  CliOptions options;

  if (argc < 2) {
    options.command = Command::Help;
    return options;
  }

  std::string command = argv[1];
  if (command == "ask" || command == "a") {
    options.command = Command::Ask;
  } else if (command == "search" || command == "s") {
    options.command = Command::Search;
  } else if (command == "chunk" || command == "c") {
    options.command = Command::Chunk;
  } else if (command == "help" || command == "--help" || command == "-h") {
    options.command = Command::Help;
    return options;
  } else {
    throw CliError("Unknown command: " + command + ". Run 'docqa_cli help' for usage.");
  }

  for (int i = 2; i < argc; ++i) {
    std::string flag = argv[i];
    if (flag == "--json") {
      options.json = true;
      continue;
    }
    if (i + 1 >= argc) {
      throw CliError("Missing value for " + flag);
    }
    std::string value = argv[++i];

    if (flag == "--file" || flag == "-f") {
      options.files.push_back(value);
    } else if (flag == "--query" || flag == "-q") {
      options.query = value;
    } else if (flag == "--top-k" || flag == "-k") {
      options.top_k = parse_top_k(value);
    } else {
      throw CliError("Unknown option: " + flag);
    }
  }

  if (options.files.empty()) {
    throw CliError(command + " requires at least one file. Usage: " + command +
                   " --file <path> [--file <path> ...]");
  }
  if (options.command != Command::Chunk && docqa_core::text_utils::trim(options.query).empty()) {
    throw CliError(command + " requires a query. Usage: " + command +
                   " --file <path> --query <text>");
  }
  return options;
}

void CliHandler::execute_command(const CliOptions &options) {
  switch (options.command) {
    case Command::Ask:
      handle_ask_command(options);
      break;
    case Command::Search:
      handle_search_command(options);
      break;
    case Command::Chunk:
      handle_chunk_command(options);
      break;
    case Command::Help:
      print_help();
      break;
  }
}

void CliHandler::build_pipeline() {
  docqa_core::OllamaSettings settings;
  settings.url = config_.ollama_url;
  settings.embedding_model = config_.embedding_model;
  settings.completion_model = config_.completion_model;
  settings.max_tokens = config_.answer_max_tokens;
  settings.temperature = config_.answer_temperature;
  auto ollama_client = std::make_shared<docqa_core::OllamaClient>(settings);

  auto document_store = std::make_shared<docqa_core::DocumentStore>();
  auto keyword_index = std::make_shared<docqa_core::KeywordIndex>();
  auto vector_store =
      std::make_shared<docqa_core::FaissVectorStore>(config_.embedding_dimension);
  auto extractor_factory = std::make_shared<docqa_core::ContentExtractorFactory>();

  ingest_service_ = std::make_shared<docqa_core::DocumentIngestService>(
      document_store, text_chunker_, keyword_index, vector_store, ollama_client,
      extractor_factory, static_cast<size_t>(config_.max_file_size_bytes));

  auto search_engine = std::make_shared<docqa_core::HybridSearchEngine>(
      keyword_index, vector_store, ollama_client, config_.hybrid_alpha,
      config_.semantic_min_score);
  // Chunk sizes and the context budget are counted with the same tokenizer
  auto context_builder = std::make_shared<docqa_core::ContextBuilder>(
      tokenizer_, static_cast<size_t>(config_.max_context_tokens));
  auto answer_generator = std::make_shared<docqa_core::AnswerGenerator>(
      ollama_client, context_builder, config_.confidence_threshold);

  question_service_ = std::make_shared<docqa_core::QuestionService>(
      search_engine, answer_generator, config_.search_top_k);
}

void CliHandler::ingest_files(const std::vector<std::string> &files, bool quiet) {
  size_t indexed = 0;
  for (const auto &file : files) {
    docqa_core::IngestResult result = ingest_service_->ingest_file(file);
    if (!result.success) {
      std::cerr << "Error: " << file << ": " << result.error_message << std::endl;
      continue;
    }
    ++indexed;
    if (!quiet) {
      std::cout << "Indexed " << result.filename << " (" << result.chunk_count << " chunks"
                << (result.duplicate ? ", duplicate" : "")
                << (!result.duplicate && !result.embedded ? ", keyword only" : "") << ")"
                << std::endl;
    }
  }
  if (indexed == 0) {
    throw CliError("None of the given files could be indexed");
  }
}

void CliHandler::handle_ask_command(const CliOptions &options) {
  build_pipeline();
  ingest_files(options.files, options.json);

  const int top_k = options.top_k > 0 ? options.top_k : config_.search_top_k;
  docqa_core::AnswerRecord record = question_service_->ask(options.query, top_k);

  if (options.json) {
    std::cout << nlohmann::json(record).dump(2) << std::endl;
  } else {
    print_answer(record);
  }
}

void CliHandler::handle_search_command(const CliOptions &options) {
  build_pipeline();
  ingest_files(options.files, options.json);

  const int top_k = options.top_k > 0 ? options.top_k : config_.search_top_k;
  std::vector<docqa_core::FusedResult> results = question_service_->search(options.query, top_k);

  if (options.json) {
    nlohmann::json response = {{"results", results},
                               {"stats", question_service_->get_search_stats()}};
    std::cout << response.dump(2) << std::endl;
  } else {
    print_search_results(results);
  }
}

void CliHandler::handle_chunk_command(const CliOptions &options) {
  docqa_core::ContentExtractorFactory extractor_factory;
  nlohmann::json response = nlohmann::json::array();

  for (const auto &file : options.files) {
    const std::filesystem::path path(file);
    const docqa_core::ContentExtractor &extractor = extractor_factory.get_extractor_for(path);
    std::string text = extractor.extract_text(path);
    std::vector<docqa_core::Chunk> chunks = text_chunker_->chunk_document(
        {.doc_id = "", .filename = path.filename().string(), .file_type = extractor.get_file_type()},
        text);

    if (options.json) {
      nlohmann::json chunk_list = nlohmann::json::array();
      for (const auto &chunk : chunks) {
        chunk_list.push_back({{"chunk_id", chunk.chunk_id},
                              {"token_count", chunk.token_count},
                              {"char_count", chunk.char_count},
                              {"start_sentence", chunk.start_sentence},
                              {"end_sentence", chunk.end_sentence},
                              {"text", chunk.text}});
      }
      response.push_back({{"filename", path.filename().string()}, {"chunks", chunk_list}});
    } else {
      print_chunks(path.filename().string(), chunks);
    }
  }

  if (options.json) {
    std::cout << response.dump(2) << std::endl;
  }
}

void CliHandler::print_answer(const docqa_core::AnswerRecord &record) {
  std::cout << "\n=== Answer ===" << std::endl;
  std::cout << record.answer << std::endl;

  std::cout << "\nConfidence: " << std::fixed << std::setprecision(2) << record.confidence
            << (record.low_confidence ? " (low confidence)" : "") << std::endl;

  if (!record.citations.empty()) {
    std::cout << "\n=== Sources ===" << std::endl;
    for (const auto &citation : record.citations) {
      std::cout << "  [" << citation.id << "] " << citation.filename << " (chunk "
                << citation.chunk_id << ", score: " << std::setprecision(3) << citation.score
                << ")" << (citation.mentioned_in_answer ? "" : " (not cited)") << std::endl;
    }
  }

  if (!record.follow_up_questions.empty()) {
    std::cout << "\nFollow-up questions:" << std::endl;
    for (const auto &question : record.follow_up_questions) {
      std::cout << "  - " << question << std::endl;
    }
  }
}

void CliHandler::print_search_results(const std::vector<docqa_core::FusedResult> &results) {
  std::cout << "\n=== Search Results ===" << std::endl;
  if (results.empty()) {
    std::cout << "No results found." << std::endl;
    return;
  }
  for (size_t i = 0; i < results.size(); ++i) {
    const auto &result = results[i];
    std::cout << "  " << (i + 1) << ". " << result.filename << " (chunk " << result.chunk_id
              << ", " << docqa_core::to_string(result.source) << ", score: " << std::fixed
              << std::setprecision(4) << result.combined_score << ")" << std::endl;
    std::cout << "     " << preview(result.text) << std::endl;
  }
}

void CliHandler::print_chunks(const std::string &filename,
                              const std::vector<docqa_core::Chunk> &chunks) {
  std::cout << "\n=== " << filename << ": " << chunks.size() << " chunks ===" << std::endl;
  std::cout << std::left << std::setw(6) << "id" << std::setw(8) << "tokens" << std::setw(8)
            << "chars" << std::setw(12) << "sentences"
            << "text" << std::endl;
  for (const auto &chunk : chunks) {
    const std::string sentences =
        std::to_string(chunk.start_sentence) + "-" + std::to_string(chunk.end_sentence);
    std::cout << std::left << std::setw(6) << chunk.chunk_id << std::setw(8) << chunk.token_count
              << std::setw(8) << chunk.char_count << std::setw(12) << sentences
              << preview(chunk.text, 60) << std::endl;
  }
}

void CliHandler::print_help() {
  std::cout << R"(
Docs Q&A CLI - Hybrid retrieval over your documents

Usage: docqa_cli <command> [options]

Commands:
  ask, a        Index the given files and answer a question with citations
    --file, -f <path>    File to index (.txt or .md), repeatable
    --query, -q <text>   Question to answer
    --top-k, -k <num>    Number of sources to retrieve (default: search_top_k)
    --json               Print the answer record as JSON

  search, s     Index the given files and run a hybrid search
    --file, -f <path>    File to index, repeatable
    --query, -q <text>   Search query
    --top-k, -k <num>    Number of results to return (default: search_top_k)
    --json               Print results and index statistics as JSON

  chunk, c      Print the chunks produced for each file (no model server needed)
    --file, -f <path>    File to chunk, repeatable
    --json               Print chunks as JSON

  help          Show this help message

Configuration is read from $DOCQA_CONFIG, or ./docqarc.json when present.
)" << std::endl;
}

}  // namespace docqa_cli
