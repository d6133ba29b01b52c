#include "docqa_core/answer/answer_generator.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "docqa_core/utils/text_utils.hpp"

namespace docqa_core {

namespace {

// "employee_handbook-2024.pdf" -> "employee handbook 2024"
std::string filename_topic(const std::string &filename) {
  std::string topic = filename.substr(0, filename.find('.'));
  std::replace(topic.begin(), topic.end(), '_', ' ');
  std::replace(topic.begin(), topic.end(), '-', ' ');
  return topic;
}

}  // namespace

AnswerGenerator::AnswerGenerator(std::shared_ptr<CompletionProvider> completion_provider,
                                 std::shared_ptr<ContextBuilder> context_builder,
                                 float confidence_threshold)
    : completion_provider_(std::move(completion_provider)),
      context_builder_(std::move(context_builder)),
      confidence_threshold_(confidence_threshold) {
  if (!completion_provider_ || !context_builder_) {
    throw std::invalid_argument("AnswerGenerator requires a completion provider and a context "
                                "builder");
  }
}

std::string AnswerGenerator::create_system_prompt() {
  return "You are a helpful AI assistant that answers questions based on provided document "
         "excerpts.\n"
         "\n"
         "Guidelines:\n"
         "1. Answer questions accurately based only on the provided sources\n"
         "2. Include specific citations in your answer using [Source X] format\n"
         "3. If the sources don't contain enough information, say so clearly\n"
         "4. Be concise but comprehensive\n"
         "5. Maintain a professional, helpful tone\n"
         "6. If asked about something not in the sources, politely explain the limitation\n"
         "\n"
         "Always cite your sources when making specific claims.";
}

std::string AnswerGenerator::create_user_prompt(const std::string &question,
                                                const std::string &context) {
  return "Question: " + question + "\n\nSources:\n" + context +
         "\n\nPlease answer the question based on the provided sources. Include citations "
         "using [Source X] format when referencing specific information.";
}

std::vector<std::string> AnswerGenerator::generate_follow_up_questions(
    const std::string &answer, const std::vector<Citation> &citations) {
  std::vector<std::string> topics;
  for (const auto &citation : citations) {
    if (citation.filename.empty()) {
      continue;
    }
    std::string topic = filename_topic(citation.filename);
    if (!topic.empty() && std::find(topics.begin(), topics.end(), topic) == topics.end()) {
      topics.push_back(std::move(topic));
    }
  }

  std::vector<std::string> follow_ups;
  for (size_t i = 0; i < topics.size() && i < MAX_FOLLOW_UPS; ++i) {
    follow_ups.push_back("What else does " + topics[i] + " say about this topic?");
  }

  const std::string answer_lower = text_utils::to_lower_ascii(answer);
  if (answer_lower.find("policy") != std::string::npos) {
    follow_ups.push_back("What are the exceptions to this policy?");
  }
  if (answer_lower.find("process") != std::string::npos ||
      answer_lower.find("procedure") != std::string::npos) {
    follow_ups.push_back("What are the next steps in this process?");
  }

  if (follow_ups.size() > MAX_FOLLOW_UPS) {
    follow_ups.resize(MAX_FOLLOW_UPS);
  }
  return follow_ups;
}

AnswerRecord AnswerGenerator::generate(const std::string &question,
                                       const std::vector<FusedResult> &search_results) const {
  AnswerRecord record;

  if (search_results.empty()) {
    record.answer = NO_RESULTS_MESSAGE;
    record.status = AnswerStatus::NoResults;
    record.low_confidence = true;
    return record;
  }

  BuiltContext built = context_builder_->build(search_results);
  if (built.context.empty()) {
    record.answer = NO_CONTEXT_MESSAGE;
    record.status = AnswerStatus::NoContext;
    record.low_confidence = true;
    return record;
  }

  std::string answer_text;
  try {
    answer_text = completion_provider_->complete(create_system_prompt(),
                                                 create_user_prompt(question, built.context));
  } catch (const std::exception &e) {
    std::cerr << "[AnswerGenerator] Error generating answer: " << e.what() << std::endl;
    record.answer = GENERATION_FAILED_MESSAGE;
    record.status = AnswerStatus::GenerationFailed;
    record.low_confidence = true;
    return record;
  }

  ConfidenceOutcome confidence = confidence_scorer_.score(question, answer_text, search_results);
  CitationOutcome citations = citation_processor_.extract(answer_text, built.citations);

  record.answer = answer_text;
  record.confidence = confidence.confidence;
  record.citations = std::move(citations.citations);
  record.context_used = static_cast<int>(built.citations.size());
  record.status = AnswerStatus::Answered;
  record.low_confidence = record.confidence < confidence_threshold_;
  record.follow_up_questions = generate_follow_up_questions(answer_text, record.citations);

  std::cout << "[AnswerGenerator] Generated answer with confidence " << record.confidence
            << (confidence.degraded ? " (fallback)" : "") << std::endl;
  return record;
}

}  // namespace docqa_core
