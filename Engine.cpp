#include "Solver.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <exception>
#include <iostream>
#include <sstream>
#include <utility>

namespace wordsieve {
namespace {
using Clock = std::chrono::high_resolution_clock;

long long MicrosBetween(Clock::time_point start, Clock::time_point end) {
  return std::chrono::duration_cast<std::chrono::microseconds>(end - start)
      .count();
}

std::string JsonEscape(const std::string& input) {
  std::string out;
  out.reserve(input.size());
  for (char c : input) {
    if (c == '\\' || c == '"') {
      out.push_back('\\');
      out.push_back(c);
    } else if (c == '\n') {
      out += "\\n";
    } else if (static_cast<unsigned char>(c) < 0x20) {
      out.push_back(' ');
    } else {
      out.push_back(c);
    }
  }
  return out;
}

double RoundScore(double score) { return std::round(score * 100.0) / 100.0; }
}  // namespace

Engine::Engine(const DictionaryProvider& provider, EngineOptions options)
    : options_(options), cache_(provider) {}

Status Engine::ValidateConfig(const NextMoveRequest& request,
                              std::string* prefix) const {
  if (request.word_length < 1) {
    return Status::InvalidArgument("Invalid wordLength: " +
                                   std::to_string(request.word_length));
  }
  if (request.dictionary.empty()) {
    return Status::InvalidArgument("Missing dictionary in config");
  }
  std::string normalized = ToLowerAscii(request.prefix);
  if (!normalized.empty() && !IsValidWord(normalized)) {
    return Status::InvalidArgument("Prefix must contain only letters: '" +
                                   normalized + "'");
  }
  if (normalized.size() > static_cast<size_t>(request.word_length)) {
    return Status::InvalidArgument("Prefix '" + normalized +
                                   "' is longer than wordLength");
  }
  *prefix = std::move(normalized);
  return Status::Ok();
}

Status Engine::CalculateNextMove(const NextMoveRequest& request,
                                 NextMoveResponse* out) {
  if (!out) {
    return Status::Internal("CalculateNextMove: null output");
  }
  std::string prefix;
  Status status = ValidateConfig(request, &prefix);
  if (!status.ok()) {
    return status;
  }
  const size_t length = static_cast<size_t>(request.word_length);

  std::vector<GuessFeedback> history;
  history.reserve(request.history.size());
  for (const HistoryEntry& entry : request.history) {
    GuessFeedback feedback;
    status = ParseGuessFeedback(entry.guess, entry.feedback, length, &feedback);
    if (!status.ok()) {
      return status;
    }
    history.push_back(std::move(feedback));
  }

  auto load_start = Clock::now();
  DictionaryCache::WordList dictionary;
  status = cache_.Get(request.dictionary, &dictionary);
  if (!status.ok()) {
    return status;
  }
  auto replay_start = Clock::now();

  Session session(length, prefix);
  status = session.Replay(*dictionary, history);
  if (!status.ok()) {
    return status;
  }
  const std::vector<std::string>& candidates = session.candidates();
  auto recommend_start = Clock::now();

  NextMoveResponse response;
  response.guess_count = session.guess_count();
  // Candidates are the only eligible answers, but letter frequencies come
  // from the whole dictionary.
  response.recommendations =
      Recommend(candidates, length, prefix, options_.top_n,
                response.guess_count, dictionary.get());
  auto analyze_start = Clock::now();

  status = FindVariablePositions(candidates, &response.variable_positions);
  if (!status.ok()) {
    return status;
  }
  const std::string letters = VariableLetters(response.variable_positions);
  if (!letters.empty() && candidates.size() > options_.filler_threshold) {
    response.filler_suggestions =
        FindFillerWords(*dictionary, letters, length, options_.top_n);
  }

  response.remaining_count = candidates.size();
  const size_t shown =
      std::min(candidates.size(), options_.max_remaining_words);
  response.remaining_words.assign(
      candidates.begin(),
      candidates.begin() + static_cast<std::ptrdiff_t>(shown));
  auto end = Clock::now();

  if (options_.profile) {
    std::cerr << "Perf: load=" << MicrosBetween(load_start, replay_start)
              << "us replay=" << MicrosBetween(replay_start, recommend_start)
              << "us recommend="
              << MicrosBetween(recommend_start, analyze_start)
              << "us analyze=" << MicrosBetween(analyze_start, end)
              << "us remaining=" << candidates.size() << "\n";
  }

  *out = std::move(response);
  return Status::Ok();
}

std::string Engine::CalculateNextMoveJson(const NextMoveRequest& request) {
  try {
    NextMoveResponse response;
    Status status = CalculateNextMove(request, &response);
    if (!status.ok()) {
      if (status.code == ErrorCode::kInternal) {
        std::cerr << "calculate_next_move: " << status.message << "\n";
      }
      return ErrorJson(status);
    }
    return ResponseJson(response);
  } catch (const std::exception& e) {
    std::cerr << "calculate_next_move: unexpected failure: " << e.what()
              << "\n";
    return ErrorJson(Status::Internal(e.what()));
  }
}

std::string Engine::ResponseJson(const NextMoveResponse& response) {
  std::ostringstream out;
  out << "{\"recommendations\":[";
  for (size_t i = 0; i < response.recommendations.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    const Recommendation& rec = response.recommendations[i];
    out << "{\"word\":\"" << JsonEscape(rec.word)
        << "\",\"score\":" << RoundScore(rec.score) << "}";
  }
  out << "],\"remainingWords\":[";
  for (size_t i = 0; i < response.remaining_words.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << "\"" << JsonEscape(response.remaining_words[i]) << "\"";
  }
  out << "],\"remainingCount\":" << response.remaining_count;
  out << ",\"variablePositions\":{";
  bool first = true;
  for (const auto& position : response.variable_positions) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << "\"" << position.first << "\":[";
    bool first_letter = true;
    for (char letter : position.second) {
      if (!first_letter) {
        out << ",";
      }
      first_letter = false;
      out << "\"" << letter << "\"";
    }
    out << "]";
  }
  out << "},\"fillerSuggestions\":[";
  for (size_t i = 0; i < response.filler_suggestions.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << "\"" << JsonEscape(response.filler_suggestions[i]) << "\"";
  }
  out << "],\"guessCount\":" << response.guess_count << "}";
  return out.str();
}

std::string Engine::ErrorJson(const Status& status) {
  std::string message = status.code == ErrorCode::kInternal
                            ? "An unexpected error occurred"
                            : status.message;
  std::ostringstream out;
  out << "{\"error\":\"" << ErrorKindName(status.code)
      << "\",\"message\":\"" << JsonEscape(message) << "\"}";
  return out.str();
}

std::string Engine::HealthCheckJson() {
  return "{\"status\":\"healthy\",\"message\":\"wordsieve engine is running\"}";
}

}  // namespace wordsieve
