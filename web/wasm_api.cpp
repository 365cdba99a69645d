#include "Solver.hpp"

#include <sstream>
#include <string>
#include <vector>

#include <emscripten/bind.h>

namespace {
wordsieve::InMemoryDictionaryProvider g_dictionaries;
wordsieve::Engine g_engine(g_dictionaries);

std::vector<std::string> SplitWordsText(const std::string& text) {
  std::istringstream iss(text);
  std::vector<std::string> words;
  std::string token;
  while (iss >> token) {
    words.push_back(token);
  }
  return words;
}

// "crane bbygb\nslate gybbb" -> ordered history entries. A trailing guess
// without feedback is kept with an empty feedback so validation reports it.
std::vector<wordsieve::HistoryEntry> ParseHistoryText(const std::string& text) {
  std::vector<std::string> tokens = SplitWordsText(text);
  std::vector<wordsieve::HistoryEntry> history;
  for (size_t i = 0; i < tokens.size(); i += 2) {
    wordsieve::HistoryEntry entry;
    entry.guess = tokens[i];
    if (i + 1 < tokens.size()) {
      entry.feedback = tokens[i + 1];
    }
    history.push_back(entry);
  }
  return history;
}
}  // namespace

int LoadDictionary(const std::string& id, const std::string& dict_text) {
  g_dictionaries.Add(id, SplitWordsText(dict_text));
  g_engine.cache().Clear();
  std::vector<std::string> words;
  wordsieve::Status status = g_dictionaries.Load(id, &words);
  return status.ok() ? static_cast<int>(words.size()) : -1;
}

std::string CalculateNextMove(const std::string& dictionary,
                              int word_length,
                              const std::string& prefix,
                              const std::string& history_text) {
  wordsieve::NextMoveRequest request;
  request.dictionary = dictionary;
  request.word_length = word_length;
  request.prefix = prefix;
  request.history = ParseHistoryText(history_text);
  return g_engine.CalculateNextMoveJson(request);
}

std::string HealthCheck() { return wordsieve::Engine::HealthCheckJson(); }

EMSCRIPTEN_BINDINGS(wordsieve_wasm) {
  emscripten::function("loadDictionary", &LoadDictionary);
  emscripten::function("calculateNextMove", &CalculateNextMove);
  emscripten::function("healthCheck", &HealthCheck);
}
