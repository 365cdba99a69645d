#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace wordsieve {

constexpr int kAlphabet = 26;
constexpr size_t kDefaultTopN = 9;

enum class ErrorCode {
  kOk = 0,
  kInvalidArgument,
  kDictionaryNotFound,
  kDictionaryFormat,
  kInternal,
};

struct Status {
  ErrorCode code = ErrorCode::kOk;
  std::string message;

  bool ok() const { return code == ErrorCode::kOk; }

  static Status Ok() { return Status(); }
  static Status InvalidArgument(std::string message) {
    return Status{ErrorCode::kInvalidArgument, std::move(message)};
  }
  static Status DictionaryNotFound(std::string message) {
    return Status{ErrorCode::kDictionaryNotFound, std::move(message)};
  }
  static Status DictionaryFormat(std::string message) {
    return Status{ErrorCode::kDictionaryFormat, std::move(message)};
  }
  static Status Internal(std::string message) {
    return Status{ErrorCode::kInternal, std::move(message)};
  }
};

// Wire name of an error kind ("INVALID_ARGUMENT", ...).
const char* ErrorKindName(ErrorCode code);

enum class FeedbackSymbol : uint8_t {
  kAbsent = 0,
  kPresent = 1,
  kCorrect = 2,
};

// Accepts 'g', 'y', 'b' in either case.
bool ParseFeedbackSymbol(char c, FeedbackSymbol* out);
char FeedbackSymbolChar(FeedbackSymbol symbol);

struct LetterFeedback {
  char letter = 'a';
  FeedbackSymbol symbol = FeedbackSymbol::kAbsent;
};

struct GuessFeedback {
  std::vector<LetterFeedback> letters;

  size_t size() const { return letters.size(); }
  bool empty() const { return letters.empty(); }
  std::string Word() const;
  std::string Pattern() const;
};

// Pairs a guess with its feedback string. Both are lowercased; the guess must
// be alphabetic and both must be `word_length` long.
Status ParseGuessFeedback(std::string_view guess,
                          std::string_view feedback,
                          size_t word_length,
                          GuessFeedback* out);

// Per-letter table backed by a fixed Eigen array. `mask` marks which letters
// carry a value, so an absent letter is distinguishable from a zero score.
struct LetterTable {
  Eigen::Array<double, kAlphabet, 1> values =
      Eigen::Array<double, kAlphabet, 1>::Zero();
  uint32_t mask = 0;

  bool empty() const { return mask == 0; }
  size_t size() const;
  bool Has(char letter) const;
  double Get(char letter) const;
  void Set(char letter, double value);
};

struct Recommendation {
  std::string word;
  double score = 0.0;
};

using VariablePositions = std::map<size_t, std::set<char>>;

bool IsValidWord(std::string_view word);
std::string ToLowerAscii(std::string_view input);
bool MatchesShape(std::string_view word, size_t length,
                  std::string_view prefix);
std::vector<std::string> FilterByShape(const std::vector<std::string>& words,
                                       size_t length,
                                       std::string_view prefix);

// Keeps the words of `words` consistent with one guess. An empty feedback
// copies the input; otherwise every word must match the feedback length.
Status FilterCandidates(const std::vector<std::string>& words,
                        const GuessFeedback& feedback,
                        std::vector<std::string>* out);
bool IsConsistent(std::string_view word, const GuessFeedback& feedback);

LetterTable LetterFrequencies(const std::vector<std::string>& basis,
                              size_t length,
                              std::string_view prefix);
LetterTable NormalizeScores(const LetterTable& frequencies);
double ScoreGuess(std::string_view word, const LetterTable& scores,
                  int guess_index);

// `scoring_basis` defaults to `pool` when null.
std::vector<Recommendation> Recommend(
    const std::vector<std::string>& pool,
    size_t length,
    std::string_view prefix,
    size_t top_n,
    int guess_index,
    const std::vector<std::string>* scoring_basis = nullptr);

Status FindVariablePositions(const std::vector<std::string>& candidates,
                             VariablePositions* out);
std::string VariableLetters(const VariablePositions& positions);
std::vector<std::string> FindFillerWords(
    const std::vector<std::string>& words,
    std::string_view variable_letters,
    size_t length,
    size_t top_n = kDefaultTopN);

class Session {
 public:
  Session(size_t word_length, std::string prefix);

  // Resets history and seeds the candidates from `dictionary`.
  void Begin(const std::vector<std::string>& dictionary);
  Status Apply(const GuessFeedback& feedback);
  // Validates the whole history before narrowing anything.
  Status Replay(const std::vector<std::string>& dictionary,
                const std::vector<GuessFeedback>& history);

  size_t word_length() const { return word_length_; }
  const std::string& prefix() const { return prefix_; }
  const std::vector<GuessFeedback>& history() const { return history_; }
  const std::vector<std::string>& candidates() const { return candidates_; }
  int guess_count() const { return static_cast<int>(history_.size()) + 1; }
  bool Solved() const;

 private:
  size_t word_length_;
  std::string prefix_;
  std::vector<GuessFeedback> history_;
  std::vector<std::string> candidates_;
};

class DictionaryProvider {
 public:
  virtual ~DictionaryProvider() = default;
  virtual Status Load(const std::string& id,
                      std::vector<std::string>* out) const = 0;
};

class FileDictionaryProvider : public DictionaryProvider {
 public:
  explicit FileDictionaryProvider(std::string root);
  Status Load(const std::string& id,
              std::vector<std::string>* out) const override;

  static Status ParseJsonWordList(const std::string& text,
                                  std::vector<std::string>* out);

 private:
  std::string root_;
};

class InMemoryDictionaryProvider : public DictionaryProvider {
 public:
  void Add(const std::string& id, std::vector<std::string> words);
  Status Load(const std::string& id,
              std::vector<std::string>* out) const override;

 private:
  std::unordered_map<std::string, std::vector<std::string>> dictionaries_;
};

class DictionaryCache {
 public:
  using WordList = std::shared_ptr<const std::vector<std::string>>;

  explicit DictionaryCache(const DictionaryProvider& provider);

  Status Get(const std::string& id, WordList* out);
  size_t size() const;
  void Clear();

 private:
  const DictionaryProvider& provider_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, WordList> entries_;
};

struct HistoryEntry {
  std::string guess;
  std::string feedback;
};

struct NextMoveRequest {
  int word_length = 5;
  std::string prefix;
  std::string dictionary = "english.json";
  std::vector<HistoryEntry> history;
};

struct NextMoveResponse {
  std::vector<Recommendation> recommendations;
  std::vector<std::string> remaining_words;
  size_t remaining_count = 0;
  VariablePositions variable_positions;
  std::vector<std::string> filler_suggestions;
  int guess_count = 1;
};

struct EngineOptions {
  size_t top_n = kDefaultTopN;
  size_t max_remaining_words = 100;
  size_t filler_threshold = 10;
  bool profile = false;
};

class Engine {
 public:
  explicit Engine(const DictionaryProvider& provider,
                  EngineOptions options = EngineOptions());

  Status CalculateNextMove(const NextMoveRequest& request,
                           NextMoveResponse* out);
  std::string CalculateNextMoveJson(const NextMoveRequest& request);

  static std::string ResponseJson(const NextMoveResponse& response);
  static std::string ErrorJson(const Status& status);
  static std::string HealthCheckJson();

  const EngineOptions& options() const { return options_; }
  DictionaryCache& cache() { return cache_; }

 private:
  Status ValidateConfig(const NextMoveRequest& request,
                        std::string* prefix) const;

  EngineOptions options_;
  DictionaryCache cache_;
};

}  // namespace wordsieve
