#include "Solver.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

#include <algorithm>
#include <array>
#include <utility>
#include <vector>

namespace wordsieve {
namespace {
using LetterCounts = std::array<int, kAlphabet>;

bool IsLetter(char c) { return c >= 'a' && c <= 'z'; }

LetterCounts CountLetters(std::string_view word) {
  LetterCounts counts{};
  counts.fill(0);
  for (char c : word) {
    counts[c - 'a']++;
  }
  return counts;
}

// Green and yellow tallies per letter of one guess. A black mark only rules
// out occurrences beyond correct + present, which is what makes repeated
// letters work.
struct FeedbackCounts {
  LetterCounts correct{};
  LetterCounts present{};
};

FeedbackCounts CountFeedback(const GuessFeedback& feedback) {
  FeedbackCounts counts;
  counts.correct.fill(0);
  counts.present.fill(0);
  for (const LetterFeedback& entry : feedback.letters) {
    int letter = entry.letter - 'a';
    if (entry.symbol == FeedbackSymbol::kCorrect) {
      counts.correct[letter]++;
    } else if (entry.symbol == FeedbackSymbol::kPresent) {
      counts.present[letter]++;
    }
  }
  return counts;
}

bool Matches(std::string_view word,
             const GuessFeedback& feedback,
             const FeedbackCounts& counts) {
  const LetterCounts occurrences = CountLetters(word);
  for (size_t i = 0; i < feedback.letters.size(); ++i) {
    const char letter = feedback.letters[i].letter;
    const int index = letter - 'a';
    const int count = occurrences[index];
    switch (feedback.letters[i].symbol) {
      case FeedbackSymbol::kCorrect:
        if (word[i] != letter || count < counts.correct[index]) {
          return false;
        }
        break;
      case FeedbackSymbol::kPresent:
        // Needs a free occurrence beyond the ones pinned green.
        if (count == 0 || word[i] == letter ||
            count <= counts.correct[index]) {
          return false;
        }
        break;
      case FeedbackSymbol::kAbsent:
        if (count > counts.correct[index] + counts.present[index]) {
          return false;
        }
        break;
      default:
        return false;
    }
  }
  return true;
}

bool IsKnownSymbol(FeedbackSymbol symbol) {
  return symbol == FeedbackSymbol::kCorrect ||
         symbol == FeedbackSymbol::kPresent ||
         symbol == FeedbackSymbol::kAbsent;
}

bool IsWellFormed(const GuessFeedback& feedback) {
  for (const LetterFeedback& entry : feedback.letters) {
    if (!IsLetter(entry.letter) || !IsKnownSymbol(entry.symbol)) {
      return false;
    }
  }
  return true;
}
}  // namespace

const char* ErrorKindName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "OK";
    case ErrorCode::kInvalidArgument:
      return "INVALID_ARGUMENT";
    case ErrorCode::kDictionaryNotFound:
    case ErrorCode::kDictionaryFormat:
      return "DICTIONARY_NOT_FOUND";
    case ErrorCode::kInternal:
      return "INTERNAL_ERROR";
  }
  return "INTERNAL_ERROR";
}

bool ParseFeedbackSymbol(char c, FeedbackSymbol* out) {
  FeedbackSymbol symbol;
  switch (c) {
    case 'g':
    case 'G':
      symbol = FeedbackSymbol::kCorrect;
      break;
    case 'y':
    case 'Y':
      symbol = FeedbackSymbol::kPresent;
      break;
    case 'b':
    case 'B':
      symbol = FeedbackSymbol::kAbsent;
      break;
    default:
      return false;
  }
  if (out) {
    *out = symbol;
  }
  return true;
}

char FeedbackSymbolChar(FeedbackSymbol symbol) {
  switch (symbol) {
    case FeedbackSymbol::kCorrect:
      return 'g';
    case FeedbackSymbol::kPresent:
      return 'y';
    case FeedbackSymbol::kAbsent:
      return 'b';
  }
  return 'b';
}

std::string GuessFeedback::Word() const {
  std::string word;
  word.reserve(letters.size());
  for (const LetterFeedback& entry : letters) {
    word.push_back(entry.letter);
  }
  return word;
}

std::string GuessFeedback::Pattern() const {
  std::string pattern;
  pattern.reserve(letters.size());
  for (const LetterFeedback& entry : letters) {
    pattern.push_back(FeedbackSymbolChar(entry.symbol));
  }
  return pattern;
}

Status ParseGuessFeedback(std::string_view guess,
                          std::string_view feedback,
                          size_t word_length,
                          GuessFeedback* out) {
  if (!out) {
    return Status::Internal("ParseGuessFeedback: null output");
  }
  std::string word = ToLowerAscii(guess);
  std::string pattern = ToLowerAscii(feedback);
  if (word.size() != word_length || pattern.size() != word_length) {
    return Status::InvalidArgument(
        "Guess and feedback length mismatch: expected " +
        std::to_string(word_length) + " letters, got '" + word + "' and '" +
        pattern + "'");
  }
  if (!IsValidWord(word)) {
    return Status::InvalidArgument("Guess must contain only letters: '" +
                                   word + "'");
  }

  GuessFeedback parsed;
  parsed.letters.reserve(word_length);
  for (size_t i = 0; i < word_length; ++i) {
    LetterFeedback entry;
    entry.letter = word[i];
    if (!ParseFeedbackSymbol(pattern[i], &entry.symbol)) {
      return Status::InvalidArgument(
          "Invalid feedback characters in '" + pattern +
          "' (use only 'g', 'y' or 'b')");
    }
    parsed.letters.push_back(entry);
  }
  *out = std::move(parsed);
  return Status::Ok();
}

bool IsValidWord(std::string_view word) {
  if (word.empty()) {
    return false;
  }
  for (char c : word) {
    if (!IsLetter(c)) {
      return false;
    }
  }
  return true;
}

std::string ToLowerAscii(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  for (char c : input) {
    if (c >= 'A' && c <= 'Z') {
      out.push_back(static_cast<char>(c - 'A' + 'a'));
    } else {
      out.push_back(c);
    }
  }
  return out;
}

bool MatchesShape(std::string_view word, size_t length,
                  std::string_view prefix) {
  if (word.size() != length || prefix.size() > word.size()) {
    return false;
  }
  return word.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> FilterByShape(const std::vector<std::string>& words,
                                       size_t length,
                                       std::string_view prefix) {
  std::vector<std::string> out;
  for (const auto& word : words) {
    if (MatchesShape(word, length, prefix)) {
      out.push_back(word);
    }
  }
  return out;
}

bool IsConsistent(std::string_view word, const GuessFeedback& feedback) {
  if (word.size() != feedback.size() || !IsValidWord(word) ||
      !IsWellFormed(feedback)) {
    return false;
  }
  return Matches(word, feedback, CountFeedback(feedback));
}

Status FilterCandidates(const std::vector<std::string>& words,
                        const GuessFeedback& feedback,
                        std::vector<std::string>* out) {
  if (!out) {
    return Status::Internal("FilterCandidates: null output");
  }
  if (feedback.empty()) {
    *out = words;
    return Status::Ok();
  }
  if (!IsWellFormed(feedback)) {
    return Status::InvalidArgument(
        "Feedback must pair a-z letters with g/y/b symbols: '" +
        feedback.Word() + "'");
  }
  const size_t length = feedback.size();
  for (const auto& word : words) {
    if (word.size() != length) {
      return Status::InvalidArgument(
          "Word '" + word + "' does not match feedback length " +
          std::to_string(length));
    }
    if (!IsValidWord(word)) {
      return Status::InvalidArgument("Word must contain only letters: '" +
                                     word + "'");
    }
  }

  const FeedbackCounts counts = CountFeedback(feedback);
  std::vector<uint8_t> keep(words.size(), 0);

#ifdef _OPENMP
#pragma omp parallel for schedule(static)
#endif
  for (size_t i = 0; i < words.size(); ++i) {
    keep[i] = Matches(words[i], feedback, counts) ? 1 : 0;
  }

  std::vector<std::string> next;
  next.reserve(static_cast<size_t>(std::count(keep.begin(), keep.end(), 1)));
  for (size_t i = 0; i < words.size(); ++i) {
    if (keep[i]) {
      next.push_back(words[i]);
    }
  }
  out->swap(next);
  return Status::Ok();
}

Session::Session(size_t word_length, std::string prefix)
    : word_length_(word_length), prefix_(ToLowerAscii(prefix)) {}

void Session::Begin(const std::vector<std::string>& dictionary) {
  history_.clear();
  candidates_ = FilterByShape(dictionary, word_length_, prefix_);
}

Status Session::Apply(const GuessFeedback& feedback) {
  if (feedback.size() != word_length_) {
    return Status::InvalidArgument(
        "Feedback for '" + feedback.Word() + "' must have " +
        std::to_string(word_length_) + " letters");
  }
  std::vector<std::string> next;
  Status status = FilterCandidates(candidates_, feedback, &next);
  if (!status.ok()) {
    return status;
  }
  candidates_.swap(next);
  history_.push_back(feedback);
  return Status::Ok();
}

Status Session::Replay(const std::vector<std::string>& dictionary,
                       const std::vector<GuessFeedback>& history) {
  for (const GuessFeedback& feedback : history) {
    if (feedback.size() != word_length_) {
      return Status::InvalidArgument(
          "Feedback for '" + feedback.Word() + "' must have " +
          std::to_string(word_length_) + " letters");
    }
  }

  std::vector<std::string> remaining =
      FilterByShape(dictionary, word_length_, prefix_);
  std::vector<std::string> next;
  for (const GuessFeedback& feedback : history) {
    Status status = FilterCandidates(remaining, feedback, &next);
    if (!status.ok()) {
      return status;
    }
    remaining.swap(next);
  }
  candidates_.swap(remaining);
  history_ = history;
  return Status::Ok();
}

bool Session::Solved() const {
  if (history_.empty()) {
    return false;
  }
  for (const LetterFeedback& entry : history_.back().letters) {
    if (entry.symbol != FeedbackSymbol::kCorrect) {
      return false;
    }
  }
  return true;
}

}  // namespace wordsieve
