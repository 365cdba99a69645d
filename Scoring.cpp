#include "Solver.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

#include <algorithm>
#include <limits>
#include <set>
#include <utility>
#include <vector>

namespace wordsieve {
namespace {
using LetterArray = Eigen::Array<double, kAlphabet, 1>;

bool IsLetter(char c) { return c >= 'a' && c <= 'z'; }

LetterArray MaskArray(uint32_t mask) {
  LetterArray present = LetterArray::Zero();
  for (int i = 0; i < kAlphabet; ++i) {
    if (mask & (1U << i)) {
      present[i] = 1.0;
    }
  }
  return present;
}

LetterArray Occurrences(std::string_view word) {
  LetterArray occurrences = LetterArray::Zero();
  for (char c : word) {
    if (IsLetter(c)) {
      occurrences[c - 'a'] += 1.0;
    }
  }
  return occurrences;
}
}  // namespace

size_t LetterTable::size() const {
  size_t count = 0;
  for (int i = 0; i < kAlphabet; ++i) {
    if (mask & (1U << i)) {
      ++count;
    }
  }
  return count;
}

bool LetterTable::Has(char letter) const {
  return IsLetter(letter) && (mask & (1U << (letter - 'a'))) != 0;
}

double LetterTable::Get(char letter) const {
  return Has(letter) ? values[letter - 'a'] : 0.0;
}

void LetterTable::Set(char letter, double value) {
  if (!IsLetter(letter)) {
    return;
  }
  values[letter - 'a'] = value;
  mask |= 1U << (letter - 'a');
}

LetterTable LetterFrequencies(const std::vector<std::string>& basis,
                              size_t length,
                              std::string_view prefix) {
  LetterArray counts = LetterArray::Zero();
  uint32_t mask = 0;
  double total = 0.0;
  for (const auto& word : basis) {
    if (!MatchesShape(word, length, prefix)) {
      continue;
    }
    for (size_t i = prefix.size(); i < word.size(); ++i) {
      char c = word[i];
      if (!IsLetter(c)) {
        continue;
      }
      counts[c - 'a'] += 1.0;
      mask |= 1U << (c - 'a');
      total += 1.0;
    }
  }

  LetterTable table;
  if (total == 0.0) {
    return table;
  }
  table.values = counts * (100.0 / total);
  table.mask = mask;
  return table;
}

LetterTable NormalizeScores(const LetterTable& frequencies) {
  LetterTable normalized;
  if (frequencies.empty()) {
    return normalized;
  }

  double min_value = std::numeric_limits<double>::infinity();
  double max_value = -std::numeric_limits<double>::infinity();
  for (int i = 0; i < kAlphabet; ++i) {
    if (frequencies.mask & (1U << i)) {
      min_value = std::min(min_value, frequencies.values[i]);
      max_value = std::max(max_value, frequencies.values[i]);
    }
  }

  normalized.mask = frequencies.mask;
  if (max_value == min_value) {
    normalized.values = LetterArray::Constant(5.0);
  } else {
    normalized.values =
        ((frequencies.values - min_value) / (max_value - min_value)) * 10.0;
  }
  normalized.values *= MaskArray(frequencies.mask);
  return normalized;
}

// Heuristic stand-in for information gain, not an entropy calculation. On the
// first two guesses each distinct letter counts once so that broad letter
// coverage wins; from the third guess on every occurrence counts, since
// confirming a common repeated letter is then worth a guess.
double ScoreGuess(std::string_view word, const LetterTable& scores,
                  int guess_index) {
  LetterArray occurrences = Occurrences(word);
  if (guess_index <= 2) {
    occurrences = occurrences.min(1.0);
  }
  return (occurrences * scores.values * MaskArray(scores.mask)).sum();
}

std::vector<Recommendation> Recommend(
    const std::vector<std::string>& pool,
    size_t length,
    std::string_view prefix,
    size_t top_n,
    int guess_index,
    const std::vector<std::string>* scoring_basis) {
  std::vector<std::string> filtered = FilterByShape(pool, length, prefix);
  if (filtered.empty() || top_n == 0) {
    return {};
  }

  // The basis may be wider than the pool (e.g. the whole dictionary while
  // only candidates are eligible); denser counts give steadier scores.
  const std::vector<std::string>& basis =
      scoring_basis ? *scoring_basis : pool;
  const LetterTable scores =
      NormalizeScores(LetterFrequencies(basis, length, prefix));

  std::vector<Recommendation> scored(filtered.size());
#ifdef _OPENMP
#pragma omp parallel for schedule(static)
#endif
  for (size_t i = 0; i < filtered.size(); ++i) {
    scored[i].score = ScoreGuess(filtered[i], scores, guess_index);
  }
  for (size_t i = 0; i < filtered.size(); ++i) {
    scored[i].word = std::move(filtered[i]);
  }

  std::stable_sort(scored.begin(), scored.end(),
                   [](const Recommendation& a, const Recommendation& b) {
                     return a.score > b.score;
                   });
  if (scored.size() > top_n) {
    scored.resize(top_n);
  }
  return scored;
}

Status FindVariablePositions(const std::vector<std::string>& candidates,
                             VariablePositions* out) {
  if (!out) {
    return Status::Internal("FindVariablePositions: null output");
  }
  out->clear();
  if (candidates.empty()) {
    return Status::Ok();
  }

  const size_t length = candidates.front().size();
  std::vector<std::set<char>> seen(length);
  for (const auto& word : candidates) {
    if (word.size() != length) {
      return Status::InvalidArgument(
          "Candidates must share one length: '" + word + "' is not " +
          std::to_string(length) + " letters");
    }
    for (size_t i = 0; i < length; ++i) {
      seen[i].insert(word[i]);
    }
  }

  for (size_t i = 0; i < length; ++i) {
    if (seen[i].size() > 1) {
      out->emplace(i, std::move(seen[i]));
    }
  }
  return Status::Ok();
}

std::string VariableLetters(const VariablePositions& positions) {
  std::set<char> letters;
  for (const auto& position : positions) {
    letters.insert(position.second.begin(), position.second.end());
  }
  return std::string(letters.begin(), letters.end());
}

std::vector<std::string> FindFillerWords(
    const std::vector<std::string>& words,
    std::string_view variable_letters,
    size_t length,
    size_t top_n) {
  const std::set<char> letters(variable_letters.begin(),
                               variable_letters.end());
  if (letters.empty() || top_n == 0) {
    return {};
  }

  struct ScoredFiller {
    const std::string* word;
    int score;
  };
  std::vector<ScoredFiller> scored;
  for (const auto& word : words) {
    if (word.size() != length) {
      continue;
    }
    int score = 0;
    for (char letter : letters) {
      if (word.find(letter) != std::string::npos) {
        ++score;
      }
    }
    if (score > 0) {
      scored.push_back({&word, score});
    }
  }

  std::stable_sort(scored.begin(), scored.end(),
                   [](const ScoredFiller& a, const ScoredFiller& b) {
                     return a.score > b.score;
                   });

  std::vector<std::string> fillers;
  const size_t count = std::min(top_n, scored.size());
  fillers.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    fillers.push_back(*scored[i].word);
  }
  return fillers;
}

}  // namespace wordsieve
