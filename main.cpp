#include "Solver.hpp"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {
constexpr size_t kListRemainingLimit = 30;

struct Config {
  std::string dict_dir = ".";
  std::string dictionary = "english.json";
  int word_length = 5;
  std::string prefix;
  std::vector<wordsieve::HistoryEntry> history;
  size_t top_n = wordsieve::kDefaultTopN;
  bool interactive = false;
  bool profile = false;
};

void PrintUsage(const char* argv0) {
  std::cout
      << "wordsieve: letter-feedback word filter and guess recommender\n"
      << "Usage:\n"
      << "  " << argv0
      << " --dict-dir DIR --dictionary english.json --guess crane bbygb\n"
      << "  " << argv0 << " --dict-dir DIR --interactive [--length 7] "
         "[--prefix p]\n"
      << "Options:\n"
      << "  --dict-dir DIR           Directory holding dictionary files "
         "(default .)\n"
      << "  --dictionary ID          Dictionary file name (default "
         "english.json)\n"
      << "                           .json = flat list of strings, otherwise "
         "one word per line\n"
      << "  --length N               Word length (default 5)\n"
      << "  --prefix P               Only consider words starting with P\n"
      << "  --guess WORD FEEDBACK    Add a guess with g/y/b feedback "
         "(repeatable)\n"
      << "  --top N                  Number of recommendations (default 9)\n"
      << "  --interactive            Interactive solving loop\n"
      << "  --profile                Log per-stage timing to stderr\n"
      << "  --help                   Show this help\n";
}

std::string TrimWhitespace(const std::string& input) {
  size_t start = 0;
  while (start < input.size() &&
         std::isspace(static_cast<unsigned char>(input[start]))) {
    ++start;
  }
  size_t end = input.size();
  while (end > start &&
         std::isspace(static_cast<unsigned char>(input[end - 1]))) {
    --end;
  }
  return input.substr(start, end - start);
}

bool ParseInt(const std::string& text, int* out) {
  std::istringstream iss(text);
  int value = 0;
  if (!(iss >> value) || !iss.eof()) {
    return false;
  }
  *out = value;
  return true;
}

bool IsDigits(const std::string& text) {
  if (text.empty()) {
    return false;
  }
  for (char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return true;
}

bool LooksLikeFeedback(const std::string& text) {
  for (char c : text) {
    if (c != 'g' && c != 'y' && c != 'b') {
      return false;
    }
  }
  return !text.empty();
}

void PrintInteractiveHelp() {
  std::cout
      << "Interactive commands:\n"
      << "  GUESS FEEDBACK  A guess and its feedback (g=green y=yellow "
         "b=black)\n"
      << "  N [FEEDBACK]    Play recommendation N\n"
      << "  GUESS           A guess; feedback is asked for next\n"
      << "  0               Filler words for a set of letters\n"
      << "  help or ?       Show this help\n"
      << "  quit or exit    Leave interactive mode\n";
}

void PrintColoredFeedback(const std::string& label,
                          const wordsieve::GuessFeedback& feedback) {
  const char* colors[] = {"\x1b[90m", "\x1b[33m", "\x1b[32m"};
  const char* reset = "\x1b[0m";
  std::cout << label;
  for (const wordsieve::LetterFeedback& entry : feedback.letters) {
    int value = static_cast<int>(entry.symbol);
    char upper = static_cast<char>(entry.letter - 'a' + 'A');
    std::cout << colors[value] << upper << reset;
  }
  std::cout << "\n";
}

void PrintGuessHistory(const std::vector<wordsieve::GuessFeedback>& history) {
  std::cout << "Guesses so far:\n";
  for (size_t i = 0; i < history.size(); ++i) {
    PrintColoredFeedback("  " + std::to_string(i + 1) + ". ", history[i]);
  }
}

void PrintRemainingWords(const std::vector<std::string>& candidates) {
  std::cout << "Remaining possibilities: " << candidates.size();
  if (candidates.size() > 1 && candidates.size() <= kListRemainingLimit) {
    std::cout << ": ";
    for (size_t i = 0; i < candidates.size(); ++i) {
      std::cout << (i > 0 ? ", " : "") << candidates[i];
    }
  }
  std::cout << "\n";
}

void PrintRemainingBar(size_t remaining, size_t total) {
  if (total == 0) {
    return;
  }
  constexpr int kBarWidth = 20;
  double ratio = static_cast<double>(remaining) / static_cast<double>(total);
  int filled = static_cast<int>(std::round(ratio * kBarWidth));
  if (filled > kBarWidth) {
    filled = kBarWidth;
  }
  if (filled < 0) {
    filled = 0;
  }
  std::cout << "Candidates: [";
  for (int i = 0; i < kBarWidth; ++i) {
    std::cout << (i < filled ? '#' : '.');
  }
  std::cout << "] " << std::fixed << std::setprecision(1) << ratio * 100.0
            << "% remaining\n";
}

void PrintVariablePositions(const wordsieve::VariablePositions& positions) {
  if (positions.empty()) {
    return;
  }
  std::cout << "Undetermined positions:";
  for (const auto& position : positions) {
    std::cout << " " << (position.first + 1) << "=";
    for (char letter : position.second) {
      std::cout << letter;
    }
  }
  std::cout << "\n";
}

int RunInteractive(const Config& config,
                   const std::vector<std::string>& dictionary,
                   wordsieve::Session* session) {
  const size_t length = session->word_length();
  const size_t initial_count = session->candidates().size();

  std::cout << "\n[wordsieve] " << dictionary.size() << " words, length "
            << length;
  if (!session->prefix().empty()) {
    std::cout << ", prefix '" << session->prefix() << "'";
  }
  std::cout << "\nType '?' for help.\n";

  while (true) {
    const std::vector<std::string>& candidates = session->candidates();
    if (session->Solved()) {
      std::cout << "Solved in " << session->history().size()
                << " guesses.\n";
      return 0;
    }
    if (candidates.empty()) {
      std::cout << "Remaining possibilities: 0\n";
      std::cout << "No valid candidates remain. Check your inputs.\n";
      return 1;
    }
    if (candidates.size() == 1) {
      std::cout << "Solved! The word is '" << candidates[0] << "'.\n";
      return 0;
    }

    std::vector<wordsieve::Recommendation> recommendations =
        wordsieve::Recommend(candidates, length, session->prefix(),
                             config.top_n, session->guess_count(),
                             &dictionary);
    wordsieve::VariablePositions positions;
    wordsieve::Status status =
        wordsieve::FindVariablePositions(candidates, &positions);
    if (!status.ok()) {
      std::cerr << status.message << "\n";
      return 1;
    }

    std::cout << "\nGuess " << session->guess_count() << "\n";
    PrintRemainingWords(candidates);
    PrintRemainingBar(candidates.size(), initial_count);
    PrintVariablePositions(positions);
    std::cout << "Recommended guesses:\n";
    for (size_t i = 0; i < recommendations.size(); ++i) {
      std::cout << "  " << (i + 1) << ". " << recommendations[i].word
                << " - " << std::fixed << std::setprecision(2)
                << recommendations[i].score << "\n";
    }
    std::cout << "Enter guess and feedback (e.g. crane bbygb), 1-"
              << recommendations.size()
              << " to pick a recommendation, or 0 for filler words: ";

    std::string line;
    if (!std::getline(std::cin, line)) {
      return 0;
    }
    line = wordsieve::ToLowerAscii(TrimWhitespace(line));
    if (line.empty()) {
      continue;
    }
    if (line == "help" || line == "?") {
      PrintInteractiveHelp();
      continue;
    }
    if (line == "quit" || line == "exit") {
      return 0;
    }

    if (line == "0") {
      std::string letters = wordsieve::VariableLetters(positions);
      std::cout << "Letters for filler words [" << letters << "]: ";
      std::string input;
      if (!std::getline(std::cin, input)) {
        return 0;
      }
      input = wordsieve::ToLowerAscii(TrimWhitespace(input));
      if (!input.empty()) {
        if (!wordsieve::IsValidWord(input)) {
          std::cout << "Use only letters for filler word search.\n";
          continue;
        }
        letters = input;
      }
      std::vector<std::string> fillers = wordsieve::FindFillerWords(
          dictionary, letters, length, config.top_n);
      std::cout << "Filler words for '" << letters << "':";
      for (const auto& word : fillers) {
        std::cout << " " << word;
      }
      std::cout << "\n";
      continue;
    }

    std::istringstream iss(line);
    std::string guess;
    std::string feedback;
    iss >> guess >> feedback;

    if (IsDigits(guess)) {
      int choice = 0;
      if (!ParseInt(guess, &choice) || choice < 1 ||
          static_cast<size_t>(choice) > recommendations.size()) {
        std::cout << "Choose 1-" << recommendations.size() << ".\n";
        continue;
      }
      guess = recommendations[choice - 1].word;
    } else {
      if (guess.size() != length) {
        std::cout << "Word length must be " << length << " characters.\n";
        continue;
      }
      if (!wordsieve::IsValidWord(guess)) {
        std::cout << "Guess must contain only letters.\n";
        continue;
      }
      if (feedback.empty() && LooksLikeFeedback(guess)) {
        std::cout << "Enter a guess word, not feedback.\n";
        continue;
      }
    }

    if (feedback.empty()) {
      std::cout << "Feedback for '" << guess << "': ";
      if (!std::getline(std::cin, feedback)) {
        return 0;
      }
      feedback = TrimWhitespace(feedback);
    }

    wordsieve::GuessFeedback parsed;
    status = wordsieve::ParseGuessFeedback(guess, feedback, length, &parsed);
    if (!status.ok()) {
      std::cout << status.message << "\n";
      continue;
    }
    size_t before = candidates.size();
    status = session->Apply(parsed);
    if (!status.ok()) {
      std::cout << status.message << "\n";
      continue;
    }
    PrintGuessHistory(session->history());
    std::cout << "Pruned " << before << " -> "
              << session->candidates().size() << "\n";
  }
}
}  // namespace

int main(int argc, char** argv) {
  Config config;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--dict-dir" && i + 1 < argc) {
      config.dict_dir = argv[++i];
    } else if (arg == "--dictionary" && i + 1 < argc) {
      config.dictionary = argv[++i];
    } else if (arg == "--length" && i + 1 < argc) {
      if (!ParseInt(argv[++i], &config.word_length)) {
        std::cerr << "Invalid word length: " << argv[i] << "\n";
        return 1;
      }
    } else if (arg == "--prefix" && i + 1 < argc) {
      config.prefix = argv[++i];
    } else if (arg == "--guess" && i + 2 < argc) {
      wordsieve::HistoryEntry entry;
      entry.guess = argv[++i];
      entry.feedback = argv[++i];
      config.history.push_back(entry);
    } else if (arg == "--top" && i + 1 < argc) {
      int top = 0;
      if (!ParseInt(argv[++i], &top) || top < 1) {
        std::cerr << "Invalid --top value: " << argv[i] << "\n";
        return 1;
      }
      config.top_n = static_cast<size_t>(top);
    } else if (arg == "--interactive") {
      config.interactive = true;
    } else if (arg == "--profile") {
      config.profile = true;
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      PrintUsage(argv[0]);
      return 1;
    }
  }

  wordsieve::FileDictionaryProvider provider(config.dict_dir);
  wordsieve::EngineOptions options;
  options.top_n = config.top_n;
  options.profile = config.profile;
  wordsieve::Engine engine(provider, options);

  wordsieve::NextMoveRequest request;
  request.word_length = config.word_length;
  request.prefix = config.prefix;
  request.dictionary = config.dictionary;
  request.history = config.history;

  // Validates the config and history the same way for both modes.
  wordsieve::NextMoveResponse response;
  wordsieve::Status status = engine.CalculateNextMove(request, &response);
  if (!status.ok()) {
    std::cerr << wordsieve::ErrorKindName(status.code) << ": "
              << status.message << "\n";
    return 1;
  }

  if (!config.interactive) {
    std::cout << wordsieve::Engine::ResponseJson(response) << "\n";
    return 0;
  }

  wordsieve::DictionaryCache::WordList dictionary;
  status = engine.cache().Get(config.dictionary, &dictionary);
  if (!status.ok()) {
    std::cerr << "Failed to load dictionary: " << status.message << "\n";
    return 1;
  }
  wordsieve::Session session(static_cast<size_t>(config.word_length),
                             config.prefix);
  session.Begin(*dictionary);
  for (const auto& entry : config.history) {
    wordsieve::GuessFeedback feedback;
    status = wordsieve::ParseGuessFeedback(
        entry.guess, entry.feedback, session.word_length(), &feedback);
    if (status.ok()) {
      status = session.Apply(feedback);
    }
    if (!status.ok()) {
      std::cerr << status.message << "\n";
      return 1;
    }
  }
  return RunInteractive(config, *dictionary, &session);
}
