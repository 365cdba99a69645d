#include "Solver.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {
int g_failures = 0;

void ExpectTrue(bool condition, const char* message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    ++g_failures;
  }
}

void ExpectFalse(bool condition, const char* message) {
  ExpectTrue(!condition, message);
}

bool Contains(const std::string& text, const std::string& needle) {
  return text.find(needle) != std::string::npos;
}

std::vector<std::string> AllWordsOver(const std::string& alphabet,
                                      size_t length) {
  std::vector<std::string> words = {""};
  for (size_t i = 0; i < length; ++i) {
    std::vector<std::string> next;
    for (const auto& word : words) {
      for (char c : alphabet) {
        next.push_back(word + c);
      }
    }
    words.swap(next);
  }
  return words;
}

class CountingProvider : public wordsieve::DictionaryProvider {
 public:
  explicit CountingProvider(const wordsieve::DictionaryProvider& inner)
      : inner_(inner) {}

  wordsieve::Status Load(const std::string& id,
                         std::vector<std::string>* out) const override {
    ++loads;
    return inner_.Load(id, out);
  }

  mutable int loads = 0;

 private:
  const wordsieve::DictionaryProvider& inner_;
};

// Holds every Load until `expected` loads are in flight, so concurrent
// lookups are forced to miss together.
class GatedProvider : public wordsieve::DictionaryProvider {
 public:
  GatedProvider(const wordsieve::DictionaryProvider& inner, int expected)
      : inner_(inner), expected_(expected) {}

  wordsieve::Status Load(const std::string& id,
                         std::vector<std::string>* out) const override {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      ++loads_;
      ready_.notify_all();
      if (!ready_.wait_for(lock, std::chrono::seconds(5),
                           [this] { return loads_ >= expected_; })) {
        return wordsieve::Status::Internal("gate timed out");
      }
    }
    return inner_.Load(id, out);
  }

  int loads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loads_;
  }

 private:
  const wordsieve::DictionaryProvider& inner_;
  const int expected_;
  mutable std::mutex mutex_;
  mutable std::condition_variable ready_;
  mutable int loads_ = 0;
};

class ThrowingProvider : public wordsieve::DictionaryProvider {
 public:
  wordsieve::Status Load(const std::string&,
                         std::vector<std::string>*) const override {
    throw std::runtime_error("storage backend exploded");
  }
};

void WriteFile(const std::filesystem::path& path, const std::string& text) {
  std::ofstream out(path);
  out << text;
}

wordsieve::NextMoveRequest MakeRequest(const std::string& dictionary,
                                       int word_length) {
  wordsieve::NextMoveRequest request;
  request.dictionary = dictionary;
  request.word_length = word_length;
  return request;
}
}  // namespace

int main() {
  wordsieve::InMemoryDictionaryProvider provider;
  provider.Add("english.json", {"crane", "slate", "place", "grape", "paint",
                                "point", "Crate", "cat", "ab-cd"});
  provider.Add("single.json", {"slate"});
  provider.Add("letters.json", AllWordsOver("abcde", 3));

  {
    std::vector<std::string> words;
    wordsieve::Status status = provider.Load("english.json", &words);
    ExpectTrue(status.ok() && words.size() == 8,
               "in-memory provider should drop non-letter entries");
    ExpectTrue(words[6] == "crate", "in-memory provider should lowercase");
    status = provider.Load("missing.json", &words);
    ExpectTrue(status.code == wordsieve::ErrorCode::kDictionaryNotFound,
               "unknown id should be not found");
  }

  {
    wordsieve::Engine engine(provider);
    wordsieve::NextMoveResponse response;
    wordsieve::Status status =
        engine.CalculateNextMove(MakeRequest("english.json", 5), &response);
    ExpectTrue(status.ok(), "first move should succeed");
    ExpectTrue(response.guess_count == 1, "first move is guess 1");
    ExpectTrue(response.remaining_count == 7,
               "all five-letter words should remain");
    ExpectTrue(response.recommendations.size() == 7,
               "recommendations are capped by the pool");
    ExpectTrue(response.filler_suggestions.empty(),
               "no fillers with ten or fewer candidates");
    ExpectFalse(response.variable_positions.empty(),
                "distinct words should vary somewhere");
  }

  {
    wordsieve::Engine engine(provider);
    wordsieve::NextMoveRequest request = MakeRequest("english.json", 5);
    request.history.push_back({"CRANE", "BBGBG"});
    wordsieve::NextMoveResponse response;
    wordsieve::Status status = engine.CalculateNextMove(request, &response);
    ExpectTrue(status.ok(), "move with history should succeed");
    ExpectTrue(response.guess_count == 2, "one guess played means guess 2");
    ExpectTrue(response.remaining_words == std::vector<std::string>({"slate"}),
               "crane bbgbg should leave slate");
    ExpectTrue(response.recommendations.size() == 1 &&
                   response.recommendations[0].word == "slate",
               "only candidates are recommended");
    ExpectTrue(response.recommendations[0].score > 0.0,
               "full dictionary basis should give slate a score");
    ExpectTrue(response.variable_positions.empty(),
               "one candidate has no variable positions");
  }

  {
    wordsieve::Engine engine(provider);
    std::string json =
        engine.CalculateNextMoveJson(MakeRequest("single.json", 5));
    ExpectTrue(json ==
                   "{\"recommendations\":[{\"word\":\"slate\",\"score\":25}],"
                   "\"remainingWords\":[\"slate\"],\"remainingCount\":1,"
                   "\"variablePositions\":{},\"fillerSuggestions\":[],"
                   "\"guessCount\":1}",
               "response JSON should match the wire shape");
  }

  {
    wordsieve::Engine engine(provider);
    wordsieve::NextMoveResponse response;
    wordsieve::Status status =
        engine.CalculateNextMove(MakeRequest("letters.json", 3), &response);
    ExpectTrue(status.ok(), "large pool should succeed");
    ExpectTrue(response.remaining_count == 125, "125 words remain");
    ExpectTrue(response.remaining_words.size() == 100,
               "remaining words should be capped at 100");
    ExpectTrue(response.variable_positions.size() == 3,
               "every position should vary");
    ExpectTrue(response.filler_suggestions.size() == 9,
               "fillers should be suggested for a large pool");
    for (const auto& word : response.filler_suggestions) {
      ExpectTrue(word.size() == 3, "fillers should have the target length");
    }
    ExpectTrue(response.recommendations.size() == 9,
               "recommendations default to 9");

    std::string json = wordsieve::Engine::ResponseJson(response);
    ExpectTrue(Contains(json, "\"0\":[\"a\",\"b\",\"c\",\"d\",\"e\"]"),
               "variable positions should render as string keys");
  }

  {
    wordsieve::Engine engine(provider);
    wordsieve::NextMoveRequest request = MakeRequest("english.json", 5);
    request.history.push_back({"crane", "bbxgg"});
    std::string json = engine.CalculateNextMoveJson(request);
    ExpectTrue(Contains(json, "\"error\":\"INVALID_ARGUMENT\""),
               "invalid feedback characters should be INVALID_ARGUMENT");

    request.history.back() = {"crane", "bbg"};
    json = engine.CalculateNextMoveJson(request);
    ExpectTrue(Contains(json, "\"error\":\"INVALID_ARGUMENT\""),
               "short feedback should be INVALID_ARGUMENT");

    request.history.back() = {"crane", "bbgbg"};
    request.history.push_back({"slate", "ggggx"});
    request.dictionary = "missing.json";
    json = engine.CalculateNextMoveJson(request);
    ExpectTrue(Contains(json, "\"error\":\"INVALID_ARGUMENT\""),
               "history should be validated before loading the dictionary");

    json = engine.CalculateNextMoveJson(MakeRequest("english.json", 0));
    ExpectTrue(Contains(json, "\"error\":\"INVALID_ARGUMENT\""),
               "non-positive length should be INVALID_ARGUMENT");

    request = MakeRequest("english.json", 5);
    request.prefix = "s1";
    json = engine.CalculateNextMoveJson(request);
    ExpectTrue(Contains(json, "\"error\":\"INVALID_ARGUMENT\""),
               "non-letter prefix should be INVALID_ARGUMENT");

    request.prefix = "slatey";
    json = engine.CalculateNextMoveJson(request);
    ExpectTrue(Contains(json, "\"error\":\"INVALID_ARGUMENT\""),
               "prefix longer than the word should be INVALID_ARGUMENT");

    request.prefix = "SL";
    wordsieve::NextMoveResponse response;
    wordsieve::Status status = engine.CalculateNextMove(request, &response);
    ExpectTrue(status.ok() && response.remaining_words ==
                                  std::vector<std::string>({"slate"}),
               "uppercase prefix should be lowercased");

    json = engine.CalculateNextMoveJson(MakeRequest("missing.json", 5));
    ExpectTrue(Contains(json, "\"error\":\"DICTIONARY_NOT_FOUND\""),
               "unknown dictionary should be DICTIONARY_NOT_FOUND");
  }

  {
    ThrowingProvider throwing;
    wordsieve::Engine engine(throwing);
    std::string json =
        engine.CalculateNextMoveJson(MakeRequest("english.json", 5));
    ExpectTrue(Contains(json, "\"error\":\"INTERNAL_ERROR\""),
               "unexpected failures should be INTERNAL_ERROR");
    ExpectFalse(Contains(json, "exploded"),
                "internal error messages should be withheld");
  }

  {
    CountingProvider counting(provider);
    wordsieve::DictionaryCache cache(counting);
    wordsieve::DictionaryCache::WordList first;
    wordsieve::DictionaryCache::WordList second;
    ExpectTrue(cache.Get("english.json", &first).ok(), "cache miss loads");
    ExpectTrue(cache.Get("english.json", &second).ok(), "cache hit succeeds");
    ExpectTrue(counting.loads == 1, "second lookup should be served cached");
    ExpectTrue(first == second, "hits should share the cached list");
    ExpectTrue(cache.size() == 1, "one entry cached");

    wordsieve::DictionaryCache::WordList missing;
    wordsieve::Status status = cache.Get("missing.json", &missing);
    ExpectTrue(status.code == wordsieve::ErrorCode::kDictionaryNotFound,
               "cache should pass provider errors through");
    ExpectTrue(cache.size() == 1, "failed loads should not be cached");

    cache.Clear();
    ExpectTrue(cache.Get("english.json", &first).ok() && counting.loads == 3,
               "cleared cache should reload");
  }

  {
    GatedProvider gated(provider, 2);
    wordsieve::DictionaryCache cache(gated);
    wordsieve::DictionaryCache::WordList first;
    wordsieve::DictionaryCache::WordList second;
    wordsieve::Status first_status;
    wordsieve::Status second_status;
    std::thread a([&] { first_status = cache.Get("english.json", &first); });
    std::thread b(
        [&] { second_status = cache.Get("english.json", &second); });
    a.join();
    b.join();
    ExpectTrue(first_status.ok() && second_status.ok(),
               "concurrent misses should both succeed");
    ExpectTrue(gated.loads() == 2, "both concurrent misses should load");
    ExpectTrue(first && second && *first == *second,
               "concurrent misses should see the same words");
    ExpectTrue(first == second,
               "the losing insert should be dropped for the cached list");
    ExpectTrue(cache.size() == 1, "concurrent misses cache one entry");

    wordsieve::DictionaryCache::WordList third;
    ExpectTrue(cache.Get("english.json", &third).ok() && third == first &&
                   gated.loads() == 2,
               "later lookups should hit the surviving entry");
  }

  {
    std::vector<std::string> words;
    wordsieve::Status status = wordsieve::FileDictionaryProvider::
        ParseJsonWordList(" [ \"crane\" ,\n \"Slate\" ] ", &words);
    ExpectTrue(status.ok() &&
                   words == std::vector<std::string>({"crane", "Slate"}),
               "flat JSON list should parse in order");
    status = wordsieve::FileDictionaryProvider::ParseJsonWordList("[]", &words);
    ExpectTrue(status.ok() && words.empty(), "empty JSON list is valid");
    status = wordsieve::FileDictionaryProvider::ParseJsonWordList(
        "[\"a\", 1]", &words);
    ExpectTrue(status.code == wordsieve::ErrorCode::kDictionaryFormat,
               "non-string entries should be a format error");
    status = wordsieve::FileDictionaryProvider::ParseJsonWordList(
        "{\"words\": []}", &words);
    ExpectTrue(status.code == wordsieve::ErrorCode::kDictionaryFormat,
               "objects should be a format error");
    status = wordsieve::FileDictionaryProvider::ParseJsonWordList(
        "[\"a\"] trailing", &words);
    ExpectTrue(status.code == wordsieve::ErrorCode::kDictionaryFormat,
               "trailing data should be a format error");
    status = wordsieve::FileDictionaryProvider::ParseJsonWordList(
        "[\"crane\", ", &words);
    ExpectTrue(status.code == wordsieve::ErrorCode::kDictionaryFormat,
               "truncated JSON should be a format error");
  }

  {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "wordsieve_engine_tests";
    fs::remove_all(dir);
    fs::create_directories(dir);
    WriteFile(dir / "english.json", "[\"Crane\", \"slate\", \"x-ray\"]\n");
    WriteFile(dir / "nested.json", "[[\"crane\"]]");
    WriteFile(dir / "plain.txt", "crane\nslate\n\nplace\n");

    wordsieve::FileDictionaryProvider files(dir.string());
    std::vector<std::string> words;
    wordsieve::Status status = files.Load("english.json", &words);
    ExpectTrue(status.ok() &&
                   words == std::vector<std::string>({"crane", "slate"}),
               "JSON dictionary should load lowercased valid words");
    status = files.Load("plain.txt", &words);
    ExpectTrue(status.ok() && words.size() == 3,
               "text dictionary should load one word per line");
    status = files.Load("nested.json", &words);
    ExpectTrue(status.code == wordsieve::ErrorCode::kDictionaryFormat,
               "nested JSON should be a format error");
    status = files.Load("absent.json", &words);
    ExpectTrue(status.code == wordsieve::ErrorCode::kDictionaryNotFound,
               "missing file should be not found");
    status = files.Load("../english.json", &words);
    ExpectTrue(status.code == wordsieve::ErrorCode::kDictionaryNotFound,
               "path traversal should be not found");

    wordsieve::Engine engine(files);
    std::string json =
        engine.CalculateNextMoveJson(MakeRequest("nested.json", 5));
    ExpectTrue(Contains(json, "\"error\":\"DICTIONARY_NOT_FOUND\""),
               "format errors should surface as DICTIONARY_NOT_FOUND");

    fs::remove_all(dir);
  }

  ExpectTrue(Contains(wordsieve::Engine::HealthCheckJson(), "healthy"),
             "health check should report healthy");

  if (g_failures > 0) {
    std::cerr << g_failures << " test(s) failed.\n";
    return 1;
  }
  std::cout << "All tests passed.\n";
  return 0;
}
