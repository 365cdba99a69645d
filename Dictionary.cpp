#include "Solver.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

namespace wordsieve {
namespace {
using json = nlohmann::json;

bool IsSafeId(const std::string& id) {
  if (id.empty()) {
    return false;
  }
  if (id.find('/') != std::string::npos ||
      id.find('\\') != std::string::npos ||
      id.find("..") != std::string::npos) {
    return false;
  }
  return true;
}

bool EndsWith(const std::string& text, const std::string& suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) ==
             0;
}

// Lowercases entries and drops anything that is not a plain a-z word.
std::vector<std::string> NormalizeWordList(const std::string& id,
                                           std::vector<std::string> raw) {
  std::vector<std::string> words;
  words.reserve(raw.size());
  size_t skipped = 0;
  for (auto& entry : raw) {
    std::string word = ToLowerAscii(entry);
    if (!IsValidWord(word)) {
      ++skipped;
      continue;
    }
    words.push_back(std::move(word));
  }
  if (skipped > 0) {
    std::cerr << "Dictionary '" << id << "': skipped " << skipped
              << " entries with non-letter characters\n";
  }
  return words;
}
}  // namespace

FileDictionaryProvider::FileDictionaryProvider(std::string root)
    : root_(std::move(root)) {}

Status FileDictionaryProvider::Load(const std::string& id,
                                    std::vector<std::string>* out) const {
  if (!out) {
    return Status::Internal("FileDictionaryProvider: null output");
  }
  if (!IsSafeId(id)) {
    return Status::DictionaryNotFound("Dictionary '" + id + "' not found");
  }
  std::string path = root_.empty() ? id : root_ + "/" + id;
  std::ifstream infile(path);
  if (!infile) {
    return Status::DictionaryNotFound("Dictionary '" + id + "' not found");
  }
  std::ostringstream buffer;
  buffer << infile.rdbuf();
  const std::string text = buffer.str();

  std::vector<std::string> raw;
  if (EndsWith(id, ".json")) {
    Status status = ParseJsonWordList(text, &raw);
    if (!status.ok()) {
      status.message = "Failed to load dictionary '" + id + "': " +
                       status.message;
      return status;
    }
  } else {
    std::istringstream iss(text);
    std::string token;
    while (iss >> token) {
      raw.push_back(token);
    }
  }
  *out = NormalizeWordList(id, std::move(raw));
  return Status::Ok();
}

Status FileDictionaryProvider::ParseJsonWordList(
    const std::string& text,
    std::vector<std::string>* out) {
  const Status format_error =
      Status::DictionaryFormat("Invalid dictionary format (expected a flat "
                               "JSON list of strings)");
  if (!out) {
    return Status::Internal("ParseJsonWordList: null output");
  }
  const json parsed = json::parse(text, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_array()) {
    return format_error;
  }
  std::vector<std::string> words;
  words.reserve(parsed.size());
  for (const json& entry : parsed) {
    if (!entry.is_string()) {
      return format_error;
    }
    words.push_back(entry.get<std::string>());
  }
  *out = std::move(words);
  return Status::Ok();
}

void InMemoryDictionaryProvider::Add(const std::string& id,
                                     std::vector<std::string> words) {
  dictionaries_[id] = NormalizeWordList(id, std::move(words));
}

Status InMemoryDictionaryProvider::Load(const std::string& id,
                                        std::vector<std::string>* out) const {
  if (!out) {
    return Status::Internal("InMemoryDictionaryProvider: null output");
  }
  auto it = dictionaries_.find(id);
  if (it == dictionaries_.end()) {
    return Status::DictionaryNotFound("Dictionary '" + id + "' not found");
  }
  *out = it->second;
  return Status::Ok();
}

DictionaryCache::DictionaryCache(const DictionaryProvider& provider)
    : provider_(provider) {}

// The provider runs outside the lock. Two concurrent misses may both load the
// same id; the lists are immutable and identical, so whichever insert lands
// first is kept and the other is dropped.
Status DictionaryCache::Get(const std::string& id, WordList* out) {
  if (!out) {
    return Status::Internal("DictionaryCache: null output");
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it != entries_.end()) {
      *out = it->second;
      return Status::Ok();
    }
  }

  std::vector<std::string> words;
  Status status = provider_.Load(id, &words);
  if (!status.ok()) {
    return status;
  }
  WordList loaded =
      std::make_shared<const std::vector<std::string>>(std::move(words));

  std::lock_guard<std::mutex> lock(mutex_);
  auto result = entries_.emplace(id, std::move(loaded));
  *out = result.first->second;
  return Status::Ok();
}

size_t DictionaryCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void DictionaryCache::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
}

}  // namespace wordsieve
