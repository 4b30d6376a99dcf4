#include "veilguard/scanner/classifier_lexicon.hpp"

#include <cctype>
#include <cmath>

namespace veilguard::scanner {

namespace {

constexpr double DEFAULT_BIAS = -2.0;

std::unordered_map<std::string, double> default_weights() {
  return {
      {"hate", 2.5},      {"hated", 2.5},      {"hates", 2.5},   {"kill", 3.0},
      {"murder", 3.0},    {"destroy", 2.5},    {"terrible", 2.0}, {"worthless", 2.0},
      {"disgusting", 2.0}, {"die", 2.0},       {"weapon", 2.0},  {"bomb", 3.0},
      {"stupid", 1.5},    {"idiot", 1.5},      {"attack", 1.5},  {"hurt", 1.5},
      {"awful", 1.5},     {"horrible", 1.5},   {"useless", 1.5}, {"threaten", 1.5},
      {"trash", 1.0},     {"damn", 1.0},       {"thanks", -1.0}, {"thank", -1.0},
      {"please", -0.5},   {"love", -1.0},      {"great", -1.0},  {"help", -0.5},
  };
}

double sigmoid(const double z) { return 1.0 / (1.0 + std::exp(-z)); }

} // namespace

LexiconClassifier::LexiconClassifier() : LexiconClassifier(default_weights(), DEFAULT_BIAS) {}

LexiconClassifier::LexiconClassifier(std::unordered_map<std::string, double> weights,
                                     const double bias)
    : weights_(std::move(weights)), bias_(bias) {}

double LexiconClassifier::hostility(const std::string &text) const {
  double z = bias_;
  std::string word;
  const auto flush = [&]() {
    if (word.empty()) {
      return;
    }
    if (const auto it = weights_.find(word); it != weights_.end()) {
      z += it->second;
    }
    word.clear();
  };

  for (const char ch : text) {
    const auto uch = static_cast<unsigned char>(ch);
    if (std::isalpha(uch) != 0) {
      word.push_back(static_cast<char>(std::tolower(uch)));
    } else {
      flush();
    }
  }
  flush();
  return sigmoid(z);
}

common::Result<LabelDistribution> LexiconClassifier::classify(const std::string &text) {
  const double negative = hostility(text);
  return common::Result<LabelDistribution>::success(LabelDistribution{
      LabelScore{.label = "NEGATIVE", .score = negative},
      LabelScore{.label = "POSITIVE", .score = 1.0 - negative},
  });
}

} // namespace veilguard::scanner
