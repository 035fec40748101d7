#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>

#include "stemmer.hpp"
#include "tokenizer.hpp"

namespace rustem {

struct ClassifierStats {
    size_t train_documents = 0;
    size_t skipped_documents = 0;
    size_t train_tokens = 0;
    size_t test_documents = 0;
    double training_time_sec = 0.0;
    double classification_time_sec = 0.0;

    std::unordered_map<std::string, size_t> documents_per_category;

    double train_docs_per_second() const;
    double test_docs_per_second() const;
};

struct Classification {
    std::string label;
    // Scores in category enumeration order
    std::vector<std::pair<std::string, size_t>> scores;
};

/**
 * Nearest-vocabulary news classifier.
 *
 * Every category keeps the set of stems seen in its training documents.
 * A document gets the category whose vocabulary covers most of its stems.
 */
class NewsClassifier {
public:
    struct Config {
        std::vector<std::string> categories;
        Tokenizer::Config tokenizer;
        size_t progress_every = 1000;
    };

    explicit NewsClassifier(const Config& config);

    Tokenizer& tokenizer() { return tokenizer_; }
    const Tokenizer& tokenizer() const { return tokenizer_; }

    std::vector<std::string> stems(const std::string& text) const;

    /**
     * Adds the stems of text to the category vocabulary.
     * @return false if the category is not in the enumeration
     */
    bool train(const std::string& category, const std::string& text);

    /**
     * Reads "category<TAB>text" lines. Throws std::runtime_error if the file cannot be opened.
     * @return number of documents used for training
     */
    size_t train_file(const std::string& path, size_t limit = 0);

    Classification classify(const std::string& text) const;

    /**
     * Writes one label per line of input into output.
     * @return number of labelled documents
     */
    size_t classify_file(const std::string& input_path, const std::string& output_path);

    const std::vector<std::string>& categories() const { return config_.categories; }
    const std::unordered_set<std::string>& vocabulary(const std::string& category) const;
    const ClassifierStats& stats() const { return stats_; }

private:
    Config config_;
    Tokenizer tokenizer_;
    RussianStemmer stemmer_;
    ClassifierStats stats_;

    std::unordered_map<std::string, std::unordered_set<std::string>> vocabularies_;
};

}
