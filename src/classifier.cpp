#include "classifier.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace rustem {

double ClassifierStats::train_docs_per_second() const {
    if (training_time_sec <= 0) return 0;
    return train_documents / training_time_sec;
}

double ClassifierStats::test_docs_per_second() const {
    if (classification_time_sec <= 0) return 0;
    return test_documents / classification_time_sec;
}

NewsClassifier::NewsClassifier(const Config& config)
    : config_(config), tokenizer_(config.tokenizer) {
    if (config_.categories.empty()) {
        throw std::invalid_argument("NewsClassifier needs at least one category");
    }
    for (const auto& category : config_.categories) {
        vocabularies_[category];
        stats_.documents_per_category[category] = 0;
    }
}

std::vector<std::string> NewsClassifier::stems(const std::string& text) const {
    std::vector<std::string> result;
    for (const auto& token : tokenizer_.tokenize(text)) {
        result.push_back(stemmer_.stem(token));
    }
    return result;
}

bool NewsClassifier::train(const std::string& category, const std::string& text) {
    auto it = vocabularies_.find(category);
    if (it == vocabularies_.end()) {
        return false;
    }

    auto document_stems = stems(text);
    it->second.insert(document_stems.begin(), document_stems.end());

    stats_.train_tokens += document_stems.size();
    stats_.train_documents++;
    stats_.documents_per_category[category]++;
    return true;
}

size_t NewsClassifier::train_file(const std::string& path, size_t limit) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open training file: " + path);
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    size_t used = 0;
    size_t line_number = 0;
    std::string line;

    while (std::getline(file, line)) {
        ++line_number;
        if (limit > 0 && used >= limit) break;

        size_t tab = line.find('\t');
        if (tab == std::string::npos) {
            std::cerr << "Warning: " << path << ":" << line_number << ": no category, line skipped\n";
            stats_.skipped_documents++;
            continue;
        }

        std::string category = line.substr(0, tab);
        if (!train(category, line.substr(tab + 1))) {
            std::cerr << "Warning: " << path << ":" << line_number
                      << ": unknown category '" << category << "', line skipped\n";
            stats_.skipped_documents++;
            continue;
        }

        ++used;
        if (config_.progress_every > 0 && used % config_.progress_every == 0) {
            std::cout << "  [train] " << used << " documents\n";
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    stats_.training_time_sec += std::chrono::duration<double>(end_time - start_time).count();

    return used;
}

Classification NewsClassifier::classify(const std::string& text) const {
    Classification result;
    for (const auto& category : config_.categories) {
        result.scores.emplace_back(category, 0);
    }

    for (const auto& stem : stems(text)) {
        for (auto& score : result.scores) {
            if (vocabularies_.at(score.first).count(stem)) {
                score.second++;
            }
        }
    }

    // Strictly greater: ties go to the category listed first
    size_t best = 0;
    for (size_t i = 1; i < result.scores.size(); ++i) {
        if (result.scores[i].second > result.scores[best].second) {
            best = i;
        }
    }
    result.label = result.scores[best].first;

    return result;
}

size_t NewsClassifier::classify_file(const std::string& input_path, const std::string& output_path) {
    std::ifstream input(input_path);
    if (!input.is_open()) {
        throw std::runtime_error("Cannot open test file: " + input_path);
    }

    std::ofstream output(output_path);
    if (!output.is_open()) {
        throw std::runtime_error("Cannot open output file: " + output_path);
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    size_t count = 0;
    std::string line;
    while (std::getline(input, line)) {
        output << classify(line).label << '\n';
        ++count;

        if (config_.progress_every > 0 && count % config_.progress_every == 0) {
            std::cout << "  [test] " << count << " documents\n";
        }
    }

    if (!output) {
        throw std::runtime_error("Write failed: " + output_path);
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    stats_.classification_time_sec += std::chrono::duration<double>(end_time - start_time).count();
    stats_.test_documents += count;

    return count;
}

const std::unordered_set<std::string>& NewsClassifier::vocabulary(const std::string& category) const {
    auto it = vocabularies_.find(category);
    if (it == vocabularies_.end()) {
        throw std::out_of_range("Unknown category: " + category);
    }
    return it->second;
}

}
