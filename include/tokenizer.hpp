#pragma once

#include <string>
#include <vector>
#include <unordered_set>

namespace rustem {

class Tokenizer {
public:
    struct Config {
        size_t min_length = 1;
        bool lowercase = true;
        bool remove_stopwords = true;
    };

    Tokenizer();
    explicit Tokenizer(const Config& config);

    /**
     * Приводит к нижнему регистру и удаляет всё, кроме a-z, а-я и пробельных символов
     */
    std::string normalize(const std::string& text) const;
    std::vector<std::string> tokenize(const std::string& text) const;

    void load_stop_words(const std::string& path);
    bool is_stop_word(const std::string& word) const;
    size_t stop_words_count() const { return stop_words_.size(); }

private:
    Config config_;
    std::unordered_set<std::string> stop_words_;

    void init_stop_words();
    std::string to_lower(const std::string& str) const;
};

}
