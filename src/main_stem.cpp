#include "stemmer.hpp"
#include "tokenizer.hpp"
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    bool raw = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--raw") {
            raw = true;
        } else {
            std::cout << "Usage: " << argv[0] << " [--raw] < words.txt\n\n"
                      << "Prints \"word stem\" for every word read from stdin.\n"
                      << "  --raw  stem words as given, without lowercasing and filtering\n";
            return arg == "--help" ? 0 : 1;
        }
    }

    rustem::Tokenizer::Config tok_config;
    tok_config.remove_stopwords = false;
    rustem::Tokenizer tokenizer(tok_config);
    rustem::RussianStemmer stemmer;

    std::string word;
    while (std::cin >> word) {
        if (raw) {
            std::cout << word << " " << stemmer.stem(word) << "\n";
            continue;
        }
        for (const auto& token : tokenizer.tokenize(word)) {
            std::cout << token << " " << stemmer.stem(token) << "\n";
        }
    }

    return 0;
}
