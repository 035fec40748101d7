#include "tokenizer.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace rustem {

namespace {

// Длина UTF-8 последовательности по первому байту
size_t sequence_length(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;
}

bool is_cyrillic_letter(unsigned char c1, unsigned char c2) {
    // А-Я, а-п: D0 90..BF; р-я: D1 80..8F. Ё/ё сюда не входят
    return (c1 == 0xD0 && c2 >= 0x90 && c2 <= 0xBF) ||
           (c1 == 0xD1 && c2 >= 0x80 && c2 <= 0x8F);
}

// U+2000..U+200A, U+2028, U+2029, U+202F, U+205F, U+3000
bool is_wide_space(unsigned char c1, unsigned char c2, unsigned char c3) {
    if (c1 == 0xE2 && c2 == 0x80) {
        return c3 <= 0x8A || c3 == 0xA8 || c3 == 0xA9 || c3 == 0xAF;
    }
    if (c1 == 0xE2 && c2 == 0x81) return c3 == 0x9F;
    return c1 == 0xE3 && c2 == 0x80 && c3 == 0x80;
}

size_t utf8_length(const std::string& str) {
    size_t length = 0;
    for (unsigned char c : str) {
        if ((c & 0xC0) != 0x80) ++length;
    }
    return length;
}

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

}

Tokenizer::Tokenizer() : Tokenizer(Config{}) {}

Tokenizer::Tokenizer(const Config& config) : config_(config) {
    init_stop_words();
}

void Tokenizer::init_stop_words() {
    stop_words_ = {
        "и", "в", "во", "не", "что", "он", "на", "я", "с", "со", "как", "а", "то", "все",
        "она", "так", "его", "но", "да", "ты", "к", "у", "же", "вы", "за", "бы", "по",
        "только", "мне", "было", "вот", "от", "меня", "нет", "о", "из", "ему",
        "для", "при", "без", "до", "под", "над", "об", "про", "это", "этот", "эта", "эти",
        "был", "была", "были", "быть", "есть", "или", "также", "который", "которая",
        "которое", "которые", "где", "когда", "если", "чем", "их", "уже", "после", "ли"
    };
}

void Tokenizer::load_stop_words(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open stop words file: " + path);
    }

    stop_words_.clear();
    std::string line;
    while (std::getline(file, line)) {
        std::string word = to_lower(trim(line));
        if (!word.empty()) {
            stop_words_.insert(word);
        }
    }
}

bool Tokenizer::is_stop_word(const std::string& word) const {
    return stop_words_.find(word) != stop_words_.end();
}

std::string Tokenizer::to_lower(const std::string& str) const {
    std::string result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        unsigned char c = str[i];

        if (c < 128) {
            result += static_cast<char>(std::tolower(c));
        } else if ((c & 0xE0) == 0xC0 && i + 1 < str.size()) {
            unsigned char c2 = str[i + 1];

            if (c == 0xD0 && c2 >= 0x90 && c2 <= 0x9F) {
                // А-П -> а-п
                result += static_cast<char>(0xD0);
                result += static_cast<char>(c2 + 0x20);
            } else if (c == 0xD0 && c2 >= 0xA0 && c2 <= 0xAF) {
                // Р-Я -> р-я
                result += static_cast<char>(0xD1);
                result += static_cast<char>(c2 - 0x20);
            } else if (c == 0xD0 && c2 == 0x81) {
                // Ё -> ё
                result += static_cast<char>(0xD1);
                result += static_cast<char>(0x91);
            } else {
                result += static_cast<char>(c);
                result += static_cast<char>(c2);
            }
            ++i;
        } else {
            result += static_cast<char>(c);
        }
    }

    return result;
}

std::string Tokenizer::normalize(const std::string& text) const {
    std::string source = config_.lowercase ? to_lower(text) : text;

    std::string result;
    result.reserve(source.size());

    for (size_t i = 0; i < source.size();) {
        unsigned char c = source[i];
        size_t len = sequence_length(c);

        if (len == 1) {
            if (std::isalpha(c)) {
                result += static_cast<char>(c);
            } else if (std::isspace(c)) {
                result += ' ';
            }
        } else if (len == 2 && i + 1 < source.size()) {
            unsigned char c2 = source[i + 1];
            if (is_cyrillic_letter(c, c2)) {
                result += static_cast<char>(c);
                result += static_cast<char>(c2);
            } else if (c == 0xC2 && c2 == 0xA0) {
                // неразрывный пробел
                result += ' ';
            }
        } else if (len == 3 && i + 2 < source.size()) {
            if (is_wide_space(c, source[i + 1], source[i + 2])) {
                result += ' ';
            }
        }

        i += std::min(len, source.size() - i);
    }

    return result;
}

std::vector<std::string> Tokenizer::tokenize(const std::string& text) const {
    std::string normalized = normalize(text);

    std::vector<std::string> tokens;
    std::string current_token;

    auto flush = [&]() {
        if (current_token.empty()) return;
        if (utf8_length(current_token) >= config_.min_length) {
            if (!config_.remove_stopwords || !is_stop_word(current_token)) {
                tokens.push_back(current_token);
            }
        }
        current_token.clear();
    };

    for (char c : normalized) {
        if (c == ' ') {
            flush();
        } else {
            current_token += c;
        }
    }
    flush();

    return tokens;
}

}
