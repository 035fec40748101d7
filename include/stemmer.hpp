#pragma once

#include <string>
#include <utility>
#include <vector>

namespace rustem {

/**
 * Окончание (альтернатива суффикса) в таблице правил
 */
struct Ending {
    std::u32string suffix;
    // Буквы, одна из которых обязана стоять перед суффиксом и остаётся в основе
    // (входит в совпадение, поэтому тоже должна быть не левее границы)
    std::u32string ignore;
    // Буква, которая обязана стоять перед суффиксом, но в совпадение не входит
    std::u32string preceded_by;

    size_t match_length() const { return suffix.size() + (ignore.empty() ? 0 : 1); }
};

/**
 * Упорядоченный набор окончаний: сначала длинные
 */
using EndingRule = std::vector<Ending>;

/**
 * Стеммер Портера для русского языка
 * Основан на алгоритме Snowball Russian Stemmer
 *
 * Не хранит состояния между вызовами, безопасен для одновременного
 * использования из нескольких потоков.
 */
class RussianStemmer {
public:
    using CutResult = std::pair<bool, std::u32string>;

    RussianStemmer() = default;

    /**
     * Применяет стемминг к слову
     * @param word Слово в нижнем регистре (UTF-8)
     * @return Основа слова (всегда префикс входного слова)
     */
    std::string stem(const std::string& word) const;
    std::u32string stem(const std::u32string& word) const;

    /**
     * RV: позиция сразу после первой гласной, либо длина слова
     */
    static size_t find_rv(const std::u32string& word);

    /**
     * R2: позиция после второго сочетания "гласная + негласная", либо длина слова
     */
    static size_t find_r2(const std::u32string& word);

    /**
     * Отрезает первое подходящее окончание правила, начинающееся не левее min_pos
     */
    static CutResult cut(const std::u32string& word, const EndingRule& rule, size_t min_pos);

    // Шаги алгоритма
    std::u32string step1(const std::u32string& word, size_t rv) const;
    std::u32string step2(const std::u32string& word, size_t rv) const;
    std::u32string step3(const std::u32string& word, size_t r2) const;
    std::u32string step4(const std::u32string& word, size_t rv) const;

    static bool is_vowel(char32_t ch);

    // Группы окончаний
    static const EndingRule& perfective_gerund();
    static const EndingRule& adjective();
    static const EndingRule& participle();
    static const EndingRule& reflexive();
    static const EndingRule& verb();
    static const EndingRule& noun();
    static const EndingRule& superlative();
    static const EndingRule& derivational();
    static const EndingRule& letter_i();
    static const EndingRule& double_n();
    static const EndingRule& soft_sign();
};

std::u32string to_utf32(const std::string& text);
std::string to_utf8(const std::u32string& text);

} // namespace rustem
