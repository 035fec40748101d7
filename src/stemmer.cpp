#include "stemmer.hpp"
#include <algorithm>
#include <codecvt>
#include <locale>
#include <stdexcept>

namespace rustem {

namespace {

const std::u32string VOWELS = U"аеиоуыэюя";
const std::u32string IGNORE_A_YA = U"ая";

// Группа 1 требует предшествующую 'а' или 'я', группа 2 - без условий.
// Итоговый порядок: по убыванию длины совпадения, чтобы первое найденное
// окончание было самым длинным из возможных.
EndingRule make_rule(const std::vector<std::u32string>& group1,
                     const std::vector<std::u32string>& group2) {
    EndingRule rule;
    rule.reserve(group1.size() + group2.size());
    for (const auto& suffix : group1) {
        rule.push_back(Ending{suffix, IGNORE_A_YA, U""});
    }
    for (const auto& suffix : group2) {
        rule.push_back(Ending{suffix, U"", U""});
    }
    std::stable_sort(rule.begin(), rule.end(), [](const Ending& a, const Ending& b) {
        return a.match_length() > b.match_length();
    });
    return rule;
}

EndingRule make_rule(const std::vector<std::u32string>& endings) {
    return make_rule({}, endings);
}

} // namespace

std::u32string to_utf32(const std::string& text) {
    std::wstring_convert<std::codecvt_utf8<char32_t>, char32_t> converter;
    return converter.from_bytes(text);
}

std::string to_utf8(const std::u32string& text) {
    std::wstring_convert<std::codecvt_utf8<char32_t>, char32_t> converter;
    return converter.to_bytes(text);
}

const EndingRule& RussianStemmer::perfective_gerund() {
    static const EndingRule rule = make_rule(
        {U"в", U"вши", U"вшись"},
        {U"ив", U"ивши", U"ившись", U"ыв", U"ывши", U"ывшись"});
    return rule;
}

const EndingRule& RussianStemmer::adjective() {
    static const EndingRule rule = make_rule({
        U"ее", U"ие", U"ые", U"ое", U"ими", U"ыми", U"ей", U"ий", U"ый", U"ой",
        U"ем", U"им", U"ым", U"ом", U"его", U"ого", U"ему", U"ому", U"их", U"ых",
        U"ую", U"юю", U"ая", U"яя", U"ою", U"ею"
    });
    return rule;
}

const EndingRule& RussianStemmer::participle() {
    static const EndingRule rule = make_rule(
        {U"ем", U"нн", U"вш", U"ющ", U"щ"},
        {U"ивш", U"ывш", U"ующ"});
    return rule;
}

const EndingRule& RussianStemmer::reflexive() {
    static const EndingRule rule = make_rule({U"ся", U"сь"});
    return rule;
}

const EndingRule& RussianStemmer::verb() {
    static const EndingRule rule = make_rule(
        {U"ла", U"на", U"ете", U"йте", U"ли", U"й", U"л", U"ем", U"н", U"ло",
         U"но", U"ет", U"ют", U"ны", U"ть", U"ешь", U"нно"},
        {U"ила", U"ыла", U"ена", U"ейте", U"уйте", U"ите", U"или", U"ыли", U"ей",
         U"уй", U"ил", U"ыл", U"им", U"ым", U"ен", U"ило", U"ыло", U"ено", U"ят",
         U"ует", U"уют", U"ит", U"ыт", U"ены", U"ить", U"ыть", U"ишь", U"ую", U"ю"});
    return rule;
}

const EndingRule& RussianStemmer::noun() {
    static const EndingRule rule = make_rule({
        U"а", U"ев", U"ов", U"ие", U"ье", U"е", U"иями", U"ями", U"ами", U"еи",
        U"ии", U"и", U"ией", U"ей", U"ой", U"ий", U"й", U"иям", U"ям", U"ием",
        U"ем", U"ам", U"ом", U"о", U"у", U"ах", U"иях", U"ях", U"ы", U"ь",
        U"ию", U"ью", U"ю", U"ия", U"ья", U"я"
    });
    return rule;
}

const EndingRule& RussianStemmer::superlative() {
    static const EndingRule rule = make_rule({U"ейш", U"ейше"});
    return rule;
}

const EndingRule& RussianStemmer::derivational() {
    static const EndingRule rule = make_rule({U"ост", U"ость"});
    return rule;
}

const EndingRule& RussianStemmer::letter_i() {
    static const EndingRule rule = make_rule({U"и"});
    return rule;
}

const EndingRule& RussianStemmer::double_n() {
    static const EndingRule rule = {Ending{U"н", U"", U"н"}};
    return rule;
}

const EndingRule& RussianStemmer::soft_sign() {
    static const EndingRule rule = make_rule({U"ь"});
    return rule;
}

bool RussianStemmer::is_vowel(char32_t ch) {
    return VOWELS.find(ch) != std::u32string::npos;
}

size_t RussianStemmer::find_rv(const std::u32string& word) {
    for (size_t i = 0; i < word.size(); ++i) {
        if (is_vowel(word[i])) {
            return i + 1;
        }
    }
    return word.size();
}

size_t RussianStemmer::find_r2(const std::u32string& word) {
    // Конец первого сочетания "гласная + негласная", начиная с from
    auto find_region = [&word](size_t from) -> size_t {
        for (size_t i = from; i + 1 < word.size(); ++i) {
            if (is_vowel(word[i]) && !is_vowel(word[i + 1])) {
                return i + 2;
            }
        }
        return std::u32string::npos;
    };

    size_t r1 = find_region(0);
    if (r1 == std::u32string::npos) {
        return word.size();
    }
    size_t r2 = find_region(r1);
    if (r2 == std::u32string::npos) {
        return word.size();
    }
    return r2;
}

RussianStemmer::CutResult RussianStemmer::cut(const std::u32string& word,
                                              const EndingRule& rule,
                                              size_t min_pos) {
    for (const auto& ending : rule) {
        const size_t length = ending.match_length();
        if (length > word.size()) continue;

        const size_t start = word.size() - length;
        if (start < min_pos) continue;

        const size_t suffix_start = word.size() - ending.suffix.size();
        if (word.compare(suffix_start, ending.suffix.size(), ending.suffix) != 0) continue;

        if (!ending.ignore.empty()) {
            if (ending.ignore.find(word[start]) == std::u32string::npos) continue;
            // Не отрезаем 'а'/'я' перед окончанием
            return {true, word.substr(0, suffix_start)};
        }

        if (!ending.preceded_by.empty()) {
            if (start == 0 || ending.preceded_by.find(word[start - 1]) == std::u32string::npos) {
                continue;
            }
        }

        return {true, word.substr(0, start)};
    }
    return {false, word};
}

std::u32string RussianStemmer::step1(const std::u32string& word, size_t rv) const {
    auto gerund = cut(word, perfective_gerund(), rv);
    if (gerund.first) {
        return gerund.second;
    }

    std::u32string result = cut(word, reflexive(), rv).second;

    auto adj = cut(result, adjective(), rv);
    if (adj.first) {
        return cut(adj.second, participle(), rv).second;
    }

    auto vrb = cut(result, verb(), rv);
    if (vrb.first) {
        return vrb.second;
    }

    return cut(result, noun(), rv).second;
}

std::u32string RussianStemmer::step2(const std::u32string& word, size_t rv) const {
    return cut(word, letter_i(), rv).second;
}

std::u32string RussianStemmer::step3(const std::u32string& word, size_t r2) const {
    return cut(word, derivational(), r2).second;
}

std::u32string RussianStemmer::step4(const std::u32string& word, size_t rv) const {
    std::u32string result = cut(word, superlative(), rv).second;

    // 'нн' -> 'н', иначе убираем 'ь'
    auto nn = cut(result, double_n(), rv);
    if (nn.first) {
        return nn.second;
    }
    return cut(result, soft_sign(), rv).second;
}

std::u32string RussianStemmer::stem(const std::u32string& word) const {
    const size_t rv = find_rv(word);
    const size_t r2 = find_r2(word);

    std::u32string result = step1(word, rv);
    result = step2(result, rv);
    result = step3(result, r2);
    result = step4(result, rv);

    return result;
}

std::string RussianStemmer::stem(const std::string& word) const {
    if (word.empty()) {
        return word;
    }

    std::u32string word32;
    try {
        word32 = to_utf32(word);
    } catch (const std::range_error&) {
        // Не UTF-8: в слове нет букв алфавита, правила к нему не применимы
        return word;
    }

    return to_utf8(stem(word32));
}

} // namespace rustem
