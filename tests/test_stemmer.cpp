#include "stemmer.hpp"
#include <gtest/gtest.h>

#include <random>
#include <string>
#include <thread>
#include <vector>

using rustem::RussianStemmer;

namespace {

const std::vector<std::string> kWords = {
    "", "бгд", "вртск", "сделавшись", "читавши", "прочитав", "умывшись", "красивейшие",
    "длинный", "красивый", "читающий", "читающая", "одеваться", "умывалась", "дорогой",
    "дороги", "книга", "книги", "машинами", "радость", "активность", "новейший", "ценн",
    "каменн", "конь", "дверь", "сон", "завтрашний", "благодарность", "строить", "строили",
    "читаем", "делают", "мальчик", "россии", "армии", "зданиями", "бегом", "испытание",
    "делаешь", "war", "бежать", "мыться", "бился", "ась", "сь", "учёный", "ёлка",
    "известность", "обученн", "путь", "рассказывающая", "писавшие", "стеклянн", "аа"
};

// Случайные слова: основа из алфавита плюс окончание из таблиц
std::vector<std::u32string> generated_words(size_t count) {
    const std::u32string alphabet = U"абвгдеёжзийклмнопрстуфхцчшщъыьэюя";
    const std::vector<const rustem::EndingRule*> rules = {
        &RussianStemmer::perfective_gerund(), &RussianStemmer::adjective(),
        &RussianStemmer::participle(), &RussianStemmer::reflexive(),
        &RussianStemmer::verb(), &RussianStemmer::noun(),
        &RussianStemmer::superlative(), &RussianStemmer::derivational()
    };

    std::mt19937 rng(20240517);
    std::uniform_int_distribution<size_t> length(0, 8);
    std::uniform_int_distribution<size_t> letter(0, alphabet.size() - 1);
    std::uniform_int_distribution<size_t> rule(0, rules.size());

    std::vector<std::u32string> words;
    words.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        std::u32string word;
        for (size_t n = length(rng); n > 0; --n) {
            word += alphabet[letter(rng)];
        }
        size_t r = rule(rng);
        if (r < rules.size()) {
            const auto& endings = *rules[r];
            std::uniform_int_distribution<size_t> pick(0, endings.size() - 1);
            const auto& ending = endings[pick(rng)];
            word += ending.preceded_by + ending.ignore.substr(0, 1) + ending.suffix;
        }
        words.push_back(word);
    }
    return words;
}

bool is_prefix(const std::u32string& prefix, const std::u32string& word) {
    return word.compare(0, prefix.size(), prefix) == 0;
}

}

TEST(RussianStemmer, KnownStems) {
    RussianStemmer stemmer;
    EXPECT_EQ(stemmer.stem(std::string("красивый")), "красив");
    EXPECT_EQ(stemmer.stem(std::string("красивейшие")), "красив");
    EXPECT_EQ(stemmer.stem(std::string("длинный")), "длин");
    EXPECT_EQ(stemmer.stem(std::string("книги")), "книг");
    EXPECT_EQ(stemmer.stem(std::string("машинами")), "машин");
    EXPECT_EQ(stemmer.stem(std::string("активность")), "активн");
    EXPECT_EQ(stemmer.stem(std::string("благодарность")), "благодарн");
    EXPECT_EQ(stemmer.stem(std::string("новейший")), "нов");
    EXPECT_EQ(stemmer.stem(std::string("прекраснейшая")), "прекрасн");
    EXPECT_EQ(stemmer.stem(std::string("зданиями")), "здан");
    EXPECT_EQ(stemmer.stem(std::string("испытание")), "испытан");
    EXPECT_EQ(stemmer.stem(std::string("строили")), "стро");
    EXPECT_EQ(stemmer.stem(std::string("делаешь")), "дела");
    EXPECT_EQ(stemmer.stem(std::string("мыслей")), "мысл");
    EXPECT_EQ(stemmer.stem(std::string("мальчик")), "мальчик");
}

TEST(RussianStemmer, WordWithoutVowelsIsUnchanged) {
    RussianStemmer stemmer;
    EXPECT_EQ(RussianStemmer::find_rv(U"бгд"), 3u);
    EXPECT_EQ(stemmer.stem(std::string("бгд")), "бгд");
    EXPECT_EQ(stemmer.stem(std::string("вртск")), "вртск");
}

TEST(RussianStemmer, EmptyWord) {
    RussianStemmer stemmer;
    EXPECT_EQ(stemmer.stem(std::string()), "");
    EXPECT_EQ(stemmer.stem(std::u32string()), U"");
    EXPECT_EQ(RussianStemmer::find_rv(U""), 0u);
    EXPECT_EQ(RussianStemmer::find_r2(U""), 0u);
}

TEST(RussianStemmer, ReflexiveOnly) {
    RussianStemmer stemmer;
    EXPECT_EQ(stemmer.stem(std::string("ась")), "а");
    EXPECT_EQ(stemmer.stem(std::string("бился")), "бил");
    // RV = 2: "сь" начинается левее границы
    EXPECT_EQ(stemmer.stem(std::string("сь")), "сь");
}

TEST(RussianStemmer, GerundKeepsIgnoreLetter) {
    RussianStemmer stemmer;
    EXPECT_EQ(stemmer.stem(std::string("читавши")), "чита");
    EXPECT_EQ(stemmer.stem(std::string("прочитав")), "прочита");
    EXPECT_EQ(stemmer.stem(std::string("сделавшись")), "сдела");
    EXPECT_EQ(stemmer.stem(std::string("умывшись")), "ум");
}

TEST(RussianStemmer, DoubleNAndSoftSign) {
    RussianStemmer stemmer;
    EXPECT_EQ(stemmer.stem(std::string("ценн")), "цен");
    EXPECT_EQ(stemmer.stem(std::string("каменн")), "камен");
    EXPECT_EQ(stemmer.stem(std::string("сон")), "сон");
    EXPECT_EQ(stemmer.stem(std::string("конь")), "кон");
    EXPECT_EQ(stemmer.stem(std::string("путь")), "пут");
}

TEST(RussianStemmer, NonAlphabetInputPassesThrough) {
    RussianStemmer stemmer;
    EXPECT_EQ(stemmer.stem(std::string("war")), "war");
    EXPECT_EQ(stemmer.stem(std::string("ВОДА")), "ВОДА");
    EXPECT_EQ(stemmer.stem(std::string("ёлка")), "ёлка");
    // некорректный UTF-8
    EXPECT_EQ(stemmer.stem(std::string("\xD0\xD0\xFF")), "\xD0\xD0\xFF");
}

TEST(RussianStemmer, Regions) {
    EXPECT_EQ(RussianStemmer::find_rv(U"прочитав"), 3u);
    EXPECT_EQ(RussianStemmer::find_r2(U"прочитав"), 6u);
    EXPECT_EQ(RussianStemmer::find_rv(U"благодарность"), 3u);
    EXPECT_EQ(RussianStemmer::find_r2(U"благодарность"), 6u);
    EXPECT_EQ(RussianStemmer::find_r2(U"ценность"), 6u);
    EXPECT_EQ(RussianStemmer::find_rv(U"армии"), 1u);
    EXPECT_EQ(RussianStemmer::find_r2(U"армии"), 5u);
    // только одно сочетание "гласная + согласная"
    EXPECT_EQ(RussianStemmer::find_r2(U"сон"), 3u);
    EXPECT_EQ(RussianStemmer::find_r2(U"ёлка"), 4u);
}

TEST(RussianStemmer, CutRespectsBoundary) {
    const auto& gerund = RussianStemmer::perfective_gerund();
    EXPECT_EQ(RussianStemmer::cut(U"прочитав", gerund, 3), std::make_pair(true, std::u32string(U"прочита")));
    EXPECT_EQ(RussianStemmer::cut(U"прочитав", gerund, 6), std::make_pair(true, std::u32string(U"прочита")));
    // оставляемая 'а' тоже должна быть не левее границы
    EXPECT_EQ(RussianStemmer::cut(U"прочитав", gerund, 7), std::make_pair(false, std::u32string(U"прочитав")));
}

TEST(RussianStemmer, CutDoubleN) {
    const auto& nn = RussianStemmer::double_n();
    EXPECT_EQ(RussianStemmer::cut(U"длинн", nn, 4), std::make_pair(true, std::u32string(U"длин")));
    EXPECT_EQ(RussianStemmer::cut(U"длинн", nn, 5), std::make_pair(false, std::u32string(U"длинн")));
    EXPECT_EQ(RussianStemmer::cut(U"н", nn, 0), std::make_pair(false, std::u32string(U"н")));
    EXPECT_FALSE(RussianStemmer::cut(U"стекло", nn, 0).first);
}

TEST(RussianStemmer, CutPrefersLongestEnding) {
    EXPECT_EQ(RussianStemmer::cut(U"зданиями", RussianStemmer::noun(), 3).second, U"здан");
    EXPECT_EQ(RussianStemmer::cut(U"новейше", RussianStemmer::superlative(), 2).second, U"нов");
    EXPECT_EQ(RussianStemmer::cut(U"радость", RussianStemmer::derivational(), 2).second, U"рад");
}

TEST(RussianStemmer, RulesAreOrderedLongestFirst) {
    const std::vector<const rustem::EndingRule*> rules = {
        &RussianStemmer::perfective_gerund(), &RussianStemmer::adjective(),
        &RussianStemmer::participle(), &RussianStemmer::reflexive(),
        &RussianStemmer::verb(), &RussianStemmer::noun(),
        &RussianStemmer::superlative(), &RussianStemmer::derivational()
    };
    for (const auto* rule : rules) {
        for (size_t i = 1; i < rule->size(); ++i) {
            EXPECT_GE((*rule)[i - 1].match_length(), (*rule)[i].match_length());
        }
    }
}

TEST(RussianStemmer, Step1Branches) {
    RussianStemmer stemmer;
    // деепричастие
    EXPECT_EQ(stemmer.step1(U"читавши", 2), U"чита");
    // возвратное + прилагательное + причастие
    EXPECT_EQ(stemmer.step1(U"одевающийся", 1), U"одева");
    EXPECT_EQ(stemmer.step1(U"красивейшие", 3), U"красивейш");
    // причастие без прилагательного не отрезается
    EXPECT_EQ(stemmer.step1(U"читающ", 2), U"читающ");
    // глагол, существительное
    EXPECT_EQ(stemmer.step1(U"делаешь", 2), U"дела");
    EXPECT_EQ(stemmer.step1(U"армии", 1), U"арм");
}

TEST(RussianStemmer, Step2Step3) {
    RussianStemmer stemmer;
    EXPECT_EQ(stemmer.step2(U"книги", 3), U"книг");
    EXPECT_EQ(stemmer.step2(U"ни", 2), U"ни");
    EXPECT_EQ(stemmer.step3(U"благодарност", 6), U"благодарн");
    EXPECT_EQ(stemmer.step3(U"ценност", 6), U"ценност");
}

TEST(RussianStemmer, Step4AppliesOneOfDoubleNOrSoftSign) {
    RussianStemmer stemmer;
    EXPECT_EQ(stemmer.step4(U"красивейш", 3), U"красив");
    EXPECT_EQ(stemmer.step4(U"каменн", 2), U"камен");
    EXPECT_EQ(stemmer.step4(U"сталь", 3), U"стал");
    // 'ь' убирается, но "нн" после этого уже не схлопывается
    EXPECT_EQ(stemmer.step4(U"каменнь", 2), U"каменн");
}

TEST(RussianStemmer, StemIsPrefixAndRespectsRV) {
    RussianStemmer stemmer;
    for (const auto& word : kWords) {
        std::u32string word32 = rustem::to_utf32(word);
        std::u32string stem = stemmer.stem(word32);
        EXPECT_TRUE(is_prefix(stem, word32)) << word;
        EXPECT_GE(stem.size(), RussianStemmer::find_rv(word32)) << word;
    }
}

TEST(RussianStemmer, GeneratedWordsKeepPrefixAndRV) {
    RussianStemmer stemmer;
    for (const auto& word : generated_words(50000)) {
        std::u32string stem = stemmer.stem(word);
        ASSERT_TRUE(is_prefix(stem, word)) << rustem::to_utf8(word);
        ASSERT_GE(stem.size(), RussianStemmer::find_rv(word)) << rustem::to_utf8(word);
    }
}

TEST(RussianStemmer, ConcurrentStemMatchesSequential) {
    const RussianStemmer stemmer;
    const auto words = generated_words(5000);

    std::vector<std::u32string> expected;
    expected.reserve(words.size());
    for (const auto& word : words) {
        expected.push_back(stemmer.stem(word));
    }

    const size_t thread_count = 4;
    std::vector<std::vector<std::u32string>> results(thread_count);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < thread_count; ++t) {
        threads.emplace_back([&stemmer, &words, &results, t]() {
            for (const auto& word : words) {
                results[t].push_back(stemmer.stem(word));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (size_t t = 0; t < thread_count; ++t) {
        EXPECT_EQ(results[t], expected) << "thread " << t;
    }
}

TEST(RussianStemmer, StemmedWordsAreStable) {
    RussianStemmer stemmer;
    EXPECT_EQ(stemmer.stem(std::string("мальчик")), "мальчик");
    EXPECT_EQ(stemmer.stem(std::string("машин")), "машин");
    EXPECT_EQ(stemmer.stem(std::string("стол")), "стол");
}
