#include "classifier.hpp"
#include "config.hpp"

#include <algorithm>
#include <iostream>
#include <iomanip>
#include <string>

using namespace rustem;

void print_usage() {
    std::cout << "Использование:\n";
    std::cout << "  ./rustem_classify <config.yaml>              - обучение и разметка тестового файла\n";
    std::cout << "  ./rustem_classify <config.yaml> --limit 100  - обучение на первых 100 документах\n";
}

void print_statistics(const NewsClassifier& classifier) {
    const auto& stats = classifier.stats();

    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "СТАТИСТИКА КЛАССИФИКАЦИИ\n";
    std::cout << std::string(60, '=') << "\n";

    std::cout << "\nОбучение:\n";
    std::cout << "   Документов: " << stats.train_documents << "\n";
    std::cout << "   Пропущено строк: " << stats.skipped_documents << "\n";
    std::cout << "   Стемов: " << stats.train_tokens << "\n";
    std::cout << "   Время: " << std::fixed << std::setprecision(2)
              << stats.training_time_sec << " сек ("
              << std::setprecision(0) << stats.train_docs_per_second() << " док/сек)\n";

    std::cout << "\nСловари по категориям:\n";
    for (const auto& category : classifier.categories()) {
        std::cout << "   " << std::left << std::setw(12) << category << std::right
                  << " документов: " << std::setw(7) << stats.documents_per_category.at(category)
                  << "  стемов: " << classifier.vocabulary(category).size() << "\n";
    }

    std::cout << "\nРазметка:\n";
    std::cout << "   Документов: " << stats.test_documents << "\n";
    std::cout << "   Время: " << std::fixed << std::setprecision(2)
              << stats.classification_time_sec << " сек ("
              << std::setprecision(0) << stats.test_docs_per_second() << " док/сек)\n";

    std::cout << std::string(60, '=') << "\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string config_path = argv[1];

    try {
        size_t limit = 0;
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--limit" && i + 1 < argc) {
                limit = parse_count(argv[++i]);
            } else {
                std::cerr << "Неизвестный аргумент: " << arg << "\n";
                print_usage();
                return 1;
            }
        }

        std::cout << std::string(60, '=') << "\n";
        std::cout << "КЛАССИФИКАЦИЯ НОВОСТЕЙ ПО СЛОВАРЯМ СТЕМОВ\n";
        std::cout << std::string(60, '=') << "\n";

        AppConfig config = load_config(config_path);

        NewsClassifier::Config classifier_config;
        classifier_config.categories = config.categories;
        classifier_config.tokenizer.min_length = config.min_length;
        classifier_config.tokenizer.remove_stopwords = config.remove_stopwords;

        NewsClassifier classifier(classifier_config);

        if (!config.stop_words_path.empty()) {
            classifier.tokenizer().load_stop_words(config.stop_words_path);
            std::cout << "Стоп-слов загружено: " << classifier.tokenizer().stop_words_count() << "\n";
        }

        std::cout << "\nОбучение: " << config.train_path << "\n";
        classifier.train_file(config.train_path, limit);

        std::cout << "\nРазметка: " << config.test_path << " -> " << config.output_path << "\n";
        classifier.classify_file(config.test_path, config.output_path);

        print_statistics(classifier);

        std::cout << "\nГотово.\n";

    } catch (const std::exception& e) {
        std::cerr << "Ошибка: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
