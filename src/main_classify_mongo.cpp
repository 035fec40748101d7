#include "classifier.hpp"
#include "config.hpp"
#include "mongodb_client.hpp"

#include <chrono>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cout << "Usage: " << argv[0] << " <config.yaml> [--limit N]\n\n"
                  << "Trains on the MongoDB collection from the db section of the config\n"
                  << "and labels the test file.\n";
        return 1;
    }

    try {
        size_t limit = 0;
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--limit" && i + 1 < argc) {
                limit = rustem::parse_count(argv[++i]);
            }
        }

        rustem::AppConfig config = rustem::load_config(argv[1]);

        rustem::MongoDBClient db_client(config.db);
        if (!db_client.connect()) {
            return 1;
        }

        size_t total_docs = db_client.count_documents();
        if (limit > 0 && limit < total_docs) {
            total_docs = limit;
        }
        std::cout << "\nDocuments to train on: " << total_docs << "\n";

        rustem::NewsClassifier::Config classifier_config;
        classifier_config.categories = config.categories;
        classifier_config.tokenizer.min_length = config.min_length;
        classifier_config.tokenizer.remove_stopwords = config.remove_stopwords;

        rustem::NewsClassifier classifier(classifier_config);
        if (!config.stop_words_path.empty()) {
            classifier.tokenizer().load_stop_words(config.stop_words_path);
        }

        auto start_time = std::chrono::high_resolution_clock::now();
        size_t seen = 0;
        size_t skipped = 0;

        db_client.for_each_document([&](const rustem::LabeledDocument& doc) {
            ++seen;
            if (!classifier.train(doc.category, doc.text)) {
                ++skipped;
            }

            if (seen % 500 == 0) {
                auto now = std::chrono::high_resolution_clock::now();
                double elapsed = std::chrono::duration<double>(now - start_time).count();
                std::cout << "   [" << seen << "/" << total_docs << "] "
                          << seen / elapsed << " docs/sec\n";
            }
        }, limit);

        if (skipped > 0) {
            std::cerr << "Warning: " << skipped << " documents with unknown category skipped\n";
        }

        size_t labelled = classifier.classify_file(config.test_path, config.output_path);

        std::cout << "\nTrained on " << classifier.stats().train_documents << " documents, "
                  << "labelled " << labelled << " -> " << config.output_path << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
