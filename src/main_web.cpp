#include "web_server.hpp"
#include <iostream>
#include "config.hpp"
#include <memory>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 2 || std::string(argv[1]) == "--help") {
        std::cout << "Usage: " << argv[0] << " <config.yaml> [options]\n\n"
                  << "Options:\n"
                  << "  --host HOST  Host (default: from config, 0.0.0.0)\n"
                  << "  --port PORT  Port (default: from config, 8080)\n";
        return argc < 2 ? 1 : 0;
    }

    try {
        rustem::AppConfig config = rustem::load_config(argv[1]);

        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--host" && i + 1 < argc) {
                config.server.host = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                config.server.port = static_cast<int>(rustem::parse_count(argv[++i]));
            }
        }

        rustem::NewsClassifier::Config classifier_config;
        classifier_config.categories = config.categories;
        classifier_config.tokenizer.min_length = config.min_length;
        classifier_config.tokenizer.remove_stopwords = config.remove_stopwords;

        auto classifier = std::make_unique<rustem::NewsClassifier>(classifier_config);
        if (!config.stop_words_path.empty()) {
            classifier->tokenizer().load_stop_words(config.stop_words_path);
        }

        std::cout << "Training on " << config.train_path << "...\n";
        size_t documents = classifier->train_file(config.train_path);
        std::cout << "Trained on " << documents << " documents\n";

        rustem::WebServer server(config.server, std::move(classifier));
        server.run();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
