#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <iostream>
#include <stdexcept>

namespace rustem {

namespace {

// Absent keys keep the default; present keys must convert or YAML::Exception is thrown
template <typename T>
void read_value(const YAML::Node& node, const char* key, T& value) {
    if (node[key]) {
        value = node[key].as<T>();
    }
}

AppConfig from_yaml(const YAML::Node& yaml) {
    AppConfig config;

    if (yaml["data"]) {
        auto data = yaml["data"];
        read_value(data, "stop_words", config.stop_words_path);
        read_value(data, "train", config.train_path);
        read_value(data, "test", config.test_path);
        read_value(data, "output", config.output_path);
    }

    if (yaml["categories"]) {
        config.categories = yaml["categories"].as<std::vector<std::string>>();
        if (config.categories.empty()) {
            throw std::runtime_error("categories list is empty");
        }
    }

    if (yaml["tokenizer"]) {
        auto tokenizer = yaml["tokenizer"];
        read_value(tokenizer, "min_length", config.min_length);
        read_value(tokenizer, "remove_stopwords", config.remove_stopwords);
    }

    if (yaml["server"]) {
        auto server = yaml["server"];
        read_value(server, "host", config.server.host);
        read_value(server, "port", config.server.port);
    }

    if (yaml["db"]) {
        auto db = yaml["db"];
        read_value(db, "host", config.db.host);
        read_value(db, "port", config.db.port);
        read_value(db, "database", config.db.database);
        read_value(db, "collection", config.db.collection);
        read_value(db, "username", config.db.username);
        read_value(db, "password", config.db.password);
    }

    return config;
}

}

std::vector<std::string> AppConfig::default_categories() {
    return {"science", "style", "culture", "life", "economics",
            "business", "travel", "forces", "media", "sport"};
}

std::string connection_uri(const DbConfig& db) {
    std::string credentials;
    if (!db.username.empty()) {
        credentials = db.username;
        if (!db.password.empty()) credentials += ":" + db.password;
        credentials += "@";
    }
    return "mongodb://" + credentials + db.host + ":" + std::to_string(db.port);
}

AppConfig load_config(const std::string& config_path) {
    try {
        return from_yaml(YAML::LoadFile(config_path));
    } catch (const std::exception& e) {
        std::cerr << "Error loading config " << config_path << ": " << e.what() << std::endl;
        throw;
    }
}

AppConfig parse_config(const std::string& yaml_text) {
    return from_yaml(YAML::Load(yaml_text));
}

size_t parse_count(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("not a non-negative number: '" + text + "'");
    }
    return static_cast<size_t>(std::stoull(text));
}

}
