#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace rustem {

struct DbConfig {
    std::string host = "localhost";
    int port = 27017;
    std::string database = "news";
    std::string collection = "train";
    std::string username;
    std::string password;
};

// mongodb://[user[:password]@]host:port
std::string connection_uri(const DbConfig& db);

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
};

struct AppConfig {
    // Paths to the corpus files; empty stop_words means the built-in list
    std::string stop_words_path;
    std::string train_path = "news_train.txt";
    std::string test_path = "news_test.txt";
    std::string output_path = "output.txt";

    std::vector<std::string> categories = default_categories();

    size_t min_length = 1;
    bool remove_stopwords = true;

    ServerConfig server;
    DbConfig db;

    static std::vector<std::string> default_categories();
};

/**
 * Reads a YAML configuration file; absent keys keep their defaults.
 * Throws YAML::Exception on malformed input or values of the wrong type,
 * std::runtime_error on an empty category list.
 */
AppConfig load_config(const std::string& config_path);

AppConfig parse_config(const std::string& yaml_text);

/**
 * Command-line count such as --limit: decimal digits only.
 * Throws std::invalid_argument otherwise, std::out_of_range on overflow.
 */
size_t parse_count(const std::string& text);

}
