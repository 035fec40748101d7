#pragma once

#include <string>
#include <memory>

#include "classifier.hpp"
#include "config.hpp"

namespace rustem {

class WebServer {
public:
    WebServer(const ServerConfig& config, std::unique_ptr<NewsClassifier> classifier);
    ~WebServer();

    void run();

    std::string stem_json(const std::string& word) const;
    std::string classify_json(const std::string& text) const;

private:
    ServerConfig config_;
    std::unique_ptr<NewsClassifier> classifier_;
    RussianStemmer stemmer_;

    std::string render_index_page() const;

    static std::string html_escape(const std::string& s);
    static std::string json_escape(const std::string& s);
};

}
