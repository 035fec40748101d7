#include "web_server.hpp"

#include <httplib.h>

#include <cstdio>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace rustem {

WebServer::WebServer(const ServerConfig& config, std::unique_ptr<NewsClassifier> classifier)
    : config_(config), classifier_(std::move(classifier)) {}

WebServer::~WebServer() = default;

std::string WebServer::html_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '&': result += "&amp;"; break;
            case '"': result += "&quot;"; break;
            default: result += c;
        }
    }
    return result;
}

std::string WebServer::json_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

std::string WebServer::stem_json(const std::string& word) const {
    std::ostringstream json;
    json << "{\"word\":\"" << json_escape(word) << "\","
         << "\"stem\":\"" << json_escape(stemmer_.stem(word)) << "\"}";
    return json.str();
}

std::string WebServer::classify_json(const std::string& text) const {
    auto result = classifier_->classify(text);

    std::ostringstream json;
    json << "{\"label\":\"" << json_escape(result.label) << "\",\"scores\":{";
    for (size_t i = 0; i < result.scores.size(); ++i) {
        if (i > 0) json << ",";
        json << "\"" << json_escape(result.scores[i].first) << "\":" << result.scores[i].second;
    }
    json << "}}";
    return json.str();
}

std::string WebServer::render_index_page() const {
    std::ostringstream html;
    html << R"(<!DOCTYPE html>
<html lang="ru">
<head>
<meta charset="UTF-8">
<title>rustem</title>
<style>
body{font-family:sans-serif;background:#f5f5f5;max-width:700px;margin:40px auto;padding:20px}
form{display:flex;margin-bottom:20px}
input[type="text"]{flex:1;padding:10px 15px;font-size:16px;border:2px solid #ddd;border-radius:20px 0 0 20px;outline:none}
button{padding:10px 20px;font-size:16px;background:#4a90d9;color:white;border:none;border-radius:0 20px 20px 0;cursor:pointer}
code{background:#f0f0f0;padding:2px 6px;border-radius:3px}
</style>
</head>
<body>
<h1>rustem</h1>
<form action="/api/stem" method="get">
<input type="text" name="word" placeholder="Слово..." autofocus>
<button type="submit">Stem</button>
</form>
<form action="/api/classify" method="get">
<input type="text" name="text" placeholder="Заголовок новости...">
<button type="submit">Classify</button>
</form>
<p>Categories:)";
    for (const auto& category : classifier_->categories()) {
        html << " <code>" << html_escape(category) << "</code>";
    }
    html << R"(</p>
</body>
</html>)";
    return html.str();
}

void WebServer::run() {
    std::cout << "Starting web server on http://" << config_.host
              << ":" << config_.port << "\n";

    httplib::Server server;

    server.Get("/", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(render_index_page(), "text/html; charset=utf-8");
    });

    server.Get("/api/stem", [this](const httplib::Request& req, httplib::Response& res) {
        if (!req.has_param("word")) {
            res.status = 400;
            res.set_content("{\"error\":\"missing parameter: word\"}", "application/json; charset=utf-8");
            return;
        }
        res.set_content(stem_json(req.get_param_value("word")), "application/json; charset=utf-8");
    });

    server.Get("/api/classify", [this](const httplib::Request& req, httplib::Response& res) {
        if (!req.has_param("text")) {
            res.status = 400;
            res.set_content("{\"error\":\"missing parameter: text\"}", "application/json; charset=utf-8");
            return;
        }
        res.set_content(classify_json(req.get_param_value("text")), "application/json; charset=utf-8");
    });

    if (!server.listen(config_.host.c_str(), config_.port)) {
        throw std::runtime_error("Cannot listen on " + config_.host + ":" + std::to_string(config_.port));
    }
}

}
