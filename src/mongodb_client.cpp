#include "mongodb_client.hpp"
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/types.hpp>
#include <mongocxx/options/find.hpp>
#include <mongocxx/uri.hpp>
#include <iostream>

namespace rustem {

namespace {

std::string string_field(const bsoncxx::document::view& doc, const char* name) {
    auto element = doc[name];
    if (!element || element.type() != bsoncxx::type::k_string) {
        return {};
    }
    auto view = element.get_string().value;
    return std::string(view.data(), view.length());
}

}

MongoDBClient::MongoDBClient(const DbConfig& config) : config_(config) {
    instance_ = std::make_unique<mongocxx::instance>();
}

MongoDBClient::~MongoDBClient() = default;

bool MongoDBClient::connect() {
    try {
        client_ = std::make_unique<mongocxx::client>(mongocxx::uri(connection_uri(config_)));
        db_ = (*client_)[config_.database];
        collection_ = db_[config_.collection];
    } catch (const std::exception& e) {
        std::cerr << "MongoDB: cannot open " << config_.host << ":" << config_.port
                  << " (" << e.what() << ")" << std::endl;
        return false;
    }

    std::cout << "MongoDB: " << config_.database << "." << config_.collection
              << " at " << config_.host << ":" << config_.port << std::endl;
    return true;
}

size_t MongoDBClient::count_documents() const {
    return static_cast<size_t>(collection_.count_documents({}));
}

void MongoDBClient::for_each_document(
    std::function<void(const LabeledDocument&)> callback,
    size_t limit
) const {
    auto opts = mongocxx::options::find{};
    opts.projection(bsoncxx::builder::basic::make_document(
        bsoncxx::builder::basic::kvp("category", 1),
        bsoncxx::builder::basic::kvp("text", 1)
    ));

    if (limit > 0) {
        opts.limit(static_cast<int64_t>(limit));
    }

    auto cursor = collection_.find({}, opts);

    for (auto&& doc : cursor) {
        LabeledDocument document;
        document.category = string_field(doc, "category");
        document.text = string_field(doc, "text");
        callback(document);
    }
}

}
