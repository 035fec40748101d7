#pragma once

#include <functional>
#include <memory>
#include <string>

#include <mongocxx/client.hpp>
#include <mongocxx/collection.hpp>
#include <mongocxx/database.hpp>
#include <mongocxx/instance.hpp>

#include "config.hpp"

namespace rustem {

struct LabeledDocument {
    std::string category;
    std::string text;
};

/**
 * Training corpus stored in a MongoDB collection,
 * one document per news item with "category" and "text" fields
 */
class MongoDBClient {
public:
    explicit MongoDBClient(const DbConfig& config);
    ~MongoDBClient();

    bool connect();
    size_t count_documents() const;

    void for_each_document(std::function<void(const LabeledDocument&)> callback,
                           size_t limit = 0) const;

private:
    DbConfig config_;
    std::unique_ptr<mongocxx::instance> instance_;
    std::unique_ptr<mongocxx::client> client_;
    mongocxx::database db_;
    mutable mongocxx::collection collection_;
};

}
