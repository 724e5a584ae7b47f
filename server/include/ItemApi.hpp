#pragma once

#include "HttpMessage.hpp"
#include "ItemStore.hpp"
#include <cstdint>
#include <string>

namespace itemstore {

// Maps HTTP requests onto ItemStore operations:
//   GET /                 welcome message and endpoint directory
//   GET /items            all items with their count
//   GET /items/{id}       one item
//   POST /items           create, 201
//   PUT /items/{id}       partial update
//   DELETE /items/{id}    remove
class ItemApi {
public:
    explicit ItemApi(ItemStore& store);

    HttpResponse handle(const HttpRequest& request);

private:
    ItemStore& store_;

    HttpResponse handleRoot();
    HttpResponse handleList();
    HttpResponse handleGet(const std::string& idSegment);
    HttpResponse handleCreate(const HttpRequest& request);
    HttpResponse handleUpdate(const std::string& idSegment, const HttpRequest& request);
    HttpResponse handleDelete(const std::string& idSegment);
};

} // namespace itemstore
