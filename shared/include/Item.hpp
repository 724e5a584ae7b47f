#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace itemstore {

// keeps object keys in insertion order on the wire
using Json = nlohmann::ordered_json;

struct Item {
    int64_t id;
    std::string name;
    std::optional<std::string> description;
    double price;
    int64_t quantity;

    Item() : id(0), price(0.0), quantity(0) {}

    bool operator==(const Item& other) const {
        return id == other.id && name == other.name && description == other.description &&
               price == other.price && quantity == other.quantity;
    }
};

// create payload, already validated
struct NewItem {
    std::string name;
    std::optional<std::string> description;
    double price;
    int64_t quantity;

    NewItem() : price(0.0), quantity(0) {}
};

// update payload: a field is applied only when its wrapper is set.
// description has two levels so an explicit null (clear) differs from absent (keep).
struct ItemUpdate {
    std::optional<std::string> name;
    std::optional<std::optional<std::string>> description;
    std::optional<double> price;
    std::optional<int64_t> quantity;

    bool empty() const { return !name && !description && !price && !quantity; }
    void applyTo(Item& item) const;
};

// one entry of a 422 response
struct FieldError {
    std::vector<std::string> loc;
    std::string msg;
    std::string type;

    FieldError() = default;
    FieldError(std::vector<std::string> l, const std::string& m, const std::string& t)
        : loc(std::move(l)), msg(m), type(t) {}
};

Json toJson(const Item& item);
Json toJson(const FieldError& error);
Json toJson(const std::vector<FieldError>& errors);

// validation helpers: return nullopt and append to errors when the body is rejected
std::optional<NewItem> decodeNewItem(const Json& body, std::vector<FieldError>& errors);
std::optional<ItemUpdate> decodeItemUpdate(const Json& body, std::vector<FieldError>& errors);

} // namespace itemstore
