#pragma once

#include "Item.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace itemstore {

// In-memory item collection for the lifetime of the process.
// - ids come from a counter starting at 1 and are never reused
// - every operation runs under one mutex
class ItemStore {
public:
    enum class Result {
        SUCCESS,
        NOT_FOUND
    };

    ItemStore();
    ~ItemStore();

    ItemStore(const ItemStore&) = delete;
    ItemStore& operator=(const ItemStore&) = delete;

    // all items in insertion order
    std::vector<Item> listItems() const;

    std::optional<Item> getItem(int64_t id) const;

    // assigns the next id and stores the record
    Item createItem(const NewItem& fields);

    // applies only the fields set in update; updated receives the stored record
    Result updateItem(int64_t id, const ItemUpdate& update, Item& updated);

    // removed receives the record that was dropped
    Result deleteItem(int64_t id, Item& removed);

    size_t count() const;
    int64_t nextId() const;

private:
    std::map<int64_t, Item> items_;
    int64_t nextId_;
    mutable std::mutex mutex_;
};

} // namespace itemstore
