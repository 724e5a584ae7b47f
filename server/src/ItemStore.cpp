#include "ItemStore.hpp"

namespace itemstore {

ItemStore::ItemStore() : nextId_(1) {
}

ItemStore::~ItemStore() = default;

std::vector<Item> ItemStore::listItems() const {
    std::lock_guard<std::mutex> lock(mutex_);

    // ids only grow, so key order is insertion order
    std::vector<Item> result;
    result.reserve(items_.size());
    for (const auto& [id, item] : items_) {
        result.push_back(item);
    }
    return result;
}

std::optional<Item> ItemStore::getItem(int64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = items_.find(id);
    if (it != items_.end()) {
        return it->second;
    }
    return std::nullopt;
}

Item ItemStore::createItem(const NewItem& fields) {
    std::lock_guard<std::mutex> lock(mutex_);

    Item item;
    item.id = nextId_++;
    item.name = fields.name;
    item.description = fields.description;
    item.price = fields.price;
    item.quantity = fields.quantity;

    items_[item.id] = item;
    return item;
}

ItemStore::Result ItemStore::updateItem(int64_t id, const ItemUpdate& update, Item& updated) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = items_.find(id);
    if (it == items_.end()) {
        return Result::NOT_FOUND;
    }

    update.applyTo(it->second);
    updated = it->second;
    return Result::SUCCESS;
}

ItemStore::Result ItemStore::deleteItem(int64_t id, Item& removed) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = items_.find(id);
    if (it == items_.end()) {
        return Result::NOT_FOUND;
    }

    removed = std::move(it->second);
    items_.erase(it);
    return Result::SUCCESS;
}

size_t ItemStore::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

int64_t ItemStore::nextId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nextId_;
}

} // namespace itemstore
