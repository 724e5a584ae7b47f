#include "Item.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace itemstore {

namespace {

// 2^63, the first double above the int64 range
const double kInt64Bound = 9223372036854775808.0;

std::vector<std::string> bodyLoc(const std::string& field) {
    return {"body", field};
}

std::string trim(const std::string& text) {
    const char* blanks = " \t\r\n";
    size_t begin = text.find_first_not_of(blanks);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(blanks);
    return text.substr(begin, end - begin + 1);
}

void missingField(const std::string& field, std::vector<FieldError>& errors) {
    errors.emplace_back(bodyLoc(field), "field required", "value_error.missing");
}

void nullNotAllowed(const std::string& field, std::vector<FieldError>& errors) {
    errors.emplace_back(bodyLoc(field), "none is not an allowed value", "type_error.none.not_allowed");
}

std::optional<std::string> readName(const Json& value, std::vector<FieldError>& errors) {
    if (!value.is_string()) {
        errors.emplace_back(bodyLoc("name"), "str type expected", "type_error.str");
        return std::nullopt;
    }
    std::string name = value.get<std::string>();
    if (name.empty()) {
        errors.emplace_back(bodyLoc("name"), "ensure this value has at least 1 characters",
                            "value_error.any_str.min_length");
        return std::nullopt;
    }
    return name;
}

// null is a valid description, returned as an engaged optional holding nullopt
std::optional<std::optional<std::string>> readDescription(const Json& value, std::vector<FieldError>& errors) {
    if (value.is_null()) {
        return std::optional<std::string>();
    }
    if (!value.is_string()) {
        errors.emplace_back(bodyLoc("description"), "str type expected", "type_error.str");
        return std::nullopt;
    }
    return std::optional<std::string>(value.get<std::string>());
}

std::optional<double> readPrice(const Json& value, std::vector<FieldError>& errors) {
    std::optional<double> price;

    if (value.is_number()) {
        price = value.get<double>();
    } else if (value.is_string()) {
        std::string text = trim(value.get<std::string>());
        if (!text.empty()) {
            char* end = nullptr;
            errno = 0;
            double parsed = std::strtod(text.c_str(), &end);
            if (errno == 0 && end == text.c_str() + text.size()) {
                price = parsed;
            }
        }
    }

    // booleans, containers, unparsable strings, inf and nan
    if (!price || !std::isfinite(*price)) {
        errors.emplace_back(bodyLoc("price"), "value is not a valid float", "type_error.float");
        return std::nullopt;
    }
    return price;
}

std::optional<int64_t> readQuantity(const Json& value, std::vector<FieldError>& errors) {
    std::optional<int64_t> quantity;

    if (value.is_number_unsigned()) {
        uint64_t raw = value.get<uint64_t>();
        if (raw <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            quantity = static_cast<int64_t>(raw);
        }
    } else if (value.is_number_integer()) {
        quantity = value.get<int64_t>();
    } else if (value.is_number_float()) {
        double raw = value.get<double>();
        if (std::isfinite(raw) && std::floor(raw) == raw && raw >= -kInt64Bound && raw < kInt64Bound) {
            quantity = static_cast<int64_t>(raw);
        }
    } else if (value.is_string()) {
        std::string text = trim(value.get<std::string>());
        if (!text.empty()) {
            char* end = nullptr;
            errno = 0;
            long long parsed = std::strtoll(text.c_str(), &end, 10);
            if (errno == 0 && end == text.c_str() + text.size()) {
                quantity = static_cast<int64_t>(parsed);
            }
        }
    }

    if (!quantity) {
        errors.emplace_back(bodyLoc("quantity"), "value is not a valid integer", "type_error.integer");
    }
    return quantity;
}

bool requireObject(const Json& body, std::vector<FieldError>& errors) {
    if (!body.is_object()) {
        errors.emplace_back(std::vector<std::string>{"body"}, "value is not a valid dict", "type_error.dict");
        return false;
    }
    return true;
}

} // namespace

void ItemUpdate::applyTo(Item& item) const {
    if (name) {
        item.name = *name;
    }
    if (description) {
        item.description = *description;
    }
    if (price) {
        item.price = *price;
    }
    if (quantity) {
        item.quantity = *quantity;
    }
}

Json toJson(const Item& item) {
    Json j;
    j["id"] = item.id;
    j["name"] = item.name;
    if (item.description) {
        j["description"] = *item.description;
    } else {
        j["description"] = nullptr;
    }
    j["price"] = item.price;
    j["quantity"] = item.quantity;
    return j;
}

Json toJson(const FieldError& error) {
    Json j;
    j["loc"] = error.loc;
    j["msg"] = error.msg;
    j["type"] = error.type;
    return j;
}

Json toJson(const std::vector<FieldError>& errors) {
    Json list = Json::array();
    for (const auto& error : errors) {
        list.push_back(toJson(error));
    }
    return list;
}

std::optional<NewItem> decodeNewItem(const Json& body, std::vector<FieldError>& errors) {
    if (!requireObject(body, errors)) {
        return std::nullopt;
    }

    const size_t errorsBefore = errors.size();
    NewItem item;

    auto it = body.find("name");
    if (it == body.end()) {
        missingField("name", errors);
    } else if (it->is_null()) {
        nullNotAllowed("name", errors);
    } else if (auto name = readName(*it, errors)) {
        item.name = *name;
    }

    it = body.find("description");
    if (it != body.end()) {
        if (auto description = readDescription(*it, errors)) {
            item.description = *description;
        }
    }

    it = body.find("price");
    if (it == body.end()) {
        missingField("price", errors);
    } else if (it->is_null()) {
        nullNotAllowed("price", errors);
    } else if (auto price = readPrice(*it, errors)) {
        item.price = *price;
    }

    // quantity defaults to 0
    it = body.find("quantity");
    if (it != body.end()) {
        if (it->is_null()) {
            nullNotAllowed("quantity", errors);
        } else if (auto quantity = readQuantity(*it, errors)) {
            item.quantity = *quantity;
        }
    }

    if (errors.size() != errorsBefore) {
        return std::nullopt;
    }
    return item;
}

std::optional<ItemUpdate> decodeItemUpdate(const Json& body, std::vector<FieldError>& errors) {
    if (!requireObject(body, errors)) {
        return std::nullopt;
    }

    const size_t errorsBefore = errors.size();
    ItemUpdate update;

    // "id" and unknown keys are ignored
    auto it = body.find("name");
    if (it != body.end()) {
        if (it->is_null()) {
            nullNotAllowed("name", errors);
        } else {
            update.name = readName(*it, errors);
        }
    }

    it = body.find("description");
    if (it != body.end()) {
        update.description = readDescription(*it, errors);
    }

    it = body.find("price");
    if (it != body.end()) {
        if (it->is_null()) {
            nullNotAllowed("price", errors);
        } else {
            update.price = readPrice(*it, errors);
        }
    }

    it = body.find("quantity");
    if (it != body.end()) {
        if (it->is_null()) {
            nullNotAllowed("quantity", errors);
        } else {
            update.quantity = readQuantity(*it, errors);
        }
    }

    if (errors.size() != errorsBefore) {
        return std::nullopt;
    }
    return update;
}

} // namespace itemstore
