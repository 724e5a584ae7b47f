#include "ItemApi.hpp"
#include <cerrno>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

namespace itemstore
{

    namespace
    {

        const std::string kItemsPrefix = "/items/";

        HttpResponse detailResponse(int status, const std::string &detail)
        {
            Json body;
            body["detail"] = detail;
            return HttpResponse::json(status, body);
        }

        HttpResponse itemNotFound()
        {
            return detailResponse(404, "Item not found");
        }

        HttpResponse methodNotAllowed(const std::string &allowed)
        {
            HttpResponse response = detailResponse(405, "Method Not Allowed");
            response.setHeader("Allow", allowed);
            return response;
        }

        HttpResponse validationFailed(const std::vector<FieldError> &errors)
        {
            Json body;
            body["detail"] = toJson(errors);
            return HttpResponse::json(422, body);
        }

        HttpResponse itemMessage(int status, const std::string &message, const Item &item)
        {
            Json body;
            body["message"] = message;
            body["item"] = toJson(item);
            return HttpResponse::json(status, body);
        }

        // path segment -> item id; optional sign followed by digits only
        std::optional<int64_t> parseItemId(const std::string &segment, std::vector<FieldError> &errors)
        {
            bool valid = !segment.empty();
            size_t digitsStart = (valid && (segment[0] == '-' || segment[0] == '+')) ? 1 : 0;
            if (digitsStart >= segment.size())
            {
                valid = false;
            }
            for (size_t i = digitsStart; valid && i < segment.size(); ++i)
            {
                if (!std::isdigit(static_cast<unsigned char>(segment[i])))
                {
                    valid = false;
                }
            }

            if (valid)
            {
                errno = 0;
                long long id = std::strtoll(segment.c_str(), nullptr, 10);
                if (errno == 0)
                {
                    return static_cast<int64_t>(id);
                }
            }

            errors.emplace_back(std::vector<std::string>{"path", "item_id"}, "value is not a valid integer",
                                "type_error.integer");
            return std::nullopt;
        }

        std::optional<Json> parseBody(const HttpRequest &request, std::vector<FieldError> &errors)
        {
            if (request.body.empty())
            {
                errors.emplace_back(std::vector<std::string>{"body"}, "field required", "value_error.missing");
                return std::nullopt;
            }

            try
            {
                return Json::parse(request.body);
            }
            catch (const Json::parse_error &e)
            {
                // the library message quotes raw input bytes, report only the offset
                errors.emplace_back(std::vector<std::string>{"body"},
                                    "JSON decode error at byte " + std::to_string(e.byte),
                                    "value_error.jsondecode");
                return std::nullopt;
            }
        }

    } // namespace

    ItemApi::ItemApi(ItemStore &store) : store_(store)
    {
    }

    HttpResponse ItemApi::handle(const HttpRequest &request)
    {
        std::string path = request.path;
        while (path.size() > 1 && path.back() == '/')
        {
            path.pop_back();
        }

        if (path == "/")
        {
            if (request.method == "GET")
            {
                return handleRoot();
            }
            return methodNotAllowed("GET");
        }

        if (path == "/items")
        {
            if (request.method == "GET")
            {
                return handleList();
            }
            if (request.method == "POST")
            {
                return handleCreate(request);
            }
            return methodNotAllowed("GET, POST");
        }

        if (path.compare(0, kItemsPrefix.size(), kItemsPrefix) == 0)
        {
            std::string idSegment = path.substr(kItemsPrefix.size());
            if (idSegment.find('/') == std::string::npos)
            {
                if (request.method == "GET")
                {
                    return handleGet(idSegment);
                }
                if (request.method == "PUT")
                {
                    return handleUpdate(idSegment, request);
                }
                if (request.method == "DELETE")
                {
                    return handleDelete(idSegment);
                }
                return methodNotAllowed("GET, PUT, DELETE");
            }
        }

        return detailResponse(404, "Not Found");
    }

    HttpResponse ItemApi::handleRoot()
    {
        Json endpoints;
        endpoints["GET /items"] = "Get all items";
        endpoints["GET /items/{id}"] = "Get item by ID";
        endpoints["POST /items"] = "Create new item";
        endpoints["PUT /items/{id}"] = "Update item";
        endpoints["DELETE /items/{id}"] = "Delete item";

        Json body;
        body["message"] = "Welcome to the Simple REST API";
        body["endpoints"] = endpoints;
        return HttpResponse::json(200, body);
    }

    HttpResponse ItemApi::handleList()
    {
        std::vector<Item> items = store_.listItems();

        Json list = Json::array();
        for (const auto &item : items)
        {
            list.push_back(toJson(item));
        }

        Json body;
        body["items"] = list;
        body["count"] = items.size();
        return HttpResponse::json(200, body);
    }

    HttpResponse ItemApi::handleGet(const std::string &idSegment)
    {
        std::vector<FieldError> errors;
        auto id = parseItemId(idSegment, errors);
        if (!id)
        {
            return validationFailed(errors);
        }

        auto item = store_.getItem(*id);
        if (!item)
        {
            return itemNotFound();
        }
        return HttpResponse::json(200, toJson(*item));
    }

    HttpResponse ItemApi::handleCreate(const HttpRequest &request)
    {
        std::vector<FieldError> errors;
        auto body = parseBody(request, errors);
        if (!body)
        {
            return validationFailed(errors);
        }

        auto fields = decodeNewItem(*body, errors);
        if (!fields)
        {
            return validationFailed(errors);
        }

        Item created = store_.createItem(*fields);
        return itemMessage(201, "Item created successfully", created);
    }

    HttpResponse ItemApi::handleUpdate(const std::string &idSegment, const HttpRequest &request)
    {
        // path and body are both validated before the store is consulted
        std::vector<FieldError> errors;
        auto id = parseItemId(idSegment, errors);

        std::optional<ItemUpdate> update;
        if (auto body = parseBody(request, errors))
        {
            update = decodeItemUpdate(*body, errors);
        }

        if (!errors.empty())
        {
            return validationFailed(errors);
        }

        Item updated;
        if (store_.updateItem(*id, *update, updated) == ItemStore::Result::NOT_FOUND)
        {
            return itemNotFound();
        }
        return itemMessage(200, "Item updated successfully", updated);
    }

    HttpResponse ItemApi::handleDelete(const std::string &idSegment)
    {
        std::vector<FieldError> errors;
        auto id = parseItemId(idSegment, errors);
        if (!id)
        {
            return validationFailed(errors);
        }

        Item removed;
        if (store_.deleteItem(*id, removed) == ItemStore::Result::NOT_FOUND)
        {
            return itemNotFound();
        }
        return itemMessage(200, "Item deleted successfully", removed);
    }

} // namespace itemstore
