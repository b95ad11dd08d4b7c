#include "har.hpp"

#include <unordered_map>

#include "../utils/constants.hpp"
#include "../utils/string_utils.hpp"

namespace network::har {
    namespace {
        nlohmann::ordered_json header_list(const http::model::Headers& headers) {
            auto list = nlohmann::ordered_json::array();
            for (const auto& [name, value] : headers) {
                list.push_back(nlohmann::ordered_json{{"name", name}, {"value", value}});
            }
            return list;
        }

        nlohmann::ordered_json entry(const RequestEvent& req, const ResponseEvent& resp, bool positional) {
            nlohmann::ordered_json e;
            e["startedDateTime"] = string_utils::iso8601_utc(req.timestamp_);
            e["request"] = {
                {"method", req.method_},
                {"url", req.url_},
                {"headers", header_list(req.headers_)},
            };
            e["response"] = {
                {"status", resp.status_},
                {"headers", header_list(resp.headers_)},
            };
            if (positional) {
                e["comment"] = POSITIONAL_PAIRING_COMMENT;
            }
            return e;
        }
    }  // namespace

    nlohmann::ordered_json build(const std::deque<RequestEvent>& requests, const std::deque<ResponseEvent>& responses) {
        std::unordered_map<CorrelationId, const ResponseEvent*> by_id;
        std::deque<const ResponseEvent*> uncorrelated;

        for (const auto& resp : responses) {
            if (resp.id_ == 0) {
                uncorrelated.push_back(&resp);
            } else {
                by_id.try_emplace(resp.id_, &resp);
            }
        }

        auto entries = nlohmann::ordered_json::array();
        for (const auto& req : requests) {
            if (req.id_ != 0) {
                if (auto it = by_id.find(req.id_); it != by_id.end()) {
                    entries.push_back(entry(req, *it->second, false));
                }
                continue;
            }
            if (!uncorrelated.empty()) {
                entries.push_back(entry(req, *uncorrelated.front(), true));
                uncorrelated.pop_front();
            }
        }

        nlohmann::ordered_json doc;
        doc["log"] = {
            {"version", constants::HAR_VERSION},
            {"creator", {{"name", constants::CREATOR_NAME}, {"version", constants::CREATOR_VERSION}}},
            {"entries", std::move(entries)},
        };
        return doc;
    }

    nlohmann::ordered_json to_json(const RequestEvent& evt) {
        return nlohmann::ordered_json{
            {"id", evt.id_},
            {"timestamp", string_utils::iso8601_utc(evt.timestamp_)},
            {"method", evt.method_},
            {"url", evt.url_},
            {"headers", evt.headers_},
            {"resource_type", evt.resource_type_},
        };
    }

    nlohmann::ordered_json to_json(const ResponseEvent& evt) {
        nlohmann::ordered_json j{
            {"id", evt.id_},
            {"timestamp", string_utils::iso8601_utc(evt.timestamp_)},
            {"url", evt.url_},
            {"status", evt.status_},
            {"headers", evt.headers_},
            {"ok", evt.ok_},
        };
        if (evt.error_) {
            j["error"] = *evt.error_;
        }
        return j;
    }
}  // namespace network::har
