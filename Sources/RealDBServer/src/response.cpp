#include "realdb/response.hpp"
#include "realdb/log.hpp"

namespace realdb {

using json = nlohmann::ordered_json;

json render_value(const value& v) {
    switch (v.kind()) {
        case value_kind::identity:
            return v.as_identity().to_string();
        case value_kind::integer:
            return v.as_integer();
        case value_kind::real:
            return v.as_real();
        case value_kind::text:
            return v.as_text();
    }
    return nullptr;
}

json render_record(const record& rec) {
    json j = json::object();
    // "id" first, the remaining fields in storage order
    if (auto it = rec.find("id"); it != rec.end()) {
        j["id"] = render_value(it->second);
    }
    for (const auto& [key, v] : rec) {
        if (key == "id") continue;
        j[key] = render_value(v);
    }
    return j;
}

std::string render_records(const locked_database& db, const result_set& ids) {
    json j;
    j["message"] = "OK";
    j["data"] = json::array();
    for (const auto& id : ids) {
        const record* rec = db->find_record(id);
        if (!rec) {
            // Identities come from the same locked run, so this would be a VM bug
            LOG_ERROR("response", "record %s vanished before rendering", id.to_string().c_str());
            continue;
        }
        j["data"].push_back(render_record(*rec));
    }
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string render_error(const std::string& message) {
    json j;
    j["message"] = message;
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace realdb
