#pragma once

#ifdef __cplusplus

#include "realdb/types.hpp"
#include "realdb/storage.hpp"
#include "realdb/vm.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace realdb {

// ============================================================================
// Response rendering
// ============================================================================
//
//   {"message":"OK","data":[{"id":"person:1","name":"Ada"}, ...]}
//   {"message":"<error text>"}
//
// "message" is always the first key. Identities render as "table:row".

nlohmann::ordered_json render_value(const value& v);

nlohmann::ordered_json render_record(const record& rec);

/// Success envelope for `ids`. Reads the records, so `db` must still be the
/// handle the program ran under.
std::string render_records(const locked_database& db, const result_set& ids);

std::string render_error(const std::string& message);

} // namespace realdb

#endif // __cplusplus
