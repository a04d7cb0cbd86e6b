#pragma once

// RealDBCore - stack-language record store
//
// Usage:
//   #include <RealDBCore.hpp>
//
//   realdb::database db;
//   realdb::row_generator rows;
//
//   auto prog = realdb::compile("set @person:1 \"name\" \"Ada\" select", rows);
//   auto handle = db.acquire();              // exclusive until handle dies
//   auto ids = realdb::execute(handle, prog);
//   for (const auto& id : ids) {
//       const auto* rec = handle->find_record(id);
//       ...
//   }

#include "realdb/log.hpp"
#include "realdb/types.hpp"
#include "realdb/lexer.hpp"
#include "realdb/compiler.hpp"
#include "realdb/storage.hpp"
#include "realdb/vm.hpp"
