#pragma once

#include <memory>
#include <string>

#include "config.h"
#include "state_store.h"

namespace bbs::msgbase {

// Rows of bbs_msgbase_kv (tbl, key_name, payload); table locks map to
// GET_LOCK/RELEASE_LOCK so several BBS processes can share one database.
std::unique_ptr<StateStore> CreateMysqlStateStore(const MySqlConfig& cfg,
                                                  std::string& error);

}  // namespace bbs::msgbase
