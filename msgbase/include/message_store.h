#ifndef BBS_MSGBASE_MESSAGE_STORE_H
#define BBS_MSGBASE_MESSAGE_STORE_H

#include <chrono>
#include <optional>
#include <set>

#include "errors.h"
#include "msg.h"
#include "state_store.h"

namespace bbs::msgbase {

struct MsgLoadResult {
  bool found{false};
  Msg msg;
};

// Owns the msgbase table; the only place message ids are minted.
class MessageStore {
 public:
  MessageStore(StateStore* store, std::chrono::milliseconds lock_timeout);

  bool Load(MsgId id, MsgLoadResult& out, Error& error) const;
  bool ListIds(std::set<MsgId>& out, Error& error) const;

  // Persists `msg` under the table lock. A message without an id is new: it
  // gets max(existing ids) + 1 and its save time (and creation time, when
  // `create_time` is given) is stamped.
  // Rewrites of an existing record keep every child already stored, so a
  // stale copy never drops a reply linked meanwhile.
  bool Write(Msg& msg, const std::optional<Clock::time_point>& create_time,
             bool& created, Error& error);

  // Adds `child` to the children of `parent` in one locked read-modify-write.
  // A missing parent is kNotFound. `out` receives the updated parent.
  bool AddChild(MsgId parent, MsgId child, Msg& out, Error& error);

 private:
  bool NextId(MsgId& out, Error& error) const;
  bool Store(const Msg& msg, Error& error);

  StateStore* store_;
  std::chrono::milliseconds lock_timeout_;
};

}  // namespace bbs::msgbase

#endif  // BBS_MSGBASE_MESSAGE_STORE_H
