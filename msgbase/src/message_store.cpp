#include "message_store.h"

#include <limits>
#include <string>
#include <vector>

#include "platform_log.h"
#include "platform_time.h"

namespace bbs::msgbase {

namespace {

Clock::time_point TruncateToMicros(Clock::time_point tp) {
  return platform::FromUnixMicros(platform::ToUnixMicros(tp));
}

}  // namespace

MessageStore::MessageStore(StateStore* store,
                           std::chrono::milliseconds lock_timeout)
    : store_(store), lock_timeout_(lock_timeout) {}

bool MessageStore::Load(MsgId id, MsgLoadResult& out, Error& error) const {
  out = MsgLoadResult{};
  BlobLoadResult blob;
  std::string err;
  if (!store_->LoadBlob(kMsgTable, MsgKey(id), blob, err)) {
    error.Set(ErrorKind::kStoreUnavailable, err);
    return false;
  }
  if (!blob.found) {
    return true;
  }
  if (!DecodeMsg(blob.data, out.msg, err)) {
    error.Set(ErrorKind::kCorruptRecord,
              "message " + MsgKey(id) + ": " + err);
    return false;
  }
  if (!out.msg.id || *out.msg.id != id) {
    error.Set(ErrorKind::kCorruptRecord,
              "message " + MsgKey(id) + ": id mismatch");
    return false;
  }
  out.found = true;
  return true;
}

bool MessageStore::ListIds(std::set<MsgId>& out, Error& error) const {
  out.clear();
  std::vector<std::string> keys;
  std::string err;
  if (!store_->ListKeys(kMsgTable, keys, err)) {
    error.Set(ErrorKind::kStoreUnavailable, err);
    return false;
  }
  for (const auto& key : keys) {
    MsgId id = 0;
    if (!ParseMsgKey(key, id)) {
      platform::log::Log(platform::log::Level::kWarn, "msgbase",
                         "ignoring non-numeric key", {{"key", key}});
      continue;
    }
    out.insert(id);
  }
  return true;
}

bool MessageStore::NextId(MsgId& out, Error& error) const {
  std::set<MsgId> ids;
  if (!ListIds(ids, error)) {
    return false;
  }
  if (ids.empty()) {
    out = 0;
    return true;
  }
  const MsgId max_id = *ids.rbegin();
  if (max_id == (std::numeric_limits<MsgId>::max)()) {
    error.Set(ErrorKind::kStoreUnavailable, "message id space exhausted");
    return false;
  }
  out = max_id + 1;
  return true;
}

bool MessageStore::Store(const Msg& msg, Error& error) {
  std::vector<std::uint8_t> record;
  std::string err;
  if (!EncodeMsg(msg, record, err)) {
    error.Set(ErrorKind::kInvalidMessage, err);
    return false;
  }
  if (!store_->SaveBlob(kMsgTable, MsgKey(*msg.id), record, err)) {
    error.Set(ErrorKind::kStoreUnavailable, err);
    return false;
  }
  return true;
}

bool MessageStore::Write(Msg& msg,
                         const std::optional<Clock::time_point>& create_time,
                         bool& created, Error& error) {
  created = false;
  std::string err;
  StateStoreLock lock(store_, kMsgTable, lock_timeout_, err);
  if (!lock.locked()) {
    error.Set(ErrorKind::kStoreUnavailable, err);
    return false;
  }

  Msg staged = msg;
  if (!staged.id) {
    MsgId id = 0;
    if (!NextId(id, error)) {
      return false;
    }
    staged.id = id;
    if (create_time) {
      staged.creation_time = *create_time;
      staged.save_time = *create_time;
    } else {
      staged.save_time = Clock::now();
    }
  } else {
    MsgLoadResult current;
    if (!Load(*staged.id, current, error)) {
      return false;
    }
    if (current.found) {
      staged.children.insert(current.msg.children.begin(),
                             current.msg.children.end());
    }
  }
  staged.creation_time = TruncateToMicros(staged.creation_time);
  if (staged.save_time) {
    staged.save_time = TruncateToMicros(*staged.save_time);
  }

  if (!Store(staged, error)) {
    return false;
  }
  created = !msg.id;
  msg = std::move(staged);
  return true;
}

bool MessageStore::AddChild(MsgId parent, MsgId child, Msg& out,
                            Error& error) {
  std::string err;
  StateStoreLock lock(store_, kMsgTable, lock_timeout_, err);
  if (!lock.locked()) {
    error.Set(ErrorKind::kStoreUnavailable, err);
    return false;
  }
  MsgLoadResult loaded;
  if (!Load(parent, loaded, error)) {
    return false;
  }
  if (!loaded.found) {
    error.Set(ErrorKind::kNotFound,
              "parent message " + MsgKey(parent) + " not found");
    return false;
  }
  if (loaded.msg.children.insert(child).second &&
      !Store(loaded.msg, error)) {
    return false;
  }
  out = std::move(loaded.msg);
  return true;
}

}  // namespace bbs::msgbase
