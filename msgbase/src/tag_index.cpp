#include "tag_index.h"

#include <unordered_set>

#include "platform_log.h"

namespace bbs::msgbase {

TagIndex::TagIndex(StateStore* store, std::chrono::milliseconds lock_timeout)
    : store_(store), lock_timeout_(lock_timeout) {}

bool TagIndex::LoadMembers(const std::string& tag, bool& found,
                           std::set<MsgId>& out, Error& error) const {
  found = false;
  out.clear();
  BlobLoadResult blob;
  std::string err;
  if (!store_->LoadBlob(kTagTable, tag, blob, err)) {
    error.Set(ErrorKind::kStoreUnavailable, err);
    return false;
  }
  if (!blob.found) {
    return true;
  }
  if (!DecodeIdSet(blob.data, out)) {
    error.Set(ErrorKind::kCorruptRecord, "tag '" + tag + "': bad member set");
    return false;
  }
  found = true;
  return true;
}

bool TagIndex::SaveMembers(const std::string& tag, const std::set<MsgId>& ids,
                           Error& error) {
  std::vector<std::uint8_t> blob;
  EncodeIdSet(ids, blob);
  std::string err;
  if (!store_->SaveBlob(kTagTable, tag, blob, err)) {
    error.Set(ErrorKind::kStoreUnavailable, err);
    return false;
  }
  return true;
}

bool TagIndex::Reconcile(const Msg& msg, Error& error) {
  if (!msg.id) {
    error.Set(ErrorKind::kInvalidMessage, "cannot index unsaved message");
    return false;
  }
  const MsgId id = *msg.id;
  std::string err;
  StateStoreLock lock(store_, kTagTable, lock_timeout_, err);
  if (!lock.locked()) {
    error.Set(ErrorKind::kStoreUnavailable, err);
    return false;
  }

  std::vector<std::string> known;
  if (!store_->ListKeys(kTagTable, known, err)) {
    error.Set(ErrorKind::kStoreUnavailable, err);
    return false;
  }
  const std::unordered_set<std::string> known_set(known.begin(), known.end());

  for (const auto& tag : known) {
    bool found = false;
    std::set<MsgId> members;
    if (!LoadMembers(tag, found, members, error)) {
      return false;
    }
    const bool tagged = msg.HasTag(tag);
    const bool listed = members.count(id) != 0;
    if (tagged && !listed) {
      members.insert(id);
      if (!SaveMembers(tag, members, error)) {
        return false;
      }
      platform::log::Log(platform::log::Level::kInfo, "tag_index",
                         "msg tagged",
                         {{"msg", MsgKey(id)}, {"tag", tag}});
    } else if (!tagged && listed) {
      members.erase(id);
      if (!SaveMembers(tag, members, error)) {
        return false;
      }
      platform::log::Log(platform::log::Level::kInfo, "tag_index",
                         "msg untagged",
                         {{"msg", MsgKey(id)}, {"tag", tag}});
    }
  }

  for (const auto& tag : msg.tags) {
    if (known_set.count(tag) != 0) {
      continue;
    }
    if (!SaveMembers(tag, {id}, error)) {
      return false;
    }
    platform::log::Log(platform::log::Level::kInfo, "tag_index", "new tag",
                       {{"msg", MsgKey(id)}, {"tag", tag}});
  }
  return true;
}

bool TagIndex::Members(const std::string& tag, std::set<MsgId>& out,
                       Error& error) const {
  bool found = false;
  return LoadMembers(tag, found, out, error);
}

bool TagIndex::Union(const std::vector<std::string>& tags,
                     std::set<MsgId>& out, Error& error) const {
  out.clear();
  for (const auto& tag : tags) {
    std::set<MsgId> members;
    if (!Members(tag, members, error)) {
      return false;
    }
    out.insert(members.begin(), members.end());
  }
  return true;
}

bool TagIndex::ListTags(std::vector<std::string>& out, Error& error) const {
  std::string err;
  if (!store_->ListKeys(kTagTable, out, err)) {
    error.Set(ErrorKind::kStoreUnavailable, err);
    return false;
  }
  return true;
}

}  // namespace bbs::msgbase
