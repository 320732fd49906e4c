#include "thread_index.h"

#include <optional>
#include <unordered_set>

#include "platform_log.h"

namespace bbs::msgbase {

ThreadIndex::ThreadIndex(MessageStore* messages, TagIndex* tags)
    : messages_(messages), tags_(tags) {}

bool ThreadIndex::Link(Msg& msg, Error& error) {
  if (!msg.id || !msg.parent) {
    return true;
  }
  std::unordered_set<MsgId> visited{*msg.id};
  Msg* current = &msg;
  Msg ancestor;
  while (current->parent) {
    const MsgId child_id = *current->id;
    const MsgId parent_id = *current->parent;

    if (parent_id == child_id) {
      platform::log::Log(platform::log::Level::kError, "thread_index",
                         "parent id same as message id; stripping parent",
                         {{"msg", MsgKey(child_id)}});
      current->parent.reset();
      bool created = false;
      return messages_->Write(*current, std::nullopt, created, error);
    }
    if (visited.count(parent_id) != 0) {
      error.Set(ErrorKind::kThreadCycle,
                "thread cycle at message " + MsgKey(parent_id));
      return false;
    }

    Msg parent;
    if (!messages_->AddChild(parent_id, child_id, parent, error) ||
        !tags_->Reconcile(parent, error)) {
      return false;
    }
    platform::log::Log(platform::log::Level::kDebug, "thread_index",
                       "linked reply",
                       {{"parent", MsgKey(parent_id)},
                        {"child", MsgKey(child_id)}});
    visited.insert(parent_id);
    ancestor = std::move(parent);
    current = &ancestor;
  }
  return true;
}

}  // namespace bbs::msgbase
