#ifndef BBS_MSGBASE_THREAD_INDEX_H
#define BBS_MSGBASE_THREAD_INDEX_H

#include "errors.h"
#include "message_store.h"
#include "msg.h"
#include "tag_index.h"

namespace bbs::msgbase {

// Maintains parent -> children back-links.
class ThreadIndex {
 public:
  ThreadIndex(MessageStore* messages, TagIndex* tags);

  // Walks up from `msg` (already persisted) adding each record to its
  // parent's children and re-saving the parent with its tags reconciled.
  // A record naming itself as parent loses the link and is rewritten; an id
  // seen twice on the walk is a kThreadCycle error.
  bool Link(Msg& msg, Error& error);

 private:
  MessageStore* messages_;
  TagIndex* tags_;
};

}  // namespace bbs::msgbase

#endif  // BBS_MSGBASE_THREAD_INDEX_H
