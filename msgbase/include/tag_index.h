#ifndef BBS_MSGBASE_TAG_INDEX_H
#define BBS_MSGBASE_TAG_INDEX_H

#include <chrono>
#include <set>
#include <string>
#include <vector>

#include "errors.h"
#include "msg.h"
#include "state_store.h"

namespace bbs::msgbase {

// Owns the tags table: tag -> ids of the messages carrying it. Entries are
// never removed, so every tag ever used stays listed.
class TagIndex {
 public:
  TagIndex(StateStore* store, std::chrono::milliseconds lock_timeout);

  // Two-way diff of `msg.tags` against every known tag, then creation of the
  // tags the table has not seen yet. Holds the table lock throughout.
  bool Reconcile(const Msg& msg, Error& error);

  bool Members(const std::string& tag, std::set<MsgId>& out,
               Error& error) const;
  bool Union(const std::vector<std::string>& tags, std::set<MsgId>& out,
             Error& error) const;
  bool ListTags(std::vector<std::string>& out, Error& error) const;

 private:
  bool LoadMembers(const std::string& tag, bool& found, std::set<MsgId>& out,
                   Error& error) const;
  bool SaveMembers(const std::string& tag, const std::set<MsgId>& ids,
                   Error& error);

  StateStore* store_;
  std::chrono::milliseconds lock_timeout_;
};

}  // namespace bbs::msgbase

#endif  // BBS_MSGBASE_TAG_INDEX_H
