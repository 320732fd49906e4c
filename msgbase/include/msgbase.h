#ifndef BBS_MSGBASE_MSGBASE_H
#define BBS_MSGBASE_MSGBASE_H

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "config.h"
#include "errors.h"
#include "identity.h"
#include "message_store.h"
#include "msg.h"
#include "network_dispatcher.h"
#include "state_store.h"
#include "tag_index.h"
#include "thread_index.h"

namespace bbs::msgbase {

struct SaveOptions {
  bool suppress_dispatch{false};
  // Stamped as both creation and save time of a new message.
  std::optional<Clock::time_point> create_time;
};

struct SaveResponse {
  bool success{false};
  MsgId id{0};
  bool created{false};
  DispatchAction dispatch{DispatchAction::kNone};
  std::string network;
  ErrorKind kind{ErrorKind::kNone};
  std::string error;
};

struct GetMessageResponse {
  bool success{false};
  Msg msg;
  ErrorKind kind{ErrorKind::kNone};
  std::string error;
};

struct ListMessagesResponse {
  bool success{false};
  std::set<MsgId> ids;
  ErrorKind kind{ErrorKind::kNone};
  std::string error;
};

struct ListTagsResponse {
  bool success{false};
  std::vector<std::string> tags;
  ErrorKind kind{ErrorKind::kNone};
  std::string error;
};

class MessageBase {
 public:
  MessageBase(StateStore* store, const MsgbaseConfig& config,
              const IdentitySource* identity = nullptr);

  Msg Compose(const std::string& recipient, const std::string& subject,
              const std::string& body) const;

  GetMessageResponse GetMessage(MsgId id) const;
  // All ids when `tags` is empty, else the union of the tags' members.
  ListMessagesResponse ListMessages(
      const std::vector<std::string>& tags = {}) const;
  ListTagsResponse ListTags() const;

  // Persist, reconcile tags, link the thread, then (new messages only)
  // dispatch to a network, strictly in that order.
  SaveResponse Save(Msg& msg, const SaveOptions& options = {});

  const NetworkDispatcher& dispatcher() const { return dispatcher_; }

 private:
  bool Persist(Msg& msg, const std::optional<Clock::time_point>& create_time,
               bool& created, Error& error);
  bool Dispatch(Msg& msg, SaveResponse& response, Error& error);

  const IdentitySource* identity_;
  MessageStore messages_;
  TagIndex tags_;
  ThreadIndex threads_;
  NetworkDispatcher dispatcher_;
};

}  // namespace bbs::msgbase

#endif  // BBS_MSGBASE_MSGBASE_H
