#include "msgbase.h"

#include <unordered_set>
#include <utility>

#include "platform_log.h"

namespace bbs::msgbase {

namespace {

bool ValidateForSave(const Msg& msg, Error& error) {
  std::unordered_set<std::string> seen;
  for (const auto& tag : msg.tags) {
    if (tag.empty()) {
      error.Set(ErrorKind::kInvalidMessage, "empty tag");
      return false;
    }
    if (tag.size() > kMaxTagBytes) {
      error.Set(ErrorKind::kInvalidMessage,
                "tag longer than " + std::to_string(kMaxTagBytes) + " bytes");
      return false;
    }
    if (!seen.insert(tag).second) {
      error.Set(ErrorKind::kInvalidMessage, "duplicate tag '" + tag + "'");
      return false;
    }
  }
  if (msg.parent && msg.children.count(*msg.parent) != 0) {
    error.Set(ErrorKind::kThreadCycle,
              "parent " + MsgKey(*msg.parent) + " is also a reply");
    return false;
  }
  return true;
}

template <typename Response>
void Fail(Response& response, const Error& error) {
  response.success = false;
  response.kind = error.kind;
  response.error = error.message;
}

}  // namespace

MessageBase::MessageBase(StateStore* store, const MsgbaseConfig& config,
                         const IdentitySource* identity)
    : identity_(identity),
      messages_(store, std::chrono::milliseconds(config.store.lock_timeout_ms)),
      tags_(store, std::chrono::milliseconds(config.store.lock_timeout_ms)),
      threads_(&messages_, &tags_),
      dispatcher_(store, config) {}

Msg MessageBase::Compose(const std::string& recipient,
                         const std::string& subject,
                         const std::string& body) const {
  Msg msg;
  msg.creation_time = Clock::now();
  if (identity_) {
    msg.author = identity_->CurrentHandle();
  }
  msg.recipient = recipient;
  msg.subject = subject;
  msg.body = body;
  return msg;
}

GetMessageResponse MessageBase::GetMessage(MsgId id) const {
  GetMessageResponse resp;
  Error error;
  MsgLoadResult loaded;
  if (!messages_.Load(id, loaded, error)) {
    Fail(resp, error);
    return resp;
  }
  if (!loaded.found) {
    error.Set(ErrorKind::kNotFound, "message " + MsgKey(id) + " not found");
    Fail(resp, error);
    return resp;
  }
  resp.success = true;
  resp.msg = std::move(loaded.msg);
  return resp;
}

ListMessagesResponse MessageBase::ListMessages(
    const std::vector<std::string>& tags) const {
  ListMessagesResponse resp;
  Error error;
  const bool ok = tags.empty() ? messages_.ListIds(resp.ids, error)
                               : tags_.Union(tags, resp.ids, error);
  if (!ok) {
    resp.ids.clear();
    Fail(resp, error);
    return resp;
  }
  resp.success = true;
  return resp;
}

ListTagsResponse MessageBase::ListTags() const {
  ListTagsResponse resp;
  Error error;
  if (!tags_.ListTags(resp.tags, error)) {
    Fail(resp, error);
    return resp;
  }
  resp.success = true;
  return resp;
}

bool MessageBase::Persist(Msg& msg,
                          const std::optional<Clock::time_point>& create_time,
                          bool& created, Error& error) {
  if (!messages_.Write(msg, create_time, created, error)) {
    return false;
  }
  if (!tags_.Reconcile(msg, error)) {
    return false;
  }
  return threads_.Link(msg, error);
}

bool MessageBase::Dispatch(Msg& msg, SaveResponse& response, Error& error) {
  DispatchPlan plan;
  if (!dispatcher_.Plan(msg, plan, error)) {
    return false;
  }
  switch (plan.action) {
    case DispatchAction::kNone:
      return true;
    case DispatchAction::kLocalTransit: {
      msg.body += dispatcher_.FormatOriginLine();
      bool created = false;
      if (!Persist(msg, std::nullopt, created, error) ||
          !dispatcher_.RecordTransit(plan, *msg.id, error)) {
        return false;
      }
      break;
    }
    case DispatchAction::kRemoteQueue:
      if (!dispatcher_.RecordQueue(plan, *msg.id, error)) {
        return false;
      }
      break;
  }
  response.dispatch = plan.action;
  response.network = plan.network;
  return true;
}

SaveResponse MessageBase::Save(Msg& msg, const SaveOptions& options) {
  SaveResponse resp;
  Error error;
  if (!ValidateForSave(msg, error)) {
    Fail(resp, error);
    return resp;
  }

  bool created = false;
  const bool persisted = Persist(msg, options.create_time, created, error);
  resp.id = msg.id.value_or(0);
  resp.created = created;
  if (!persisted) {
    platform::log::Log(platform::log::Level::kError, "msgbase", "save failed",
                       {{"kind", ErrorKindName(error.kind)},
                        {"error", error.message}});
    Fail(resp, error);
    return resp;
  }

  if (created && !options.suppress_dispatch &&
      !Dispatch(msg, resp, error)) {
    platform::log::Log(platform::log::Level::kError, "dispatch",
                       "dispatch failed",
                       {{"msg", MsgKey(resp.id)}, {"error", error.message}});
    Fail(resp, error);
    return resp;
  }

  std::string what = created ? "saved new " : "saved ";
  if (msg.HasTag("public")) {
    what += "public ";
  }
  what += msg.parent ? "reply" : "message";
  what += ", addressed to '" + msg.recipient + "'";
  platform::log::Log(platform::log::Level::kInfo, "msgbase", what,
                     {{"msg", MsgKey(resp.id)}});
  resp.success = true;
  return resp;
}

}  // namespace bbs::msgbase
