#include "network_dispatcher.h"

#include <algorithm>
#include <vector>

#include "platform_log.h"
#include "protocol.h"

namespace bbs::msgbase {

namespace {
constexpr char kOriginSeparator[] = "\r\n---\r\n";
}

const char* DispatchActionName(DispatchAction action) {
  switch (action) {
    case DispatchAction::kNone:
      return "none";
    case DispatchAction::kLocalTransit:
      return "local_transit";
    case DispatchAction::kRemoteQueue:
      return "remote_queue";
  }
  return "none";
}

NetworkDispatcher::NetworkDispatcher(StateStore* store,
                                     const MsgbaseConfig& config)
    : store_(store),
      msg_(config.msg),
      bbsname_(config.system.bbsname),
      networks_(config.networks),
      lock_timeout_(config.store.lock_timeout_ms) {}

// An empty network_tags value still enables dispatch: hosted server tags keep
// routing with no remote networks listed.
bool NetworkDispatcher::enabled() const { return msg_.network_tags_configured; }

bool NetworkDispatcher::IsServerTag(const std::string& tag) const {
  return std::find(msg_.server_tags.begin(), msg_.server_tags.end(), tag) !=
         msg_.server_tags.end();
}

bool NetworkDispatcher::IsNetworkTag(const std::string& tag) const {
  return std::find(msg_.network_tags.begin(), msg_.network_tags.end(), tag) !=
         msg_.network_tags.end();
}

bool NetworkDispatcher::Plan(const Msg& msg, DispatchPlan& out,
                             Error& error) const {
  out = DispatchPlan{};
  if (!enabled()) {
    return true;
  }
  for (const auto& tag : msg.tags) {
    const bool hosted = IsServerTag(tag);
    if (!hosted && !IsNetworkTag(tag)) {
      continue;
    }
    const auto it = networks_.find(tag);
    const std::string table =
        it == networks_.end()
            ? std::string()
            : (hosted ? it->second.trans_db_name : it->second.queue_db_name);
    if (table.empty()) {
      error.Set(ErrorKind::kConfig,
                "msgnet_" + tag +
                    (hosted ? ".trans_db_name" : ".queue_db_name") +
                    " missing");
      return false;
    }
    out.action =
        hosted ? DispatchAction::kLocalTransit : DispatchAction::kRemoteQueue;
    out.network = tag;
    out.table = table;
    return true;
  }
  return true;
}

std::string NetworkDispatcher::OriginLine() const {
  if (msg_.origin_line) {
    return *msg_.origin_line;
  }
  return "Sent from " + bbsname_;
}

std::string NetworkDispatcher::FormatOriginLine() const {
  return kOriginSeparator + OriginLine();
}

bool NetworkDispatcher::Record(const std::string& table, MsgId id,
                               const std::vector<std::uint8_t>& value,
                               Error& error) {
  std::string err;
  StateStoreLock lock(store_, table, lock_timeout_, err);
  if (!lock.locked()) {
    error.Set(ErrorKind::kStoreUnavailable, err);
    return false;
  }
  if (!store_->SaveBlob(table, MsgKey(id), value, err)) {
    error.Set(ErrorKind::kStoreUnavailable, err);
    return false;
  }
  return true;
}

bool NetworkDispatcher::RecordTransit(const DispatchPlan& plan, MsgId id,
                                      Error& error) {
  std::vector<std::uint8_t> value;
  proto::WriteUint64(id, value);
  if (!Record(plan.table, id, value, error)) {
    return false;
  }
  platform::log::Log(platform::log::Level::kInfo, "dispatch",
                     "added origin line",
                     {{"network", plan.network}, {"msg", MsgKey(id)}});
  return true;
}

bool NetworkDispatcher::RecordQueue(const DispatchPlan& plan, MsgId id,
                                    Error& error) {
  std::vector<std::uint8_t> value;
  if (!proto::WriteString(plan.network, value)) {
    error.Set(ErrorKind::kInvalidMessage, "network tag too long");
    return false;
  }
  if (!Record(plan.table, id, value, error)) {
    return false;
  }
  platform::log::Log(platform::log::Level::kInfo, "dispatch",
                     "message queued for delivery",
                     {{"network", plan.network}, {"msg", MsgKey(id)}});
  return true;
}

bool NetworkDispatcher::Read(const std::string& table, MsgId id,
                             BlobLoadResult& out, Error& error) const {
  std::string err;
  if (!store_->LoadBlob(table, MsgKey(id), out, err)) {
    error.Set(ErrorKind::kStoreUnavailable, err);
    return false;
  }
  return true;
}

bool NetworkDispatcher::ReadTransit(const std::string& table, MsgId id,
                                    std::optional<MsgId>& out,
                                    Error& error) const {
  out.reset();
  BlobLoadResult blob;
  if (!Read(table, id, blob, error)) {
    return false;
  }
  if (!blob.found) {
    return true;
  }
  std::size_t off = 0;
  std::uint64_t value = 0;
  if (!proto::ReadUint64(blob.data, off, value) || off != blob.data.size()) {
    error.Set(ErrorKind::kCorruptRecord, "bad transit entry " + MsgKey(id));
    return false;
  }
  out = value;
  return true;
}

bool NetworkDispatcher::ReadQueue(const std::string& table, MsgId id,
                                  std::optional<std::string>& out,
                                  Error& error) const {
  out.reset();
  BlobLoadResult blob;
  if (!Read(table, id, blob, error)) {
    return false;
  }
  if (!blob.found) {
    return true;
  }
  std::size_t off = 0;
  std::string tag;
  if (!proto::ReadString(blob.data, off, tag) || off != blob.data.size()) {
    error.Set(ErrorKind::kCorruptRecord, "bad queue entry " + MsgKey(id));
    return false;
  }
  out = std::move(tag);
  return true;
}

}  // namespace bbs::msgbase
