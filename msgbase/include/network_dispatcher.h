#ifndef BBS_MSGBASE_NETWORK_DISPATCHER_H
#define BBS_MSGBASE_NETWORK_DISPATCHER_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

#include "config.h"
#include "errors.h"
#include "msg.h"
#include "state_store.h"

namespace bbs::msgbase {

enum class DispatchAction : std::uint8_t {
  kNone = 0,
  kLocalTransit = 1,  // network hosted here: origin line + transit table
  kRemoteQueue = 2    // network hosted elsewhere: outbound queue table
};

const char* DispatchActionName(DispatchAction action);

struct DispatchPlan {
  DispatchAction action{DispatchAction::kNone};
  std::string network;
  std::string table;
};

class NetworkDispatcher {
 public:
  NetworkDispatcher(StateStore* store, const MsgbaseConfig& config);

  bool enabled() const;

  // First tag of `msg` (insertion order) that names a hosted or a remote
  // network decides the plan; at most one network is chosen.
  bool Plan(const Msg& msg, DispatchPlan& out, Error& error) const;

  std::string OriginLine() const;
  // Footer appended to the body: "\r\n---\r\n" followed by OriginLine().
  std::string FormatOriginLine() const;

  bool RecordTransit(const DispatchPlan& plan, MsgId id, Error& error);
  bool RecordQueue(const DispatchPlan& plan, MsgId id, Error& error);

  bool ReadTransit(const std::string& table, MsgId id,
                   std::optional<MsgId>& out, Error& error) const;
  bool ReadQueue(const std::string& table, MsgId id,
                 std::optional<std::string>& out, Error& error) const;

 private:
  bool IsServerTag(const std::string& tag) const;
  bool IsNetworkTag(const std::string& tag) const;
  bool Record(const std::string& table, MsgId id,
              const std::vector<std::uint8_t>& value, Error& error);
  bool Read(const std::string& table, MsgId id, BlobLoadResult& out,
            Error& error) const;

  StateStore* store_;
  MsgSection msg_;
  std::string bbsname_;
  std::unordered_map<std::string, NetworkSection> networks_;
  std::chrono::milliseconds lock_timeout_;
};

}  // namespace bbs::msgbase

#endif  // BBS_MSGBASE_NETWORK_DISPATCHER_H
