#ifndef BBS_MSGBASE_MSG_H
#define BBS_MSGBASE_MSG_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace bbs::msgbase {

using MsgId = std::uint64_t;
using Clock = std::chrono::system_clock;

constexpr char kMsgTable[] = "msgbase";
constexpr char kTagTable[] = "tags";

// Longest tag in bytes; tags are keys of the tags table in every backend.
constexpr std::size_t kMaxTagBytes = 100;

// A message record. `tags` behaves as a set that remembers insertion order;
// network dispatch scans it in that order.
struct Msg {
  std::optional<MsgId> id;
  Clock::time_point creation_time{Clock::now()};
  std::optional<Clock::time_point> save_time;
  std::string author;
  std::string recipient;
  std::string subject;
  std::string body;
  std::vector<std::string> tags;
  std::optional<MsgId> parent;
  std::set<MsgId> children;

  bool AddTag(const std::string& tag);
  bool RemoveTag(const std::string& tag);
  bool HasTag(const std::string& tag) const;
};

std::string MsgKey(MsgId id);
bool ParseMsgKey(const std::string& key, MsgId& out);

bool EncodeMsg(const Msg& msg, std::vector<std::uint8_t>& out,
               std::string& error);
bool DecodeMsg(const std::vector<std::uint8_t>& data, Msg& out,
               std::string& error);

bool EncodeIdSet(const std::set<MsgId>& ids, std::vector<std::uint8_t>& out);
bool DecodeIdSet(const std::vector<std::uint8_t>& data, std::set<MsgId>& out);

}  // namespace bbs::msgbase

#endif  // BBS_MSGBASE_MSG_H
