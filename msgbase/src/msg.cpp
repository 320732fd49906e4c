#include "msg.h"

#include <algorithm>
#include <charconv>

#include "platform_time.h"
#include "protocol.h"

namespace bbs::msgbase {

namespace {

constexpr std::uint8_t kRecordVersion = 1;
constexpr std::uint8_t kHasId = 0x01;
constexpr std::uint8_t kHasSaveTime = 0x02;
constexpr std::uint8_t kHasParent = 0x04;

}  // namespace

bool Msg::AddTag(const std::string& tag) {
  if (tag.empty() || tag.size() > kMaxTagBytes || HasTag(tag)) {
    return false;
  }
  tags.push_back(tag);
  return true;
}

bool Msg::RemoveTag(const std::string& tag) {
  const auto it = std::find(tags.begin(), tags.end(), tag);
  if (it == tags.end()) {
    return false;
  }
  tags.erase(it);
  return true;
}

bool Msg::HasTag(const std::string& tag) const {
  return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

std::string MsgKey(MsgId id) { return std::to_string(id); }

bool ParseMsgKey(const std::string& key, MsgId& out) {
  if (key.empty() || (key.size() > 1 && key[0] == '0')) {
    return false;
  }
  const char* first = key.data();
  const char* last = key.data() + key.size();
  MsgId value = 0;
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return false;
  }
  out = value;
  return true;
}

bool EncodeMsg(const Msg& msg, std::vector<std::uint8_t>& out,
               std::string& error) {
  out.clear();
  std::uint8_t flags = 0;
  if (msg.id) {
    flags |= kHasId;
  }
  if (msg.save_time) {
    flags |= kHasSaveTime;
  }
  if (msg.parent) {
    flags |= kHasParent;
  }
  proto::WriteUint8(kRecordVersion, out);
  proto::WriteUint8(flags, out);
  proto::WriteUint64(msg.id.value_or(0), out);
  proto::WriteInt64(platform::ToUnixMicros(msg.creation_time), out);
  proto::WriteInt64(
      msg.save_time ? platform::ToUnixMicros(*msg.save_time) : 0, out);
  if (!proto::WriteString(msg.author, out) ||
      !proto::WriteString(msg.recipient, out) ||
      !proto::WriteString(msg.subject, out)) {
    error = "envelope field too long";
    return false;
  }
  if (!proto::WriteLongString(msg.body, out)) {
    error = "body too long";
    return false;
  }
  proto::WriteUint32(static_cast<std::uint32_t>(msg.tags.size()), out);
  for (const auto& tag : msg.tags) {
    if (!proto::WriteString(tag, out)) {
      error = "tag too long";
      return false;
    }
  }
  proto::WriteUint64(msg.parent.value_or(0), out);
  proto::WriteUint32(static_cast<std::uint32_t>(msg.children.size()), out);
  for (const MsgId child : msg.children) {
    proto::WriteUint64(child, out);
  }
  return true;
}

bool DecodeMsg(const std::vector<std::uint8_t>& data, Msg& out,
               std::string& error) {
  out = Msg{};
  std::size_t off = 0;
  std::uint8_t version = 0;
  std::uint8_t flags = 0;
  if (!proto::ReadUint8(data, off, version) ||
      !proto::ReadUint8(data, off, flags)) {
    error = "record truncated";
    return false;
  }
  if (version != kRecordVersion) {
    error = "unsupported record version " + std::to_string(version);
    return false;
  }
  std::uint64_t id = 0;
  std::int64_t ctime = 0;
  std::int64_t stime = 0;
  std::uint32_t tag_count = 0;
  if (!proto::ReadUint64(data, off, id) ||
      !proto::ReadInt64(data, off, ctime) ||
      !proto::ReadInt64(data, off, stime) ||
      !proto::ReadString(data, off, out.author) ||
      !proto::ReadString(data, off, out.recipient) ||
      !proto::ReadString(data, off, out.subject) ||
      !proto::ReadLongString(data, off, out.body) ||
      !proto::ReadUint32(data, off, tag_count)) {
    error = "record truncated";
    return false;
  }
  for (std::uint32_t i = 0; i < tag_count; ++i) {
    std::string tag;
    if (!proto::ReadString(data, off, tag)) {
      error = "record truncated";
      return false;
    }
    if (!out.AddTag(tag)) {
      error = "invalid tag in record";
      return false;
    }
  }
  std::uint64_t parent = 0;
  std::uint32_t child_count = 0;
  if (!proto::ReadUint64(data, off, parent) ||
      !proto::ReadUint32(data, off, child_count)) {
    error = "record truncated";
    return false;
  }
  for (std::uint32_t i = 0; i < child_count; ++i) {
    std::uint64_t child = 0;
    if (!proto::ReadUint64(data, off, child)) {
      error = "record truncated";
      return false;
    }
    out.children.insert(child);
  }
  if (off != data.size()) {
    error = "trailing bytes in record";
    return false;
  }
  if ((flags & kHasId) != 0) {
    out.id = id;
  }
  out.creation_time = platform::FromUnixMicros(ctime);
  if ((flags & kHasSaveTime) != 0) {
    out.save_time = platform::FromUnixMicros(stime);
  }
  if ((flags & kHasParent) != 0) {
    out.parent = parent;
  }
  return true;
}

bool EncodeIdSet(const std::set<MsgId>& ids, std::vector<std::uint8_t>& out) {
  out.clear();
  proto::WriteUint32(static_cast<std::uint32_t>(ids.size()), out);
  for (const MsgId id : ids) {
    proto::WriteUint64(id, out);
  }
  return true;
}

bool DecodeIdSet(const std::vector<std::uint8_t>& data, std::set<MsgId>& out) {
  out.clear();
  std::size_t off = 0;
  std::uint32_t count = 0;
  if (!proto::ReadUint32(data, off, count)) {
    return false;
  }
  for (std::uint32_t i = 0; i < count; ++i) {
    std::uint64_t id = 0;
    if (!proto::ReadUint64(data, off, id)) {
      out.clear();
      return false;
    }
    out.insert(id);
  }
  return off == data.size();
}

}  // namespace bbs::msgbase
