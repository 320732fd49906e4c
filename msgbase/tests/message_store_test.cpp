#include <chrono>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "message_store.h"
#include "platform_time.h"
#include "state_store.h"

using bbs::msgbase::Clock;
using bbs::msgbase::Error;
using bbs::msgbase::ErrorKind;
using bbs::msgbase::MessageStore;
using bbs::msgbase::Msg;
using bbs::msgbase::MsgId;
using bbs::msgbase::MsgLoadResult;

namespace {

#define FAIL()                                                        \
  do {                                                                \
    std::cerr << "message_store_test failed at " << __FILE__ << ":"   \
              << __LINE__ << "\n";                                    \
    return 1;                                                         \
  } while (false)

}  // namespace

int main() {
  auto store = bbs::msgbase::CreateMemoryStateStore();
  MessageStore messages(store.get(), std::chrono::milliseconds(200));
  Error error;

  std::set<MsgId> ids;
  if (!messages.ListIds(ids, error) || !ids.empty()) {
    FAIL();
  }

  Msg first;
  first.author = "sysop";
  first.subject = "first";
  bool created = false;
  const auto before = Clock::now();
  if (!messages.Write(first, std::nullopt, created, error)) {
    FAIL();
  }
  if (!created || first.id != MsgId{0} || !first.save_time ||
      *first.save_time < before - std::chrono::microseconds(1)) {
    FAIL();
  }

  const auto stamp = bbs::platform::FromUnixMicros(1600000000000000);
  Msg second;
  second.subject = "second";
  if (!messages.Write(second, stamp, created, error)) {
    FAIL();
  }
  if (!created || second.id != MsgId{1} || second.creation_time != stamp ||
      second.save_time != stamp) {
    FAIL();
  }

  // Rewriting an existing record keeps its id.
  second.body = "edited";
  if (!messages.Write(second, std::nullopt, created, error) || created ||
      second.id != MsgId{1}) {
    FAIL();
  }
  MsgLoadResult loaded;
  if (!messages.Load(1, loaded, error) || !loaded.found ||
      loaded.msg.body != "edited" || loaded.msg.save_time != stamp) {
    FAIL();
  }

  if (!messages.Load(99, loaded, error) || loaded.found) {
    FAIL();
  }

  {
    Msg parent;
    if (!messages.AddChild(1, 7, parent, error) ||
        parent.children != std::set<MsgId>{7} || parent.body != "edited") {
      FAIL();
    }
    // A stale copy without the child does not unlink it.
    second.subject = "second, retitled";
    if (!messages.Write(second, std::nullopt, created, error) ||
        second.children != std::set<MsgId>{7}) {
      FAIL();
    }
    if (!messages.Load(1, loaded, error) ||
        loaded.msg.children != std::set<MsgId>{7} ||
        loaded.msg.subject != "second, retitled") {
      FAIL();
    }
    error.Clear();
    if (messages.AddChild(99, 7, parent, error) ||
        error.kind != ErrorKind::kNotFound) {
      FAIL();
    }
  }

  // Ids follow the current maximum, not the record count.
  Msg far;
  far.id = 10;
  if (!messages.Write(far, std::nullopt, created, error) || created) {
    FAIL();
  }
  Msg next;
  if (!messages.Write(next, std::nullopt, created, error) ||
      next.id != MsgId{11}) {
    FAIL();
  }

  std::string err;
  if (!store->SaveBlob(bbs::msgbase::kMsgTable, "notes", {1, 2}, err)) {
    FAIL();
  }
  if (!messages.ListIds(ids, error) || ids != std::set<MsgId>{0, 1, 10, 11}) {
    FAIL();
  }

  if (!store->SaveBlob(bbs::msgbase::kMsgTable, "5", {1, 2, 3}, err)) {
    FAIL();
  }
  error.Clear();
  if (messages.Load(5, loaded, error) ||
      error.kind != ErrorKind::kCorruptRecord) {
    FAIL();
  }

  {
    // A record stored under the wrong key is corrupt.
    MsgLoadResult eleven;
    if (!messages.Load(11, eleven, error)) {
      FAIL();
    }
    std::vector<std::uint8_t> record;
    if (!bbs::msgbase::EncodeMsg(eleven.msg, record, err) ||
        !store->SaveBlob(bbs::msgbase::kMsgTable, "12", record, err)) {
      FAIL();
    }
    error.Clear();
    if (messages.Load(12, loaded, error) ||
        error.kind != ErrorKind::kCorruptRecord) {
      FAIL();
    }
  }

  {
    // Writer blocked by a held table lock.
    if (!store->AcquireLock(bbs::msgbase::kMsgTable,
                            std::chrono::milliseconds(50), err)) {
      FAIL();
    }
    MessageStore impatient(store.get(), std::chrono::milliseconds(20));
    Msg blocked;
    error.Clear();
    if (impatient.Write(blocked, std::nullopt, created, error) || created ||
        blocked.id || error.kind != ErrorKind::kStoreUnavailable) {
      FAIL();
    }
    store->ReleaseLock(bbs::msgbase::kMsgTable);
  }

  {
    Msg oversized;
    oversized.subject = std::string(70000, 's');
    error.Clear();
    if (messages.Write(oversized, std::nullopt, created, error) ||
        oversized.id || error.kind != ErrorKind::kInvalidMessage) {
      FAIL();
    }
  }

  return 0;
}
