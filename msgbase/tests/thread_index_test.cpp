#include <chrono>
#include <iostream>
#include <optional>
#include <set>
#include <string>

#include "message_store.h"
#include "state_store.h"
#include "tag_index.h"
#include "thread_index.h"

using bbs::msgbase::Error;
using bbs::msgbase::ErrorKind;
using bbs::msgbase::MessageStore;
using bbs::msgbase::Msg;
using bbs::msgbase::MsgId;
using bbs::msgbase::MsgLoadResult;
using bbs::msgbase::TagIndex;
using bbs::msgbase::ThreadIndex;

namespace {

#define FAIL()                                                        \
  do {                                                                \
    std::cerr << "thread_index_test failed at " << __FILE__ << ":"    \
              << __LINE__ << "\n";                                    \
    return 1;                                                         \
  } while (false)

}  // namespace

int main() {
  auto store = bbs::msgbase::CreateMemoryStateStore();
  const std::chrono::milliseconds timeout(200);
  MessageStore messages(store.get(), timeout);
  TagIndex tags(store.get(), timeout);
  ThreadIndex threads(&messages, &tags);
  Error error;
  bool created = false;

  auto save = [&](Msg& msg) {
    return messages.Write(msg, std::nullopt, created, error) &&
           tags.Reconcile(msg, error) && threads.Link(msg, error);
  };
  auto load = [&](MsgId id, Msg& out) {
    MsgLoadResult loaded;
    if (!messages.Load(id, loaded, error) || !loaded.found) {
      return false;
    }
    out = loaded.msg;
    return true;
  };

  Msg root;
  root.subject = "root";
  root.AddTag("public");
  if (!save(root) || root.id != MsgId{0}) {
    FAIL();
  }

  Msg reply;
  reply.subject = "Re: root";
  reply.parent = 0;
  if (!save(reply) || reply.id != MsgId{1}) {
    FAIL();
  }
  Msg nested;
  nested.subject = "Re: Re: root";
  nested.parent = 1;
  if (!save(nested) || nested.id != MsgId{2}) {
    FAIL();
  }

  Msg stored;
  if (!load(0, stored) || stored.children != std::set<MsgId>{1} ||
      stored.parent) {
    FAIL();
  }
  if (!load(1, stored) || stored.children != std::set<MsgId>{2} ||
      stored.parent != MsgId{0}) {
    FAIL();
  }
  // Parent rewrites keep the parent's tag membership.
  std::set<MsgId> members;
  if (!tags.Members("public", members, error) ||
      members != std::set<MsgId>{0}) {
    FAIL();
  }

  // Second reply to the root.
  Msg sibling;
  sibling.parent = 0;
  if (!save(sibling) || !load(0, stored) ||
      stored.children != std::set<MsgId>{1, 3}) {
    FAIL();
  }

  // A message naming itself as parent is repaired, not rejected.
  Msg self;
  if (!save(self)) {
    FAIL();
  }
  self.parent = self.id;
  if (!save(self) || self.parent) {
    FAIL();
  }
  if (!load(*self.id, stored) || stored.parent || !stored.children.empty()) {
    FAIL();
  }

  {
    Msg orphan;
    orphan.parent = 77;
    error.Clear();
    if (save(orphan) || error.kind != ErrorKind::kNotFound) {
      FAIL();
    }
    // The orphan itself was written before the walk failed.
    if (!orphan.id || !load(*orphan.id, stored)) {
      FAIL();
    }
  }

  {
    // Two records pointing at each other, written without linking.
    Msg x;
    Msg y;
    if (!messages.Write(x, std::nullopt, created, error) ||
        !messages.Write(y, std::nullopt, created, error)) {
      FAIL();
    }
    x.parent = y.id;
    y.parent = x.id;
    if (!messages.Write(x, std::nullopt, created, error) ||
        !messages.Write(y, std::nullopt, created, error)) {
      FAIL();
    }
    error.Clear();
    if (threads.Link(x, error) || error.kind != ErrorKind::kThreadCycle) {
      FAIL();
    }
  }

  {
    Msg top;
    if (!save(top)) {
      FAIL();
    }
    Msg unparented = top;
    if (!threads.Link(unparented, error)) {
      FAIL();
    }
  }

  return 0;
}
