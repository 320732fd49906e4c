#include <initializer_list>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "config.h"
#include "msgbase.h"
#include "network_dispatcher.h"
#include "state_store.h"

using bbs::msgbase::DispatchAction;
using bbs::msgbase::DispatchPlan;
using bbs::msgbase::Error;
using bbs::msgbase::ErrorKind;
using bbs::msgbase::MessageBase;
using bbs::msgbase::Msg;
using bbs::msgbase::MsgbaseConfig;
using bbs::msgbase::MsgId;
using bbs::msgbase::NetworkDispatcher;
using bbs::msgbase::NetworkSection;
using bbs::msgbase::SaveOptions;

namespace {

#define FAIL()                                                        \
  do {                                                                \
    std::cerr << "network_dispatcher_test failed at " << __FILE__     \
              << ":" << __LINE__ << "\n";                             \
    return 1;                                                         \
  } while (false)

MsgbaseConfig NetworkConfig() {
  MsgbaseConfig cfg;
  cfg.system.bbsname = "Quiet Harbor";
  cfg.store.backend = bbs::msgbase::StoreBackend::kMemory;
  cfg.store.lock_timeout_ms = 200;
  cfg.msg.network_tags_configured = true;
  cfg.msg.network_tags = {"fidonet", "local"};
  cfg.msg.server_tags = {"local"};
  NetworkSection fidonet;
  fidonet.queue_db_name = "fidonet_queue";
  cfg.networks["fidonet"] = fidonet;
  NetworkSection local;
  local.trans_db_name = "local_trans";
  cfg.networks["local"] = local;
  return cfg;
}

Msg WithTags(std::initializer_list<const char*> tags) {
  Msg msg;
  msg.recipient = "bob";
  msg.subject = "hi";
  msg.body = "hello";
  for (const char* tag : tags) {
    msg.AddTag(tag);
  }
  return msg;
}

}  // namespace

int main() {
  {
    auto store = bbs::msgbase::CreateMemoryStateStore();
    const auto cfg = NetworkConfig();
    NetworkDispatcher dispatcher(store.get(), cfg);
    Error error;
    if (!dispatcher.enabled()) {
      FAIL();
    }

    DispatchPlan plan;
    if (!dispatcher.Plan(WithTags({"public"}), plan, error) ||
        plan.action != DispatchAction::kNone) {
      FAIL();
    }
    if (!dispatcher.Plan(WithTags({"public", "fidonet", "local"}), plan,
                         error) ||
        plan.action != DispatchAction::kRemoteQueue ||
        plan.network != "fidonet" || plan.table != "fidonet_queue") {
      FAIL();
    }
    // First qualifying tag in insertion order wins.
    if (!dispatcher.Plan(WithTags({"local", "fidonet"}), plan, error) ||
        plan.action != DispatchAction::kLocalTransit ||
        plan.network != "local" || plan.table != "local_trans") {
      FAIL();
    }

    if (dispatcher.OriginLine() != "Sent from Quiet Harbor" ||
        dispatcher.FormatOriginLine() != "\r\n---\r\nSent from Quiet Harbor") {
      FAIL();
    }
    auto custom = cfg;
    custom.msg.origin_line = "Quiet Harbor BBS, Port Ellen";
    NetworkDispatcher with_origin(store.get(), custom);
    if (with_origin.OriginLine() != "Quiet Harbor BBS, Port Ellen") {
      FAIL();
    }

    std::optional<MsgId> transit;
    if (!dispatcher.ReadTransit("local_trans", 3, transit, error) || transit) {
      FAIL();
    }
    plan.action = DispatchAction::kLocalTransit;
    plan.network = "local";
    plan.table = "local_trans";
    if (!dispatcher.RecordTransit(plan, 3, error) ||
        !dispatcher.ReadTransit("local_trans", 3, transit, error) ||
        transit != MsgId{3}) {
      FAIL();
    }
    std::string err;
    if (!store->SaveBlob("local_trans", "4", {1}, err)) {
      FAIL();
    }
    error.Clear();
    if (dispatcher.ReadTransit("local_trans", 4, transit, error) ||
        error.kind != ErrorKind::kCorruptRecord) {
      FAIL();
    }
  }

  {
    auto cfg = NetworkConfig();
    cfg.networks.erase("fidonet");
    auto store = bbs::msgbase::CreateMemoryStateStore();
    NetworkDispatcher dispatcher(store.get(), cfg);
    DispatchPlan plan;
    Error error;
    if (dispatcher.Plan(WithTags({"fidonet"}), plan, error) ||
        error.kind != ErrorKind::kConfig) {
      FAIL();
    }
  }

  {
    // Remote network: queue entry id -> tag, body untouched.
    auto cfg = NetworkConfig();
    cfg.msg.network_tags = {"fidonet"};
    cfg.msg.server_tags.clear();
    auto store = bbs::msgbase::CreateMemoryStateStore();
    MessageBase base(store.get(), cfg);
    Msg msg = WithTags({"fidonet"});
    const auto resp = base.Save(msg);
    if (!resp.success || !resp.created ||
        resp.dispatch != DispatchAction::kRemoteQueue ||
        resp.network != "fidonet") {
      FAIL();
    }
    Error error;
    std::optional<std::string> queued;
    if (!base.dispatcher().ReadQueue("fidonet_queue", resp.id, queued, error) ||
        queued != std::string("fidonet")) {
      FAIL();
    }
    const auto stored = base.GetMessage(resp.id);
    if (!stored.success || stored.msg.body != "hello") {
      FAIL();
    }
  }

  {
    // Hosted network: origin line appended, transit entry id -> id.
    const auto cfg = NetworkConfig();
    auto store = bbs::msgbase::CreateMemoryStateStore();
    MessageBase base(store.get(), cfg);
    Msg first = WithTags({"public"});
    if (!base.Save(first).success) {
      FAIL();
    }
    Msg msg = WithTags({"local"});
    const auto resp = base.Save(msg);
    if (!resp.success || resp.id != 1 ||
        resp.dispatch != DispatchAction::kLocalTransit) {
      FAIL();
    }
    const std::string expected = "hello\r\n---\r\nSent from Quiet Harbor";
    if (msg.body != expected) {
      FAIL();
    }
    const auto stored = base.GetMessage(1);
    if (!stored.success || stored.msg.body != expected) {
      FAIL();
    }
    Error error;
    std::optional<MsgId> transit;
    if (!base.dispatcher().ReadTransit("local_trans", 1, transit, error) ||
        transit != MsgId{1}) {
      FAIL();
    }

    // Updates of an existing message are never dispatched again.
    msg.subject = "edited";
    const auto update = base.Save(msg);
    if (!update.success || update.created ||
        update.dispatch != DispatchAction::kNone || msg.body != expected) {
      FAIL();
    }
  }

  {
    // Suppressed dispatch saves but records nothing.
    const auto cfg = NetworkConfig();
    auto store = bbs::msgbase::CreateMemoryStateStore();
    MessageBase base(store.get(), cfg);
    Msg msg = WithTags({"fidonet"});
    SaveOptions options;
    options.suppress_dispatch = true;
    const auto resp = base.Save(msg, options);
    if (!resp.success || resp.dispatch != DispatchAction::kNone) {
      FAIL();
    }
    std::vector<std::string> keys;
    std::string err;
    if (!store->ListKeys("fidonet_queue", keys, err) || !keys.empty()) {
      FAIL();
    }
  }

  {
    // No network_tags key: dispatch disabled whatever the tags say.
    MsgbaseConfig cfg;
    cfg.store.backend = bbs::msgbase::StoreBackend::kMemory;
    cfg.msg.server_tags = {"local"};
    auto store = bbs::msgbase::CreateMemoryStateStore();
    MessageBase base(store.get(), cfg);
    if (base.dispatcher().enabled()) {
      FAIL();
    }
    Msg msg = WithTags({"local", "fidonet"});
    const auto resp = base.Save(msg);
    if (!resp.success || resp.dispatch != DispatchAction::kNone ||
        msg.body != "hello") {
      FAIL();
    }
  }

  {
    // An empty network_tags value still routes hosted server tags.
    auto cfg = NetworkConfig();
    cfg.msg.network_tags.clear();
    auto store = bbs::msgbase::CreateMemoryStateStore();
    MessageBase base(store.get(), cfg);
    if (!base.dispatcher().enabled()) {
      FAIL();
    }
    DispatchPlan plan;
    Error error;
    if (!base.dispatcher().Plan(WithTags({"fidonet"}), plan, error) ||
        plan.action != DispatchAction::kNone) {
      FAIL();
    }
    Msg msg = WithTags({"fidonet", "local"});
    const auto resp = base.Save(msg);
    if (!resp.success || resp.dispatch != DispatchAction::kLocalTransit ||
        resp.network != "local" ||
        msg.body != "hello\r\n---\r\nSent from Quiet Harbor") {
      FAIL();
    }
    std::optional<MsgId> transit;
    if (!base.dispatcher().ReadTransit("local_trans", resp.id, transit,
                                       error) ||
        transit != resp.id) {
      FAIL();
    }
  }

  return 0;
}
