#include <atomic>
#include <filesystem>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "config.h"
#include "msgbase.h"
#include "platform_log.h"
#include "state_store.h"

using bbs::msgbase::MessageBase;
using bbs::msgbase::Msg;
using bbs::msgbase::MsgbaseConfig;
using bbs::msgbase::MsgId;

namespace {

#define FAIL()                                                        \
  do {                                                                \
    std::cerr << "concurrency_test failed at " << __FILE__ << ":"     \
              << __LINE__ << "\n";                                    \
    return 1;                                                         \
  } while (false)

constexpr int kThreads = 4;
constexpr int kPerThread = 10;

// Every writer posts kPerThread messages through its own facade.
bool RunWriters(bbs::msgbase::StateStore* store, const MsgbaseConfig& cfg,
                std::vector<MsgId>& ids) {
  std::atomic<bool> ok{true};
  std::vector<std::vector<MsgId>> per_thread(kThreads);
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t] {
      MessageBase base(store, cfg);
      for (int i = 0; i < kPerThread; ++i) {
        Msg msg = base.Compose("All", "load", "n=" + std::to_string(i));
        msg.AddTag(t % 2 == 0 ? "even" : "odd");
        const auto resp = base.Save(msg);
        if (!resp.success) {
          ok = false;
          return;
        }
        per_thread[t].push_back(resp.id);
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
  for (const auto& chunk : per_thread) {
    ids.insert(ids.end(), chunk.begin(), chunk.end());
  }
  return ok.load();
}

// Every writer replies kPerThread times to message `root`.
bool RunRepliers(bbs::msgbase::StateStore* store, const MsgbaseConfig& cfg,
                 MsgId root, std::set<MsgId>& ids) {
  std::atomic<bool> ok{true};
  std::vector<std::vector<MsgId>> per_thread(kThreads);
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t] {
      MessageBase base(store, cfg);
      for (int i = 0; i < kPerThread; ++i) {
        Msg reply = base.Compose("All", "Re: load", "ack");
        reply.parent = root;
        const auto resp = base.Save(reply);
        if (!resp.success) {
          ok = false;
          return;
        }
        per_thread[t].push_back(resp.id);
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
  for (const auto& chunk : per_thread) {
    ids.insert(chunk.begin(), chunk.end());
  }
  return ok.load();
}

int CheckReplies(bbs::msgbase::StateStore* store, const MsgbaseConfig& cfg) {
  MessageBase base(store, cfg);
  Msg root = base.Compose("All", "thread root", "reply here");
  root.AddTag("public");
  const auto saved = base.Save(root);
  if (!saved.success) {
    FAIL();
  }
  std::set<MsgId> ids;
  if (!RunRepliers(store, cfg, saved.id, ids) ||
      ids.size() != static_cast<std::size_t>(kThreads * kPerThread)) {
    FAIL();
  }
  const auto reloaded = base.GetMessage(saved.id);
  if (!reloaded.success || reloaded.msg.children != ids) {
    FAIL();
  }
  return 0;
}

int Check(bbs::msgbase::StateStore* store, const MsgbaseConfig& cfg) {
  std::vector<MsgId> ids;
  if (!RunWriters(store, cfg, ids)) {
    FAIL();
  }
  const std::set<MsgId> unique(ids.begin(), ids.end());
  if (unique.size() != ids.size() ||
      unique.size() != static_cast<std::size_t>(kThreads * kPerThread)) {
    FAIL();
  }
  if (*unique.begin() != 0 ||
      *unique.rbegin() != static_cast<MsgId>(kThreads * kPerThread - 1)) {
    FAIL();
  }
  MessageBase base(store, cfg);
  const auto even = base.ListMessages({"even"});
  const auto odd = base.ListMessages({"odd"});
  if (!even.success || !odd.success ||
      even.ids.size() + odd.ids.size() != unique.size()) {
    FAIL();
  }
  return 0;
}

}  // namespace

int main() {
  MsgbaseConfig cfg;
  cfg.store.backend = bbs::msgbase::StoreBackend::kMemory;
  cfg.store.lock_timeout_ms = 10000;
  bbs::platform::log::SetMinLevel(bbs::platform::log::Level::kWarn);

  {
    auto store = bbs::msgbase::CreateMemoryStateStore();
    if (Check(store.get(), cfg) != 0 || CheckReplies(store.get(), cfg) != 0) {
      FAIL();
    }
  }

  {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec) / "bbs_msgbase_concurrency";
    if (ec) {
      dir = std::filesystem::path{"."} / "bbs_msgbase_concurrency";
    }
    std::filesystem::remove_all(dir, ec);
    std::string err;
    auto store = bbs::msgbase::CreateFileStateStore(dir, err);
    if (!store || Check(store.get(), cfg) != 0 ||
        CheckReplies(store.get(), cfg) != 0) {
      FAIL();
    }
  }

  return 0;
}
