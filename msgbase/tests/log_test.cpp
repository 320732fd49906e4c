#include <iostream>
#include <string>
#include <vector>

#include "config.h"
#include "msgbase.h"
#include "platform_log.h"
#include "state_store.h"

namespace plog = bbs::platform::log;

namespace {

#define FAIL()                                                        \
  do {                                                                \
    std::cerr << "log_test failed at " << __FILE__ << ":" << __LINE__ \
              << "\n";                                                \
    return 1;                                                         \
  } while (false)

struct Captured {
  plog::Level level;
  std::string tag;
  std::string message;
  std::string fields;
};

void Capture(plog::Level level, const char* tag, const char* message,
             const plog::Field* fields, std::size_t field_count,
             void* user_data) {
  auto* sink = static_cast<std::vector<Captured>*>(user_data);
  Captured entry{level, tag, message, {}};
  for (std::size_t i = 0; i < field_count; ++i) {
    entry.fields += std::string(fields[i].key) + "=" +
                    std::string(fields[i].value) + ";";
  }
  sink->push_back(std::move(entry));
}

bool Has(const std::vector<Captured>& sink, const std::string& tag,
         const std::string& message) {
  for (const auto& entry : sink) {
    if (entry.tag == tag && entry.message == message) {
      return true;
    }
  }
  return false;
}

}  // namespace

int main() {
  std::vector<Captured> sink;
  plog::SetLogCallback(&Capture, &sink);
  plog::SetMinLevel(plog::Level::kDebug);

  plog::Log(plog::Level::kInfo, "config", "loaded",
           {{"mysql_password", "hunter2"}, {"bbsname", "Quiet Harbor"}});
  if (sink.size() != 1 ||
      sink[0].fields != "mysql_password=***;bbsname=Quiet Harbor;") {
    FAIL();
  }

  plog::SetMinLevel(plog::Level::kWarn);
  plog::Log(plog::Level::kInfo, "config", "dropped");
  if (sink.size() != 1) {
    FAIL();
  }
  plog::Log(plog::Level::kError, "config", "kept");
  if (sink.size() != 2 || sink[1].level != plog::Level::kError) {
    FAIL();
  }

  plog::Level parsed = plog::Level::kInfo;
  if (!plog::ParseLevel("WARNING", parsed) || parsed != plog::Level::kWarn ||
      plog::ParseLevel("loud", parsed)) {
    FAIL();
  }
  if (std::string(plog::LevelName(plog::Level::kDebug)) != "DEBUG") {
    FAIL();
  }
  if (!plog::IsSensitiveKey("api_token") || plog::IsSensitiveKey("tag")) {
    FAIL();
  }

  {
    sink.clear();
    plog::SetMinLevel(plog::Level::kDebug);
    bbs::msgbase::MsgbaseConfig cfg;
    cfg.store.backend = bbs::msgbase::StoreBackend::kMemory;
    auto store = bbs::msgbase::CreateMemoryStateStore();
    bbs::msgbase::MessageBase base(store.get(), cfg);

    bbs::msgbase::Msg msg = base.Compose("bob", "hi", "hello");
    msg.AddTag("public");
    if (!base.Save(msg).success) {
      FAIL();
    }
    if (!Has(sink, "tag_index", "new tag") ||
        !Has(sink, "msgbase", "saved new public message, addressed to 'bob'")) {
      FAIL();
    }

    bbs::msgbase::Msg reply = base.Compose("sysop", "Re: hi", "yes");
    reply.parent = msg.id;
    if (!base.Save(reply).success ||
        !Has(sink, "thread_index", "linked reply") ||
        !Has(sink, "msgbase", "saved new reply, addressed to 'sysop'")) {
      FAIL();
    }

    reply.parent = reply.id;
    if (!base.Save(reply).success) {
      FAIL();
    }
    bool logged = false;
    for (const auto& entry : sink) {
      if (entry.tag == "thread_index" && entry.level == plog::Level::kError &&
          entry.message == "parent id same as message id; stripping parent") {
        logged = true;
      }
    }
    if (!logged) {
      FAIL();
    }
  }

  plog::SetLogCallback(nullptr, nullptr);
  plog::SetMinLevel(plog::Level::kInfo);
  return 0;
}
