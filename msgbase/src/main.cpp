#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "config.h"
#include "identity.h"
#include "msgbase.h"
#include "platform_log.h"
#include "platform_time.h"
#include "state_store.h"

namespace {

using bbs::msgbase::MsgId;

void LogError(const std::string& msg) {
  std::cerr << "[bbs_msgbase] " << msg << "\n";
}

void Usage() {
  std::cerr << "usage: bbs_msgbase <config.ini> <command> [args]\n"
               "  post --as <handle> [--to <who>] [--subject <text>]\n"
               "       [--tags a,b] [--parent <id>] [--no-queue]"
               "   (body read from stdin)\n"
               "  show <id>\n"
               "  list [tag ...]\n"
               "  tags\n";
}

bool ParseId(const std::string& text, MsgId& out) {
  if (!bbs::msgbase::ParseMsgKey(text, out)) {
    LogError("invalid message id: " + text);
    return false;
  }
  return true;
}

int RunPost(bbs::msgbase::StateStore* store,
            const bbs::msgbase::MsgbaseConfig& cfg,
            const std::vector<std::string>& args) {
  std::string handle;
  std::string to = "All";
  std::string subject;
  std::string tags;
  std::string parent;
  bool no_queue = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--no-queue") {
      no_queue = true;
      continue;
    }
    if (i + 1 >= args.size()) {
      LogError("missing value for " + arg);
      return 2;
    }
    const std::string& value = args[++i];
    if (arg == "--as") {
      handle = value;
    } else if (arg == "--to") {
      to = value;
    } else if (arg == "--subject") {
      subject = value;
    } else if (arg == "--tags") {
      tags = value;
    } else if (arg == "--parent") {
      parent = value;
    } else {
      LogError("unknown option " + arg);
      return 2;
    }
  }
  if (handle.empty()) {
    LogError("post requires --as");
    return 2;
  }

  const std::string body((std::istreambuf_iterator<char>(std::cin)),
                         std::istreambuf_iterator<char>());
  bbs::msgbase::FixedIdentity identity(handle);
  bbs::msgbase::MessageBase base(store, cfg, &identity);
  auto msg = base.Compose(to, subject, body);
  for (const auto& tag : bbs::msgbase::SplitTagList(tags)) {
    msg.AddTag(tag);
  }
  if (!parent.empty()) {
    MsgId parent_id = 0;
    if (!ParseId(parent, parent_id)) {
      return 2;
    }
    msg.parent = parent_id;
  }

  bbs::msgbase::SaveOptions options;
  options.suppress_dispatch = no_queue;
  const auto resp = base.Save(msg, options);
  if (!resp.success) {
    LogError(resp.error);
    return 1;
  }
  std::cout << resp.id << "\n";
  return 0;
}

int RunShow(bbs::msgbase::StateStore* store,
            const bbs::msgbase::MsgbaseConfig& cfg,
            const std::vector<std::string>& args) {
  if (args.size() != 1) {
    Usage();
    return 2;
  }
  MsgId id = 0;
  if (!ParseId(args[0], id)) {
    return 2;
  }
  bbs::msgbase::MessageBase base(store, cfg);
  const auto resp = base.GetMessage(id);
  if (!resp.success) {
    LogError(resp.error);
    return 1;
  }
  const auto& msg = resp.msg;
  std::cout << "Id:      " << id << "\n"
            << "From:    " << msg.author << "\n"
            << "To:      " << msg.recipient << "\n"
            << "Subject: " << msg.subject << "\n"
            << "Created: "
            << bbs::platform::FormatTimestamp(msg.creation_time, true) << "\n";
  if (msg.save_time) {
    std::cout << "Saved:   "
              << bbs::platform::FormatTimestamp(*msg.save_time, true) << "\n";
  }
  std::cout << "Tags:   ";
  for (const auto& tag : msg.tags) {
    std::cout << " " << tag;
  }
  std::cout << "\n";
  if (msg.parent) {
    std::cout << "Parent:  " << *msg.parent << "\n";
  }
  if (!msg.children.empty()) {
    std::cout << "Replies:";
    for (const MsgId child : msg.children) {
      std::cout << " " << child;
    }
    std::cout << "\n";
  }
  std::cout << "\n" << msg.body << "\n";
  return 0;
}

int RunList(bbs::msgbase::StateStore* store,
            const bbs::msgbase::MsgbaseConfig& cfg,
            const std::vector<std::string>& args) {
  bbs::msgbase::MessageBase base(store, cfg);
  const auto resp = base.ListMessages(args);
  if (!resp.success) {
    LogError(resp.error);
    return 1;
  }
  for (const MsgId id : resp.ids) {
    std::cout << id << "\n";
  }
  return 0;
}

int RunTags(bbs::msgbase::StateStore* store,
            const bbs::msgbase::MsgbaseConfig& cfg) {
  bbs::msgbase::MessageBase base(store, cfg);
  const auto resp = base.ListTags();
  if (!resp.success) {
    LogError(resp.error);
    return 1;
  }
  for (const auto& tag : resp.tags) {
    std::cout << tag << "\n";
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 2;
  }
  const std::string config_path = argv[1];
  const std::string command = argv[2];
  const std::vector<std::string> args(argv + 3, argv + argc);

  std::string error;
  bbs::msgbase::MsgbaseConfig cfg;
  if (!bbs::msgbase::LoadConfig(config_path, cfg, error)) {
    LogError(error);
    return 1;
  }
  bbs::platform::log::SetMinLevel(cfg.log.level);

  auto store = bbs::msgbase::CreateStateStore(cfg, error);
  if (!store) {
    LogError(error.empty() ? "state store init failed" : error);
    return 1;
  }

  if (command == "post") {
    return RunPost(store.get(), cfg, args);
  }
  if (command == "show") {
    return RunShow(store.get(), cfg, args);
  }
  if (command == "list") {
    return RunList(store.get(), cfg, args);
  }
  if (command == "tags" && args.empty()) {
    return RunTags(store.get(), cfg);
  }
  Usage();
  return 2;
}
