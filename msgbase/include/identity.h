#ifndef BBS_MSGBASE_IDENTITY_H
#define BBS_MSGBASE_IDENTITY_H

#include <string>
#include <utility>

namespace bbs::msgbase {

// Session lookup supplying the author of newly composed messages.
class IdentitySource {
 public:
  virtual ~IdentitySource() = default;

  // Handle of the user owning the active session; empty without a session.
  virtual std::string CurrentHandle() const = 0;
};

class FixedIdentity final : public IdentitySource {
 public:
  explicit FixedIdentity(std::string handle) : handle_(std::move(handle)) {}

  std::string CurrentHandle() const override { return handle_; }

 private:
  std::string handle_;
};

}  // namespace bbs::msgbase

#endif  // BBS_MSGBASE_IDENTITY_H
