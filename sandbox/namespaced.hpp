#ifndef SANDBOX_NAMESPACED_HPP
#define SANDBOX_NAMESPACED_HPP
#include <memory>
#include <string>
#include <vector>

#include "sandbox/unix.hpp"

namespace sandbox {

// Sandbox that runs the program in new user, pid, mount, ipc, uts and
// (unless the network is allowed) network namespaces, chrooted in a jail
// that only contains the read-only system paths, a few devices and the
// working directory, mounted at /box. If the service runs as root, the
// program runs as nobody (65534), which then owns the working directory.
class Namespaced : public Unix {
 public:
  std::string Name() const override { return "namespaced"; }
  bool Isolated() const override { return true; }
  static Sandbox* Create() { return new Namespaced(); }
  // Usable only if a trivial program can actually be run in the jail.
  static int Score();

 protected:
  Namespaced() = default;

  bool OnSetup(std::string* error_msg) override;
  bool DoFork(std::string* error_msg) override;
  bool OnForked(std::string* error_msg) override;
  bool OnChild(char* error_msg, size_t buflen) override;
  void OnFinish(ExecutionInfo* info) override;

 private:
  struct BindMount {
    std::string source;
    std::string target;
    // Flags that the remount must carry: those of the source mount, which
    // cannot be cleared from inside a user namespace, plus the requested
    // ones.
    unsigned long remount_flags;  // NOLINT
    bool remount;
  };

  static int ChildEntry(void* sandbox);

  std::string jail_;
  std::string proc_;
  std::vector<std::string> proc_readonly_;
  std::vector<BindMount> mounts_;
  std::unique_ptr<char[]> stack_;
  bool running_as_root_ = false;
};

}  // namespace sandbox
#endif
