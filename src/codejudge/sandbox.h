#ifndef CODEJUDGE_SANDBOX_H_
#define CODEJUDGE_SANDBOX_H_

#include <string>
#include <vector>
#include <cstdint>

#include <cjail/cjail.h>

class SandboxOptions;
class CJailCtxClass {
 private:
  std::vector<const char*> argv_buf_;
  std::vector<const char*> env_buf_;
  std::vector<std::string> str_buf_;
  std::vector<struct jail_mount_ctx> mnt_buf_;
  struct jail_mount_list* mnt_list_;
  struct cjail_ctx ctx_;
 public:
  CJailCtxClass() : mnt_list_(mnt_list_new()) {}
  ~CJailCtxClass() {
    mnt_list_free(mnt_list_);
  }
  CJailCtxClass(const CJailCtxClass&) = delete;
  CJailCtxClass& operator=(const CJailCtxClass&) = delete;
  struct cjail_ctx& GetCtx() { return ctx_; }
  const struct cjail_ctx& GetCtx() const { return ctx_; }

  friend class SandboxOptions;
};

class SandboxOptions {
  using Int = long; // serialize
 public:
  std::string boxdir;
  std::vector<std::string> command;
  std::vector<std::string> envs;
  // inside box (relative to boxdir but start with /)
  std::string workdir, input, output, error;
  int uid, gid;
  long wall_time, cpu_time; // us; 0 for no limit
  long rss, vss; // KiB
  int proc_num;
  int file_num;
  long fsize; // KiB
  bool share_net;
  // bind-mounted read-only at the same path inside the box
  std::vector<std::string> dirs;

  SandboxOptions() :
      uid(65534), gid(65534),
      wall_time(0), cpu_time(0),
      rss(0), vss(0),
      proc_num(0),
      file_num(0),
      fsize(0),
      share_net(false) {}
  explicit SandboxOptions(const std::vector<uint8_t>& serial);

  // drop directories that do not exist on this machine
  void FilterDirs();
  // platform dependent, only intended for same machine
  std::vector<uint8_t> Serialize() const;
  // fills ctx; ctx is invalidated after reassignment/reallocation of any string/vector member
  void ToCJailCtx(CJailCtxClass& ctx) const;
};

#endif  // CODEJUDGE_SANDBOX_H_
