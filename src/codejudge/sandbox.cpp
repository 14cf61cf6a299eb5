#include "sandbox.h"

#include <unistd.h>
#include <sys/stat.h>
#include <cstring>
#include <algorithm>
#include <stdexcept>

SandboxOptions::SandboxOptions(const std::vector<uint8_t>& vec) {
  size_t cur = 0;
  auto Check = [&](size_t len) {
    if (cur + len > vec.size()) throw std::out_of_range("truncated sandbox options");
  };
  auto ReadInt = [&]() {
    Check(sizeof(Int));
    Int r;
    memcpy(&r, vec.data() + cur, sizeof(Int));
    cur += sizeof(Int);
    return r;
  };
  auto ReadString = [&]() {
    Int size = ReadInt();
    if (size < 0) throw std::out_of_range("bad string length");
    Check(size);
    std::string str(size, '\0');
    memcpy(str.data(), vec.data() + cur, size);
    cur += size;
    return str;
  };
  auto ReadStrings = [&](std::vector<std::string>& v) {
    Int size = ReadInt();
    if (size < 0) throw std::out_of_range("bad vector length");
    v.resize(size);
    for (auto& i : v) i = ReadString();
  };
  boxdir = ReadString();
  ReadStrings(command);
  ReadStrings(envs);
  workdir = ReadString();
  input = ReadString();
  output = ReadString();
  error = ReadString();
  uid = ReadInt();
  gid = ReadInt();
  wall_time = ReadInt();
  cpu_time = ReadInt();
  rss = ReadInt();
  vss = ReadInt();
  proc_num = ReadInt();
  file_num = ReadInt();
  fsize = ReadInt();
  share_net = ReadInt();
  ReadStrings(dirs);
}

std::vector<uint8_t> SandboxOptions::Serialize() const {
  std::vector<uint8_t> ret;
  auto PushInt = [&](Int r) {
    size_t cur = ret.size();
    ret.resize(cur + sizeof(Int));
    memcpy(ret.data() + cur, &r, sizeof(Int));
  };
  auto PushString = [&](const std::string& str) {
    PushInt(str.size());
    ret.insert(ret.end(), str.begin(), str.end());
  };
  auto PushStrings = [&](const std::vector<std::string>& v) {
    PushInt(v.size());
    for (auto& i : v) PushString(i);
  };
  PushString(boxdir);
  PushStrings(command);
  PushStrings(envs);
  PushString(workdir);
  PushString(input);
  PushString(output);
  PushString(error);
  PushInt(uid);
  PushInt(gid);
  PushInt(wall_time);
  PushInt(cpu_time);
  PushInt(rss);
  PushInt(vss);
  PushInt(proc_num);
  PushInt(file_num);
  PushInt(fsize);
  PushInt(share_net);
  PushStrings(dirs);
  return ret;
}

void SandboxOptions::FilterDirs() {
  dirs.erase(std::remove_if(dirs.begin(), dirs.end(), [](const std::string& dir) {
    struct stat st;
    return stat(dir.c_str(), &st) < 0 || !S_ISDIR(st.st_mode);
  }), dirs.end());
}

void SandboxOptions::ToCJailCtx(CJailCtxClass& ret) const {
  struct cjail_ctx& ctx = ret.ctx_;
  cjail_ctx_init(&ctx);
  // default: preservefd
  if (!input.empty()) ctx.redir_input = input.data();
  if (!output.empty()) ctx.redir_output = output.data();
  if (!error.empty()) ctx.redir_error = error.data();
  for (auto& i : command) ret.argv_buf_.push_back(i.data());
  ret.argv_buf_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(ret.argv_buf_.data());
  for (auto& i : envs) ret.env_buf_.emplace_back(i.data());
  ret.env_buf_.push_back(nullptr);
  ctx.environ = const_cast<char* const*>(ret.env_buf_.data());
  ctx.chroot = boxdir.data();
  ctx.working_dir = workdir.data();
  ctx.cpuset = nullptr;
  ctx.sharenet = share_net ? 1 : 0;
  ctx.uid = uid;
  ctx.gid = gid;
  ctx.rlim_as = vss;
  ctx.rlim_core = 0; // no core dump
  ctx.rlim_nofile = file_num;
  ctx.rlim_fsize = fsize;
  ctx.rlim_proc = proc_num;
  ctx.cg_rss = rss;
  ctx.lim_time.tv_sec = wall_time / 1'000'000;
  ctx.lim_time.tv_usec = wall_time % 1'000'000;
  ctx.lim_cputime.tv_sec = cpu_time / 1'000'000;
  ctx.lim_cputime.tv_usec = cpu_time % 1'000'000;
  // bind mounts
  // reallocation of str_buf_ invalidate str.data(), thus we need to reserve it first
  ret.str_buf_.reserve(dirs.size());
  ret.mnt_buf_.reserve(dirs.size());
  for (auto& i : dirs) {
    ret.mnt_buf_.emplace_back();
    struct jail_mount_ctx& mnt_ctx = ret.mnt_buf_.back();
    ret.str_buf_.push_back("bind");
    mnt_ctx.type = ret.str_buf_.back().data();
    mnt_ctx.source = mnt_ctx.target = const_cast<char*>(i.data());
    mnt_ctx.fstype = mnt_ctx.data = nullptr;
    mnt_ctx.flags = 0;
    mnt_list_add(ret.mnt_list_, &mnt_ctx);
  }
  ctx.mount_cfg = ret.mnt_list_;
}
