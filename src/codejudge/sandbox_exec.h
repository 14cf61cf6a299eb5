#ifndef CODEJUDGE_SANDBOX_EXEC_H_
#define CODEJUDGE_SANDBOX_EXEC_H_

#include "sandbox.h"

// Kept apart from sandbox.h because this needs the logger and the paths of
// libcodejudge, while sandbox-exec links only sandbox.cpp.

// before SandboxExec:
// 1. create a box directory exclusive to this run
// 2. take a uid&gid from the pool
// 3. create workdir, source and input inside the box, writable by that uid
// The launcher runs sandbox-exec as a child and passes the options through a pipe.
// On failure of the launcher itself, timekill is -1 and oomkill holds errno.
struct cjail_result SandboxExec(const SandboxOptions&);

#endif  // CODEJUDGE_SANDBOX_EXEC_H_
