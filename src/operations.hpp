#pragma once

#define FUSE_USE_VERSION FUSE_MAKE_VERSION(3, 14)

#ifndef _GNU_SOURCE
#define _GNU_SOURCE
#endif

#include <fuse_lowlevel.h>
#include "common.hpp"

// Fills the lowlevel operation table. Every callback expects the session
// userdata to be the FsHandler serving the mount.
void assign_operations(fuse_lowlevel_ops &ffs_oper);
