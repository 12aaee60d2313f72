#pragma once
#include "fs_handler.hpp"
#include "inode_table.hpp"
#include "operations.hpp"

// A file system whose sole contents are a file named "foo" and a directory
// named "bar".
//
// "foo" may be opened, but reads and writes aren't supported. Any name may be
// created or mkdir'd within any directory, but the resulting inode appears to
// have been unlinked immediately.
//
// Lookup counts are tracked for every inode. The process aborts if a count
// would become negative or an inode is referenced after it was forgotten.
// check() verifies that no unexpected counts remain after unmounting.
class ForgetFs
{
public:
	explicit ForgetFs(bool forget_delivery_reliable);
	ForgetFs(const ForgetFs &) = delete;
	ForgetFs &operator=(const ForgetFs &) = delete;

	// Creates a session whose requests are served by this file system. The
	// caller owns the result and must keep this object alive until it is
	// destroyed. Returns nullptr on failure.
	fuse_session *new_session(fuse_args *args);

	void check();

private:
	InodeTable table_;
	FsHandler handler_;
};
