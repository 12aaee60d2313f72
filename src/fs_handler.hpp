#pragma once
#include "common.hpp"
#include "inode_table.hpp"

struct ChildEntry
{
	InodeId child{0};
	InodeAttributes attributes;
};

struct ForgetRequest
{
	InodeId ino{0};
	uint64_t nlookup{0};
};

// Request handlers for the forget-tracking file system. Each returns 0 or an
// errno value; references to unknown or forgotten inodes abort the process.
class FsHandler
{
public:
	explicit FsHandler(InodeTable &table) : table_(table) {}

	int init();
	int lookup(InodeId parent, std::string_view name, ChildEntry &entry);
	int getattr(InodeId ino, InodeAttributes &attr);
	void forget(InodeId ino, uint64_t nlookup);
	void forget_multi(const std::vector<ForgetRequest> &forgets);
	int mkdir(InodeId parent, ChildEntry &entry);
	int create(InodeId parent, ChildEntry &entry);
	int open(InodeId ino);
	int opendir(InodeId ino);

private:
	void mint_child(InodeId parent, mode_t mode, ChildEntry &entry);

	InodeTable &table_;
};
